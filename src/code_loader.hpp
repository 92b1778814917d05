#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "code_catalog.hpp"

namespace gdd {

// Reads generator / parity-check tables for both families, e.g.
// {"codes": {"7,4": {"data_bits": "leading",
//                    "generator": ["1000101", ...],
//                    "parity_check": ["1110100", ...]},
//            "15,11": {...}}}
CodeCatalog loadCodeCatalog(const std::string& path = "configs/codes.json");
CodeCatalog codeCatalogFromJson(const nlohmann::json& doc);

nlohmann::json codeToJson(const LinearBlockCode& code);

}  // namespace gdd
