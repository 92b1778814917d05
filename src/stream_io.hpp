#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "gdd.hpp"

namespace gdd {

// {"family": "15,11", "padded": false,
//  "bases": ["10110011100", {"ref": 0}], "deviations": ["01011", "00001"]}
nlohmann::json streamToJson(const CompressedStream& stream);

// Checks entry widths against the family; throws MalformedStream for a bad
// entry and std::runtime_error for a document of the wrong shape.
CompressedStream streamFromJson(const nlohmann::json& doc);

void saveStream(const CompressedStream& stream, const std::string& path);
CompressedStream loadStream(const std::string& path);

struct CompressionStats {
    std::size_t input_bytes = 0;
    std::size_t chunks = 0;
    std::size_t literal_bases = 0;
    std::size_t references = 0;
    std::size_t base_bits = 0;
    std::size_t reference_bits = 0;
    std::size_t deviation_bits = 0;

    std::size_t originalBits() const { return input_bytes * 8; }
    std::size_t compressedBits() const { return base_bits + reference_bits + deviation_bits; }
    // compressed / original, 0 for empty input
    double ratio() const;
};

// Literal bases cost k bits and references the bits needed to index the
// base sequence; every entry pays one literal/reference tag bit.
CompressionStats computeStats(const CompressedStream& stream, std::size_t input_bytes);
nlohmann::json statsToJson(const CompressionStats& stats);

}  // namespace gdd
