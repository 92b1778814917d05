#include "code_loader.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace gdd {

namespace {

DataBits parseDataBits(const std::string& value) {
    if (value == "leading") return DataBits::Leading;
    if (value == "trailing") return DataBits::Trailing;
    throw InvalidCodeDefinition("data_bits must be 'leading' or 'trailing', got '" + value + "'");
}

LinearBlockCode codeFromJson(const nlohmann::json& codes, CodeFamily family) {
    const std::string name = familyName(family);
    if (!codes.contains(name)) {
        throw InvalidCodeDefinition("No definition for Hamming(" + name + ")");
    }
    const auto& def = codes.at(name);
    auto generator = gf2::Matrix::fromStrings(def.at("generator").get<std::vector<std::string>>());
    auto parity_check = gf2::Matrix::fromStrings(def.at("parity_check").get<std::vector<std::string>>());
    return LinearBlockCode(std::move(generator), std::move(parity_check),
                           parseDataBits(def.value("data_bits", "leading")));
}

}  // namespace

CodeCatalog codeCatalogFromJson(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("codes") || !doc.at("codes").is_object()) {
        throw InvalidCodeDefinition("Code definition needs a 'codes' object");
    }
    const auto& codes = doc.at("codes");
    try {
        return CodeCatalog(codeFromJson(codes, CodeFamily::SevenFour),
                           codeFromJson(codes, CodeFamily::FifteenEleven));
    } catch (const nlohmann::json::exception& e) {
        throw InvalidCodeDefinition(std::string("Malformed code definition: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidCodeDefinition(std::string("Malformed code definition: ") + e.what());
    }
}

CodeCatalog loadCodeCatalog(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Unable to open code definition file: " + path);
    }
    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse code definition file '" + path + "': " + e.what());
    }
    return codeCatalogFromJson(doc);
}

nlohmann::json codeToJson(const LinearBlockCode& code) {
    return {
        {"data_bits", code.dataBits() == DataBits::Leading ? "leading" : "trailing"},
        {"generator", code.generator().toStrings()},
        {"parity_check", code.parityCheck().matrix().toStrings()}
    };
}

}  // namespace gdd
