#include "src/code_loader.hpp"
#include "src/errors.hpp"
#include "src/gdd.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using gdd::CodeFamily;

namespace {
nlohmann::json standardDefinition() {
    nlohmann::json doc;
    doc["codes"]["7,4"] = gdd::codeToJson(gdd::hamming74());
    doc["codes"]["15,11"] = gdd::codeToJson(gdd::hamming1511());
    return doc;
}
}

TEST(CodeLoader, ShippedDefinitionMatchesBuiltInTables) {
    auto catalog = gdd::loadCodeCatalog(GDD_CODES_JSON);
    const auto& standard = gdd::CodeCatalog::standard();
    for (auto family : {CodeFamily::SevenFour, CodeFamily::FifteenEleven}) {
        EXPECT_EQ(catalog.code(family).generator(), standard.code(family).generator());
        EXPECT_EQ(catalog.code(family).parityCheck().matrix(), standard.code(family).parityCheck().matrix());
        EXPECT_EQ(catalog.code(family).dataBits(), standard.code(family).dataBits());
    }
}

TEST(CodeLoader, AlternativeTablesDriveThePipeline) {
    // Hamming(7,4) with parity bits first and data bits trailing.
    auto doc = standardDefinition();
    doc["codes"]["7,4"] = {
        {"data_bits", "trailing"},
        {"generator", {"0111000", "1010100", "1100010", "1110001"}},
        {"parity_check", {"1000111", "0101011", "0011101"}}
    };
    auto catalog = gdd::codeCatalogFromJson(doc);
    EXPECT_EQ(catalog.code(CodeFamily::SevenFour).dataBits(), gdd::DataBits::Trailing);
    EXPECT_EQ(catalog.code(CodeFamily::SevenFour).encode(gdd::BitVector{1, 0, 1, 1}).toString(), "0101011");

    std::vector<uint8_t> data{'h', 'a', 'm', 'm', 'i', 'n', 'g'};
    auto stream = gdd::compress(data, CodeFamily::SevenFour, catalog);
    EXPECT_EQ(gdd::decompress(stream, CodeFamily::SevenFour, catalog), data);
}

TEST(CodeLoader, RejectsInvalidTables) {
    auto doc = standardDefinition();
    doc["codes"]["7,4"]["parity_check"] = {"1110100", "0111010", "1110100"};
    EXPECT_THROW(gdd::codeCatalogFromJson(doc), gdd::InvalidCodeDefinition);

    doc = standardDefinition();
    doc["codes"]["15,11"]["data_bits"] = "middle";
    EXPECT_THROW(gdd::codeCatalogFromJson(doc), gdd::InvalidCodeDefinition);

    doc = standardDefinition();
    doc["codes"]["7,4"]["generator"][0] = "10001x1";
    EXPECT_THROW(gdd::codeCatalogFromJson(doc), gdd::InvalidCodeDefinition);

    doc = standardDefinition();
    doc["codes"]["7,4"].erase("generator");
    EXPECT_THROW(gdd::codeCatalogFromJson(doc), gdd::InvalidCodeDefinition);

    doc = standardDefinition();
    doc["codes"].erase("15,11");
    EXPECT_THROW(gdd::codeCatalogFromJson(doc), gdd::InvalidCodeDefinition);

    EXPECT_THROW(gdd::codeCatalogFromJson(nlohmann::json::object()), gdd::InvalidCodeDefinition);
}

TEST(CodeLoader, MissingFileThrows) {
    EXPECT_THROW(gdd::loadCodeCatalog("does/not/exist.json"), std::runtime_error);
}
