#include "src/code_catalog.hpp"
#include "src/errors.hpp"
#include "src/linear_code.hpp"

#include <cstdint>
#include <set>
#include <string>

#include <gtest/gtest.h>

using gdd::BitVector;
using gdd::DataBits;
using gdd::LinearBlockCode;
using gdd::gf2::Matrix;

namespace {
BitVector messageFromInt(uint32_t value, std::size_t bits) {
    BitVector msg = BitVector::zeros(bits);
    for (std::size_t i = 0; i < bits; ++i) {
        msg.set(i, (value >> (bits - 1 - i)) & 1u);
    }
    return msg;
}

// (5,2) code whose parity-check matrix leaves syndromes 101 and 111 unused.
LinearBlockCode shortenedCode() {
    return LinearBlockCode(Matrix::fromStrings({"10110", "01011"}),
                           Matrix::fromStrings({"10100", "11010", "01001"}),
                           DataBits::Leading);
}
}

class LinearCodeTest : public ::testing::TestWithParam<bool> {
protected:
    LinearBlockCode code;

    LinearCodeTest() : code(GetParam() ? gdd::hamming74() : gdd::hamming1511()) {}
};

TEST_P(LinearCodeTest, NoErrorRoundTrip) {
    const uint32_t messages = 1u << code.k();
    for (uint32_t m = 0; m < messages; ++m) {
        BitVector message = messageFromInt(m, code.k());
        BitVector codeword = code.encode(message);
        ASSERT_EQ(codeword.size(), code.n());
        auto result = code.decode(codeword);
        EXPECT_EQ(result.data, message) << "Message " << message.toString();
        EXPECT_TRUE(result.syndrome.isZero()) << "Message " << message.toString();
        EXPECT_EQ(result.syndrome.size(), code.syndromeLength());
    }
}

TEST_P(LinearCodeTest, CorrectsSingleBitErrors) {
    const uint32_t messages = 1u << code.k();
    for (uint32_t m = 0; m < messages; ++m) {
        BitVector message = messageFromInt(m, code.k());
        BitVector baseline = code.encode(message);
        for (std::size_t pos = 0; pos < code.n(); ++pos) {
            BitVector corrupted = baseline;
            corrupted.flip(pos);
            auto result = code.decode(corrupted);
            ASSERT_EQ(result.data, message) << "Message " << message.toString() << " position " << pos;
            EXPECT_EQ(result.syndrome, code.parityCheck().matrix().column(pos));
            EXPECT_EQ(code.correct(corrupted, result.syndrome), baseline);
        }
    }
}

TEST_P(LinearCodeTest, ParityCheckColumnsAreDistinctAndNonZero) {
    std::set<std::string> seen;
    const auto& h = code.parityCheck().matrix();
    for (std::size_t c = 0; c < h.cols(); ++c) {
        BitVector col = h.column(c);
        EXPECT_FALSE(col.isZero()) << "Column " << c;
        EXPECT_TRUE(seen.insert(col.toString()).second) << "Column " << c;
    }
}

INSTANTIATE_TEST_SUITE_P(HammingFamilies, LinearCodeTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Hamming74") : std::string("Hamming1511");
                         });

TEST(Hamming74, KnownCodewordAndEveryFlip) {
    auto code = gdd::hamming74();
    ASSERT_EQ(code.dataBits(), DataBits::Leading);
    BitVector message{1, 0, 1, 1};
    BitVector codeword = code.encode(message);
    EXPECT_EQ(codeword.toString(), "1011000");
    for (std::size_t pos = 0; pos < 7; ++pos) {
        BitVector corrupted = codeword;
        corrupted.flip(pos);
        auto result = code.decode(corrupted);
        EXPECT_EQ(result.data.toString(), "1011") << "Position " << pos;
        EXPECT_FALSE(result.syndrome.isZero()) << "Position " << pos;
    }
}

TEST(Hamming1511, DataBitsAreTrailing) {
    auto code = gdd::hamming1511();
    BitVector message = BitVector::fromString("10000000001");
    EXPECT_EQ(code.encode(message).toString(), "110010000000001");
    EXPECT_EQ(code.extractData(code.encode(message)), message);
}

TEST(LinearCode, WrongLengthsThrow) {
    auto code = gdd::hamming74();
    EXPECT_THROW(code.encode(BitVector{1, 0, 1, 1, 0}), gdd::InvalidLength);
    EXPECT_THROW(code.encode(BitVector{1, 0, 1}), gdd::InvalidLength);
    EXPECT_THROW(code.decode(BitVector::zeros(8)), gdd::InvalidLength);
    EXPECT_THROW(code.decode(BitVector::zeros(6)), gdd::InvalidLength);
    EXPECT_THROW(code.correct(BitVector::zeros(7), BitVector::zeros(4)), gdd::InvalidLength);
    EXPECT_THROW(code.correct(BitVector::zeros(8), BitVector::zeros(3)), gdd::InvalidLength);
}

TEST(LinearCode, ZeroSyndromeLeavesWordUnchanged) {
    auto code = gdd::hamming74();
    BitVector word = BitVector::fromString("1111111");
    EXPECT_EQ(code.correct(word, BitVector::zeros(3)), word);
}

TEST(LinearCode, UnmatchedSyndromeIsUncorrectable) {
    auto code = shortenedCode();
    EXPECT_EQ(code.encode(BitVector{1, 1}).toString(), "11101");
    EXPECT_THROW(code.correct(BitVector::zeros(5), BitVector{1, 1, 1}), gdd::UncorrectableSyndrome);
    EXPECT_THROW(code.decode(BitVector::fromString("10001")), gdd::UncorrectableSyndrome);
    EXPECT_EQ(code.decode(BitVector::fromString("10111")).data.toString(), "10");
}

TEST(LinearCode, ConstructionRejectsDuplicateColumns) {
    EXPECT_THROW(LinearBlockCode(Matrix::fromStrings({"10110", "01011"}),
                                 Matrix::fromStrings({"10110", "11010", "01001"}),
                                 DataBits::Leading),
                 gdd::InvalidCodeDefinition);
}

TEST(LinearCode, ConstructionRejectsZeroColumn) {
    EXPECT_THROW(LinearBlockCode(Matrix::fromStrings({"10000", "01011"}),
                                 Matrix::fromStrings({"00100", "01010", "01001"}),
                                 DataBits::Leading),
                 gdd::InvalidCodeDefinition);
}

TEST(LinearCode, ConstructionRejectsNonOrthogonalGenerator) {
    EXPECT_THROW(LinearBlockCode(Matrix::fromStrings({"1000100", "0100111", "0010110", "0001011"}),
                                 Matrix::fromStrings({"1110100", "0111010", "1101001"}),
                                 DataBits::Leading),
                 gdd::InvalidCodeDefinition);
}

TEST(LinearCode, ConstructionRejectsMisplacedIdentity) {
    EXPECT_THROW(LinearBlockCode(Matrix::fromStrings({"1000101", "0100111", "0010110", "0001011"}),
                                 Matrix::fromStrings({"1110100", "0111010", "1101001"}),
                                 DataBits::Trailing),
                 gdd::InvalidCodeDefinition);
}

TEST(LinearCode, ConstructionRejectsBadShapes) {
    EXPECT_THROW(LinearBlockCode(Matrix::fromStrings({"1000101", "0100111", "0010110", "0001011"}),
                                 Matrix::fromStrings({"1110100", "0111010"}),
                                 DataBits::Leading),
                 gdd::InvalidCodeDefinition);
    EXPECT_THROW(LinearBlockCode(Matrix(), Matrix::fromStrings({"1"}), DataBits::Leading),
                 gdd::InvalidCodeDefinition);
}
