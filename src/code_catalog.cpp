#include "code_catalog.hpp"

#include <utility>

#include "errors.hpp"

namespace gdd {

std::string familyName(CodeFamily family) {
    switch (family) {
        case CodeFamily::SevenFour:
            return "7,4";
        case CodeFamily::FifteenEleven:
            return "15,11";
    }
    return "unknown";
}

std::size_t codewordLength(CodeFamily family) {
    return family == CodeFamily::SevenFour ? 7 : 15;
}

std::size_t messageLength(CodeFamily family) {
    return family == CodeFamily::SevenFour ? 4 : 11;
}

CodeFamily parseFamily(const std::string& name) {
    if (name == "7,4" || name == "7-4") {
        return CodeFamily::SevenFour;
    }
    if (name == "15,11" || name == "15-11") {
        return CodeFamily::FifteenEleven;
    }
    throw UnsupportedCodeLength("Unknown code family '" + name + "', expected 7,4 or 15,11");
}

CodeFamily familyForMessageLength(std::size_t length) {
    if (length == 4) return CodeFamily::SevenFour;
    if (length == 11) return CodeFamily::FifteenEleven;
    throw UnsupportedCodeLength("No code with message length " + std::to_string(length));
}

CodeFamily familyForCodewordLength(std::size_t length) {
    if (length == 7) return CodeFamily::SevenFour;
    if (length == 15) return CodeFamily::FifteenEleven;
    throw UnsupportedCodeLength("No code with codeword length " + std::to_string(length));
}

LinearBlockCode hamming74() {
    auto generator = gf2::Matrix::fromStrings({
        "1000101",
        "0100111",
        "0010110",
        "0001011"
    });
    auto parity_check = gf2::Matrix::fromStrings({
        "1110100",
        "0111010",
        "1101001"
    });
    return LinearBlockCode(std::move(generator), std::move(parity_check), DataBits::Leading);
}

LinearBlockCode hamming1511() {
    // H = [I4 | A], the columns of A being every 4-bit pattern of weight >= 2.
    // G = [A^T | I11].
    auto generator = gf2::Matrix::fromStrings({
        "001110000000000",
        "010101000000000",
        "011000100000000",
        "011100010000000",
        "100100001000000",
        "101000000100000",
        "101100000010000",
        "110000000001000",
        "110100000000100",
        "111000000000010",
        "111100000000001"
    });
    auto parity_check = gf2::Matrix::fromStrings({
        "100000001111111",
        "010001110001111",
        "001010110110011",
        "000111011010101"
    });
    return LinearBlockCode(std::move(generator), std::move(parity_check), DataBits::Trailing);
}

CodeCatalog::CodeCatalog() : CodeCatalog(hamming74(), hamming1511()) {}

CodeCatalog::CodeCatalog(LinearBlockCode seven_four, LinearBlockCode fifteen_eleven)
    : seven_four_(std::move(seven_four)),
      fifteen_eleven_(std::move(fifteen_eleven)) {
    checkShape(seven_four_, CodeFamily::SevenFour);
    checkShape(fifteen_eleven_, CodeFamily::FifteenEleven);
}

void CodeCatalog::checkShape(const LinearBlockCode& code, CodeFamily family) {
    const std::size_t expected_n = codewordLength(family);
    const std::size_t expected_k = messageLength(family);
    if (code.n() != expected_n || code.k() != expected_k) {
        throw InvalidCodeDefinition("Code for family " + familyName(family) + " is (" +
                                    std::to_string(code.n()) + "," + std::to_string(code.k()) + ")");
    }
}

const CodeCatalog& CodeCatalog::standard() {
    static const CodeCatalog catalog;
    return catalog;
}

const LinearBlockCode& CodeCatalog::code(CodeFamily family) const {
    return family == CodeFamily::SevenFour ? seven_four_ : fifteen_eleven_;
}

BitVector CodeCatalog::encode(const BitVector& message) const {
    return code(familyForMessageLength(message.size())).encode(message);
}

LinearBlockCode::DecodeResult CodeCatalog::decode(const BitVector& codeword) const {
    return code(familyForCodewordLength(codeword.size())).decode(codeword);
}

}  // namespace gdd
