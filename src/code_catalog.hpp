#pragma once

#include <cstddef>
#include <string>

#include "BitVector.hpp"
#include "linear_code.hpp"

namespace gdd {

enum class CodeFamily {
    SevenFour,
    FifteenEleven
};

// "7,4" / "15,11"
std::string familyName(CodeFamily family);
std::size_t codewordLength(CodeFamily family);
std::size_t messageLength(CodeFamily family);
CodeFamily parseFamily(const std::string& name);

// Boundary helpers: pick a family from a message (4/11) or codeword (7/15)
// length. Throw UnsupportedCodeLength for anything else.
CodeFamily familyForMessageLength(std::size_t length);
CodeFamily familyForCodewordLength(std::size_t length);

// Built-in tables. Hamming(7,4) keeps its data bits in the leading four
// positions, Hamming(15,11) in the trailing eleven.
LinearBlockCode hamming74();
LinearBlockCode hamming1511();

class CodeCatalog {
public:
    CodeCatalog();
    CodeCatalog(LinearBlockCode seven_four, LinearBlockCode fifteen_eleven);

    // Immutable catalog built from the built-in tables.
    static const CodeCatalog& standard();

    const LinearBlockCode& code(CodeFamily family) const;

    // Family resolved from the argument length, once per call.
    BitVector encode(const BitVector& message) const;
    LinearBlockCode::DecodeResult decode(const BitVector& codeword) const;

private:
    static void checkShape(const LinearBlockCode& code, CodeFamily family);

    LinearBlockCode seven_four_;
    LinearBlockCode fifteen_eleven_;
};

}  // namespace gdd
