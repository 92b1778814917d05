#pragma once

#include <cstddef>

#include "BitVector.hpp"
#include "ParityCheckMatrix.hpp"
#include "gf2.hpp"

namespace gdd {

// Where the generator matrix keeps its k x k identity block, and therefore
// where the data bits sit verbatim inside a codeword.
enum class DataBits {
    Leading,
    Trailing
};

class LinearBlockCode {
public:
    struct DecodeResult {
        BitVector data;
        BitVector syndrome;  // before correction
    };

    // Throws InvalidCodeDefinition unless G is k x n with the identity in the
    // declared columns, H is (n-k) x n with non-zero distinct columns, and
    // every row of G lies in the null space of H.
    LinearBlockCode(gf2::Matrix generator, gf2::Matrix parity_check, DataBits data_bits);

    std::size_t n() const { return generator_.cols(); }
    std::size_t k() const { return generator_.rows(); }
    std::size_t syndromeLength() const { return n() - k(); }
    DataBits dataBits() const { return data_bits_; }

    const gf2::Matrix& generator() const { return generator_; }
    const ParityCheckMatrix& parityCheck() const { return parity_check_; }

    BitVector encode(const BitVector& message) const;
    DecodeResult decode(const BitVector& codeword) const;
    BitVector correct(BitVector codeword, const BitVector& syndrome) const;

    BitVector extractData(const BitVector& codeword) const;

private:
    void validateGenerator() const;

    gf2::Matrix generator_;
    ParityCheckMatrix parity_check_;
    DataBits data_bits_;
};

}  // namespace gdd
