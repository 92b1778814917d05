#include "linear_code.hpp"

#include <string>
#include <utility>

#include "errors.hpp"

namespace gdd {

namespace {
std::string lengthMismatch(const char* what, std::size_t got, std::size_t expected) {
    return std::string(what) + " must be " + std::to_string(expected) + " bits, got " + std::to_string(got);
}
}

LinearBlockCode::LinearBlockCode(gf2::Matrix generator, gf2::Matrix parity_check, DataBits data_bits)
    : generator_(std::move(generator)),
      parity_check_(std::move(parity_check)),
      data_bits_(data_bits) {
    validateGenerator();
}

void LinearBlockCode::validateGenerator() const {
    const std::size_t rows = k();
    const std::size_t cols = n();
    if (rows == 0 || rows >= cols) {
        throw InvalidCodeDefinition("Generator matrix must be k x n with 0 < k < n, got " +
                                    std::to_string(rows) + " x " + std::to_string(cols));
    }
    if (parity_check_.cols() != cols || parity_check_.rows() != cols - rows) {
        throw InvalidCodeDefinition("Parity-check matrix must be " + std::to_string(cols - rows) + " x " +
                                    std::to_string(cols) + ", got " + std::to_string(parity_check_.rows()) +
                                    " x " + std::to_string(parity_check_.cols()));
    }

    const std::size_t offset = data_bits_ == DataBits::Leading ? 0 : cols - rows;
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < rows; ++c) {
            if (generator_.at(r, offset + c) != (r == c)) {
                throw InvalidCodeDefinition("Generator matrix has no identity block in its " +
                                            std::string(data_bits_ == DataBits::Leading ? "leading" : "trailing") +
                                            " " + std::to_string(rows) + " columns");
            }
        }
    }

    for (std::size_t r = 0; r < rows; ++r) {
        if (!parity_check_.syndrome(generator_.row(r)).isZero()) {
            throw InvalidCodeDefinition("Generator row " + std::to_string(r) +
                                        " is not orthogonal to the parity-check matrix");
        }
    }
}

BitVector LinearBlockCode::encode(const BitVector& message) const {
    if (message.size() != k()) {
        throw InvalidLength(lengthMismatch("Message", message.size(), k()));
    }
    return gf2::vectorTimesMatrix(message, generator_);
}

LinearBlockCode::DecodeResult LinearBlockCode::decode(const BitVector& codeword) const {
    if (codeword.size() != n()) {
        throw InvalidLength(lengthMismatch("Codeword", codeword.size(), n()));
    }
    DecodeResult result;
    result.syndrome = parity_check_.syndrome(codeword);
    result.data = extractData(correct(codeword, result.syndrome));
    return result;
}

BitVector LinearBlockCode::correct(BitVector codeword, const BitVector& syndrome) const {
    if (codeword.size() != n()) {
        throw InvalidLength(lengthMismatch("Codeword", codeword.size(), n()));
    }
    if (syndrome.size() != syndromeLength()) {
        throw InvalidLength(lengthMismatch("Syndrome", syndrome.size(), syndromeLength()));
    }
    if (syndrome.isZero()) {
        return codeword;
    }
    codeword.flip(parity_check_.errorPosition(syndrome));
    return codeword;
}

BitVector LinearBlockCode::extractData(const BitVector& codeword) const {
    if (codeword.size() != n()) {
        throw InvalidLength(lengthMismatch("Codeword", codeword.size(), n()));
    }
    return data_bits_ == DataBits::Leading ? codeword.slice(0, k()) : codeword.slice(n() - k(), k());
}

}  // namespace gdd
