#ifndef GDD_PARITYCHECKMATRIX_HPP
#define GDD_PARITYCHECKMATRIX_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

#include "BitVector.hpp"
#include "src/errors.hpp"
#include "src/gf2.hpp"

namespace gdd {

// (n-k) x n parity-check matrix with a precomputed syndrome -> bit position
// table. The columns must be non-zero and pairwise distinct so that every
// non-zero syndrome names at most one position.
class ParityCheckMatrix {
public:
    ParityCheckMatrix() = default;

    explicit ParityCheckMatrix(gf2::Matrix h) : h_(std::move(h)) {
        if (h_.rows() == 0 || h_.cols() == 0) {
            throw InvalidCodeDefinition("Parity-check matrix is empty");
        }
        for (std::size_t c = 0; c < h_.cols(); ++c) {
            BitVector col = h_.column(c);
            if (col.isZero()) {
                throw InvalidCodeDefinition("Parity-check column " + std::to_string(c) + " is zero");
            }
            auto inserted = positions_.emplace(col, c);
            if (!inserted.second) {
                throw InvalidCodeDefinition("Parity-check columns " + std::to_string(inserted.first->second) +
                                            " and " + std::to_string(c) + " are identical (" +
                                            col.toString() + ")");
            }
        }
    }

    const gf2::Matrix& matrix() const { return h_; }
    std::size_t rows() const { return h_.rows(); }
    std::size_t cols() const { return h_.cols(); }

    BitVector syndrome(const BitVector& cw) const {
        return gf2::matrixTimesVector(h_, cw);
    }

    // Same answer as scanning the columns left to right for the first match.
    std::size_t errorPosition(const BitVector& syn) const {
        auto it = positions_.find(syn);
        if (it == positions_.end()) {
            throw UncorrectableSyndrome("Failed to fix codeword, no fix found for syndrome " + syn.toString());
        }
        return it->second;
    }

private:
    gf2::Matrix h_;
    std::unordered_map<BitVector, std::size_t> positions_;
};

}  // namespace gdd

#endif // GDD_PARITYCHECKMATRIX_HPP
