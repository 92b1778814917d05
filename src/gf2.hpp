#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "BitVector.hpp"

namespace gdd {
namespace gf2 {

inline bool add(bool a, bool b) { return a != b; }
inline bool mul(bool a, bool b) { return a && b; }

// Dense row-major matrix over GF(2). Every row is a BitVector of cols() bits.
class Matrix {
public:
    Matrix() = default;
    explicit Matrix(std::vector<BitVector> rows);

    // Rows written as "0"/"1" strings, e.g. {"1000101", "0100111"}.
    static Matrix fromStrings(const std::vector<std::string>& rows);

    std::size_t rows() const { return rows_.size(); }
    std::size_t cols() const { return cols_; }

    const BitVector& row(std::size_t r) const;
    BitVector column(std::size_t c) const;
    bool at(std::size_t r, std::size_t c) const;

    std::vector<std::string> toStrings() const;

    friend bool operator==(const Matrix& a, const Matrix& b) {
        return a.cols_ == b.cols_ && a.rows_ == b.rows_;
    }

private:
    std::vector<BitVector> rows_;
    std::size_t cols_ = 0;
};

// v * M: XOR of the rows of M selected by the 1-bits of v.
BitVector vectorTimesMatrix(const BitVector& v, const Matrix& m);

// M * v: mod-2 dot product of every row of M with v.
BitVector matrixTimesVector(const Matrix& m, const BitVector& v);

}  // namespace gf2
}  // namespace gdd
