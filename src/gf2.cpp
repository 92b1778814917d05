#include "gf2.hpp"

#include <utility>

#include "errors.hpp"

namespace gdd {
namespace gf2 {

Matrix::Matrix(std::vector<BitVector> rows) : rows_(std::move(rows)) {
    if (rows_.empty()) {
        return;
    }
    cols_ = rows_.front().size();
    for (std::size_t r = 0; r < rows_.size(); ++r) {
        if (rows_[r].size() != cols_) {
            throw DimensionError("Ragged matrix: row " + std::to_string(r) + " has " +
                                 std::to_string(rows_[r].size()) + " columns, expected " +
                                 std::to_string(cols_));
        }
    }
}

Matrix Matrix::fromStrings(const std::vector<std::string>& rows) {
    std::vector<BitVector> parsed;
    parsed.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() > BitVector::MAX_BITS) {
            throw DimensionError("Matrix row wider than " + std::to_string(BitVector::MAX_BITS) + " bits");
        }
        parsed.push_back(BitVector::fromString(row));
    }
    return Matrix(std::move(parsed));
}

const BitVector& Matrix::row(std::size_t r) const {
    if (r >= rows_.size()) {
        throw std::out_of_range("Matrix row " + std::to_string(r) + " out of range");
    }
    return rows_[r];
}

BitVector Matrix::column(std::size_t c) const {
    if (c >= cols_) {
        throw std::out_of_range("Matrix column " + std::to_string(c) + " out of range");
    }
    BitVector col = BitVector::zeros(rows_.size());
    for (std::size_t r = 0; r < rows_.size(); ++r) {
        col.set(r, rows_[r].get(c));
    }
    return col;
}

bool Matrix::at(std::size_t r, std::size_t c) const {
    return row(r).get(c);
}

std::vector<std::string> Matrix::toStrings() const {
    std::vector<std::string> out;
    out.reserve(rows_.size());
    for (const auto& row : rows_) {
        out.push_back(row.toString());
    }
    return out;
}

BitVector vectorTimesMatrix(const BitVector& v, const Matrix& m) {
    if (v.size() != m.rows()) {
        throw DimensionError("Wrong dimensions! Vector length " + std::to_string(v.size()) +
                             " must be the same as matrix rows " + std::to_string(m.rows()));
    }
    BitVector result = BitVector::zeros(m.cols());
    for (std::size_t r = 0; r < m.rows(); ++r) {
        if (v.get(r)) {
            result ^= m.row(r);
        }
    }
    return result;
}

BitVector matrixTimesVector(const Matrix& m, const BitVector& v) {
    if (m.cols() != v.size()) {
        throw DimensionError("Wrong dimensions! Vector length " + std::to_string(v.size()) +
                             " must be the same as matrix columns " + std::to_string(m.cols()));
    }
    BitVector result = BitVector::zeros(m.rows());
    for (std::size_t r = 0; r < m.rows(); ++r) {
        const BitVector& row = m.row(r);
        uint64_t a = row.words[0] & v.words[0];
        uint64_t b = row.words[1] & v.words[1];
        unsigned parity = __builtin_popcountll(a) + __builtin_popcountll(b);
        if (parity & 1)
            result.set(r, true);
    }
    return result;
}

}  // namespace gf2
}  // namespace gdd
