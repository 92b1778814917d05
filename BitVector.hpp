#ifndef GDD_BITVECTOR_HPP
#define GDD_BITVECTOR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace gdd {

// Fixed-length GF(2) vector. Element 0 is the first bit of the sequence
// (the most significant one when the vector was built from a byte).
struct BitVector {
    static constexpr std::size_t MAX_BITS = 128;

    std::array<uint64_t,2> words{};
    std::size_t length = 0;

    BitVector() : words{0,0}, length(0) {}

    BitVector(std::initializer_list<int> bits) : words{0,0}, length(0) {
        if (bits.size() > MAX_BITS) {
            throw std::length_error("BitVector supports up to 128 bits");
        }
        length = bits.size();
        std::size_t pos = 0;
        for (int b : bits) {
            if (b != 0 && b != 1) {
                throw std::invalid_argument("BitVector elements must be 0 or 1");
            }
            set(pos++, b == 1);
        }
    }

    static BitVector zeros(std::size_t size) {
        if (size > MAX_BITS) {
            throw std::length_error("BitVector supports up to 128 bits");
        }
        BitVector v;
        v.length = size;
        return v;
    }

    static BitVector fromString(const std::string& bits) {
        BitVector v = zeros(bits.size());
        for (std::size_t i = 0; i < bits.size(); ++i) {
            if (bits[i] == '1') {
                v.set(i, true);
            } else if (bits[i] != '0') {
                throw std::invalid_argument("Invalid bit character in '" + bits + "'");
            }
        }
        return v;
    }

    std::size_t size() const { return length; }
    bool empty() const { return length == 0; }

    bool get(std::size_t pos) const {
        checkPosition(pos);
        return (words[pos/64] >> (pos % 64)) & 1ULL;
    }

    void set(std::size_t pos, bool value) {
        checkPosition(pos);
        if (value)
            words[pos/64] |= (1ULL << (pos % 64));
        else
            words[pos/64] &= ~(1ULL << (pos % 64));
    }

    void flip(std::size_t pos) {
        checkPosition(pos);
        words[pos/64] ^= (1ULL << (pos % 64));
    }

    void push_back(bool value) {
        if (length >= MAX_BITS) {
            throw std::length_error("BitVector supports up to 128 bits");
        }
        ++length;
        set(length - 1, value);
    }

    bool isZero() const {
        return words[0] == 0 && words[1] == 0;
    }

    int countOnes() const {
        return __builtin_popcountll(words[0]) + __builtin_popcountll(words[1]);
    }

    // Bits [begin, begin + count).
    BitVector slice(std::size_t begin, std::size_t count) const {
        if (begin > length || count > length - begin) {
            throw std::out_of_range("BitVector slice out of range");
        }
        BitVector out = zeros(count);
        for (std::size_t i = 0; i < count; ++i) {
            out.set(i, get(begin + i));
        }
        return out;
    }

    BitVector concat(const BitVector& tail) const {
        if (length + tail.length > MAX_BITS) {
            throw std::length_error("BitVector supports up to 128 bits");
        }
        BitVector out = *this;
        for (std::size_t i = 0; i < tail.length; ++i) {
            out.push_back(tail.get(i));
        }
        return out;
    }

    std::string toString() const {
        std::string s;
        s.reserve(length);
        for (std::size_t i = 0; i < length; ++i) {
            s += get(i) ? '1' : '0';
        }
        return s;
    }

    // Callers check lengths; the unused high bits are always zero.
    BitVector& operator^=(const BitVector& other) {
        words[0] ^= other.words[0];
        words[1] ^= other.words[1];
        return *this;
    }

    friend bool operator==(const BitVector& a, const BitVector& b) {
        return a.length == b.length && a.words == b.words;
    }

    friend bool operator!=(const BitVector& a, const BitVector& b) {
        return !(a == b);
    }

private:
    void checkPosition(std::size_t pos) const {
        if (pos >= length) {
            throw std::out_of_range("Invalid bit position " + std::to_string(pos) +
                                    " for BitVector of length " + std::to_string(length));
        }
    }
};

}  // namespace gdd

namespace std {
template <>
struct hash<gdd::BitVector> {
    std::size_t operator()(const gdd::BitVector& v) const noexcept {
        std::size_t h = std::hash<uint64_t>{}(v.words[0]);
        h ^= std::hash<uint64_t>{}(v.words[1]) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::size_t>{}(v.length) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
}  // namespace std

#endif // GDD_BITVECTOR_HPP
