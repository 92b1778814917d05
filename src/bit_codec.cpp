#include "bit_codec.hpp"

#include <string>

#include "errors.hpp"

namespace gdd {

BitVector byteToBits(uint8_t byte) {
    BitVector bits = BitVector::zeros(8);
    for (std::size_t i = 0; i < 8; ++i) {
        bits.set(i, (byte >> (7 - i)) & 1u);
    }
    return bits;
}

uint8_t bitsToByte(const BitVector& bits) {
    if (bits.size() != 8) {
        throw InvalidLength("A byte needs exactly 8 bits, got " + std::to_string(bits.size()));
    }
    uint8_t byte = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        if (bits.get(i)) {
            byte |= static_cast<uint8_t>(1u << (7 - i));
        }
    }
    return byte;
}

BitVector bytesToBits(const std::vector<uint8_t>& bytes, std::size_t offset, std::size_t count) {
    if (offset > bytes.size() || count > bytes.size() - offset) {
        throw std::out_of_range("Byte range out of bounds");
    }
    BitVector bits;
    for (std::size_t i = 0; i < count; ++i) {
        bits = bits.concat(byteToBits(bytes[offset + i]));
    }
    return bits;
}

void appendBytes(const BitVector& bits, std::vector<uint8_t>& out) {
    if (bits.size() % 8 != 0) {
        throw InvalidLength("Bit count " + std::to_string(bits.size()) + " is not a whole number of bytes");
    }
    for (std::size_t i = 0; i < bits.size(); i += 8) {
        out.push_back(bitsToByte(bits.slice(i, 8)));
    }
}

}  // namespace gdd
