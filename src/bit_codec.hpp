#pragma once

#include <cstdint>
#include <vector>

#include "BitVector.hpp"

namespace gdd {

// 8-bit MSB-first representation: bit 0 of the vector is bit 7 of the byte.
BitVector byteToBits(uint8_t byte);

// Inverse of byteToBits. Throws InvalidLength unless bits.size() == 8.
uint8_t bitsToByte(const BitVector& bits);

// Concatenated MSB-first bits of bytes[offset, offset + count).
BitVector bytesToBits(const std::vector<uint8_t>& bytes, std::size_t offset, std::size_t count);

// Splits a multiple-of-8 vector back into bytes, appending them to out.
void appendBytes(const BitVector& bits, std::vector<uint8_t>& out);

}  // namespace gdd
