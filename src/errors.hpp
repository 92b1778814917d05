#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gdd {

class CodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Vector/matrix shapes do not agree.
class DimensionError : public CodeError {
public:
    using CodeError::CodeError;
};

// Message, codeword, syndrome or byte width does not match the code.
class InvalidLength : public CodeError {
public:
    using CodeError::CodeError;
};

class UnsupportedCodeLength : public CodeError {
public:
    using CodeError::CodeError;
};

// Syndrome equals no parity-check column: a malformed table or a
// multi-bit error the code cannot locate.
class UncorrectableSyndrome : public CodeError {
public:
    using CodeError::CodeError;
};

class InvalidCodeDefinition : public CodeError {
public:
    using CodeError::CodeError;
};

class MalformedStream : public CodeError {
public:
    MalformedStream(std::size_t chunk_index, const std::string& what)
        : CodeError("Chunk " + std::to_string(chunk_index) + ": " + what),
          chunk_index_(chunk_index) {}

    std::size_t chunkIndex() const { return chunk_index_; }

private:
    std::size_t chunk_index_;
};

}  // namespace gdd
