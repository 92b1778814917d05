#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "BitVector.hpp"
#include "code_catalog.hpp"

namespace gdd {

// Index of an earlier literal in CompressedStream::bases.
struct BaseReference {
    std::size_t index = 0;

    friend bool operator==(const BaseReference& a, const BaseReference& b) { return a.index == b.index; }
    friend bool operator!=(const BaseReference& a, const BaseReference& b) { return a.index != b.index; }
};

using BaseEntry = std::variant<BitVector, BaseReference>;

// Output of compress(). bases[i] and deviations[i] both come from input
// chunk i. A deviation is the block syndrome followed by the carry-over bit.
struct CompressedStream {
    CodeFamily family = CodeFamily::SevenFour;
    std::vector<BaseEntry> bases;
    std::vector<BitVector> deviations;
    bool padded = false;  // one zero byte was appended to the input

    std::size_t chunkCount() const { return bases.size(); }
    std::size_t literalCount() const;
    std::size_t referenceCount() const { return bases.size() - literalCount(); }

    friend bool operator==(const CompressedStream& a, const CompressedStream& b) {
        return a.family == b.family && a.padded == b.padded && a.bases == b.bases &&
               a.deviations == b.deviations;
    }
};

// Input bytes consumed per block: n data bits plus one carry-over bit.
std::size_t chunkBytes(CodeFamily family);
std::size_t deviationLength(CodeFamily family);

CompressedStream compress(const std::vector<uint8_t>& data, CodeFamily family,
                          const CodeCatalog& catalog = CodeCatalog::standard());

// Throws MalformedStream, carrying the chunk index, if the stream is
// inconsistent or was produced for another family.
std::vector<uint8_t> decompress(const CompressedStream& stream, CodeFamily family,
                                const CodeCatalog& catalog = CodeCatalog::standard());
std::vector<uint8_t> decompress(const CompressedStream& stream,
                                const CodeCatalog& catalog = CodeCatalog::standard());

// Literal base of entry i, following at most one reference.
const BitVector& resolveBase(const CompressedStream& stream, std::size_t i);

}  // namespace gdd
