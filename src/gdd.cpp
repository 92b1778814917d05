#include "gdd.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "bit_codec.hpp"
#include "errors.hpp"

namespace gdd {

namespace {

// Bits of chunk [offset, offset + count), zero-filled past the end of data.
BitVector chunkBits(const std::vector<uint8_t>& data, std::size_t offset, std::size_t count) {
    const std::size_t available = std::min(count, data.size() - offset);
    BitVector bits = bytesToBits(data, offset, available);
    for (std::size_t i = available; i < count; ++i) {
        bits = bits.concat(byteToBits(0));
    }
    return bits;
}

}  // namespace

std::size_t CompressedStream::literalCount() const {
    return static_cast<std::size_t>(std::count_if(bases.begin(), bases.end(), [](const BaseEntry& entry) {
        return std::holds_alternative<BitVector>(entry);
    }));
}

std::size_t chunkBytes(CodeFamily family) {
    return (codewordLength(family) + 1) / 8;
}

std::size_t deviationLength(CodeFamily family) {
    return codewordLength(family) - messageLength(family) + 1;
}

CompressedStream compress(const std::vector<uint8_t>& data, CodeFamily family, const CodeCatalog& catalog) {
    const LinearBlockCode& code = catalog.code(family);
    const std::size_t chunk = chunkBytes(family);

    CompressedStream out;
    out.family = family;
    out.padded = data.size() % chunk != 0;
    const std::size_t chunks = (data.size() + chunk - 1) / chunk;
    out.bases.reserve(chunks);
    out.deviations.reserve(chunks);

    // Base value -> position of its literal in out.bases.
    std::unordered_map<BitVector, std::size_t> first_seen;
    first_seen.reserve(chunks);

    for (std::size_t offset = 0; offset < data.size(); offset += chunk) {
        const BitVector bits = chunkBits(data, offset, chunk);
        const BitVector window = bits.slice(0, code.n());
        const BitVector carry = bits.slice(code.n(), bits.size() - code.n());

        auto decoded = code.decode(window);

        auto it = first_seen.find(decoded.data);
        if (it != first_seen.end()) {
            out.bases.emplace_back(BaseReference{it->second});
        } else {
            first_seen.emplace(decoded.data, out.bases.size());
            out.bases.emplace_back(decoded.data);
        }
        out.deviations.push_back(decoded.syndrome.concat(carry));
    }
    return out;
}

const BitVector& resolveBase(const CompressedStream& stream, std::size_t i) {
    if (i >= stream.bases.size()) {
        throw MalformedStream(i, "no base entry");
    }
    const BaseEntry& entry = stream.bases[i];
    if (const auto* literal = std::get_if<BitVector>(&entry)) {
        return *literal;
    }
    const std::size_t target = std::get<BaseReference>(entry).index;
    if (target >= i) {
        throw MalformedStream(i, "reference to base " + std::to_string(target) + " does not point backwards");
    }
    const auto* literal = std::get_if<BitVector>(&stream.bases[target]);
    if (literal == nullptr) {
        throw MalformedStream(i, "reference to base " + std::to_string(target) + " which is itself a reference");
    }
    return *literal;
}

std::vector<uint8_t> decompress(const CompressedStream& stream, CodeFamily family, const CodeCatalog& catalog) {
    if (stream.family != family) {
        throw MalformedStream(0, "stream was compressed with Hamming(" + familyName(stream.family) +
                                 "), not Hamming(" + familyName(family) + ")");
    }
    if (stream.bases.size() != stream.deviations.size()) {
        throw MalformedStream(std::min(stream.bases.size(), stream.deviations.size()),
                              "stream has " + std::to_string(stream.bases.size()) + " bases but " +
                              std::to_string(stream.deviations.size()) + " deviations");
    }

    const LinearBlockCode& code = catalog.code(family);
    const std::size_t chunk = chunkBytes(family);
    const std::size_t syndrome_bits = code.syndromeLength();
    const std::size_t carry_bits = chunk * 8 - code.n();

    if (stream.padded && (chunk == 1 || stream.bases.empty())) {
        throw MalformedStream(0, "padding flag set on a stream that cannot be padded");
    }

    std::vector<uint8_t> out;
    out.reserve(stream.bases.size() * chunk);
    for (std::size_t i = 0; i < stream.bases.size(); ++i) {
        const BitVector& base = resolveBase(stream, i);
        if (base.size() != code.k()) {
            throw MalformedStream(i, "base has " + std::to_string(base.size()) + " bits, expected " +
                                     std::to_string(code.k()));
        }
        const BitVector& deviation = stream.deviations[i];
        if (deviation.size() != syndrome_bits + carry_bits) {
            throw MalformedStream(i, "deviation has " + std::to_string(deviation.size()) + " bits, expected " +
                                     std::to_string(syndrome_bits + carry_bits));
        }

        // Re-encoding gives the nearest codeword; replaying the recorded
        // syndrome on it restores the original window.
        BitVector window;
        try {
            window = code.correct(code.encode(base), deviation.slice(0, syndrome_bits));
        } catch (const UncorrectableSyndrome& e) {
            throw MalformedStream(i, e.what());
        }
        appendBytes(window.concat(deviation.slice(syndrome_bits, carry_bits)), out);
    }

    if (stream.padded) {
        if (out.back() != 0) {
            throw MalformedStream(stream.bases.size() - 1, "padding byte is not zero");
        }
        out.pop_back();
    }
    return out;
}

std::vector<uint8_t> decompress(const CompressedStream& stream, const CodeCatalog& catalog) {
    return decompress(stream, stream.family, catalog);
}

}  // namespace gdd
