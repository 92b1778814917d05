#include "stream_io.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "errors.hpp"

namespace gdd {

namespace {

BitVector parseEntry(const nlohmann::json& value, std::size_t width, std::size_t index, const char* what) {
    if (!value.is_string()) {
        throw MalformedStream(index, std::string(what) + " is not a bit string");
    }
    const auto bits = value.get<std::string>();
    if (bits.size() != width || bits.find_first_not_of("01") != std::string::npos) {
        throw MalformedStream(index, std::string(what) + " '" + bits + "' is not a " + std::to_string(width) +
                                     "-bit string");
    }
    return BitVector::fromString(bits);
}

std::size_t indexWidth(std::size_t entries) {
    std::size_t bits = 1;
    while (bits < 64 && (std::size_t{1} << bits) < entries) {
        ++bits;
    }
    return bits;
}

}  // namespace

nlohmann::json streamToJson(const CompressedStream& stream) {
    nlohmann::json doc;
    doc["family"] = familyName(stream.family);
    doc["padded"] = stream.padded;
    auto bases = nlohmann::json::array();
    for (const auto& entry : stream.bases) {
        if (const auto* literal = std::get_if<BitVector>(&entry)) {
            bases.push_back(literal->toString());
        } else {
            bases.push_back(nlohmann::json{{"ref", std::get<BaseReference>(entry).index}});
        }
    }
    doc["bases"] = std::move(bases);
    auto deviations = nlohmann::json::array();
    for (const auto& deviation : stream.deviations) {
        deviations.push_back(deviation.toString());
    }
    doc["deviations"] = std::move(deviations);
    return doc;
}

CompressedStream streamFromJson(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("family") || !doc.contains("bases") || !doc.contains("deviations")) {
        throw std::runtime_error("Compressed stream needs 'family', 'bases' and 'deviations'");
    }
    const auto& bases = doc.at("bases");
    const auto& deviations = doc.at("deviations");
    if (!doc.at("family").is_string() || !bases.is_array() || !deviations.is_array() ||
        (doc.contains("padded") && !doc.at("padded").is_boolean())) {
        throw std::runtime_error("Compressed stream has fields of the wrong type");
    }

    CompressedStream stream;
    stream.family = parseFamily(doc.at("family").get<std::string>());
    stream.padded = doc.value("padded", false);

    const std::size_t base_width = messageLength(stream.family);
    const std::size_t deviation_width = deviationLength(stream.family);

    stream.bases.reserve(bases.size());
    for (std::size_t i = 0; i < bases.size(); ++i) {
        const auto& entry = bases[i];
        if (entry.is_object()) {
            if (!entry.contains("ref") || !entry.at("ref").is_number_integer() ||
                entry.at("ref").get<long long>() < 0) {
                throw MalformedStream(i, "reference entry needs a non-negative 'ref'");
            }
            stream.bases.emplace_back(BaseReference{entry.at("ref").get<std::size_t>()});
        } else {
            stream.bases.emplace_back(parseEntry(entry, base_width, i, "base"));
        }
    }
    stream.deviations.reserve(deviations.size());
    for (std::size_t i = 0; i < deviations.size(); ++i) {
        stream.deviations.push_back(parseEntry(deviations[i], deviation_width, i, "deviation"));
    }
    return stream;
}

void saveStream(const CompressedStream& stream, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Unable to open output file: " + path);
    }
    out << streamToJson(stream).dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

CompressedStream loadStream(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Unable to open compressed stream: " + path);
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse compressed stream '" + path + "': " + e.what());
    }
    try {
        return streamFromJson(doc);
    } catch (const CodeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid compressed stream '" + path + "': " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid compressed stream '" + path + "': " + e.what());
    }
}

double CompressionStats::ratio() const {
    if (input_bytes == 0) {
        return 0.0;
    }
    return static_cast<double>(compressedBits()) / static_cast<double>(originalBits());
}

CompressionStats computeStats(const CompressedStream& stream, std::size_t input_bytes) {
    CompressionStats stats;
    stats.input_bytes = input_bytes;
    stats.chunks = stream.chunkCount();
    stats.literal_bases = stream.literalCount();
    stats.references = stream.referenceCount();
    stats.base_bits = stats.literal_bases * messageLength(stream.family) + stats.chunks;
    stats.reference_bits = stats.references * indexWidth(stats.chunks);
    stats.deviation_bits = stream.deviations.size() * deviationLength(stream.family);
    return stats;
}

nlohmann::json statsToJson(const CompressionStats& stats) {
    return {
        {"input_bytes", stats.input_bytes},
        {"chunks", stats.chunks},
        {"literal_bases", stats.literal_bases},
        {"references", stats.references},
        {"original_bits", stats.originalBits()},
        {"compressed_bits", stats.compressedBits()},
        {"base_bits", stats.base_bits},
        {"reference_bits", stats.reference_bits},
        {"deviation_bits", stats.deviation_bits},
        {"ratio", stats.ratio()}
    };
}

}  // namespace gdd
