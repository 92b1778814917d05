#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/code_loader.hpp"
#include "src/gdd.hpp"
#include "src/stream_io.hpp"
#include "src/tool_options.hpp"

namespace {

void printUsage() {
    std::cerr << "Usage:\n"
              << "  gdd_tool compress <input> <output.json> [--family 7,4|15,11] [--codes file]\n"
              << "  gdd_tool decompress <input.json> <output> [--codes file]\n"
              << "  gdd_tool verify <input> [--family 7,4|15,11] [--codes file] [--stats file]\n"
              << "  gdd_tool codes [--codes file]" << std::endl;
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Unable to open input file: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Unable to open output file: " + path);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

void printStats(const gdd::CompressionStats& stats) {
    std::cout << "Chunks: " << stats.chunks << " (" << stats.literal_bases << " literal bases, "
              << stats.references << " references)" << std::endl;
    std::cout << "Compression: " << stats.originalBits() << " -> " << stats.compressedBits() << " bits, "
              << std::fixed << std::setprecision(2) << (100.0 - 100.0 * stats.ratio())
              << " percent size reduction" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        gdd::ToolOptions opts;
        try {
            opts = gdd::parseToolArgs(std::vector<std::string>(argv + 1, argv + argc));
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            printUsage();
            return 1;
        }
        const std::size_t needed = opts.command == "codes" ? 0 : opts.command == "verify" ? 1 : 2;
        if (opts.command.empty() || opts.paths.size() != needed) {
            printUsage();
            return 1;
        }

        gdd::CodeCatalog catalog = opts.codes_path.empty() ? gdd::CodeCatalog::standard()
                                                            : gdd::loadCodeCatalog(opts.codes_path);

        if (opts.command == "codes") {
            nlohmann::json doc;
            doc["codes"][gdd::familyName(gdd::CodeFamily::SevenFour)] =
                gdd::codeToJson(catalog.code(gdd::CodeFamily::SevenFour));
            doc["codes"][gdd::familyName(gdd::CodeFamily::FifteenEleven)] =
                gdd::codeToJson(catalog.code(gdd::CodeFamily::FifteenEleven));
            std::cout << doc.dump(2) << std::endl;
        } else if (opts.command == "compress") {
            auto data = readFile(opts.paths[0]);
            std::cout << "File read: " << data.size() << " bytes" << std::endl;
            auto stream = gdd::compress(data, opts.family, catalog);
            gdd::saveStream(stream, opts.paths[1]);
            std::cout << "Compressed with Hamming(" << gdd::familyName(opts.family) << ")" << std::endl;
            printStats(gdd::computeStats(stream, data.size()));
        } else if (opts.command == "decompress") {
            auto stream = gdd::loadStream(opts.paths[0]);
            auto data = gdd::decompress(stream, catalog);
            writeFile(opts.paths[1], data);
            std::cout << "Decompressed " << stream.chunkCount() << " chunks into " << data.size() << " bytes"
                      << std::endl;
        } else if (opts.command == "verify") {
            auto data = readFile(opts.paths[0]);
            std::cout << "File read: " << data.size() << " bytes" << std::endl;
            auto stream = gdd::compress(data, opts.family, catalog);
            auto stats = gdd::computeStats(stream, data.size());
            printStats(stats);
            if (!opts.stats_path.empty()) {
                std::ofstream json_out(opts.stats_path);
                if (!json_out) {
                    std::cerr << "Warning: unable to write statistics to '" << opts.stats_path << "'" << std::endl;
                } else {
                    json_out << gdd::statsToJson(stats).dump(2) << '\n';
                }
            }
            if (gdd::decompress(stream, opts.family, catalog) != data) {
                std::cerr << "Error: decompressed data differs from the input" << std::endl;
                return 1;
            }
            std::cout << "Decompression correct!" << std::endl;
        } else {
            printUsage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
