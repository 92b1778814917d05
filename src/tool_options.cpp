#include "tool_options.hpp"

#include <stdexcept>

namespace gdd {

ToolOptions parseToolArgs(const std::vector<std::string>& args) {
    ToolOptions opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--family" || arg == "--codes" || arg == "--stats") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            const std::string& value = args[++i];
            if (arg == "--family") {
                opts.family = parseFamily(value);
            } else if (arg == "--codes") {
                opts.codes_path = value;
            } else {
                opts.stats_path = value;
            }
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.paths.push_back(arg);
        }
    }
    return opts;
}

}  // namespace gdd
