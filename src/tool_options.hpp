#pragma once

#include <string>
#include <vector>

#include "code_catalog.hpp"

namespace gdd {

struct ToolOptions {
    std::string command;
    std::vector<std::string> paths;
    CodeFamily family = CodeFamily::FifteenEleven;
    std::string codes_path;
    std::string stats_path;
};

// Parses gdd_tool arguments (without the program name). Throws
// std::invalid_argument when --family, --codes or --stats has no value.
ToolOptions parseToolArgs(const std::vector<std::string>& args);

}  // namespace gdd
