#pragma once

#include <optional>
#include <string>
#include <vector>

namespace awx {
namespace cli {

// Parsed wrapper options; everything else belongs to aws
struct Options {
    std::optional<std::string> profile;
    std::optional<std::string> clearCache;   // "all" or a profile name
    bool showConfig = false;
    bool noInteractive = false;
    bool verbose = false;
    bool version = false;
    bool help = false;
    std::vector<std::string> awsArgs;
};

// Flag expansion: -nv becomes --no-interactive --verbose. Stops at "--" and
// at the first token that is not a wrapper option.
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args);

// Throws ConfigError on a missing option value
Options parseOptions(const std::vector<std::string>& args);

// Help system
void cmd_help();
void showVersion();

} // namespace cli
} // namespace awx
