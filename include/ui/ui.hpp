#pragma once

#include <string>

namespace awx {
namespace ui {

// Colors namespace
namespace Colors {
    extern const std::string RESET;
    extern const std::string BOLD;
    extern const std::string DIM;

    extern const std::string BRIGHT_RED;
    extern const std::string BRIGHT_GREEN;
    extern const std::string BRIGHT_YELLOW;
    extern const std::string BRIGHT_BLUE;
    extern const std::string BRIGHT_CYAN;
    extern const std::string BRIGHT_WHITE;
}

// Color support functions. Wrapper messages go to stderr, so color support
// follows stderr, not stdout.
bool isColorSupported();
std::string colorize(const std::string& text, const std::string& color);

} // namespace ui
} // namespace awx
