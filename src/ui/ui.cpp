#include "ui/ui.hpp"
#include <cstdlib>
#ifdef __unix__
#include <unistd.h>
#endif

namespace awx {
namespace ui {

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string DIM = "\033[2m";

    const std::string BRIGHT_RED = "\033[91m";
    const std::string BRIGHT_GREEN = "\033[92m";
    const std::string BRIGHT_YELLOW = "\033[93m";
    const std::string BRIGHT_BLUE = "\033[94m";
    const std::string BRIGHT_CYAN = "\033[96m";
    const std::string BRIGHT_WHITE = "\033[97m";
}

bool isColorSupported() {
    if (std::getenv("NO_COLOR")) return false;
#ifdef __unix__
    const char* term = std::getenv("TERM");
    if (!term) return false;
    std::string termStr(term);
    return termStr != "dumb" && isatty(STDERR_FILENO);
#else
    return false;
#endif
}

std::string colorize(const std::string& text, const std::string& color) {
    if (color.empty() || !isColorSupported()) return text;
    return color + text + Colors::RESET;
}

} // namespace ui
} // namespace awx
