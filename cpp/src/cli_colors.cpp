#include "pngstash/cli_colors.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/env.hpp"

#include <unistd.h>

#include <cstdio>

namespace pngstash::cli {

namespace {
    bool g_forced = false;
    bool g_forced_value = true;
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced) {
        return g_forced_value;
    }
    if (env::IsEnabled(constants::kEnvNoColor)) {
        return false;
    }
    // Auto-detect: only color a terminal
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_forced = true;
    g_forced_value = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace pngstash::cli
