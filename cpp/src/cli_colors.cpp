#include "aether/cli_colors.hpp"

#include "aether/env.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace aether::cli {

namespace {
    bool g_forced = false;
    bool g_forced_value = true;
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced) {
        return g_forced_value;
    }
    if (aether::env::IsEnabled("AETHER_NO_COLOR")) {
        return false;
    }
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return isatty(fileno(stderr)) != 0;
    }
    // Files and string streams never get escape codes.
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

}  // namespace aether::cli
