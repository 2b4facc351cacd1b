#include "argroute/color.hpp"

#include <cstdio>
#include <cstdlib>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace argroute::color {

namespace {

constexpr std::string_view kBoldRed = "\x1b[1m\x1b[31m";
constexpr std::string_view kReset = "\x1b[0m";

bool envDisablesColor() {
    // https://no-color.org/
    if (std::getenv("NO_COLOR") != nullptr) return true;
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

} // namespace

bool isTty(Stream stream) {
#if defined(_WIN32)
    switch (stream) {
        case Stream::Stdout: return _isatty(_fileno(stdout)) != 0;
        case Stream::Stderr: return _isatty(_fileno(stderr)) != 0;
        case Stream::Other: return false;
    }
#else
    switch (stream) {
        case Stream::Stdout: return ::isatty(fileno(stdout)) != 0;
        case Stream::Stderr: return ::isatty(fileno(stderr)) != 0;
        case Stream::Other: return false;
    }
#endif
    return false;
}

bool enabled(ColorMode mode, Stream stream) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: return !envDisablesColor() && isTty(stream);
    }
    return false;
}

std::string error(std::string_view text) {
    std::string out;
    out.reserve(kBoldRed.size() + text.size() + kReset.size());
    out.append(kBoldRed).append(text).append(kReset);
    return out;
}

} // namespace argroute::color
