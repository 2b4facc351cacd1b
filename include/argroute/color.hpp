#ifndef ARGROUTE_COLOR_HPP
#define ARGROUTE_COLOR_HPP

#include <string>
#include <string_view>

namespace argroute {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

namespace color {

enum class Stream {
    Stdout,
    Stderr,
    // An injected stream (std::ostringstream, a file). Never a terminal.
    Other,
};

// Returns true if the underlying stream is a terminal.
bool isTty(Stream stream);

// Auto colors only a terminal, and never when NO_COLOR is set or TERM=dumb.
bool enabled(ColorMode mode, Stream stream);

// Bold red.
std::string error(std::string_view text);

} // namespace color
} // namespace argroute

#endif // ARGROUTE_COLOR_HPP
