#ifndef ARGROUTE_ERRORS_HPP
#define ARGROUTE_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace argroute {

// Thrown while commands, options and signatures are being registered or finalized.
// It is a mistake in the integrating program, never a user error, so it is not routed
// through the rendering collaborators.
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct ParameterError {
    enum class Kind {
        NotEnoughArguments,
        TooManyArguments,
    };

    Kind kind{Kind::NotEnoughArguments};
    std::size_t minimum{0};
    // Absent when the signature ends in a variadic slot.
    std::optional<std::size_t> maximum;
    std::size_t given{0};
};

// Returned by a command action to fail the invocation.
struct ProcessError {
    std::optional<std::string> message;
    int exitStatus{1};

    ProcessError() = default;
    explicit ProcessError(std::string msg, int status = 1) : message(std::move(msg)), exitStatus(status) {}
    explicit ProcessError(int status) : exitStatus(status) {}
};

} // namespace argroute

#endif // ARGROUTE_ERRORS_HPP
