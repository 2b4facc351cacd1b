#ifndef ARGROUTE_HELP_HPP
#define ARGROUTE_HELP_HPP

#include <cstddef>
#include <string>

#include "errors.hpp"
#include "option_registry.hpp"
#include "router.hpp"

namespace argroute {

// Turns pipeline outcomes into user-facing text. The pipeline itself never formats messages;
// the orchestrator hands every outcome to one of these.
class HelpMessageGenerator {
public:
    virtual ~HelpMessageGenerator() = default;

    // Lists the children of path.deepest().
    [[nodiscard]] virtual std::string commandList(const GroupPath& path) const = 0;
    [[nodiscard]] virtual std::string usage(const CommandPath& path) const = 0;
    [[nodiscard]] virtual std::string unknownCommand(const GroupPath& path, const std::string& token) const = 0;
    [[nodiscard]] virtual std::string misusedOptions(const CommandPath& path, const OptionError& error) const = 0;
    [[nodiscard]] virtual std::string parameterMismatch(const CommandPath& path, const ParameterError& error) const = 0;
};

class DefaultHelpMessageGenerator : public HelpMessageGenerator {
public:
    struct Options {
        bool suggestions{true};
        std::size_t suggestionsMaxDistance{2};
    };

    DefaultHelpMessageGenerator() = default;
    explicit DefaultHelpMessageGenerator(Options options) : options_(options) {}

    [[nodiscard]] std::string commandList(const GroupPath& path) const override;
    [[nodiscard]] std::string usage(const CommandPath& path) const override;
    [[nodiscard]] std::string unknownCommand(const GroupPath& path, const std::string& token) const override;
    [[nodiscard]] std::string misusedOptions(const CommandPath& path, const OptionError& error) const override;
    [[nodiscard]] std::string parameterMismatch(const CommandPath& path, const ParameterError& error) const override;

    // "Unrecognized option: --nmae", "Expected a value to follow: --name", ...
    [[nodiscard]] static std::string describe(const OptionError& error);
    [[nodiscard]] static std::string describe(const ParameterError& error);

    // "Usage: app test unit <name> [<greeting>] [options]"
    [[nodiscard]] static std::string usageLine(const CommandPath& path);

private:
    Options options_;
};

} // namespace argroute

#endif // ARGROUTE_HELP_HPP
