#ifndef ARGROUTE_CLI_HPP
#define ARGROUTE_CLI_HPP

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "color.hpp"
#include "command.hpp"
#include "errors.hpp"
#include "help.hpp"
#include "manipulator.hpp"
#include "option_registry.hpp"
#include "parameter.hpp"
#include "router.hpp"
#include "token_stream.hpp"

namespace argroute {

// A routed command with its options and positionals bound, ready to run.
struct BoundCommand {
    CommandPath path;
    OptionValues options;
    Parameters parameters;
};

// The help flag was given: print the command's usage and exit 0.
struct UsageRequest {
    CommandPath path;
};

struct MisusedOptions {
    CommandPath path;
    OptionError error;
};

struct ParameterMismatch {
    CommandPath path;
    ParameterError error;
};

using Interpretation = std::variant<BoundCommand, UsageRequest, RoutingFailure, MisusedOptions, ParameterMismatch>;

class Cli {
public:
    struct Settings {
        // -abc -> -a -b -c
        bool shortFlagSplitting{true};
        bool helpFlag{true};
        bool helpCommand{true};
        ColorMode color{ColorMode::Auto};
        bool suggestions{true};
        std::size_t suggestionsMaxDistance{2};
    };

    // The version command exists only when `version` is non-empty.
    explicit Cli(std::string name, std::string version = {}, std::string description = {});

    // Built-in actions capture `this`.
    Cli(const Cli&) = delete;
    Cli& operator=(const Cli&) = delete;
    Cli(Cli&&) = delete;
    Cli& operator=(Cli&&) = delete;

    // All configuration calls throw ConfigurationError once the Cli is finalized.
    Cli& settings(Settings settings);
    Cli& addCommand(Command cmd);
    Cli& addGroup(CommandGroup group);
    Cli& withGlobalOption(Option option);
    Cli& withGlobalFlag(std::vector<std::string> names, std::string description) {
        return withGlobalOption(Option::flag(std::move(names), std::move(description)));
    }
    Cli& withGlobalKey(std::vector<std::string> names,
                       ValueType type,
                       std::string description,
                       std::string valueName = "value") {
        return withGlobalOption(Option::key(std::move(names), type, std::move(description), std::move(valueName)));
    }

    // Runs after the built-in splitters, in registration order.
    Cli& addManipulator(std::unique_ptr<StreamManipulator> manipulator);
    Cli& setHelpMessageGenerator(std::unique_ptr<HelpMessageGenerator> generator);

    // Replacement pipeline stages. A custom router is usually built over root() and aliases().
    Cli& setRouter(std::unique_ptr<Router> router);
    Cli& setOptionRecognizer(std::unique_ptr<OptionRecognizer> recognizer);
    Cli& setParameterFiller(std::unique_ptr<ParameterFiller> filler);

    Cli& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Cli& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    [[nodiscard]] AliasTable& aliases() { return aliases_; }
    [[nodiscard]] const AliasTable& aliases() const { return aliases_; }

    [[nodiscard]] const Settings& settings() const { return settings_; }
    [[nodiscard]] const std::string& name() const { return root_.name(); }
    [[nodiscard]] const std::string& version() const { return version_; }
    [[nodiscard]] const CommandGroup& root() const { return root_; }
    [[nodiscard]] bool finalized() const { return finalized_; }

    // Adds the built-ins, installs the splitters and validates the option set of every command.
    // Throws ConfigurationError. Called implicitly by interpret() and go(); runs once.
    void finalize();

    // Applies every manipulator to `stream`, in order.
    void manipulate(TokenStream& stream);

    // Route, recognize options, fill parameters. Does not manipulate the stream, print or run anything.
    [[nodiscard]] Interpretation interpret(TokenStream stream);

    // Full run: manipulate, interpret, print messages, execute the action. Returns the exit status.
    int go(std::vector<std::string> tokens);
    int go(int argc, char** argv);

private:
    void requireMutable(const char* what) const;
    void validate(const CommandGroup& group, const GroupPath& path) const;

    int run(TokenStream stream);
    std::optional<ProcessError> runHelp(const BoundCommand& bound) const;

    int execute(const BoundCommand& bound) const;
    int report(const RoutingFailure& failure) const;
    int fail(const std::string& message) const;

    std::ostream& out() const;
    std::ostream& err() const;

    CommandGroup root_;
    std::string version_;
    Settings settings_;
    AliasTable aliases_{AliasTable::withDefaults()};
    std::unique_ptr<HelpMessageGenerator> generator_;
    std::vector<std::unique_ptr<StreamManipulator>> userManipulators_;
    std::vector<std::unique_ptr<StreamManipulator>> manipulators_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<OptionRecognizer> recognizer_;
    std::unique_ptr<ParameterFiller> filler_;
    const Option* helpFlag_{nullptr};
    bool finalized_{false};

    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace argroute

#endif // ARGROUTE_CLI_HPP
