#include "argroute/cli.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace argroute {

Cli::Cli(std::string name, std::string version, std::string description)
    : root_(std::move(name), std::move(description)), version_(std::move(version)) {}

Cli& Cli::settings(Settings settings) {
    requireMutable("change settings");
    settings_ = settings;
    return *this;
}

Cli& Cli::addCommand(Command cmd) {
    requireMutable("add a command");
    root_.addCommand(std::move(cmd));
    return *this;
}

Cli& Cli::addGroup(CommandGroup group) {
    requireMutable("add a group");
    root_.addGroup(std::move(group));
    return *this;
}

Cli& Cli::withGlobalOption(Option option) {
    requireMutable("add a global option");
    root_.withSharedOption(std::move(option));
    return *this;
}

Cli& Cli::addManipulator(std::unique_ptr<StreamManipulator> manipulator) {
    requireMutable("add a manipulator");
    if (!manipulator) throw ConfigurationError("manipulator must not be null");
    userManipulators_.push_back(std::move(manipulator));
    return *this;
}

Cli& Cli::setHelpMessageGenerator(std::unique_ptr<HelpMessageGenerator> generator) {
    requireMutable("replace the help message generator");
    if (!generator) throw ConfigurationError("help message generator must not be null");
    generator_ = std::move(generator);
    return *this;
}

Cli& Cli::setRouter(std::unique_ptr<Router> router) {
    requireMutable("replace the router");
    if (!router) throw ConfigurationError("router must not be null");
    router_ = std::move(router);
    return *this;
}

Cli& Cli::setOptionRecognizer(std::unique_ptr<OptionRecognizer> recognizer) {
    requireMutable("replace the option recognizer");
    if (!recognizer) throw ConfigurationError("option recognizer must not be null");
    recognizer_ = std::move(recognizer);
    return *this;
}

Cli& Cli::setParameterFiller(std::unique_ptr<ParameterFiller> filler) {
    requireMutable("replace the parameter filler");
    if (!filler) throw ConfigurationError("parameter filler must not be null");
    filler_ = std::move(filler);
    return *this;
}

void Cli::requireMutable(const char* what) const {
    if (finalized_) throw ConfigurationError(std::string("cannot ") + what + " after \"" + name() + "\" is finalized");
}

void Cli::finalize() {
    if (finalized_) return;

    if (!generator_) {
        DefaultHelpMessageGenerator::Options opts;
        opts.suggestions = settings_.suggestions;
        opts.suggestionsMaxDistance = settings_.suggestionsMaxDistance;
        generator_ = std::make_unique<DefaultHelpMessageGenerator>(opts);
    }

    if (settings_.helpFlag && !helpFlag_) {
        root_.withSharedFlag({"-h", "--help"}, "Show help information for this command");
        helpFlag_ = &root_.sharedOptions().back();
    }

    // Built-ins never shadow a command the program registered itself.
    if (settings_.helpCommand && !root_.hasChild("help")) {
        Command help("help", "Prints help information");
        help.withParameter(Parameter::variadic("command"))
            .disableOptionParsing()
            .action([this](const BoundCommand& bound) { return runHelp(bound); });
        root_.addCommand(std::move(help));
    }
    if (!version_.empty() && !root_.hasChild("version")) {
        Command versionCmd("version", "Prints the current version of this app");
        versionCmd.action([this](const BoundCommand&) -> std::optional<ProcessError> {
            out() << "Version: " << version_ << "\n";
            return std::nullopt;
        });
        root_.addCommand(std::move(versionCmd));
    }

    validate(root_, GroupPath(root_));

    if (!router_) router_ = std::make_unique<Router>(root_, aliases_);
    if (!recognizer_) recognizer_ = std::make_unique<OptionRecognizer>(helpFlag_);
    if (!filler_) filler_ = std::make_unique<ParameterFiller>();

    manipulators_.clear();
    if (settings_.shortFlagSplitting) manipulators_.push_back(std::make_unique<ShortFlagSplitter>());
    for (auto& m : userManipulators_) manipulators_.push_back(std::move(m));
    userManipulators_.clear();

    finalized_ = true;
    spdlog::debug("cli \"{}\" finalized: {} top-level entries, {} manipulators",
                  name(),
                  root_.children().size(),
                  manipulators_.size());
}

void Cli::validate(const CommandGroup& group, const GroupPath& path) const {
    for (const auto& child : group.children()) {
        if (const auto* sub = std::get_if<CommandGroup>(child.get())) {
            validate(*sub, path.appending(*sub));
        } else {
            // Throws on a conflicting option set.
            const OptionRegistry registry(CommandPath(path, std::get<Command>(*child)));
            spdlog::trace("\"{}\" sees {} options", path.joinedNames() + " " + nameOf(*child), registry.options().size());
        }
    }
}

void Cli::manipulate(TokenStream& stream) {
    finalize();
    for (const auto& m : manipulators_) m->manipulate(stream);
}

Interpretation Cli::interpret(TokenStream stream) {
    finalize();

    auto routed = router_->route(std::move(stream));
    if (!routed.ok()) return std::move(routed.error());

    const CommandPath path = routed.value();
    const Command& cmd = path.command();
    TokenStream rest = std::move(routed.stream);

    const OptionRegistry registry(path);
    OptionValues options(registry);
    if (cmd.optionParsingDisabled()) {
        spdlog::debug("option parsing disabled for \"{}\"", path.joinedNames());
    } else {
        auto recognized = recognizer_->recognize(registry, std::move(rest));
        rest = std::move(recognized.stream);
        if (!recognized.ok()) return MisusedOptions{path, recognized.error()};
        options = std::move(recognized.value());

        if (helpFlag_ && options.isSet(*helpFlag_)) {
            spdlog::debug("help flag given for \"{}\"", path.joinedNames());
            return UsageRequest{path};
        }
    }

    auto filled = filler_->fill(cmd.signature(), std::move(rest));
    if (!filled.ok()) return ParameterMismatch{path, filled.error()};

    return BoundCommand{path, std::move(options), std::move(filled.value())};
}

int Cli::go(std::vector<std::string> tokens) { return run(TokenStream(std::move(tokens))); }

int Cli::go(int argc, char** argv) { return run(TokenStream::fromArgv(argc, argv)); }

int Cli::run(TokenStream stream) {
    manipulate(stream);
    spdlog::debug("interpreting {} tokens", stream.size());

    const auto result = interpret(std::move(stream));
    return std::visit(
        [this](const auto& r) -> int {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, BoundCommand>) {
                return execute(r);
            } else if constexpr (std::is_same_v<T, UsageRequest>) {
                out() << generator_->usage(r.path);
                return 0;
            } else if constexpr (std::is_same_v<T, RoutingFailure>) {
                return report(r);
            } else if constexpr (std::is_same_v<T, MisusedOptions>) {
                return fail(generator_->misusedOptions(r.path, r.error));
            } else {
                static_assert(std::is_same_v<T, ParameterMismatch>, "unhandled interpretation");
                return fail(generator_->parameterMismatch(r.path, r.error));
            }
        },
        result);
}

// help [<command> ...]: the command list of a group, or the usage of a command.
std::optional<ProcessError> Cli::runHelp(const BoundCommand& bound) const {
    GroupPath path(root_);
    for (const auto& word : bound.parameters.collected("command")) {
        const Routable* child = path.deepest().findChild(word);
        if (!child) return ProcessError(generator_->unknownCommand(path, word));
        if (const auto* group = std::get_if<CommandGroup>(child)) {
            path = path.appending(*group);
            continue;
        }
        out() << generator_->usage(CommandPath(path, std::get<Command>(*child)));
        return std::nullopt;
    }
    out() << generator_->commandList(path);
    return std::nullopt;
}

int Cli::execute(const BoundCommand& bound) const {
    const auto& action = bound.path.command().action();
    if (!action) {
        spdlog::debug("\"{}\" has no action", bound.path.joinedNames());
        return 0;
    }

    try {
        if (const auto error = action(bound)) {
            if (error->message) fail(*error->message);
            return error->exitStatus;
        }
        return 0;
    } catch (const std::exception& e) {
        return fail(std::string("An error occurred: ") + e.what());
    }
}

int Cli::report(const RoutingFailure& failure) const {
    if (!failure.unmatchedToken) {
        out() << generator_->commandList(failure.partialPath);
        return 1;
    }

    const auto& token = *failure.unmatchedToken;
    // `app group --help` lists the group instead of failing on the flag.
    if (helpFlag_) {
        const auto& spellings = helpFlag_->names();
        if (std::find(spellings.begin(), spellings.end(), token) != spellings.end()) {
            out() << generator_->commandList(failure.partialPath);
            return 0;
        }
    }

    fail(generator_->unknownCommand(failure.partialPath, token));
    out() << "\n" << generator_->commandList(failure.partialPath);
    return 1;
}

int Cli::fail(const std::string& message) const {
    const auto stream = err_ ? color::Stream::Other : color::Stream::Stderr;
    if (color::enabled(settings_.color, stream)) {
        err() << color::error("Error:") << " " << message;
    } else {
        err() << "Error: " << message;
    }
    if (message.empty() || message.back() != '\n') err() << "\n";
    return 1;
}

std::ostream& Cli::out() const {
    if (out_) return *out_;
    return std::cout;
}

std::ostream& Cli::err() const {
    if (err_) return *err_;
    return std::cerr;
}

} // namespace argroute
