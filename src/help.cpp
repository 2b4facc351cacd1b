#include "argroute/help.hpp"

#include <sstream>
#include <variant>
#include <vector>

#include "argroute/utils.hpp"

namespace argroute {

namespace {

std::string plural(std::size_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

void appendSuggestions(std::ostringstream& oss, const std::vector<std::string>& suggestions) {
    if (suggestions.empty()) return;
    oss << "\n\nDid you mean this?\n";
    for (const auto& s : suggestions) oss << "  " << s << "\n";
}

} // namespace

std::string DefaultHelpMessageGenerator::commandList(const GroupPath& path) const {
    const auto& group = path.deepest();

    std::vector<const Routable*> groups;
    std::vector<const Routable*> commands;
    for (const auto& child : group.children()) {
        if (std::holds_alternative<CommandGroup>(*child)) {
            groups.push_back(child.get());
        } else {
            commands.push_back(child.get());
        }
    }

    std::ostringstream oss;
    oss << "Usage: " << path.joinedNames() << " <command> [options]\n";
    if (!group.shortDescription().empty()) oss << "\n" << group.shortDescription() << "\n";
    if (!groups.empty()) {
        oss << "\nGroups:\n";
        for (const auto* g : groups) oss << "  " << nameOf(*g) << " - " << descriptionOf(*g) << "\n";
    }
    if (!commands.empty()) {
        oss << "\nCommands:\n";
        for (const auto* c : commands) oss << "  " << nameOf(*c) << " - " << descriptionOf(*c) << "\n";
    }
    return oss.str();
}

std::string DefaultHelpMessageGenerator::usageLine(const CommandPath& path) {
    std::string line = "Usage: " + path.joinedNames();
    const auto params = path.command().signature().usage();
    if (!params.empty()) line += " " + params;
    if (!path.visibleOptions().empty()) line += " [options]";
    return line;
}

std::string DefaultHelpMessageGenerator::usage(const CommandPath& path) const {
    const auto& cmd = path.command();

    std::ostringstream oss;
    oss << usageLine(path) << "\n";
    const auto& desc = cmd.longDescription().empty() ? cmd.shortDescription() : cmd.longDescription();
    if (!desc.empty()) oss << "\n" << desc << "\n";

    const auto visible = path.visibleOptions();
    const std::size_t own = cmd.options().size();
    if (own > 0) {
        oss << "\nOptions:\n";
        for (std::size_t i = 0; i < own; ++i) {
            oss << "  " << visible[i]->signature() << " - " << visible[i]->description() << "\n";
        }
    }
    if (visible.size() > own) {
        oss << "\nGlobal Options:\n";
        for (std::size_t i = own; i < visible.size(); ++i) {
            oss << "  " << visible[i]->signature() << " - " << visible[i]->description() << "\n";
        }
    }
    return oss.str();
}

std::string DefaultHelpMessageGenerator::unknownCommand(const GroupPath& path, const std::string& token) const {
    std::ostringstream oss;
    oss << "Command \"" << token << "\" not found";
    if (options_.suggestions) {
        std::vector<std::string> names;
        for (const auto& child : path.deepest().children()) names.push_back(nameOf(*child));
        appendSuggestions(oss, utils::suggest(token, names, options_.suggestionsMaxDistance));
    }
    return oss.str();
}

std::string DefaultHelpMessageGenerator::misusedOptions(const CommandPath& path, const OptionError& error) const {
    std::ostringstream oss;
    oss << describe(error);
    std::vector<std::string> suggestions;
    if (options_.suggestions && error.kind == OptionError::Kind::UnrecognizedOption) {
        const OptionRegistry registry(path);
        suggestions = utils::suggest(error.option, registry.spellings(), options_.suggestionsMaxDistance);
    }
    if (suggestions.empty()) {
        oss << "\n";
    } else {
        appendSuggestions(oss, suggestions);
    }
    oss << "\n" << usage(path);
    return oss.str();
}

std::string DefaultHelpMessageGenerator::parameterMismatch(const CommandPath& path, const ParameterError& error) const {
    return describe(error) + "\n" + usageLine(path);
}

std::string DefaultHelpMessageGenerator::describe(const OptionError& error) {
    switch (error.kind) {
        case OptionError::Kind::UnrecognizedOption:
            return "Unrecognized option: " + error.option;
        case OptionError::Kind::ExpectedValue:
            return "Expected a value to follow: " + error.option;
        case OptionError::Kind::InvalidValue:
            return "Invalid value \"" + error.value + "\" for " + error.option + ": expected " +
                   std::string(typeName(error.expected));
        case OptionError::Kind::UnsatisfiedGroup: {
            if (!error.group) return "Options are not used together correctly";
            const auto names = utils::join(error.group->spellings(), ", ");
            switch (error.group->restriction()) {
                case OptionGroup::Restriction::AtMostOne:
                    return "Only one of the following options may be passed: " + names;
                case OptionGroup::Restriction::AtLeastOne:
                    return "At least one of the following options must be passed: " + names;
                case OptionGroup::Restriction::ExactlyOne:
                    return "Exactly one of the following options must be passed: " + names;
            }
            return "Options are not used together correctly: " + names;
        }
    }
    return "Options are not used correctly";
}

std::string DefaultHelpMessageGenerator::describe(const ParameterError& error) {
    std::string expected;
    if (!error.maximum) {
        expected = "at least " + plural(error.minimum, "argument");
    } else if (*error.maximum == error.minimum) {
        expected = plural(error.minimum, "argument");
    } else {
        expected = "between " + std::to_string(error.minimum) + " and " + plural(*error.maximum, "argument");
    }
    return "Expected " + expected + ", but got " + std::to_string(error.given) + ".";
}

} // namespace argroute
