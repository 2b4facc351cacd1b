#ifndef ARGROUTE_COMMAND_HPP
#define ARGROUTE_COMMAND_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "option.hpp"
#include "parameter.hpp"

namespace argroute {

struct BoundCommand;
class Command;
class CommandGroup;

// A node of the command tree. Closed: the router matches it exhaustively.
using Routable = std::variant<Command, CommandGroup>;

class Command {
public:
    // Empty optional on success.
    using Action = std::function<std::optional<ProcessError>(const BoundCommand&)>;

    explicit Command(std::string name, std::string shortDesc = {}, std::string longDesc = {});

    Command& withOption(Option option) {
        options_.push_back(std::move(option));
        return *this;
    }

    Command& withFlag(std::vector<std::string> names, std::string description) {
        return withOption(Option::flag(std::move(names), std::move(description)));
    }

    Command& withKey(std::vector<std::string> names,
                     ValueType type,
                     std::string description,
                     std::string valueName = "value") {
        return withOption(Option::key(std::move(names), type, std::move(description), std::move(valueName)));
    }

    Command& withOptionGroup(OptionGroup group) {
        optionGroups_.push_back(std::move(group));
        return *this;
    }

    // Throws ConfigurationError when the slot breaks Required*, Optional*, Variadic? ordering.
    Command& withParameter(Parameter slot) {
        signature_.add(std::move(slot));
        return *this;
    }

    Command& withSignature(ParameterSignature signature) {
        signature_ = std::move(signature);
        return *this;
    }

    Command& addAlias(std::string alias) {
        aliases_.push_back(std::move(alias));
        return *this;
    }

    // Every remaining token is positional; the option recognizer is skipped.
    Command& disableOptionParsing(bool v = true) {
        disableOptionParsing_ = v;
        return *this;
    }

    Command& action(Action action) {
        action_ = std::move(action);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& shortDescription() const { return short_; }
    [[nodiscard]] const std::string& longDescription() const { return long_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::vector<Option>& options() const { return options_; }
    [[nodiscard]] const std::vector<OptionGroup>& optionGroups() const { return optionGroups_; }
    [[nodiscard]] const ParameterSignature& signature() const { return signature_; }
    [[nodiscard]] bool optionParsingDisabled() const { return disableOptionParsing_; }
    [[nodiscard]] const Action& action() const { return action_; }

private:
    std::string name_;
    std::string short_;
    std::string long_;
    std::vector<std::string> aliases_;
    std::vector<Option> options_;
    std::vector<OptionGroup> optionGroups_;
    ParameterSignature signature_;
    bool disableOptionParsing_{false};
    Action action_;
};

class CommandGroup {
public:
    explicit CommandGroup(std::string name, std::string shortDesc = {});
    ~CommandGroup();

    CommandGroup(CommandGroup&&) noexcept;
    CommandGroup& operator=(CommandGroup&&) noexcept;
    CommandGroup(const CommandGroup&) = delete;
    CommandGroup& operator=(const CommandGroup&) = delete;

    // Both throw ConfigurationError when a child with the same name or alias already exists.
    CommandGroup& addCommand(Command cmd);
    CommandGroup& addGroup(CommandGroup group);

    // Inherited by every descendant command.
    CommandGroup& withSharedOption(Option option) {
        sharedOptions_.push_back(std::move(option));
        return *this;
    }

    CommandGroup& withSharedFlag(std::vector<std::string> names, std::string description) {
        return withSharedOption(Option::flag(std::move(names), std::move(description)));
    }

    CommandGroup& withSharedKey(std::vector<std::string> names,
                                ValueType type,
                                std::string description,
                                std::string valueName = "value") {
        return withSharedOption(Option::key(std::move(names), type, std::move(description), std::move(valueName)));
    }

    CommandGroup& addAlias(std::string alias) {
        aliases_.push_back(std::move(alias));
        return *this;
    }

    CommandGroup& shortDescription(std::string desc) {
        short_ = std::move(desc);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& shortDescription() const { return short_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::vector<Option>& sharedOptions() const { return sharedOptions_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Routable>>& children() const { return children_; }

    // Exact, case-sensitive: primary names first, then alternate names.
    [[nodiscard]] const Routable* findChild(const std::string& name) const;

    [[nodiscard]] bool hasChild(const std::string& name) const { return findChild(name) != nullptr; }

private:
    void adopt(std::unique_ptr<Routable> child);

    std::string name_;
    std::string short_;
    std::vector<std::string> aliases_;
    std::vector<Option> sharedOptions_;
    std::vector<std::unique_ptr<Routable>> children_;
};

[[nodiscard]] const std::string& nameOf(const Routable& r);
[[nodiscard]] const std::string& descriptionOf(const Routable& r);
[[nodiscard]] const std::vector<std::string>& aliasesOf(const Routable& r);

// Alternate invocation name -> canonical name, substituted once per routing step.
class AliasTable {
public:
    AliasTable() = default;

    // -h -> help, -v -> version
    static AliasTable withDefaults();

    AliasTable& set(std::string alias, std::string target) {
        entries_[std::move(alias)] = std::move(target);
        return *this;
    }

    AliasTable& remove(const std::string& alias) {
        entries_.erase(alias);
        return *this;
    }

    AliasTable& clear() {
        entries_.clear();
        return *this;
    }

    // The target of `token`, or `token` itself. Never follows a second hop.
    [[nodiscard]] const std::string& resolve(const std::string& token) const {
        const auto it = entries_.find(token);
        if (it == entries_.end()) return token;
        return it->second;
    }

    [[nodiscard]] bool contains(const std::string& alias) const { return entries_.find(alias) != entries_.end(); }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& entries() const { return entries_; }

private:
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace argroute

#endif // ARGROUTE_COMMAND_HPP
