#include "argroute/command.hpp"

#include <type_traits>

namespace argroute {

Command::Command(std::string name, std::string shortDesc, std::string longDesc)
    : name_(std::move(name)), short_(std::move(shortDesc)), long_(std::move(longDesc)) {
    if (name_.empty()) throw ConfigurationError("command declared without a name");
}

CommandGroup::CommandGroup(std::string name, std::string shortDesc)
    : name_(std::move(name)), short_(std::move(shortDesc)) {
    if (name_.empty()) throw ConfigurationError("command group declared without a name");
}

CommandGroup::~CommandGroup() = default;
CommandGroup::CommandGroup(CommandGroup&&) noexcept = default;
CommandGroup& CommandGroup::operator=(CommandGroup&&) noexcept = default;

CommandGroup& CommandGroup::addCommand(Command cmd) {
    adopt(std::make_unique<Routable>(std::in_place_type<Command>, std::move(cmd)));
    return *this;
}

CommandGroup& CommandGroup::addGroup(CommandGroup group) {
    adopt(std::make_unique<Routable>(std::in_place_type<CommandGroup>, std::move(group)));
    return *this;
}

void CommandGroup::adopt(std::unique_ptr<Routable> child) {
    std::vector<std::string> names{nameOf(*child)};
    const auto& alternates = aliasesOf(*child);
    names.insert(names.end(), alternates.begin(), alternates.end());
    for (const auto& n : names) {
        if (hasChild(n)) {
            throw ConfigurationError("\"" + n + "\" is already registered under \"" + name_ + "\"");
        }
    }
    children_.push_back(std::move(child));
}

const Routable* CommandGroup::findChild(const std::string& name) const {
    for (const auto& c : children_) {
        if (nameOf(*c) == name) return c.get();
    }
    for (const auto& c : children_) {
        for (const auto& a : aliasesOf(*c)) {
            if (a == name) return c.get();
        }
    }
    return nullptr;
}

const std::string& nameOf(const Routable& r) {
    return std::visit([](const auto& node) -> const std::string& { return node.name(); }, r);
}

const std::string& descriptionOf(const Routable& r) {
    return std::visit([](const auto& node) -> const std::string& { return node.shortDescription(); }, r);
}

const std::vector<std::string>& aliasesOf(const Routable& r) {
    return std::visit([](const auto& node) -> const std::vector<std::string>& { return node.aliases(); }, r);
}

AliasTable AliasTable::withDefaults() {
    AliasTable t;
    t.set("-h", "help");
    t.set("-v", "version");
    return t;
}

} // namespace argroute
