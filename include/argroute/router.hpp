#ifndef ARGROUTE_ROUTER_HPP
#define ARGROUTE_ROUTER_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "command.hpp"
#include "token_stream.hpp"

namespace argroute {

// Groups traversed from the root. The root itself is not part of groups().
class GroupPath {
public:
    explicit GroupPath(const CommandGroup& root) : root_(&root) {}

    [[nodiscard]] const CommandGroup& root() const { return *root_; }
    [[nodiscard]] const std::vector<const CommandGroup*>& groups() const { return groups_; }

    // The group routing stopped at: the last traversed group, or the root.
    [[nodiscard]] const CommandGroup& deepest() const { return groups_.empty() ? *root_ : *groups_.back(); }

    [[nodiscard]] GroupPath appending(const CommandGroup& group) const {
        GroupPath out(*this);
        out.groups_.push_back(&group);
        return out;
    }

    // "app test unit"
    [[nodiscard]] std::string joinedNames() const;

private:
    const CommandGroup* root_;
    std::vector<const CommandGroup*> groups_;
};

class CommandPath {
public:
    CommandPath(GroupPath groups, const Command& command) : groups_(std::move(groups)), command_(&command) {}

    [[nodiscard]] const GroupPath& groups() const { return groups_; }
    [[nodiscard]] const Command& command() const { return *command_; }

    // Own options first, then each ancestor's shared options from the nearest group up to the root.
    [[nodiscard]] std::vector<const Option*> visibleOptions() const;

    // "app test unit"
    [[nodiscard]] std::string joinedNames() const;

private:
    GroupPath groups_;
    const Command* command_;
};

struct RoutingFailure {
    GroupPath partialPath;
    // Absent when the tokens ran out before reaching a command.
    std::optional<std::string> unmatchedToken;
};

class Router {
public:
    Router(const CommandGroup& root, const AliasTable& aliases) : root_(root), aliases_(aliases) {}
    virtual ~Router() = default;

    // Consumes routing tokens from the front of `stream`; every other token is left untouched.
    [[nodiscard]] virtual Staged<CommandPath, RoutingFailure> route(TokenStream stream) const;

private:
    const CommandGroup& root_;
    const AliasTable& aliases_;
};

} // namespace argroute

#endif // ARGROUTE_ROUTER_HPP
