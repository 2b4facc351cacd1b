#include "argroute/router.hpp"

#include <type_traits>

#include <spdlog/spdlog.h>

namespace argroute {

std::string GroupPath::joinedNames() const {
    std::string out = root_->name();
    for (const auto* g : groups_) out += " " + g->name();
    return out;
}

std::vector<const Option*> CommandPath::visibleOptions() const {
    std::vector<const Option*> out;
    for (const auto& o : command_->options()) out.push_back(&o);
    const auto& chain = groups_.groups();
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        for (const auto& o : (*it)->sharedOptions()) out.push_back(&o);
    }
    for (const auto& o : groups_.root().sharedOptions()) out.push_back(&o);
    return out;
}

std::string CommandPath::joinedNames() const { return groups_.joinedNames() + " " + command_->name(); }

Staged<CommandPath, RoutingFailure> Router::route(TokenStream stream) const {
    GroupPath path(root_);

    for (;;) {
        const std::string* head = stream.peek();
        if (!head) {
            spdlog::debug("routing stopped at \"{}\": no command given", path.joinedNames());
            return {std::move(stream), RoutingFailure{path, std::nullopt}};
        }

        const std::string token = *head;
        const std::string& name = aliases_.resolve(token);
        if (name != token) spdlog::debug("alias \"{}\" -> \"{}\"", token, name);

        const Routable* match = path.deepest().findChild(name);
        if (!match) {
            spdlog::debug("routing stopped at \"{}\": \"{}\" not found", path.joinedNames(), token);
            return {std::move(stream), RoutingFailure{path, token}};
        }

        stream.pop();

        const Command* leaf = std::visit(
            [&path](const auto& node) -> const Command* {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, CommandGroup>) {
                    path = path.appending(node);
                    return nullptr;
                } else {
                    static_assert(std::is_same_v<T, Command>, "unhandled routable kind");
                    return &node;
                }
            },
            *match);

        if (leaf) {
            CommandPath resolved(path, *leaf);
            spdlog::debug("routed to \"{}\"", resolved.joinedNames());
            return {std::move(stream), std::move(resolved)};
        }
    }
}

} // namespace argroute
