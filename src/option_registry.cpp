#include "argroute/option_registry.hpp"

#include <unordered_set>

#include <spdlog/spdlog.h>

#include "argroute/errors.hpp"

namespace argroute {

namespace {

std::vector<const OptionGroup*> groupsOf(const Command& command) {
    std::vector<const OptionGroup*> out;
    out.reserve(command.optionGroups().size());
    for (const auto& g : command.optionGroups()) out.push_back(&g);
    return out;
}

} // namespace

OptionRegistry::OptionRegistry(std::vector<const Option*> options, std::vector<const OptionGroup*> groups)
    : options_(std::move(options)), groups_(std::move(groups)) {
    for (const auto* o : options_) {
        for (const auto& spelling : o->names()) {
            const auto [it, inserted] = bySpelling_.emplace(spelling, o);
            if (!inserted && it->second != o) {
                throw ConfigurationError("option spelling \"" + spelling + "\" is declared more than once (\"" +
                                         it->second->identifier() + "\" and \"" + o->identifier() + "\")");
            }
        }
    }
    for (const auto* g : groups_) {
        for (const auto& spelling : g->spellings()) {
            if (bySpelling_.find(spelling) == bySpelling_.end()) {
                throw ConfigurationError("option group refers to undeclared option \"" + spelling + "\"");
            }
        }
    }
}

OptionRegistry::OptionRegistry(const CommandPath& path)
    : OptionRegistry(path.visibleOptions(), groupsOf(path.command())) {}

std::vector<std::string> OptionRegistry::spellings() const {
    std::vector<std::string> out;
    for (const auto* o : options_) out.insert(out.end(), o->names().begin(), o->names().end());
    return out;
}

OptionValues::OptionValues(const OptionRegistry& registry) {
    for (const auto* o : registry.options()) {
        for (const auto& spelling : o->names()) bySpelling_.emplace(spelling, o);
    }
}

const std::vector<OptionValue>& OptionValues::values(const std::string& spelling) const {
    static const std::vector<OptionValue> kNone;
    const auto* o = lookup(spelling);
    if (!o) return kNone;
    const auto it = values_.find(o);
    if (it == values_.end()) return kNone;
    return it->second;
}

Staged<OptionValues, OptionError> OptionRecognizer::recognize(const OptionRegistry& registry, TokenStream stream) const {
    OptionValues values(registry);

    std::size_t cursor = 0;
    while (auto idx = stream.next(cursor)) {
        const std::size_t i = *idx;
        cursor = i + 1;
        const std::string token = stream.at(i);

        if (token == TokenStream::kEndOfOptions) {
            stream.consume(i);
            spdlog::trace("end of options at token {}", i);
            break;
        }
        if (!TokenStream::looksLikeOption(token)) continue;

        // `--name=value` and `-n=value` carry their value inline.
        std::string spelling = token;
        std::optional<std::string> inlineValue;
        const Option* option = registry.find(token);
        if (!option) {
            const auto eq = token.find('=');
            if (eq != std::string::npos && eq >= 2) {
                spelling = token.substr(0, eq);
                inlineValue = token.substr(eq + 1);
                option = registry.find(spelling);
            }
        }
        if (!option) {
            OptionError err;
            err.kind = OptionError::Kind::UnrecognizedOption;
            err.option = spelling;
            return {std::move(stream), std::move(err)};
        }

        if (option->isFlag() && !inlineValue) {
            stream.consume(i);
            values.record(*option, true);
            spdlog::trace("flag {} set", option->identifier());
            continue;
        }

        std::optional<std::size_t> valueIdx;
        if (!inlineValue) {
            valueIdx = stream.next(i + 1);
            if (!valueIdx || TokenStream::looksLikeOption(stream.at(*valueIdx))) {
                OptionError err;
                err.kind = OptionError::Kind::ExpectedValue;
                err.option = spelling;
                return {std::move(stream), std::move(err)};
            }
        }

        const std::string raw = inlineValue ? *inlineValue : stream.at(*valueIdx);
        auto parsed = parseValue(option->valueType(), raw);
        if (!parsed) {
            OptionError err;
            err.kind = OptionError::Kind::InvalidValue;
            err.option = spelling;
            err.value = raw;
            err.expected = option->valueType();
            return {std::move(stream), std::move(err)};
        }

        stream.consume(i);
        if (valueIdx) {
            stream.consume(*valueIdx);
            cursor = *valueIdx + 1;
        }
        values.record(*option, std::move(*parsed));
        spdlog::trace("option {} = \"{}\"", option->identifier(), raw);
    }

    if (helpFlag_ && values.isSet(*helpFlag_)) return {std::move(stream), std::move(values)};

    if (auto err = checkGroups(registry, values)) return {std::move(stream), std::move(*err)};
    return {std::move(stream), std::move(values)};
}

std::optional<OptionError> OptionRecognizer::checkGroups(const OptionRegistry& registry, const OptionValues& values) {
    for (const auto* g : registry.groups()) {
        std::unordered_set<const Option*> set;
        for (const auto& spelling : g->spellings()) {
            const auto* o = registry.find(spelling);
            if (o && values.isSet(*o)) set.insert(o);
        }
        if (g->satisfiedBy(set.size())) continue;

        spdlog::debug("option group violated: {} of {} options set", set.size(), g->spellings().size());
        OptionError err;
        err.kind = OptionError::Kind::UnsatisfiedGroup;
        err.group = g;
        err.setCount = set.size();
        return err;
    }
    return std::nullopt;
}

} // namespace argroute
