#ifndef ARGROUTE_OPTION_REGISTRY_HPP
#define ARGROUTE_OPTION_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include "option.hpp"
#include "router.hpp"
#include "token_stream.hpp"

namespace argroute {

// Every option visible to one command, indexed by spelling.
class OptionRegistry {
public:
    // Throws ConfigurationError when two options share a spelling or a group names an unknown spelling.
    OptionRegistry(std::vector<const Option*> options, std::vector<const OptionGroup*> groups);
    explicit OptionRegistry(const CommandPath& path);

    [[nodiscard]] const Option* find(const std::string& spelling) const {
        const auto it = bySpelling_.find(spelling);
        return it == bySpelling_.end() ? nullptr : it->second;
    }

    [[nodiscard]] const std::vector<const Option*>& options() const { return options_; }
    [[nodiscard]] const std::vector<const OptionGroup*>& groups() const { return groups_; }

    // Registration order, all spellings of each option.
    [[nodiscard]] std::vector<std::string> spellings() const;

private:
    std::vector<const Option*> options_;
    std::vector<const OptionGroup*> groups_;
    std::unordered_map<std::string, const Option*> bySpelling_;
};

// Values recorded by the recognizer, queried by any spelling of the option.
class OptionValues {
public:
    explicit OptionValues(const OptionRegistry& registry);

    void record(const Option& option, OptionValue value) { values_[&option].push_back(std::move(value)); }

    // A flag counts as set when its last occurrence is true (`--flag=false` unsets it).
    [[nodiscard]] bool isSet(const Option& option) const {
        const auto it = values_.find(&option);
        if (it == values_.end() || it->second.empty()) return false;
        if (!option.isFlag()) return true;
        const auto* b = std::get_if<bool>(&it->second.back());
        return b != nullptr && *b;
    }

    [[nodiscard]] bool has(const std::string& spelling) const {
        const auto* o = lookup(spelling);
        return o != nullptr && isSet(*o);
    }

    [[nodiscard]] bool flag(const std::string& spelling) const { return has(spelling); }

    [[nodiscard]] std::size_t occurrences(const std::string& spelling) const { return values(spelling).size(); }

    // All occurrences, in command-line order.
    [[nodiscard]] const std::vector<OptionValue>& values(const std::string& spelling) const;

    // The last occurrence.
    [[nodiscard]] std::optional<OptionValue> value(const std::string& spelling) const {
        const auto& all = values(spelling);
        if (all.empty()) return std::nullopt;
        return all.back();
    }

    template <typename T>
    [[nodiscard]] std::optional<T> get(const std::string& spelling) const {
        const auto v = value(spelling);
        if (!v) return std::nullopt;
        if (const auto* p = std::get_if<T>(&*v)) return *p;
        return std::nullopt;
    }

    template <typename T>
    [[nodiscard]] T getOr(const std::string& spelling, T defaultValue) const {
        auto v = get<T>(spelling);
        return v ? *v : defaultValue;
    }

private:
    [[nodiscard]] const Option* lookup(const std::string& spelling) const {
        const auto it = bySpelling_.find(spelling);
        return it == bySpelling_.end() ? nullptr : it->second;
    }

    std::unordered_map<std::string, const Option*> bySpelling_;
    std::unordered_map<const Option*, std::vector<OptionValue>> values_;
};

struct OptionError {
    enum class Kind {
        UnrecognizedOption,
        ExpectedValue,
        InvalidValue,
        UnsatisfiedGroup,
    };

    Kind kind{Kind::UnrecognizedOption};
    // The spelling as given on the command line (empty for UnsatisfiedGroup).
    std::string option;
    // InvalidValue only.
    std::string value;
    ValueType expected{ValueType::String};
    // UnsatisfiedGroup only.
    const OptionGroup* group{nullptr};
    std::size_t setCount{0};
};

class OptionRecognizer {
public:
    OptionRecognizer() = default;
    // When `helpFlag` is recorded, option groups are not checked so that the caller can
    // print usage instead of a group violation.
    explicit OptionRecognizer(const Option* helpFlag) : helpFlag_(helpFlag) {}
    virtual ~OptionRecognizer() = default;

    // Scans every unconsumed token left to right, consuming recognized options and their values.
    // Non-option tokens stay unconsumed for the parameter filler; `--` is consumed and ends the scan.
    // `--name=value` binds the inline value; on a flag it must be a bool (`--loud=false`).
    [[nodiscard]] virtual Staged<OptionValues, OptionError> recognize(const OptionRegistry& registry,
                                                                      TokenStream stream) const;

protected:
    [[nodiscard]] static std::optional<OptionError> checkGroups(const OptionRegistry& registry, const OptionValues& values);

private:
    const Option* helpFlag_{nullptr};
};

} // namespace argroute

#endif // ARGROUTE_OPTION_REGISTRY_HPP
