#ifndef ARGROUTE_OPTION_HPP
#define ARGROUTE_OPTION_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace argroute {

using OptionValue = std::variant<bool, int, std::int64_t, std::uint64_t, double, std::string>;

enum class ValueType {
    Bool,
    Int,
    Int64,
    Uint64,
    Double,
    String,
};

// "bool", "int", ... (used in invalid-value messages and usage placeholders).
[[nodiscard]] std::string_view typeName(ValueType type);

// Coerces one value token. Empty optional when `text` is not a valid `type`.
[[nodiscard]] std::optional<OptionValue> parseValue(ValueType type, std::string_view text);

[[nodiscard]] std::string toString(const OptionValue& value);

class Option {
public:
    enum class Kind {
        Flag,  // presence only
        Keyed, // takes exactly one following value token
    };

    // Throws ConfigurationError if `names` is empty or a name does not start with '-'.
    Option(Kind kind, std::vector<std::string> names, std::string description, ValueType type, std::string valueName);

    static Option flag(std::vector<std::string> names, std::string description = {}) {
        return Option(Kind::Flag, std::move(names), std::move(description), ValueType::Bool, {});
    }

    static Option key(std::vector<std::string> names,
                      ValueType type = ValueType::String,
                      std::string description = {},
                      std::string valueName = "value") {
        return Option(Kind::Keyed, std::move(names), std::move(description), type, std::move(valueName));
    }

    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }
    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isFlag() const { return kind_ == Kind::Flag; }
    [[nodiscard]] ValueType valueType() const { return type_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& valueName() const { return valueName_; }

    // The longest spelling (`--name` over `-n`).
    [[nodiscard]] const std::string& identifier() const;

    // "-n, --name <value>"
    [[nodiscard]] std::string signature() const;

private:
    Kind kind_;
    std::vector<std::string> names_;  // -n, --name
    std::string description_;
    ValueType type_;
    std::string valueName_;           // value
};

// Restriction over a set of options visible to one command, checked after recognition.
class OptionGroup {
public:
    enum class Restriction {
        AtMostOne,
        AtLeastOne,
        ExactlyOne,
    };

    OptionGroup(Restriction restriction, std::vector<std::string> spellings);

    static OptionGroup atMostOne(std::vector<std::string> spellings) {
        return OptionGroup(Restriction::AtMostOne, std::move(spellings));
    }
    static OptionGroup atLeastOne(std::vector<std::string> spellings) {
        return OptionGroup(Restriction::AtLeastOne, std::move(spellings));
    }
    static OptionGroup exactlyOne(std::vector<std::string> spellings) {
        return OptionGroup(Restriction::ExactlyOne, std::move(spellings));
    }

    [[nodiscard]] Restriction restriction() const { return restriction_; }
    [[nodiscard]] const std::vector<std::string>& spellings() const { return spellings_; }

    [[nodiscard]] bool satisfiedBy(std::size_t setCount) const;

private:
    Restriction restriction_;
    std::vector<std::string> spellings_;
};

} // namespace argroute

#endif // ARGROUTE_OPTION_HPP
