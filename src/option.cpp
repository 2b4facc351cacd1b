#include "argroute/option.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <type_traits>

#include "argroute/errors.hpp"

namespace {

std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "yes" || t == "on") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "no" || t == "off") {
        out = false;
        return true;
    }
    return false;
}

// Whole-token base-10 integer or decimal number that fits in `T`.
template <typename T>
bool tryParseNumber(std::string_view s, T& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;

    if constexpr (std::is_floating_point_v<T>) {
        const double v = std::strtod(tmp.c_str(), &end);
        if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
        out = static_cast<T>(v);
    } else if constexpr (std::is_signed_v<T>) {
        const long long v = std::strtoll(tmp.c_str(), &end, 10);
        if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
        if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) return false;
        out = static_cast<T>(v);
    } else {
        // strtoull wraps "-1" around instead of failing.
        if (t.front() == '-') return false;
        const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
        if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
        if (v > std::numeric_limits<T>::max()) return false;
        out = static_cast<T>(v);
    }
    return true;
}

} // namespace

namespace argroute {

std::string_view typeName(ValueType type) {
    switch (type) {
        case ValueType::Bool: return "bool";
        case ValueType::Int: return "int";
        case ValueType::Int64: return "int64";
        case ValueType::Uint64: return "uint64";
        case ValueType::Double: return "double";
        case ValueType::String: return "string";
    }
    return "string";
}

std::optional<OptionValue> parseValue(ValueType type, std::string_view text) {
    switch (type) {
        case ValueType::Bool: {
            bool out = false;
            if (!tryParseBool(text, out)) return std::nullopt;
            return OptionValue{out};
        }
        case ValueType::Int: {
            int out = 0;
            if (!tryParseNumber(text, out)) return std::nullopt;
            return OptionValue{out};
        }
        case ValueType::Int64: {
            std::int64_t out = 0;
            if (!tryParseNumber(text, out)) return std::nullopt;
            return OptionValue{out};
        }
        case ValueType::Uint64: {
            std::uint64_t out = 0;
            if (!tryParseNumber(text, out)) return std::nullopt;
            return OptionValue{out};
        }
        case ValueType::Double: {
            double out = 0.0;
            if (!tryParseNumber(text, out)) return std::nullopt;
            return OptionValue{out};
        }
        case ValueType::String:
            return OptionValue{std::string(text)};
    }
    return std::nullopt;
}

std::string toString(const OptionValue& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return x;
            } else {
                return std::to_string(x);
            }
        },
        value);
}

Option::Option(Kind kind, std::vector<std::string> names, std::string description, ValueType type, std::string valueName)
    : kind_(kind),
      names_(std::move(names)),
      description_(std::move(description)),
      type_(type),
      valueName_(std::move(valueName)) {
    if (names_.empty()) throw ConfigurationError("option declared without any spelling");
    for (const auto& n : names_) {
        if (n.size() < 2 || n[0] != '-' || n == "--") {
            throw ConfigurationError("invalid option spelling \"" + n + "\"");
        }
    }
}

const std::string& Option::identifier() const {
    const std::string* best = &names_.front();
    for (const auto& n : names_) {
        if (n.size() > best->size()) best = &n;
    }
    return *best;
}

std::string Option::signature() const {
    std::string out;
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (i) out += ", ";
        out += names_[i];
    }
    if (kind_ == Kind::Keyed) out += " <" + valueName_ + ">";
    return out;
}

OptionGroup::OptionGroup(Restriction restriction, std::vector<std::string> spellings)
    : restriction_(restriction), spellings_(std::move(spellings)) {
    if (spellings_.empty()) throw ConfigurationError("option group declared without any option");
}

bool OptionGroup::satisfiedBy(std::size_t setCount) const {
    switch (restriction_) {
        case Restriction::AtMostOne: return setCount <= 1;
        case Restriction::AtLeastOne: return setCount >= 1;
        case Restriction::ExactlyOne: return setCount == 1;
    }
    return false;
}

} // namespace argroute
