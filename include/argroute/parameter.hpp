#ifndef ARGROUTE_PARAMETER_HPP
#define ARGROUTE_PARAMETER_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "token_stream.hpp"

namespace argroute {

class Parameter {
public:
    enum class Kind {
        Required,
        Optional,
        Variadic,
    };

    static Parameter required(std::string name) { return Parameter(Kind::Required, std::move(name), {}); }
    static Parameter optional(std::string name, std::string defaultValue = {}) {
        return Parameter(Kind::Optional, std::move(name), std::move(defaultValue));
    }
    static Parameter variadic(std::string name) { return Parameter(Kind::Variadic, std::move(name), {}); }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& defaultValue() const { return default_; }

    // "<name>", "[<name>]", "[<name>] ..."
    [[nodiscard]] std::string usage() const;

private:
    Parameter(Kind kind, std::string name, std::string defaultValue);

    Kind kind_;
    std::string name_;
    std::string default_;
};

// Ordered positional slots: Required*, Optional*, Variadic?.
// add() throws ConfigurationError as soon as a slot would break that order.
class ParameterSignature {
public:
    ParameterSignature() = default;
    ParameterSignature(std::initializer_list<Parameter> slots);

    ParameterSignature& add(Parameter slot);

    [[nodiscard]] const std::vector<Parameter>& slots() const { return slots_; }
    [[nodiscard]] std::size_t requiredCount() const { return required_; }
    [[nodiscard]] std::size_t optionalCount() const { return optional_; }
    [[nodiscard]] bool hasVariadic() const { return variadic_; }
    [[nodiscard]] bool empty() const { return slots_.empty(); }

    [[nodiscard]] std::string usage() const;

private:
    std::vector<Parameter> slots_;
    std::size_t required_{0};
    std::size_t optional_{0};
    bool variadic_{false};
};

// Positional values bound to one signature.
class Parameters {
public:
    struct Binding {
        std::string name;
        Parameter::Kind kind;
        std::vector<std::string> values;
        bool supplied{false};
    };

    Parameters() = default;
    explicit Parameters(std::vector<Binding> bindings) : bindings_(std::move(bindings)) {}

    // Value of a required or optional slot (the default when it was not supplied).
    // Throws std::out_of_range for an undeclared or variadic name.
    [[nodiscard]] const std::string& get(const std::string& name) const;

    // Values collected by the variadic slot, in order. Throws std::out_of_range for another name.
    [[nodiscard]] const std::vector<std::string>& collected(const std::string& name) const;

    [[nodiscard]] bool supplied(const std::string& name) const;
    [[nodiscard]] bool has(const std::string& name) const { return find(name) != nullptr; }

    [[nodiscard]] const std::vector<Binding>& bindings() const { return bindings_; }

private:
    [[nodiscard]] const Binding* find(const std::string& name) const;

    std::vector<Binding> bindings_;
};

class ParameterFiller {
public:
    virtual ~ParameterFiller() = default;

    // Binds every unconsumed token of `stream`, greedily and in order. The returned stream
    // has every bound token consumed.
    [[nodiscard]] virtual Staged<Parameters, ParameterError> fill(const ParameterSignature& signature,
                                                                  TokenStream stream) const;
};

} // namespace argroute

#endif // ARGROUTE_PARAMETER_HPP
