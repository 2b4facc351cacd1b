#include "argroute/parameter.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace argroute {

Parameter::Parameter(Kind kind, std::string name, std::string defaultValue)
    : kind_(kind), name_(std::move(name)), default_(std::move(defaultValue)) {
    if (name_.empty()) throw ConfigurationError("parameter declared without a name");
}

std::string Parameter::usage() const {
    switch (kind_) {
        case Kind::Required: return "<" + name_ + ">";
        case Kind::Optional: return "[<" + name_ + ">]";
        case Kind::Variadic: return "[<" + name_ + ">] ...";
    }
    return name_;
}

ParameterSignature::ParameterSignature(std::initializer_list<Parameter> slots) {
    for (const auto& s : slots) add(s);
}

ParameterSignature& ParameterSignature::add(Parameter slot) {
    for (const auto& existing : slots_) {
        if (existing.name() == slot.name()) {
            throw ConfigurationError("duplicate parameter name \"" + slot.name() + "\"");
        }
    }
    if (variadic_) {
        throw ConfigurationError("parameter \"" + slot.name() + "\" follows variadic parameter \"" +
                                 slots_.back().name() + "\"; the variadic parameter must be last");
    }
    switch (slot.kind()) {
        case Parameter::Kind::Required:
            if (optional_ > 0) {
                throw ConfigurationError("required parameter \"" + slot.name() + "\" follows an optional parameter");
            }
            ++required_;
            break;
        case Parameter::Kind::Optional:
            ++optional_;
            break;
        case Parameter::Kind::Variadic:
            variadic_ = true;
            break;
    }
    slots_.push_back(std::move(slot));
    return *this;
}

std::string ParameterSignature::usage() const {
    std::string out;
    for (const auto& s : slots_) {
        if (!out.empty()) out += " ";
        out += s.usage();
    }
    return out;
}

const Parameters::Binding* Parameters::find(const std::string& name) const {
    for (const auto& b : bindings_) {
        if (b.name == name) return &b;
    }
    return nullptr;
}

const std::string& Parameters::get(const std::string& name) const {
    const auto* b = find(name);
    if (!b || b->kind == Parameter::Kind::Variadic) throw std::out_of_range("no single-value parameter named \"" + name + "\"");
    return b->values.front();
}

const std::vector<std::string>& Parameters::collected(const std::string& name) const {
    const auto* b = find(name);
    if (!b || b->kind != Parameter::Kind::Variadic) throw std::out_of_range("no variadic parameter named \"" + name + "\"");
    return b->values;
}

bool Parameters::supplied(const std::string& name) const {
    const auto* b = find(name);
    return b != nullptr && b->supplied;
}

Staged<Parameters, ParameterError> ParameterFiller::fill(const ParameterSignature& signature, TokenStream stream) const {
    const std::size_t required = signature.requiredCount();
    const std::size_t optional = signature.optionalCount();
    const std::size_t given = stream.unconsumedCount();

    ParameterError mismatch;
    mismatch.minimum = required;
    if (!signature.hasVariadic()) mismatch.maximum = required + optional;
    mismatch.given = given;

    if (given < required) {
        mismatch.kind = ParameterError::Kind::NotEnoughArguments;
        spdlog::debug("not enough arguments: need {}, got {}", required, given);
        return {std::move(stream), mismatch};
    }
    if (!signature.hasVariadic() && given > required + optional) {
        mismatch.kind = ParameterError::Kind::TooManyArguments;
        spdlog::debug("too many arguments: accept at most {}, got {}", required + optional, given);
        return {std::move(stream), mismatch};
    }

    std::vector<Parameters::Binding> bindings;
    bindings.reserve(signature.slots().size());

    std::size_t cursor = 0;
    for (const auto& slot : signature.slots()) {
        Parameters::Binding b{slot.name(), slot.kind(), {}, false};
        if (slot.kind() == Parameter::Kind::Variadic) {
            while (auto i = stream.next(cursor)) {
                b.values.push_back(stream.at(*i));
                stream.consume(*i);
                cursor = *i + 1;
            }
            b.supplied = !b.values.empty();
        } else if (auto i = stream.next(cursor)) {
            b.values.push_back(stream.at(*i));
            b.supplied = true;
            stream.consume(*i);
            cursor = *i + 1;
        } else {
            b.values.push_back(slot.defaultValue());
        }
        spdlog::trace("parameter {} bound to {} token(s)", slot.name(), b.supplied ? b.values.size() : 0);
        bindings.push_back(std::move(b));
    }

    return {std::move(stream), Parameters(std::move(bindings))};
}

} // namespace argroute
