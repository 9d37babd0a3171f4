#pragma once
#include <cstddef>
#include <vector>

#include "formula/functions.hpp"

namespace formula::detail {

/// Argument i, or null when fewer arguments were passed.
inline const Value& arg(const std::vector<Value>& args, std::size_t i) {
    static const Value null_value;
    return i < args.size() ? args[i] : null_value;
}

/// Arrays contribute their elements, null contributes nothing, anything else itself.
inline Array flatten(const std::vector<Value>& args) {
    Array out;
    for (const auto& a : args) {
        if (a.is_array()) out.insert(out.end(), a.as_array().begin(), a.as_array().end());
        else if (!a.is_null()) out.push_back(a);
    }
    return out;
}

inline std::vector<double> flatten_numbers(const std::vector<Value>& args) {
    std::vector<double> out;
    for (const auto& v : flatten(args)) out.push_back(to_number(v));
    return out;
}

inline ParameterInfo param(std::string name, std::string type, std::string description, bool required = true) {
    return ParameterInfo{std::move(name), std::move(type), std::move(description), required, false, std::nullopt};
}

inline ParameterInfo optional_param(std::string name, std::string type, std::string description, std::string def) {
    return ParameterInfo{std::move(name), std::move(type), std::move(description), false, false, std::move(def)};
}

inline ParameterInfo variadic_param(std::string name, std::string type, std::string description) {
    return ParameterInfo{std::move(name), std::move(type), std::move(description), true, true, std::nullopt};
}

} // namespace formula::detail
