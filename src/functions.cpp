#include "formula/functions.hpp"
#include "formula/log.hpp"

#include <stdexcept>

namespace formula {

const char* to_string(FunctionCategory c) {
    switch (c) {
        case FunctionCategory::Math:      return "math";
        case FunctionCategory::String:    return "string";
        case FunctionCategory::Date:      return "date";
        case FunctionCategory::Logic:     return "logic";
        case FunctionCategory::Aggregate: return "aggregate";
        case FunctionCategory::Lookup:    return "lookup";
        case FunctionCategory::Travel:    return "travel";
        case FunctionCategory::Reference: return "reference";
    }
    return "unknown";
}

std::optional<FunctionCategory> parse_category(std::string_view name) {
    static const FunctionCategory all[] = {
        FunctionCategory::Math, FunctionCategory::String, FunctionCategory::Date,
        FunctionCategory::Logic, FunctionCategory::Aggregate, FunctionCategory::Lookup,
        FunctionCategory::Travel, FunctionCategory::Reference,
    };
    for (FunctionCategory c : all)
        if (name == to_string(c)) return c;
    return std::nullopt;
}

std::size_t FunctionDefinition::min_arity() const {
    std::size_t n = 0;
    for (const auto& p : parameters)
        if (p.required && !p.variadic) ++n;
    return n;
}

std::optional<std::size_t> FunctionDefinition::max_arity() const {
    for (const auto& p : parameters)
        if (p.variadic) return std::nullopt;
    return parameters.size();
}

FunctionRegistry::FunctionRegistry(std::vector<FunctionDefinition> defs) : defs_(std::move(defs)) {
    for (std::size_t i = 0; i < defs_.size(); ++i) {
        if (!index_.emplace(to_lower(defs_[i].name), i).second)
            throw std::invalid_argument("Duplicate function name: " + defs_[i].name);
    }
}

const FunctionRegistry& FunctionRegistry::builtin() {
    static const FunctionRegistry registry = [] {
        using Group = std::vector<FunctionDefinition> (*)();
        const Group groups[] = {math_functions, string_functions, date_functions, logic_functions,
                                aggregate_functions, travel_functions, reference_functions};
        std::vector<FunctionDefinition> defs;
        for (Group group : groups) {
            auto part = group();
            defs.insert(defs.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
        }
        FunctionRegistry r(std::move(defs));
        logger()->trace("registered {} built-in functions", r.all().size());
        return r;
    }();
    return registry;
}

const FunctionDefinition* FunctionRegistry::get_function(std::string_view name) const {
    auto it = index_.find(to_lower(name));
    return it == index_.end() ? nullptr : &defs_[it->second];
}

std::vector<const FunctionDefinition*> FunctionRegistry::functions_by_category(std::string_view category) const {
    std::vector<const FunctionDefinition*> out;
    auto c = parse_category(category);
    if (!c) return out;
    for (const auto& d : defs_)
        if (d.category == *c) out.push_back(&d);
    return out;
}

} // namespace formula
