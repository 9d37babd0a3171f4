#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "formula/context.hpp"
#include "formula/value.hpp"

namespace formula {

enum class FunctionCategory { Math, String, Date, Logic, Aggregate, Lookup, Travel, Reference };

const char* to_string(FunctionCategory c);
/// Parses a category name ("math", "string", ...); nullopt when unknown.
std::optional<FunctionCategory> parse_category(std::string_view name);

struct ParameterInfo {
    std::string name;
    std::string type;
    std::string description;
    bool required{true};
    bool variadic{false}; // accepts any number of values, including none
    std::optional<std::string> default_value;
};

using FunctionImpl = std::function<Value(const std::vector<Value>& args, const FormulaContext& ctx)>;

struct FunctionDefinition {
    std::string name; // display case
    FunctionCategory category{FunctionCategory::Math};
    std::string description;
    std::string example;
    std::vector<ParameterInfo> parameters;
    std::string return_type;
    bool is_async{false};
    FunctionImpl implementation;

    std::size_t min_arity() const;
    /// nullopt when a parameter is variadic.
    std::optional<std::size_t> max_arity() const;
};

/// Immutable name -> definition table with case-insensitive lookup.
class FunctionRegistry {
public:
    /// Throws std::invalid_argument on duplicate names (compared case-insensitively).
    explicit FunctionRegistry(std::vector<FunctionDefinition> defs);

    /// The process-wide built-in catalog.
    static const FunctionRegistry& builtin();

    const FunctionDefinition* get_function(std::string_view name) const;
    bool has_function(std::string_view name) const { return get_function(name) != nullptr; }
    std::vector<const FunctionDefinition*> functions_by_category(std::string_view category) const;
    const std::vector<FunctionDefinition>& all() const { return defs_; }

private:
    std::vector<FunctionDefinition> defs_;
    std::map<std::string, std::size_t, std::less<>> index_; // lower-cased name -> defs_ slot
};

/// Built-in definitions grouped by category; see functions_*.cpp.
std::vector<FunctionDefinition> math_functions();
std::vector<FunctionDefinition> string_functions();
std::vector<FunctionDefinition> date_functions();
std::vector<FunctionDefinition> logic_functions();
std::vector<FunctionDefinition> aggregate_functions();
std::vector<FunctionDefinition> travel_functions();
std::vector<FunctionDefinition> reference_functions();

} // namespace formula
