#include "builtin_helpers.hpp"

#include <algorithm>
#include <cctype>

namespace formula {

using detail::arg;

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::vector<FunctionDefinition> logic_functions() {
    return {
        {"If", FunctionCategory::Logic, "Conditional expression", "If(status = \"done\", \"✓\", \"○\") → \"✓\"",
         {detail::param("condition", "boolean", "Condition to test"),
          detail::param("ifTrue", "any", "Value if true"),
          detail::param("ifFalse", "any", "Value if false")},
         "any", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return truthy(arg(args, 0)) ? arg(args, 1) : arg(args, 2);
         }},
        {"And", FunctionCategory::Logic, "Logical AND", "And(true, true) → true",
         {detail::variadic_param("conditions", "boolean[]", "Conditions")}, "boolean", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return std::all_of(args.begin(), args.end(), [](const Value& v) { return truthy(v); });
         }},
        {"Or", FunctionCategory::Logic, "Logical OR", "Or(false, true) → true",
         {detail::variadic_param("conditions", "boolean[]", "Conditions")}, "boolean", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return std::any_of(args.begin(), args.end(), [](const Value& v) { return truthy(v); });
         }},
        {"Not", FunctionCategory::Logic, "Logical NOT", "Not(false) → true",
         {detail::param("value", "boolean", "Value to negate")}, "boolean", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value { return !truthy(arg(args, 0)); }},
        {"IsEmpty", FunctionCategory::Logic, "Check if value is empty", "IsEmpty(\"\") → true",
         {detail::param("value", "any", "Value to check")}, "boolean", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             const Value& v = arg(args, 0);
             if (v.is_null()) return true;
             if (v.is_string()) return is_blank(v.as_string());
             if (v.is_array()) return v.as_array().empty();
             if (v.is_object()) return v.as_object().empty();
             return false;
         }},
        {"Coalesce", FunctionCategory::Logic, "Return first non-empty value", "Coalesce(null, \"\", \"default\") → \"default\"",
         {detail::variadic_param("values", "any[]", "Values to check")}, "any", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             for (const auto& a : args) {
                 if (a.is_null()) continue;
                 if (a.is_string() && a.as_string().empty()) continue;
                 return a;
             }
             return Value();
         }},
    };
}

} // namespace formula
