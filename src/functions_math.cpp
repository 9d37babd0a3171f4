#include "builtin_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace formula {

using detail::arg;
using detail::flatten_numbers;

std::vector<FunctionDefinition> math_functions() {
    return {
        {"Sum", FunctionCategory::Math, "Sum of all numeric arguments or array elements", "Sum(1, 2, 3) → 6",
         {detail::variadic_param("values", "number[]", "Numbers to sum")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             auto n = flatten_numbers(args);
             return std::accumulate(n.begin(), n.end(), 0.0);
         }},
        {"Average", FunctionCategory::Math, "Average of all numeric arguments", "Average(10, 20, 30) → 20",
         {detail::variadic_param("values", "number[]", "Numbers to average")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             auto n = flatten_numbers(args);
             if (n.empty()) return 0.0;
             return std::accumulate(n.begin(), n.end(), 0.0) / static_cast<double>(n.size());
         }},
        {"Min", FunctionCategory::Math, "Minimum value", "Min(5, 3, 8) → 3",
         {detail::variadic_param("values", "number[]", "Numbers to compare")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             auto n = flatten_numbers(args);
             if (n.empty()) return 0.0;
             return *std::min_element(n.begin(), n.end());
         }},
        {"Max", FunctionCategory::Math, "Maximum value", "Max(5, 3, 8) → 8",
         {detail::variadic_param("values", "number[]", "Numbers to compare")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             auto n = flatten_numbers(args);
             if (n.empty()) return 0.0;
             return *std::max_element(n.begin(), n.end());
         }},
        {"Round", FunctionCategory::Math, "Round to specified decimal places", "Round(3.14159, 2) → 3.14",
         {detail::param("value", "number", "Number to round"),
          detail::optional_param("decimals", "number", "Decimal places", "0")},
         "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             const double value = to_number(arg(args, 0));
             double digits = arg(args, 1).is_null() ? 0.0 : to_number(arg(args, 1));
             if (std::isnan(digits)) digits = 0.0;
             // beyond 15 places a double has nothing left to round
             return round_half_away(value, static_cast<int>(std::clamp(digits, -15.0, 15.0)));
         }},
        {"Abs", FunctionCategory::Math, "Absolute value", "Abs(-5) → 5",
         {detail::param("value", "number", "Number")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return std::fabs(to_number(arg(args, 0)));
         }},
    };
}

} // namespace formula
