#include "builtin_helpers.hpp"

#include <algorithm>
#include <cctype>

namespace formula {

using detail::arg;

static std::string change_case(std::string s, bool upper) {
    std::transform(s.begin(), s.end(), s.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return s;
}

static std::string trim(const std::string& s) {
    auto blank = [](unsigned char c) { return std::isspace(c) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), blank);
    auto e = std::find_if_not(s.rbegin(), s.rend(), blank).base();
    return b < e ? std::string(b, e) : std::string();
}

static std::string replace_all(std::string text, const std::string& find, const std::string& to) {
    if (find.empty()) return text;
    std::size_t pos = 0;
    while ((pos = text.find(find, pos)) != std::string::npos) {
        text.replace(pos, find.size(), to);
        pos += to.size();
    }
    return text;
}

// Characters, not bytes: UTF-8 continuation bytes are not counted.
static std::size_t char_count(const std::string& s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
        [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

std::vector<FunctionDefinition> string_functions() {
    return {
        {"Concat", FunctionCategory::String, "Concatenate strings", "Concat(\"Hello\", \" \", \"World\") → \"Hello World\"",
         {detail::variadic_param("strings", "string[]", "Strings to join")}, "string", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             std::string out;
             for (const auto& a : args) out += to_display_string(a);
             return out;
         }},
        {"Upper", FunctionCategory::String, "Convert to uppercase", "Upper(\"hello\") → \"HELLO\"",
         {detail::param("text", "string", "Text to convert")}, "string", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return change_case(to_display_string(arg(args, 0)), true);
         }},
        {"Lower", FunctionCategory::String, "Convert to lowercase", "Lower(\"HELLO\") → \"hello\"",
         {detail::param("text", "string", "Text to convert")}, "string", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return change_case(to_display_string(arg(args, 0)), false);
         }},
        {"Length", FunctionCategory::String, "Length of string or array", "Length(\"hello\") → 5",
         {detail::param("value", "string|array", "String or array")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             const Value& v = arg(args, 0);
             if (v.is_array()) return static_cast<double>(v.as_array().size());
             return static_cast<double>(char_count(to_display_string(v)));
         }},
        {"Trim", FunctionCategory::String, "Remove leading/trailing whitespace", "Trim(\"  hello  \") → \"hello\"",
         {detail::param("text", "string", "Text to trim")}, "string", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return trim(to_display_string(arg(args, 0)));
         }},
        {"Replace", FunctionCategory::String, "Replace occurrences in string", "Replace(\"hello\", \"l\", \"w\") → \"hewwo\"",
         {detail::param("text", "string", "Source text"),
          detail::param("search", "string", "Text to find"),
          detail::param("replace", "string", "Replacement")},
         "string", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return replace_all(to_display_string(arg(args, 0)), to_display_string(arg(args, 1)),
                                to_display_string(arg(args, 2)));
         }},
    };
}

} // namespace formula
