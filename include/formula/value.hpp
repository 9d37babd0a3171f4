#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace formula {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

struct Value;
using Array  = std::vector<Value>;
using Object = std::map<std::string, Value>;

enum class ValueType { Null, Boolean, Number, String, Date, Array, Object };

/// "null", "boolean", "number", "string", "date", "array" or "object".
const char* to_string(ValueType t);

/// Runtime value of a formula. A default constructed Value is null.
struct Value {
    using Storage = std::variant<std::monostate, bool, double, std::string, Timestamp, Array, Object>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data(b) {}
    Value(double d) : data(d) {}
    Value(int i) : data(static_cast<double>(i)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(Timestamp t) : data(t) {}
    Value(Array a) : data(std::move(a)) {}
    Value(Object o) : data(std::move(o)) {}

    ValueType type() const noexcept { return static_cast<ValueType>(data.index()); }

    bool is_null() const noexcept   { return std::holds_alternative<std::monostate>(data); }
    bool is_bool() const noexcept   { return std::holds_alternative<bool>(data); }
    bool is_number() const noexcept { return std::holds_alternative<double>(data); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    bool is_date() const noexcept   { return std::holds_alternative<Timestamp>(data); }
    bool is_array() const noexcept  { return std::holds_alternative<Array>(data); }
    bool is_object() const noexcept { return std::holds_alternative<Object>(data); }

    bool as_bool() const                 { return std::get<bool>(data); }
    double as_number() const             { return std::get<double>(data); }
    const std::string& as_string() const { return std::get<std::string>(data); }
    Timestamp as_date() const            { return std::get<Timestamp>(data); }
    const Array& as_array() const        { return std::get<Array>(data); }
    const Object& as_object() const      { return std::get<Object>(data); }

    /// Object key lookup; nullptr when this is not an object or the key is absent.
    const Value* find(std::string_view key) const;

    Storage data;
};

/// Deep equality of kind and contents (no coercion).
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Coercions. The throwing ones raise FormulaError(TypeError).
double to_number(const Value& v);
bool truthy(const Value& v);
Timestamp to_timestamp(const Value& v);
/// Epoch milliseconds to a timestamp. Non-finite values and anything past
/// +-8.64e15 ms (+-100,000,000 days) raise FormulaError(TypeError).
Timestamp timestamp_from_ms(double ms);
std::string to_display_string(const Value& v);
std::string to_json(const Value& v);

/// Shortest decimal text that round-trips, e.g. 42 -> "42", 0.5 -> "0.5".
/// Plain notation for 1e-6 <= |d| < 1e21, otherwise "1e+21" / "1.5e-7".
std::string format_number(double d);

/// Broken-down UTC time. month is 1-12, weekday 0 = Sunday.
struct CivilTime {
    int year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    int millisecond{0};
    int weekday{4};
};

CivilTime to_civil(Timestamp t);
/// Out-of-range fields carry over (month 13 is January of the next year). weekday is ignored.
Timestamp from_civil(const CivilTime& c);
int days_in_month(int year, int month);

/// ISO-8601 UTC with milliseconds: 2024-01-15T10:30:00.000Z
std::string format_iso(Timestamp t);
/// Date portion only: 2024-01-15
std::string format_iso_date(Timestamp t);
/// Accepts YYYY-MM-DD and YYYY-MM-DDTHH:MM[:SS[.fff]][Z]. Returns false when malformed.
bool parse_iso(std::string_view text, Timestamp& out);

/// Equality used by '=' / '==': numbers and numeric strings compare numerically.
bool loosely_equal(const Value& a, const Value& b);
/// Three-way ordering used by '<', '>', '<=', '>='. Throws TypeError for unordered kinds.
int compare_values(const Value& a, const Value& b);

/// Round half away from zero to `digits` decimal places.
double round_half_away(double x, int digits = 0);

} // namespace formula
