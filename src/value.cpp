#include "formula/value.hpp"
#include "formula/error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

namespace formula {

const char* to_string(ValueType t) {
    switch (t) {
        case ValueType::Null:    return "null";
        case ValueType::Boolean: return "boolean";
        case ValueType::Number:  return "number";
        case ValueType::String:  return "string";
        case ValueType::Date:    return "date";
        case ValueType::Array:   return "array";
        case ValueType::Object:  return "object";
    }
    return "null";
}

const Value* Value::find(std::string_view key) const {
    auto* obj = std::get_if<Object>(&data);
    if (!obj) return nullptr;
    auto it = obj->find(std::string(key));
    return it == obj->end() ? nullptr : &it->second;
}

bool operator==(const Value& a, const Value& b) {
    return a.data == b.data;
}

// -----------------------------
// calendar arithmetic (proleptic Gregorian, UTC)
// -----------------------------
static constexpr long long kMsPerDay = 86400000LL;
static constexpr double kMaxDateMs = 8.64e15;

static long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static long long days_from_civil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilTime to_civil(Timestamp t) {
    const long long ms = t.time_since_epoch().count();
    long long z = floor_div(ms, kMsPerDay);
    long long rem = ms - z * kMsPerDay;

    CivilTime c;
    c.weekday = static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);

    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    c.year = static_cast<int>(static_cast<long long>(yoe) + era * 400 + (m <= 2));
    c.month = static_cast<int>(m);
    c.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);

    c.hour = static_cast<int>(rem / 3600000);
    rem %= 3600000;
    c.minute = static_cast<int>(rem / 60000);
    rem %= 60000;
    c.second = static_cast<int>(rem / 1000);
    c.millisecond = static_cast<int>(rem % 1000);
    return c;
}

Timestamp from_civil(const CivilTime& c) {
    long long y = c.year + floor_div(c.month - 1, 12);
    long long m0 = (c.month - 1) - floor_div(c.month - 1, 12) * 12;
    long long days = days_from_civil(y, static_cast<unsigned>(m0 + 1), 1) + (c.day - 1);
    long long ms = days * kMsPerDay + c.hour * 3600000LL + c.minute * 60000LL + c.second * 1000LL + c.millisecond;
    return Timestamp(std::chrono::milliseconds(ms));
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[(month - 1) % 12];
}

std::string format_iso(Timestamp t) {
    CivilTime c = to_civil(t);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       c.year, c.month, c.day, c.hour, c.minute, c.second, c.millisecond);
}

std::string format_iso_date(Timestamp t) {
    CivilTime c = to_civil(t);
    return fmt::format("{:04}-{:02}-{:02}", c.year, c.month, c.day);
}

namespace {

struct Cursor {
    std::string_view s;
    std::size_t i{0};

    bool done() const { return i >= s.size(); }
    bool take(char c) {
        if (done() || s[i] != c) return false;
        ++i;
        return true;
    }
    // exactly n digits
    bool digits(int n, int& out) {
        out = 0;
        for (int k = 0; k < n; ++k) {
            if (done() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
            out = out * 10 + (s[i++] - '0');
        }
        return true;
    }
};

} // namespace

bool parse_iso(std::string_view text, Timestamp& out) {
    Cursor cur{text};
    CivilTime c;
    if (!cur.digits(4, c.year) || !cur.take('-') || !cur.digits(2, c.month) || !cur.take('-') ||
        !cur.digits(2, c.day))
        return false;
    if (c.month < 1 || c.month > 12 || c.day < 1 || c.day > days_in_month(c.year, c.month)) return false;

    int offset_minutes = 0;
    if (cur.take('T') || cur.take(' ')) {
        if (!cur.digits(2, c.hour) || !cur.take(':') || !cur.digits(2, c.minute)) return false;
        if (cur.take(':')) {
            if (!cur.digits(2, c.second)) return false;
            if (cur.take('.')) {
                int scale = 100;
                bool any = false;
                while (!cur.done() && std::isdigit(static_cast<unsigned char>(cur.s[cur.i]))) {
                    c.millisecond += (cur.s[cur.i++] - '0') * scale;
                    scale /= 10;
                    any = true;
                }
                if (!any) return false;
            }
        }
        if (c.hour > 23 || c.minute > 59 || c.second > 59) return false;
        if (!cur.take('Z')) {
            const bool neg = cur.take('-');
            if (neg || cur.take('+')) {
                int oh = 0, om = 0;
                if (!cur.digits(2, oh)) return false;
                cur.take(':');
                if (!cur.digits(2, om)) return false;
                offset_minutes = (oh * 60 + om) * (neg ? -1 : 1);
            }
        }
    }
    if (!cur.done()) return false;

    out = from_civil(c) - std::chrono::minutes(offset_minutes);
    return true;
}

// -----------------------------
// coercions
// -----------------------------
std::string format_number(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0) return "0";

    std::string text = fmt::format("{}", d);
    const auto e = text.find('e');
    if (e == std::string::npos) return text;

    // fmt switches to d.ddde+XX outside [1e-4, 1e16); re-lay the digits out
    std::string sign;
    std::string digits;
    for (std::size_t k = 0; k < e; ++k) {
        if (text[k] == '-') sign = "-";
        else if (text[k] != '.') digits += text[k];
    }
    const int exponent = std::atoi(text.c_str() + e + 1);
    const int n = exponent + 1; // position of the decimal point relative to the digits
    const int k = static_cast<int>(digits.size());

    if (k <= n && n <= 21) return sign + digits + std::string(n - k, '0');
    if (0 < n && n <= 21) return sign + digits.substr(0, n) + "." + digits.substr(n);
    if (-6 < n && n <= 0) return sign + "0." + std::string(-n, '0') + digits;

    std::string mantissa = digits.substr(0, 1);
    if (k > 1) mantissa += "." + digits.substr(1);
    return fmt::format("{}{}e{}{}", sign, mantissa, exponent < 0 ? '-' : '+', std::abs(exponent));
}

double to_number(const Value& v) {
    if (v.is_number()) return v.as_number();
    if (v.is_bool()) return v.as_bool() ? 1.0 : 0.0;
    if (v.is_string()) {
        const char* begin = v.as_string().c_str();
        char* end = nullptr;
        double d = std::strtod(begin, &end);
        if (end != begin) return d;
        throw FormulaError(fmt::format("Cannot convert string \"{}\" to number", v.as_string()), ErrorCode::TypeError);
    }
    throw FormulaError(fmt::format("Cannot convert {} to number", to_string(v.type())), ErrorCode::TypeError);
}

bool truthy(const Value& v) {
    switch (v.type()) {
        case ValueType::Null:    return false;
        case ValueType::Boolean: return v.as_bool();
        case ValueType::Number:  return v.as_number() != 0 && !std::isnan(v.as_number());
        case ValueType::String:  return !v.as_string().empty();
        default:                 return true;
    }
}

Timestamp to_timestamp(const Value& v) {
    if (v.is_date()) return v.as_date();
    if (v.is_number()) return timestamp_from_ms(v.as_number());
    if (v.is_string()) {
        Timestamp t;
        if (parse_iso(v.as_string(), t)) return t;
        throw FormulaError(fmt::format("Cannot convert string \"{}\" to date", v.as_string()), ErrorCode::TypeError);
    }
    throw FormulaError(fmt::format("Cannot convert {} to date", to_string(v.type())), ErrorCode::TypeError);
}

Timestamp timestamp_from_ms(double ms) {
    if (!std::isfinite(ms) || std::fabs(ms) > kMaxDateMs)
        throw FormulaError(fmt::format("Date value {} is out of range", format_number(ms)), ErrorCode::TypeError);
    return Timestamp(std::chrono::milliseconds(std::llround(ms)));
}

static std::string quote_json(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) out += fmt::format("\\u{:04x}", static_cast<int>(c));
                else out += c;
        }
    }
    out += '"';
    return out;
}

std::string to_json(const Value& v) {
    switch (v.type()) {
        case ValueType::Null:    return "null";
        case ValueType::Boolean: return v.as_bool() ? "true" : "false";
        case ValueType::Number:
            return std::isfinite(v.as_number()) ? format_number(v.as_number()) : "null";
        case ValueType::String:  return quote_json(v.as_string());
        case ValueType::Date:    return quote_json(format_iso(v.as_date()));
        case ValueType::Array: {
            std::vector<std::string> parts;
            for (const auto& e : v.as_array()) parts.push_back(to_json(e));
            return fmt::format("[{}]", fmt::join(parts, ","));
        }
        case ValueType::Object: {
            std::vector<std::string> parts;
            for (const auto& [k, e] : v.as_object()) parts.push_back(quote_json(k) + ":" + to_json(e));
            return fmt::format("{{{}}}", fmt::join(parts, ","));
        }
    }
    return "null";
}

std::string to_display_string(const Value& v) {
    switch (v.type()) {
        case ValueType::Null:    return "";
        case ValueType::Boolean: return v.as_bool() ? "true" : "false";
        case ValueType::Number:  return format_number(v.as_number());
        case ValueType::String:  return v.as_string();
        case ValueType::Date:    return format_iso(v.as_date());
        default:                 return to_json(v);
    }
}

// Whole-string numeric parse; leading/trailing blanks allowed.
static bool strict_number(const std::string& s, double& out) {
    const char* begin = s.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
    return *end == '\0';
}

bool loosely_equal(const Value& a, const Value& b) {
    if (a.type() == b.type()) return a == b;

    auto numeric = [](const Value& v, double& out) {
        if (v.is_number()) { out = v.as_number(); return true; }
        if (v.is_bool())   { out = v.as_bool() ? 1.0 : 0.0; return true; }
        if (v.is_string()) return strict_number(v.as_string(), out);
        return false;
    };

    if (a.is_date() || b.is_date()) {
        const Value& other = a.is_date() ? b : a;
        Timestamp t;
        if (!other.is_string() || !parse_iso(other.as_string(), t)) return false;
        return t == (a.is_date() ? a.as_date() : b.as_date());
    }
    if (a.is_null() || b.is_null()) return false;

    double x = 0, y = 0;
    if (numeric(a, x) && numeric(b, y)) return x == y;
    return false;
}

template <class T>
static int three_way(const T& x, const T& y) {
    return x < y ? -1 : (y < x ? 1 : 0);
}

int compare_values(const Value& a, const Value& b) {
    if (a.is_string() && b.is_string()) return three_way(a.as_string(), b.as_string());
    if (a.is_date() || b.is_date()) {
        if ((a.is_date() || a.is_string()) && (b.is_date() || b.is_string()))
            return three_way(to_timestamp(a), to_timestamp(b));
    } else {
        auto orderable = [](const Value& v) { return v.is_number() || v.is_bool() || v.is_string(); };
        if (orderable(a) && orderable(b)) return three_way(to_number(a), to_number(b));
    }
    throw FormulaError(fmt::format("Cannot compare {} with {}", to_string(a.type()), to_string(b.type())),
                       ErrorCode::TypeError);
}

double round_half_away(double x, int digits) {
    if (!std::isfinite(x)) return x;
    const double factor = std::pow(10.0, digits);
    return std::round(x * factor) / factor;
}

} // namespace formula
