#include "builtin_helpers.hpp"
#include "formula/error.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace formula {

using detail::arg;

namespace {

const char* const kMonthShort[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
const char* const kMonthLong[] = {"January", "February", "March", "April", "May", "June",
                                  "July", "August", "September", "October", "November", "December"};
const char* const kWeekdayLong[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

std::string unit_arg(const std::vector<Value>& args, std::size_t i) {
    const Value& v = arg(args, i);
    return truthy(v) ? to_lower(to_display_string(v)) : std::string("days");
}

std::string clock_time(const CivilTime& c) {
    int h12 = c.hour % 12 == 0 ? 12 : c.hour % 12;
    return fmt::format("{:02}:{:02} {}", h12, c.minute, c.hour < 12 ? "AM" : "PM");
}

// Largest month shift that can land inside the representable date range.
constexpr double kMaxMonths = 3.3e6;

// Calendar month arithmetic; the day is clamped to the end of the target month.
Timestamp add_months(Timestamp t, double months) {
    if (!std::isfinite(months) || std::fabs(months) > kMaxMonths)
        throw FormulaError(fmt::format("DateAdd amount {} is out of range", format_number(months)),
                           ErrorCode::TypeError);
    CivilTime c = to_civil(t);
    int total = c.year * 12 + (c.month - 1) + static_cast<int>(months);
    c.year = total >= 0 ? total / 12 : (total - 11) / 12;
    c.month = total - c.year * 12 + 1;
    c.day = std::min(c.day, days_in_month(c.year, c.month));
    return timestamp_from_ms(static_cast<double>(from_civil(c).time_since_epoch().count()));
}

Value duration(const std::vector<Value>& args, const FormulaContext&) {
    const Timestamp start = to_timestamp(arg(args, 0));
    const Timestamp end = to_timestamp(arg(args, 1));
    const std::string unit = unit_arg(args, 2);
    const double diff = static_cast<double>((end - start).count());

    if (unit == "milliseconds" || unit == "ms") return diff;
    if (unit == "seconds" || unit == "s") return round_half_away(diff / 1000.0);
    if (unit == "minutes" || unit == "m") return round_half_away(diff / 60000.0);
    if (unit == "hours" || unit == "h") return round_half_away(diff / 3600000.0);
    return round_half_away(diff / 86400000.0);
}

Value date_add(const std::vector<Value>& args, const FormulaContext&) {
    const Timestamp date = to_timestamp(arg(args, 0));
    const double amount = to_number(arg(args, 1));
    const std::string unit = unit_arg(args, 2);

    auto shift = [&](double ms_per_unit) {
        return timestamp_from_ms(static_cast<double>(date.time_since_epoch().count()) + amount * ms_per_unit);
    };

    Timestamp result = date;
    if (unit == "minutes" || unit == "m") result = shift(60000.0);
    else if (unit == "hours" || unit == "h") result = shift(3600000.0);
    else if (unit == "days" || unit == "d") result = shift(86400000.0);
    else if (unit == "weeks" || unit == "w") result = shift(7 * 86400000.0);
    else if (unit == "months") result = add_months(date, amount);
    else if (unit == "years" || unit == "y") result = add_months(date, std::trunc(amount) * 12);
    return format_iso(result);
}

Value format_date(const std::vector<Value>& args, const FormulaContext&) {
    const CivilTime c = to_civil(to_timestamp(arg(args, 0)));
    const Value& style_arg = arg(args, 1);
    const std::string style = truthy(style_arg) ? to_display_string(style_arg) : std::string("medium");
    const char* mon = kMonthShort[c.month - 1];

    if (style == "short") return fmt::format("{} {}", mon, c.day);
    if (style == "long")
        return fmt::format("{}, {} {}, {}", kWeekdayLong[c.weekday], kMonthLong[c.month - 1], c.day, c.year);
    if (style == "iso") return fmt::format("{:04}-{:02}-{:02}", c.year, c.month, c.day);
    if (style == "time") return clock_time(c);
    if (style == "datetime") return fmt::format("{} {}, {}", mon, c.day, clock_time(c));
    return fmt::format("{} {}, {}", mon, c.day, c.year);
}

} // namespace

std::vector<FunctionDefinition> date_functions() {
    return {
        {"Now", FunctionCategory::Date, "Current date and time", "Now() → \"2024-01-15T10:30:00.000Z\"",
         {}, "datetime", false,
         [](const std::vector<Value>&, const FormulaContext& ctx) -> Value { return format_iso(ctx.now); }},
        {"Today", FunctionCategory::Date, "Current date (no time)", "Today() → \"2024-01-15\"",
         {}, "date", false,
         [](const std::vector<Value>&, const FormulaContext& ctx) -> Value { return format_iso_date(ctx.now); }},
        {"Duration", FunctionCategory::Date, "Calculate duration between two dates", "Duration(@start, @end) → 3",
         {detail::param("start", "date", "Start date"),
          detail::param("end", "date", "End date"),
          detail::optional_param("unit", "string", "Unit (days/hours/minutes)", "days")},
         "number", false, duration},
        {"DateAdd", FunctionCategory::Date, "Add duration to a date", "DateAdd(@date, 7, \"days\") → next week",
         {detail::param("date", "date", "Base date"),
          detail::param("amount", "number", "Amount to add"),
          detail::optional_param("unit", "string", "Unit (days/hours/minutes)", "days")},
         "date", false, date_add},
        {"FormatDate", FunctionCategory::Date, "Format date for display", "FormatDate(@date, \"short\") → \"Jan 15\"",
         {detail::param("date", "date", "Date to format"),
          detail::optional_param("format", "string", "Format style", "medium")},
         "string", false, format_date},
        {"DayOfWeek", FunctionCategory::Date, "Get day of week (0=Sunday, 6=Saturday)", "DayOfWeek(@date) → 1 (Monday)",
         {detail::param("date", "date", "Date")}, "number", false,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             return static_cast<double>(to_civil(to_timestamp(arg(args, 0))).weekday);
         }},
    };
}

} // namespace formula
