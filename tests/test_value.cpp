#include <gtest/gtest.h>
#include <formula/error.hpp>
#include <formula/value.hpp>

#include <cmath>
#include <limits>
#include <string>

namespace {

using namespace formula;

Timestamp iso(const char* text) {
    Timestamp t;
    EXPECT_TRUE(parse_iso(text, t)) << text;
    return t;
}

TEST(Value, KindsFollowConstructors) {
    EXPECT_EQ(Value().type(), ValueType::Null);
    EXPECT_EQ(Value(nullptr).type(), ValueType::Null);
    EXPECT_EQ(Value(true).type(), ValueType::Boolean);
    EXPECT_EQ(Value(3).type(), ValueType::Number);
    EXPECT_EQ(Value("x").type(), ValueType::String);
    EXPECT_EQ(Value(Array{1, 2}).type(), ValueType::Array);
    EXPECT_EQ(Value(Object{{"a", 1}}).type(), ValueType::Object);
    EXPECT_STREQ(to_string(ValueType::Date), "date");
}

TEST(Value, FindOnlyOnObjects) {
    Value obj = Object{{"name", "Ada"}};
    ASSERT_NE(obj.find("name"), nullptr);
    EXPECT_EQ(*obj.find("name"), Value("Ada"));
    EXPECT_EQ(obj.find("missing"), nullptr);
    EXPECT_EQ(Value(1).find("name"), nullptr);
}

TEST(Value, NumberFormatting) {
    EXPECT_EQ(format_number(42), "42");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(-3.25), "-3.25");
    EXPECT_EQ(format_number(-0.0), "0");
    EXPECT_EQ(format_number(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(format_number(std::nan("")), "NaN");
}

TEST(Value, NumberFormattingAtTheEdges) {
    EXPECT_EQ(format_number(1e16), "10000000000000000");
    EXPECT_EQ(format_number(-1e16), "-10000000000000000");
    EXPECT_EQ(format_number(123456789012345680000.0), "123456789012345680000");
    EXPECT_EQ(format_number(1e21), "1e+21");
    EXPECT_EQ(format_number(2.5e25), "2.5e+25");
    EXPECT_EQ(format_number(0.000001), "0.000001");
    EXPECT_EQ(format_number(1.2345e-5), "0.000012345");
    EXPECT_EQ(format_number(1e-7), "1e-7");
    EXPECT_EQ(format_number(-1.5e-7), "-1.5e-7");
    EXPECT_EQ(format_number(123.456), "123.456");
}

TEST(Value, TimestampRange) {
    EXPECT_EQ(format_iso(to_timestamp(Value(0))), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(format_iso(timestamp_from_ms(86400000.0)), "1970-01-02T00:00:00.000Z");
    EXPECT_NO_THROW(timestamp_from_ms(8.64e15));
    EXPECT_NO_THROW(timestamp_from_ms(-8.64e15));
    for (double ms : {8.64e15 + 1, -8.64e15 - 1, 1e300, std::numeric_limits<double>::infinity(), std::nan("")}) {
        try {
            to_timestamp(Value(ms));
            FAIL() << "expected TypeError for " << ms;
        } catch (const FormulaError& e) {
            EXPECT_EQ(e.code, ErrorCode::TypeError);
        }
    }
}

TEST(Value, ToNumber) {
    EXPECT_DOUBLE_EQ(to_number(Value(true)), 1.0);
    EXPECT_DOUBLE_EQ(to_number(Value("12.5kg")), 12.5);
    try {
        to_number(Value("abc"));
        FAIL() << "expected TypeError";
    } catch (const FormulaError& e) {
        EXPECT_EQ(e.code, ErrorCode::TypeError);
    }
    EXPECT_THROW(to_number(Value()), FormulaError);
    EXPECT_THROW(to_number(Value(Array{})), FormulaError);
}

TEST(Value, Truthiness) {
    EXPECT_FALSE(truthy(Value()));
    EXPECT_FALSE(truthy(Value(0)));
    EXPECT_FALSE(truthy(Value("")));
    EXPECT_TRUE(truthy(Value("0")));
    EXPECT_TRUE(truthy(Value(-1)));
    EXPECT_TRUE(truthy(Value(Array{})));
}

TEST(Value, DisplayAndJson) {
    EXPECT_EQ(to_display_string(Value()), "");
    EXPECT_EQ(to_display_string(Value(false)), "false");
    EXPECT_EQ(to_display_string(Value("plain")), "plain");
    EXPECT_EQ(to_display_string(Value(Array{1, "a", nullptr})), "[1,\"a\",null]");
    EXPECT_EQ(to_json(Value(Object{{"b", true}, {"a", "q\"t"}})), "{\"a\":\"q\\\"t\",\"b\":true}");
    EXPECT_EQ(to_display_string(Value(iso("2024-01-15T10:30:00Z"))), "2024-01-15T10:30:00.000Z");
}

TEST(Value, IsoParsing) {
    EXPECT_EQ(iso("1970-01-01").time_since_epoch().count(), 0);
    EXPECT_EQ(iso("1970-01-02T00:00:00.250Z").time_since_epoch().count(), 86400250);
    EXPECT_EQ(iso("2024-01-15T12:30:00+02:00"), iso("2024-01-15T10:30:00Z"));
    EXPECT_EQ(iso("2024-01-15 10:30"), iso("2024-01-15T10:30:00Z"));

    Timestamp t;
    EXPECT_FALSE(parse_iso("2024-02-30", t));
    EXPECT_FALSE(parse_iso("2024-1-5", t));
    EXPECT_FALSE(parse_iso("2024-01-15T25:00", t));
    EXPECT_FALSE(parse_iso("2024-01-15trailing", t));
    EXPECT_FALSE(parse_iso("", t));
}

TEST(Value, CivilRoundTrip) {
    CivilTime c = to_civil(iso("2024-02-29T23:59:58.123Z"));
    EXPECT_EQ(c.year, 2024);
    EXPECT_EQ(c.month, 2);
    EXPECT_EQ(c.day, 29);
    EXPECT_EQ(c.hour, 23);
    EXPECT_EQ(c.minute, 59);
    EXPECT_EQ(c.second, 58);
    EXPECT_EQ(c.millisecond, 123);
    EXPECT_EQ(c.weekday, 4); // Thursday
    EXPECT_EQ(format_iso(from_civil(c)), "2024-02-29T23:59:58.123Z");

    EXPECT_EQ(to_civil(iso("1969-12-31")).weekday, 3);
    EXPECT_EQ(to_civil(iso("1900-01-01")).year, 1900);
}

TEST(Value, FromCivilCarriesMonths) {
    CivilTime c;
    c.year = 2023;
    c.month = 13;
    c.day = 5;
    EXPECT_EQ(format_iso_date(from_civil(c)), "2024-01-05");
    c.month = 0;
    EXPECT_EQ(format_iso_date(from_civil(c)), "2022-12-05");
}

TEST(Value, DaysInMonth) {
    EXPECT_EQ(days_in_month(2024, 2), 29);
    EXPECT_EQ(days_in_month(2023, 2), 28);
    EXPECT_EQ(days_in_month(1900, 2), 28);
    EXPECT_EQ(days_in_month(2000, 2), 29);
    EXPECT_EQ(days_in_month(2024, 4), 30);
    EXPECT_EQ(days_in_month(2024, 12), 31);
}

TEST(Value, LooseEquality) {
    EXPECT_TRUE(loosely_equal(Value(5), Value("5")));
    EXPECT_TRUE(loosely_equal(Value(1), Value(true)));
    EXPECT_FALSE(loosely_equal(Value(5), Value("5x")));
    EXPECT_FALSE(loosely_equal(Value(), Value(0)));
    EXPECT_TRUE(loosely_equal(Value(), Value()));
    EXPECT_TRUE(loosely_equal(Value(iso("2024-01-15")), Value("2024-01-15T00:00:00Z")));
    EXPECT_FALSE(loosely_equal(Value("a"), Value("A")));
}

TEST(Value, Ordering) {
    EXPECT_LT(compare_values(Value(2), Value(10)), 0);
    EXPECT_GT(compare_values(Value("b"), Value("a")), 0);
    EXPECT_LT(compare_values(Value("10"), Value("9")), 0); // lexicographic
    EXPECT_GT(compare_values(Value(10), Value("9")), 0);   // numeric
    EXPECT_EQ(compare_values(Value(iso("2024-01-15")), Value("2024-01-15")), 0);
    EXPECT_THROW(compare_values(Value(Array{}), Value(1)), FormulaError);
    EXPECT_THROW(compare_values(Value(), Value(1)), FormulaError);
}

TEST(Value, RoundHalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(round_half_away(2.5), 3.0);
    EXPECT_DOUBLE_EQ(round_half_away(-2.5), -3.0);
    EXPECT_DOUBLE_EQ(round_half_away(3.14159, 2), 3.14);
    EXPECT_DOUBLE_EQ(round_half_away(1234.5, -2), 1200.0);
}

} // namespace
