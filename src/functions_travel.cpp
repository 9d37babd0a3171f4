#include "builtin_helpers.hpp"

#include <cmath>
#include <optional>

namespace formula {

using detail::arg;

namespace {

struct LatLng {
    double lat;
    double lng;
};

std::optional<LatLng> coords_of(const Value& obj) {
    const Value* lat = obj.find("latitude");
    const Value* lng = obj.find("longitude");
    if (lat && lng && lat->is_number() && lng->is_number()) return LatLng{lat->as_number(), lng->as_number()};
    return std::nullopt;
}

// Object (or its "properties") carrying latitude/longitude, or the label of a place mention.
std::optional<LatLng> locate(const Value& v, const FormulaContext& ctx) {
    if (v.is_string()) {
        const MentionRecord* m = ctx.find_mention(v.as_string());
        if (!m || to_lower(m->type) != "place") return std::nullopt;
        return coords_of(Value(m->properties));
    }
    if (!v.is_object()) return std::nullopt;
    if (auto c = coords_of(v)) return c;
    if (const Value* props = v.find("properties")) return coords_of(*props);
    return std::nullopt;
}

// Great-circle distance in km.
double haversine(LatLng a, LatLng b) {
    constexpr double kEarthRadiusKm = 6371.0;
    constexpr double kRad = 3.14159265358979323846 / 180.0;
    const double dlat = (b.lat - a.lat) * kRad;
    const double dlng = (b.lng - a.lng) * kRad;
    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(a.lat * kRad) * std::cos(b.lat * kRad) * std::sin(dlng / 2) * std::sin(dlng / 2);
    return kEarthRadiusKm * 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

// Mentions flow in as objects; use their label for display.
std::string place_name(const Value& v) {
    if (const Value* label = v.find("label")) return to_display_string(*label);
    return to_display_string(v);
}

} // namespace

std::vector<FunctionDefinition> travel_functions() {
    return {
        {"Route", FunctionCategory::Travel, "Calculate route between two places (requires external API)", "Route(@home, @office)",
         {detail::param("from", "place", "Starting location"),
          detail::param("to", "place", "Destination"),
          detail::optional_param("mode", "string", "Travel mode (drive/walk/transit)", "drive")},
         "object", true,
         [](const std::vector<Value>& args, const FormulaContext&) -> Value {
             Object o;
             o["from"] = place_name(arg(args, 0));
             o["to"] = place_name(arg(args, 1));
             o["mode"] = truthy(arg(args, 2)) ? to_display_string(arg(args, 2)) : std::string("drive");
             o["distance"] = "-- km";
             o["duration"] = "-- min";
             o["message"] = "Route API not configured. Connect a routing service for real routes.";
             return o;
         }},
        {"Weather", FunctionCategory::Travel, "Get weather forecast for a place and date", "Weather(@paris, @friday)",
         {detail::param("place", "place", "Location"),
          detail::param("date", "date", "Date for forecast", false)},
         "object", true,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             const Timestamp date = truthy(arg(args, 1)) ? to_timestamp(arg(args, 1)) : ctx.now;
             Object o;
             o["place"] = place_name(arg(args, 0));
             o["date"] = format_iso_date(date);
             o["condition"] = "Unknown";
             o["temperature"] = "--°";
             o["message"] = "Weather API not configured. Connect a forecast service for real forecasts.";
             return o;
         }},
        {"Distance", FunctionCategory::Travel, "Calculate straight-line distance between coordinates", "Distance(@paris, @london)",
         {detail::param("from", "place", "Starting point"),
          detail::param("to", "place", "End point")},
         "number", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             auto from = locate(arg(args, 0), ctx);
             auto to = locate(arg(args, 1), ctx);
             if (!from || !to) return 0.0;
             return round_half_away(haversine(*from, *to), 1);
         }},
    };
}

} // namespace formula
