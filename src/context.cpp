#include "formula/context.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace formula {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Value to_value(const MentionRecord& m) {
    Object o;
    o["id"] = m.id;
    o["type"] = m.type;
    o["label"] = m.label;
    o["resolved"] = m.resolved;
    o["properties"] = m.properties;
    return o;
}

const MentionRecord* FormulaContext::find_mention(std::string_view label) const {
    const std::string want = to_lower(label);
    for (const auto& m : mentions)
        if (to_lower(m.label) == want) return &m;
    return nullptr;
}

Timestamp current_time() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

FormulaContext create_formula_context(ContextOverrides overrides) {
    FormulaContext ctx;
    if (overrides.fields) ctx.fields = std::move(*overrides.fields);
    if (overrides.mentions) ctx.mentions = std::move(*overrides.mentions);
    if (overrides.siblings) ctx.siblings = std::move(*overrides.siblings);
    if (overrides.settings) ctx.settings = std::move(*overrides.settings);
    if (overrides.current_strand_path) ctx.current_strand_path = std::move(*overrides.current_strand_path);
    if (overrides.current_block_id) ctx.current_block_id = std::move(*overrides.current_block_id);
    ctx.now = overrides.now ? *overrides.now : current_time();
    return ctx;
}

std::vector<std::string> suggest_formulas(const FormulaContext& ctx) {
    std::vector<std::string> out{"Now()", "Today()"};

    std::vector<const MentionRecord*> places;
    for (const auto& m : ctx.mentions)
        if (to_lower(m.type) == "place") places.push_back(&m);
    if (places.size() >= 2) {
        out.push_back(fmt::format("Route(@{}, @{})", places[0]->label, places[1]->label));
        out.push_back(fmt::format("Distance(@{}, @{})", places[0]->label, places[1]->label));
    }

    std::vector<std::string> numeric;
    for (const auto& [name, v] : ctx.fields)
        if (v.is_number()) numeric.push_back(name);
    if (numeric.size() >= 2) {
        out.push_back(fmt::format("Sum({})", fmt::join(numeric, ", ")));
        out.push_back(fmt::format("Average({})", fmt::join(numeric, ", ")));
    }

    if (!ctx.siblings.empty()) out.push_back("Count(siblings)");
    return out;
}

} // namespace formula
