#include "builtin_helpers.hpp"

#include <cmath>
#include <cstdlib>

namespace formula {

using detail::arg;

namespace {

// The literal string "siblings" names the context's sibling records.
Array collection(const Value& v, const FormulaContext& ctx) {
    if (v.is_string() && v.as_string() == "siblings") return ctx.siblings;
    if (v.is_array()) return v.as_array();
    if (v.is_null()) return {};
    return Array{v};
}

// A record's field: record.fields[name] first, then record[name].
const Value* record_field(const Value& item, const std::string& name) {
    if (const Value* fields = item.find("fields"))
        if (const Value* v = fields->find(name)) return v;
    return item.find(name);
}

bool matches(const Value& item, const std::string& field, const Value& wanted) {
    if (!item.is_object()) return false;
    if (const Value* fields = item.find("fields"))
        if (const Value* v = fields->find(field); v && *v == wanted) return true;
    const Value* v = item.find(field);
    return v && *v == wanted;
}

Array filtered(const std::vector<Value>& args, const FormulaContext& ctx) {
    Array items = collection(arg(args, 0), ctx);
    if (args.size() < 2) return items;
    const std::string field = to_display_string(args[1]);
    const Value& wanted = arg(args, 2);
    Array out;
    for (auto& item : items)
        if (matches(item, field, wanted)) out.push_back(std::move(item));
    return out;
}

} // namespace

std::vector<FunctionDefinition> aggregate_functions() {
    return {
        {"Count", FunctionCategory::Aggregate, "Count items matching a filter", "Count(siblings, \"status\", \"done\")",
         {detail::param("collection", "array", "Items to count"),
          detail::param("field", "string", "Field to filter on", false),
          detail::param("value", "any", "Value to match", false)},
         "number", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             return static_cast<double>(filtered(args, ctx).size());
         }},
        {"SumField", FunctionCategory::Aggregate, "Sum a specific field across items", "SumField(siblings, \"amount\")",
         {detail::param("collection", "array", "Items to sum"),
          detail::param("field", "string", "Field to sum")},
         "number", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             const std::string field = to_display_string(arg(args, 1));
             double sum = 0.0;
             for (const auto& item : collection(arg(args, 0), ctx)) {
                 const Value* v = record_field(item, field);
                 if (!v) continue;
                 if (v->is_number()) {
                     sum += v->as_number();
                 } else if (v->is_string()) {
                     const char* begin = v->as_string().c_str();
                     char* end = nullptr;
                     double d = std::strtod(begin, &end);
                     if (end != begin && !std::isnan(d)) sum += d;
                 }
             }
             return sum;
         }},
        {"Filter", FunctionCategory::Aggregate, "Filter items by field value", "Filter(siblings, \"status\", \"done\")",
         {detail::param("collection", "array", "Items to filter"),
          detail::param("field", "string", "Field to match"),
          detail::param("value", "any", "Value to match")},
         "array", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value { return filtered(args, ctx); }},
    };
}

std::vector<FunctionDefinition> reference_functions() {
    return {
        {"Get", FunctionCategory::Reference, "Get a field value from current block", "Get(\"status\")",
         {detail::param("fieldName", "string", "Field name")}, "any", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             auto it = ctx.fields.find(to_display_string(arg(args, 0)));
             return it == ctx.fields.end() ? Value() : it->second;
         }},
        {"Mention", FunctionCategory::Reference, "Get a mentioned entity by label", "Mention(\"paris\")",
         {detail::param("label", "string", "Entity label")}, "entity", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             const MentionRecord* m = ctx.find_mention(to_display_string(arg(args, 0)));
             return m ? to_value(*m) : Value();
         }},
        {"MentionsOfType", FunctionCategory::Reference, "Get all mentions of a specific type", "MentionsOfType(\"place\")",
         {detail::param("type", "string", "Entity type")}, "entity[]", false,
         [](const std::vector<Value>& args, const FormulaContext& ctx) -> Value {
             const std::string type = to_lower(to_display_string(arg(args, 0)));
             Array out;
             for (const auto& m : ctx.mentions)
                 if (to_lower(m.type) == type) out.push_back(to_value(m));
             return out;
         }},
    };
}

} // namespace formula
