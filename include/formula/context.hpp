#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "formula/value.hpp"

namespace formula {

/// An external entity referenced as @label (place, person, date, ...).
struct MentionRecord {
    std::string id;
    std::string type;
    std::string label;
    bool resolved{true};
    Object properties;
};

/// Object form used when a mention flows through a formula:
/// {id, type, label, resolved, properties}.
Value to_value(const MentionRecord& m);

/// Read-only snapshot a formula is evaluated against.
struct FormulaContext {
    Object fields;
    std::vector<MentionRecord> mentions;
    Array siblings;
    Object settings;
    std::string current_strand_path;
    std::string current_block_id;
    Timestamp now{};

    /// Case-insensitive label lookup in `mentions`; nullptr when absent.
    const MentionRecord* find_mention(std::string_view label) const;
};

struct ContextOverrides {
    std::optional<Object> fields;
    std::optional<std::vector<MentionRecord>> mentions;
    std::optional<Array> siblings;
    std::optional<Object> settings;
    std::optional<std::string> current_strand_path;
    std::optional<std::string> current_block_id;
    std::optional<Timestamp> now;
};

/// Defaults (empty collections, empty strings, now = wall clock) overlaid with `overrides`.
FormulaContext create_formula_context(ContextOverrides overrides = {});

/// Current wall-clock time at millisecond resolution.
Timestamp current_time();

/// Heuristic formula ideas for the given context. Never fails.
std::vector<std::string> suggest_formulas(const FormulaContext& ctx);

/// ASCII lower-casing, used for case-insensitive names.
std::string to_lower(std::string_view s);

} // namespace formula
