#include "formula/recalc.hpp"
#include "formula/log.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <stdexcept>

#include <fmt/format.h>

namespace formula {

namespace {

struct Entry {
    const NamedFormula* formula;
    std::optional<ParsedFormula> parsed;
    std::vector<std::string> needs; // other formulas in the batch this one reads
                                    // (none when parsing failed)
    bool done{false};
};

FormulaResult circular(const Entry& e, const std::string& cycle, const EvaluationOptions& options) {
    FormulaResult r;
    r.display_value = options.error_display_value;
    r.error = fmt::format("Circular reference among {}", cycle);
    r.error_code = ErrorCode::CircularReference;
    if (e.parsed) {
        r.dependencies = e.parsed->dependencies;
        r.dependencies.insert(r.dependencies.end(), e.parsed->mention_dependencies.begin(),
                              e.parsed->mention_dependencies.end());
    }
    r.evaluated_at = current_time();
    return r;
}

} // namespace

Recalculation recalculate(const std::vector<NamedFormula>& formulas, const FormulaContext& base,
                          const Evaluator& evaluator) {
    std::set<std::string> names;
    for (const auto& f : formulas)
        if (!names.insert(f.name).second) throw std::invalid_argument("Duplicate formula name: " + f.name);

    std::vector<Entry> entries;
    entries.reserve(formulas.size());
    for (const auto& f : formulas) {
        Entry e{&f, std::nullopt, {}, false};
        try {
            e.parsed.emplace(parse(f.source));
            for (const auto& dep : e.parsed->dependencies)
                if (names.count(dep)) e.needs.push_back(dep);
        } catch (const FormulaError& err) {
            // no inputs; evaluate() reports the PARSE_ERROR when its turn comes
            logger()->debug("formula '{}' does not parse: {}", f.name, err.what());
        }
        entries.push_back(std::move(e));
    }

    Recalculation out;
    FormulaContext ctx = base;
    std::set<std::string> finished;

    // Repeatedly take the first pending formula whose inputs are all finished.
    for (;;) {
        auto ready = std::find_if(entries.begin(), entries.end(), [&](const Entry& e) {
            return !e.done && std::all_of(e.needs.begin(), e.needs.end(),
                                          [&](const std::string& n) { return finished.count(n) > 0; });
        });
        if (ready == entries.end()) break;

        const std::string& name = ready->formula->name;
        FormulaResult r = ready->parsed ? evaluator.evaluate(*ready->parsed, ctx)
                                        : evaluator.evaluate(ready->formula->source, ctx);
        ctx.fields[name] = r.success ? r.value : Value();
        out.order.push_back(name);
        out.results.emplace(name, std::move(r));
        finished.insert(name);
        ready->done = true;
    }

    std::vector<std::string> stuck;
    for (const auto& e : entries)
        if (!e.done) stuck.push_back(e.formula->name);
    if (!stuck.empty()) {
        const std::string cycle = fmt::format("'{}'", fmt::join(stuck, "', '"));
        logger()->warn("recalculation found a dependency cycle among {}", cycle);
        for (const auto& e : entries)
            if (!e.done) out.results.emplace(e.formula->name, circular(e, cycle, evaluator.options()));
    }

    logger()->debug("recalculated {} formula(s) in order [{}]", out.order.size(), fmt::join(out.order, ", "));
    return out;
}

} // namespace formula
