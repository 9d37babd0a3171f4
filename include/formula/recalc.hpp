#pragma once
#include <map>
#include <string>
#include <vector>

#include "formula/context.hpp"
#include "formula/evaluator.hpp"

namespace formula {

struct NamedFormula {
    std::string name;   // the field the result is stored under
    std::string source;
};

struct Recalculation {
    std::vector<std::string> order; // evaluation order; cyclic formulas are absent
    std::map<std::string, FormulaResult> results;
};

/// Evaluates computed fields so that each formula runs after the formulas it
/// reads. Successful results become fields for later formulas; failed ones are
/// visible as null. Formulas on, or downstream of, a cycle fail with
/// CIRCULAR_REFERENCE. Throws std::invalid_argument on duplicate names.
Recalculation recalculate(const std::vector<NamedFormula>& formulas, const FormulaContext& base,
                          const Evaluator& evaluator = Evaluator());

} // namespace formula
