#pragma once
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "formula/context.hpp"
#include "formula/evaluator.hpp"
#include "formula/functions.hpp"
#include "formula/parser.hpp"
#include "formula/recalc.hpp"

namespace formula {

/// Throws FormulaError(ParseError) on malformed input.
inline ParsedFormula parse_formula(std::string_view source) { return parse(source); }

/// Never throws. Without a resolver, mentions are looked up in ctx.mentions by label.
FormulaResult evaluate_formula(std::string_view source, const FormulaContext& ctx,
                               std::shared_ptr<MentionResolver> resolver = nullptr,
                               EvaluationOptions options = {});

std::future<FormulaResult> evaluate_formula_async(std::string source, FormulaContext ctx,
                                                  std::shared_ptr<MentionResolver> resolver = nullptr,
                                                  EvaluationOptions options = {});

/// Built-in catalog in registration order.
const std::vector<FunctionDefinition>& available_functions();

} // namespace formula
