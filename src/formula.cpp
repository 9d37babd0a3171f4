#include "formula/formula.hpp"

namespace formula {

FormulaResult evaluate_formula(std::string_view source, const FormulaContext& ctx,
                               std::shared_ptr<MentionResolver> resolver, EvaluationOptions options) {
    return Evaluator(FunctionRegistry::builtin(), std::move(resolver), std::move(options)).evaluate(source, ctx);
}

std::future<FormulaResult> evaluate_formula_async(std::string source, FormulaContext ctx,
                                                  std::shared_ptr<MentionResolver> resolver,
                                                  EvaluationOptions options) {
    return Evaluator(FunctionRegistry::builtin(), std::move(resolver), std::move(options))
        .evaluate_async(std::move(source), std::move(ctx));
}

const std::vector<FunctionDefinition>& available_functions() {
    return FunctionRegistry::builtin().all();
}

} // namespace formula
