#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "formula/context.hpp"
#include "formula/error.hpp"
#include "formula/functions.hpp"
#include "formula/parser.hpp"
#include "formula/value.hpp"

namespace formula {

/// External lookup of @mentions (places, people, ...). May complete on another
/// thread. An empty optional means "nothing by that name"; an exception stored
/// in the future (or thrown by resolve) fails the evaluation with ASYNC_ERROR.
class MentionResolver {
public:
    virtual ~MentionResolver() = default;
    virtual std::future<std::optional<MentionRecord>> resolve(const std::string& name) = 0;
};

struct EvaluationOptions {
    /// Deadline for the whole evaluation, checked while waiting on mention lookups.
    std::optional<std::chrono::milliseconds> timeout;
    /// Unknown identifiers fail with UNKNOWN_REFERENCE instead of evaluating to their own name.
    bool strict_references{false};
    std::string error_display_value{"Error"};
};

struct FormulaResult {
    bool success{false};
    Value value;
    ValueType value_type{ValueType::Null};
    std::string display_value;
    std::optional<std::string> error;     // set iff !success
    std::optional<ErrorCode> error_code;
    std::vector<std::string> dependencies; // fields, then "@mentions"
    Timestamp evaluated_at{};
    double execution_time_ms{0.0};
};

/// Walks a parsed formula against a context. Stateless between calls, so one
/// instance may serve concurrent evaluations.
class Evaluator {
public:
    explicit Evaluator(const FunctionRegistry& registry = FunctionRegistry::builtin(),
                       std::shared_ptr<MentionResolver> resolver = nullptr,
                       EvaluationOptions options = {});

    /// Parse + evaluate. Never throws; every failure is reported in the result.
    FormulaResult evaluate(std::string_view source, const FormulaContext& ctx) const;
    FormulaResult evaluate(const ParsedFormula& parsed, const FormulaContext& ctx) const;

    /// Runs evaluate() on its own thread.
    std::future<FormulaResult> evaluate_async(std::string source, FormulaContext ctx) const;

    /// Evaluate the tree and return the raw value. Throws FormulaError.
    Value evaluate_value(const ParsedFormula& parsed, const FormulaContext& ctx) const;

    const EvaluationOptions& options() const { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    FormulaResult finish(const ParsedFormula& parsed, const FormulaContext& ctx, Clock::time_point started) const;
    FormulaResult failure(std::string message, std::optional<ErrorCode> code, std::optional<std::size_t> position,
                          std::vector<std::string> deps, Clock::time_point started) const;

    const FunctionRegistry* registry_;
    std::shared_ptr<MentionResolver> resolver_;
    EvaluationOptions options_;
};

} // namespace formula
