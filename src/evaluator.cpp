#include "formula/evaluator.hpp"
#include "formula/log.hpp"

#include <cmath>
#include <map>

#include <fmt/format.h>

namespace formula {

namespace {

using MentionFuture = std::shared_future<std::optional<MentionRecord>>;

// One evaluation: the context, the in-flight mention lookups and the deadline.
class Walk {
public:
    Walk(const FunctionRegistry& registry, MentionResolver* resolver, const EvaluationOptions& options,
         const FormulaContext& ctx)
        : registry_(registry), resolver_(resolver), options_(options), ctx_(ctx) {
        if (options_.timeout) deadline_ = std::chrono::steady_clock::now() + *options_.timeout;
    }

    // Start every lookup up front, in source order; nodes wait on them later.
    void prefetch(const std::vector<std::string>& mentions) {
        if (!resolver_) return;
        for (const auto& dep : mentions) {
            std::string name = dep.substr(1); // strip '@'
            logger()->trace("resolving mention @{}", name);
            try {
                pending_.emplace(name, resolver_->resolve(name).share());
            } catch (...) {
                // parked in the future; mention() reports it as ASYNC_ERROR
                std::promise<std::optional<MentionRecord>> failed;
                failed.set_exception(std::current_exception());
                pending_.emplace(name, failed.get_future().share());
            }
        }
    }

    Value eval(const Node& n) {
        try {
            return dispatch(n);
        } catch (FormulaError& e) {
            if (!e.position) e.position = n.position;
            throw;
        }
    }

private:
    Value dispatch(const Node& n) {
        if (auto* x = std::get_if<Literal>(&n.data)) return x->value;
        if (auto* x = std::get_if<Identifier>(&n.data)) return identifier(*x, n.position);
        if (auto* x = std::get_if<Mention>(&n.data)) return mention(x->name, n.position);
        if (auto* x = std::get_if<Member>(&n.data)) return member(eval(*x->object), x->property);
        if (auto* x = std::get_if<Call>(&n.data)) return call(*x, n.position);
        if (auto* x = std::get_if<Unary>(&n.data)) return -to_number(eval(*x->operand));
        if (auto* x = std::get_if<Binary>(&n.data)) {
            Value l = eval(*x->left);
            Value r = eval(*x->right);
            return binary(x->op, l, r, n.position);
        }
        if (auto* x = std::get_if<Conditional>(&n.data))
            return truthy(eval(*x->condition)) ? eval(*x->when_true) : eval(*x->when_false);

        Array out;
        for (const auto& e : std::get<ArrayLiteral>(n.data).elements) out.push_back(eval(*e));
        return out;
    }

    Value identifier(const Identifier& id, std::size_t pos) {
        auto it = ctx_.fields.find(id.name);
        if (it != ctx_.fields.end()) return it->second;
        if (options_.strict_references)
            throw FormulaError(fmt::format("Unknown reference '{}'", id.name), ErrorCode::UnknownReference, pos);
        return id.name;
    }

    Value mention(const std::string& name, std::size_t pos) {
        if (!resolver_) {
            const MentionRecord* m = ctx_.find_mention(name);
            return m ? to_value(*m) : Value();
        }

        auto it = pending_.find(name);
        if (it == pending_.end() || !it->second.valid())
            throw FormulaError(fmt::format("Mention @{} has no pending lookup", name), ErrorCode::AsyncError, pos);
        const MentionFuture& fut = it->second;

        if (deadline_ && fut.wait_until(*deadline_) == std::future_status::timeout)
            throw FormulaError(fmt::format("Timed out resolving @{}", name), ErrorCode::Timeout, pos);

        try {
            const auto& rec = fut.get();
            return rec ? to_value(*rec) : Value();
        } catch (const FormulaError&) {
            throw;
        } catch (const std::exception& e) {
            throw FormulaError(fmt::format("Failed to resolve @{}: {}", name, e.what()), ErrorCode::AsyncError, pos);
        } catch (...) {
            throw FormulaError(fmt::format("Failed to resolve @{}: unknown error", name), ErrorCode::AsyncError, pos);
        }
    }

    // Direct property first, then the entity-style "properties" object.
    static Value member(const Value& obj, const std::string& prop) {
        if (!obj.is_object()) return Value();
        if (const Value* v = obj.find(prop)) return *v;
        if (const Value* props = obj.find("properties"))
            if (const Value* v = props->find(prop)) return *v;
        return Value();
    }

    Value call(const Call& c, std::size_t pos) {
        const FunctionDefinition* fn = registry_.get_function(c.name);
        if (!fn) throw FormulaError(fmt::format("Unknown function: {}", c.name), ErrorCode::UnknownFunction, pos);

        std::vector<Value> args;
        args.reserve(c.arguments.size());
        for (const auto& a : c.arguments) args.push_back(eval(*a));

        const std::size_t lo = fn->min_arity();
        const auto hi = fn->max_arity();
        if (args.size() < lo || (hi && args.size() > *hi)) {
            std::string expected = !hi ? fmt::format("at least {}", lo)
                                 : lo == *hi ? fmt::format("{}", lo)
                                             : fmt::format("{} to {}", lo, *hi);
            throw FormulaError(fmt::format("{} expects {} argument(s), got {}", fn->name, expected, args.size()),
                               ErrorCode::InvalidArguments, pos);
        }

        try {
            return fn->implementation(args, ctx_);
        } catch (const FormulaError&) {
            throw;
        } catch (const std::exception& e) {
            throw FormulaError(fmt::format("{}: {}", fn->name, e.what()), ErrorCode::InvalidArguments, pos);
        } catch (...) {
            throw FormulaError(fmt::format("{}: unknown error", fn->name), ErrorCode::InvalidArguments, pos);
        }
    }

    static Value binary(BinaryOp op, const Value& l, const Value& r, std::size_t pos) {
        switch (op) {
            case BinaryOp::Add:
                if (l.is_string() || r.is_string()) return to_display_string(l) + to_display_string(r);
                return to_number(l) + to_number(r);
            case BinaryOp::Sub: return to_number(l) - to_number(r);
            case BinaryOp::Mul: return to_number(l) * to_number(r);
            case BinaryOp::Div:
            case BinaryOp::Mod: {
                const double x = to_number(l);
                const double y = to_number(r);
                if (y == 0) throw FormulaError("Division by zero", ErrorCode::DivisionByZero, pos);
                return op == BinaryOp::Div ? x / y : std::fmod(x, y);
            }
            case BinaryOp::Eq:
            case BinaryOp::EqEq:        return loosely_equal(l, r);
            case BinaryOp::NotEq:
            case BinaryOp::LessGreater: return !loosely_equal(l, r);
            case BinaryOp::Less:        return compare_values(l, r) < 0;
            case BinaryOp::Greater:     return compare_values(l, r) > 0;
            case BinaryOp::LessEq:      return compare_values(l, r) <= 0;
            case BinaryOp::GreaterEq:   return compare_values(l, r) >= 0;
        }
        throw FormulaError("Unsupported operator", ErrorCode::TypeError, pos);
    }

    const FunctionRegistry& registry_;
    MentionResolver* resolver_;
    const EvaluationOptions& options_;
    const FormulaContext& ctx_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::map<std::string, MentionFuture> pending_;
};

std::vector<std::string> all_dependencies(const ParsedFormula& p) {
    std::vector<std::string> deps = p.dependencies;
    deps.insert(deps.end(), p.mention_dependencies.begin(), p.mention_dependencies.end());
    return deps;
}

double elapsed_ms(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

} // namespace

Evaluator::Evaluator(const FunctionRegistry& registry, std::shared_ptr<MentionResolver> resolver,
                     EvaluationOptions options)
    : registry_(&registry), resolver_(std::move(resolver)), options_(std::move(options)) {}

Value Evaluator::evaluate_value(const ParsedFormula& parsed, const FormulaContext& ctx) const {
    Walk walk(*registry_, resolver_.get(), options_, ctx);
    walk.prefetch(parsed.mention_dependencies);
    return walk.eval(*parsed.ast);
}

FormulaResult Evaluator::evaluate(std::string_view source, const FormulaContext& ctx) const {
    const auto started = Clock::now();
    std::optional<ParsedFormula> parsed;
    try {
        parsed.emplace(parse(source));
    } catch (const FormulaError& e) {
        return failure(e.what(), e.code, e.position, {}, started);
    }
    return finish(*parsed, ctx, started);
}

FormulaResult Evaluator::evaluate(const ParsedFormula& parsed, const FormulaContext& ctx) const {
    return finish(parsed, ctx, Clock::now());
}

std::future<FormulaResult> Evaluator::evaluate_async(std::string source, FormulaContext ctx) const {
    return std::async(std::launch::async, [self = *this, source = std::move(source), ctx = std::move(ctx)] {
        return self.evaluate(source, ctx);
    });
}

FormulaResult Evaluator::finish(const ParsedFormula& parsed, const FormulaContext& ctx, Clock::time_point started) const {
    try {
        Value v = evaluate_value(parsed, ctx);
        FormulaResult r;
        r.success = true;
        r.value_type = v.type();
        r.display_value = to_display_string(v);
        r.value = std::move(v);
        r.dependencies = all_dependencies(parsed);
        r.evaluated_at = current_time();
        r.execution_time_ms = elapsed_ms(started);
        return r;
    } catch (const FormulaError& e) {
        logger()->debug("evaluation of '{}' failed: {} [{}]", parsed.source, e.what(), to_string(e.code));
        return failure(e.what(), e.code, e.position, all_dependencies(parsed), started);
    } catch (const std::exception& e) {
        logger()->debug("evaluation of '{}' raised: {}", parsed.source, e.what());
        return failure(e.what(), std::nullopt, std::nullopt, all_dependencies(parsed), started);
    } catch (...) {
        logger()->debug("evaluation of '{}' raised a non-standard exception", parsed.source);
        return failure("Unknown error", std::nullopt, std::nullopt, all_dependencies(parsed), started);
    }
}

FormulaResult Evaluator::failure(std::string message, std::optional<ErrorCode> code,
                                 std::optional<std::size_t> position, std::vector<std::string> deps,
                                 Clock::time_point started) const {
    FormulaResult r;
    r.success = false;
    r.display_value = options_.error_display_value;
    r.error = position ? fmt::format("{} (at position {})", message, *position) : std::move(message);
    r.error_code = code;
    r.dependencies = std::move(deps);
    r.evaluated_at = current_time();
    r.execution_time_ms = elapsed_ms(started);
    return r;
}

} // namespace formula
