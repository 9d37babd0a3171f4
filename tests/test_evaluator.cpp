#include <gtest/gtest.h>
#include <formula/formula.hpp>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace formula;

FormulaContext base_context() {
    ContextOverrides o;
    o.fields = Object{
        {"price", 10},
        {"quantity", 5},
        {"name", "Widget"},
        {"order", Object{{"customer", Object{{"name", "Ada"}}}, {"total", 42}}},
    };
    o.mentions = std::vector<MentionRecord>{
        {"p1", "place", "Paris", true, Object{{"latitude", 48.8566}, {"longitude", 2.3522}}},
    };
    return create_formula_context(o);
}

FormulaResult run(const std::string& src, const FormulaContext& ctx = base_context()) {
    return evaluate_formula(src, ctx);
}

Value value_of(const std::string& src) {
    FormulaResult r = run(src);
    EXPECT_TRUE(r.success) << src << ": " << r.error.value_or("");
    return r.value;
}

MentionRecord place(const std::string& label) {
    return MentionRecord{"id-" + label, "place", label, true, Object{{"country", "FR"}}};
}

std::future<std::optional<MentionRecord>> ready(std::optional<MentionRecord> rec) {
    std::promise<std::optional<MentionRecord>> p;
    p.set_value(std::move(rec));
    return p.get_future();
}

// Answers from a fixed table and remembers the order of the requests.
class TableResolver : public MentionResolver {
public:
    explicit TableResolver(std::map<std::string, MentionRecord> table) : table_(std::move(table)) {}

    std::future<std::optional<MentionRecord>> resolve(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mu_);
        asked_.push_back(name);
        auto it = table_.find(name);
        if (it == table_.end()) return ready(std::nullopt);
        return ready(it->second);
    }

    std::vector<std::string> asked() const {
        std::lock_guard<std::mutex> lock(mu_);
        return asked_;
    }

private:
    std::map<std::string, MentionRecord> table_;
    mutable std::mutex mu_;
    std::vector<std::string> asked_;
};

// Completes each lookup on a worker thread after a short delay.
class SlowResolver : public MentionResolver {
public:
    std::future<std::optional<MentionRecord>> resolve(const std::string& name) override {
        return std::async(std::launch::async, [name]() -> std::optional<MentionRecord> {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return place(name);
        });
    }
};

class FailingResolver : public MentionResolver {
public:
    explicit FailingResolver(bool throw_directly) : throw_directly_(throw_directly) {}

    std::future<std::optional<MentionRecord>> resolve(const std::string&) override {
        if (throw_directly_) throw std::runtime_error("resolver offline");
        std::promise<std::optional<MentionRecord>> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("service down")));
        return p.get_future();
    }

private:
    bool throw_directly_;
};

// Fails with something that is not a std::exception.
class ThrowsIntResolver : public MentionResolver {
public:
    explicit ThrowsIntResolver(bool throw_directly) : throw_directly_(throw_directly) {}

    std::future<std::optional<MentionRecord>> resolve(const std::string&) override {
        if (throw_directly_) throw 42;
        std::promise<std::optional<MentionRecord>> p;
        p.set_exception(std::make_exception_ptr(7));
        return p.get_future();
    }

private:
    bool throw_directly_;
};

// Never answers; the promises stay alive so the futures never become ready.
class SilentResolver : public MentionResolver {
public:
    std::future<std::optional<MentionRecord>> resolve(const std::string&) override {
        std::lock_guard<std::mutex> lock(mu_);
        pending_.emplace_back();
        return pending_.back().get_future();
    }

private:
    std::mutex mu_;
    std::vector<std::promise<std::optional<MentionRecord>>> pending_;
};

TEST(Evaluator, Arithmetic) {
    EXPECT_EQ(value_of("1 + 2 * 3"), Value(7));
    EXPECT_EQ(value_of("(1 + 2) * 3 - 4"), Value(5));
    EXPECT_EQ(value_of("-price + 1"), Value(-9));
    EXPECT_EQ(value_of("price % 3"), Value(1));
    EXPECT_EQ(value_of("7 / 2"), Value(3.5));
    EXPECT_EQ(value_of("(1 = 1) + 1"), Value(2));
    EXPECT_EQ(run("0.1 + 0.2").display_value, "0.30000000000000004");
}

TEST(Evaluator, StringConcatenation) {
    EXPECT_EQ(value_of("\"value: \" + 42"), Value("value: 42"));
    EXPECT_EQ(value_of("name + \"!\""), Value("Widget!"));
    EXPECT_EQ(value_of("1 + \"2\""), Value("12"));
}

TEST(Evaluator, NestedFunctionCalls) {
    EXPECT_EQ(value_of("Round(Abs(-3.7))"), Value(4));
    EXPECT_EQ(value_of("Round(3.14159, 2)"), Value(3.14));
    EXPECT_EQ(value_of("Sum(1, [2, 3], 4)"), Value(10));
    EXPECT_EQ(value_of("round(price / 3, 1)"), Value(3.3));
}

TEST(Evaluator, FieldsAndDependencies) {
    FormulaResult r = run("price * quantity");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, Value(50));
    EXPECT_EQ(r.value_type, ValueType::Number);
    EXPECT_EQ(r.display_value, "50");
    EXPECT_EQ(r.dependencies, (std::vector<std::string>{"price", "quantity"}));
    EXPECT_FALSE(r.error.has_value());
    EXPECT_GE(r.execution_time_ms, 0.0);
    EXPECT_GT(r.evaluated_at.time_since_epoch().count(), 0);
}

TEST(Evaluator, DependenciesListFieldsThenMentions) {
    FormulaResult r = run("@Paris.label + price + @Paris.label + x");
    EXPECT_EQ(r.value, Value("Paris10Parisx"));
    EXPECT_EQ(r.dependencies, (std::vector<std::string>{"price", "x", "@Paris"}));
}

TEST(Evaluator, UnknownIdentifierEvaluatesToItsName) {
    FormulaResult r = run("unknownField");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, Value("unknownField"));
    EXPECT_EQ(r.value_type, ValueType::String);
}

TEST(Evaluator, StrictReferences) {
    EvaluationOptions opts;
    opts.strict_references = true;
    FormulaResult r = evaluate_formula("price + unknownField", base_context(), nullptr, opts);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::UnknownReference);
    EXPECT_EQ(r.error.value_or(""), "Unknown reference 'unknownField' (at position 8)");

    FormulaResult ok = evaluate_formula("price + 1", base_context(), nullptr, opts);
    EXPECT_TRUE(ok.success);
}

TEST(Evaluator, Comparisons) {
    EXPECT_EQ(value_of("5 = \"5\""), Value(true));
    EXPECT_EQ(value_of("price == 10"), Value(true));
    EXPECT_EQ(value_of("\"a\" <> \"b\""), Value(true));
    EXPECT_EQ(value_of("price != 10"), Value(false));
    EXPECT_EQ(value_of("price >= 10"), Value(true));
    EXPECT_EQ(value_of("\"apple\" < \"banana\""), Value(true));
    EXPECT_EQ(value_of("quantity > \"4\""), Value(true));
    EXPECT_EQ(run("price > 1").value_type, ValueType::Boolean);

    FormulaResult bad = run("\"abc\" < 1");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.error_code, ErrorCode::TypeError);
}

TEST(Evaluator, ConditionalEvaluatesOnlyTheChosenBranch) {
    EXPECT_EQ(value_of("price > 5 ? \"big\" : \"small\""), Value("big"));
    EXPECT_EQ(value_of("1 ? 2 : 1 / 0"), Value(2));
    EXPECT_FALSE(run("0 ? 2 : 1 / 0").success);
}

TEST(Evaluator, ArrayLiterals) {
    FormulaResult r = run("[1, \"a\", price]");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value_type, ValueType::Array);
    EXPECT_EQ(r.display_value, "[1,\"a\",10]");
}

TEST(Evaluator, MemberAccess) {
    EXPECT_EQ(value_of("order.customer.name"), Value("Ada"));
    EXPECT_EQ(value_of("order.total * 2"), Value(84));
    EXPECT_TRUE(value_of("order.missing").is_null());
    EXPECT_TRUE(value_of("order.missing.deeper").is_null());
    EXPECT_TRUE(value_of("price.digits").is_null());
    EXPECT_EQ(run("order.missing").display_value, "");
    EXPECT_EQ(run("order.missing").value_type, ValueType::Null);
}

TEST(Evaluator, MentionsFromContext) {
    EXPECT_EQ(value_of("@Paris.label"), Value("Paris"));
    EXPECT_EQ(value_of("@paris.latitude"), Value(48.8566));
    EXPECT_EQ(run("@Paris").value_type, ValueType::Object);
    EXPECT_TRUE(value_of("@Atlantis").is_null());

    FormulaResult r = run("@Paris");
    EXPECT_EQ(r.dependencies, (std::vector<std::string>{"@Paris"}));
}

TEST(Evaluator, DivisionByZero) {
    FormulaResult r = run("10 / 0");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::DivisionByZero);
    EXPECT_EQ(r.error.value_or(""), "Division by zero (at position 3)");
    EXPECT_EQ(r.display_value, "Error");
    EXPECT_TRUE(r.value.is_null());
    EXPECT_EQ(run("7 % 0").error_code, ErrorCode::DivisionByZero);
}

TEST(Evaluator, UnknownFunction) {
    FormulaResult r = run("missing + Foo(1)");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::UnknownFunction);
    EXPECT_EQ(r.error.value_or(""), "Unknown function: Foo (at position 10)");
    EXPECT_EQ(r.dependencies, (std::vector<std::string>{"missing"}));
}

TEST(Evaluator, ArityMessages) {
    EXPECT_EQ(run("Round(1, 2, 3)").error.value_or(""), "Round expects 1 to 2 argument(s), got 3 (at position 0)");
    EXPECT_EQ(run("1 + Abs(1, 2)").error.value_or(""), "Abs expects 1 argument(s), got 2 (at position 4)");
    EXPECT_EQ(run("Abs()").error_code, ErrorCode::InvalidArguments);
}

TEST(Evaluator, ParseErrorsAreReported) {
    for (const char* src : {"", "   ", "(1 + 2", "1 + + 2", "1 + 2 3", "\"open"}) {
        FormulaResult r = run(src);
        EXPECT_FALSE(r.success) << src;
        EXPECT_EQ(r.error_code, ErrorCode::ParseError) << src;
        EXPECT_TRUE(r.dependencies.empty()) << src;
        EXPECT_EQ(r.display_value, "Error") << src;
    }
    EXPECT_EQ(run("1 + + 2").error.value_or(""), "Expected operand before '+' (at position 4)");
}

TEST(Evaluator, DeepNestingIsAParseError) {
    const std::string deep = std::string(200000, '(') + "1" + std::string(200000, ')');
    FormulaResult r = run(deep);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::ParseError);
    EXPECT_EQ(r.error.value_or(""), "Expression nested too deeply (at position 256)");

    EXPECT_EQ(run(std::string(10000, '-') + "price").error_code, ErrorCode::ParseError);
    EXPECT_EQ(run(std::string(100, '(') + "price" + std::string(100, ')')).value, Value(10));
}

TEST(Evaluator, CustomErrorDisplayValue) {
    EvaluationOptions opts;
    opts.error_display_value = "#ERR";
    EXPECT_EQ(evaluate_formula("1 / 0", base_context(), nullptr, opts).display_value, "#ERR");
}

TEST(Evaluator, ForeignExceptionsBecomeInvalidArguments) {
    FunctionDefinition boom{"Boom", FunctionCategory::Math, "Reads past its arguments", "Boom()",
                            {}, "number", false,
                            [](const std::vector<Value>& args, const FormulaContext&) -> Value {
                                return args.at(3);
                            }};
    FunctionRegistry reg({boom});
    FormulaResult r = Evaluator(reg).evaluate("Boom()", base_context());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::InvalidArguments);
    EXPECT_EQ(r.error.value_or("").rfind("Boom: ", 0), 0u);
}

TEST(Evaluator, NonStandardExceptionsBecomeInvalidArguments) {
    FunctionDefinition odd{"Odd", FunctionCategory::Math, "Throws a bare int", "Odd()",
                           {}, "number", false,
                           [](const std::vector<Value>&, const FormulaContext&) -> Value { throw 13; }};
    FunctionRegistry reg({odd});
    FormulaResult r = Evaluator(reg).evaluate("1 + Odd()", base_context());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::InvalidArguments);
    EXPECT_EQ(r.error.value_or(""), "Odd: unknown error (at position 4)");
}

TEST(Evaluator, ParsedFormulaCanBeReused) {
    Evaluator ev;
    ParsedFormula parsed = parse("price * 2");
    FormulaContext a = base_context();
    FormulaContext b = base_context();
    b.fields["price"] = 4;
    EXPECT_EQ(ev.evaluate(parsed, a).value, Value(20));
    EXPECT_EQ(ev.evaluate(parsed, b).value, Value(8));
    EXPECT_EQ(ev.evaluate_value(parsed, a), Value(20));
    EXPECT_THROW(ev.evaluate_value(parse("1 / 0"), a), FormulaError);
}

TEST(Evaluator, ReparseIsStructurallyEqual) {
    for (const char* src : {"1 + 2 * 3", "Sum(price, [1, 2]) > 3 ? @Paris.label : -quantity", "order.customer.name"}) {
        ParsedFormula a = parse(src);
        ParsedFormula b = parse(src);
        EXPECT_TRUE(*a.ast == *b.ast) << src;
        EXPECT_EQ(a.dependencies, b.dependencies) << src;
        EXPECT_EQ(run(src).display_value, run(src).display_value) << src;
    }
}

TEST(Evaluator, AsyncEntryPoints) {
    auto fut = Evaluator().evaluate_async("price * quantity", base_context());
    FormulaResult r = fut.get();
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, Value(50));

    auto fut2 = evaluate_formula_async("10 / 0", base_context());
    EXPECT_EQ(fut2.get().error_code, ErrorCode::DivisionByZero);
}

TEST(MentionResolution, ResolvesThroughResolver) {
    auto resolver = std::make_shared<TableResolver>(std::map<std::string, MentionRecord>{
        {"Rome", place("Rome")},
        {"Oslo", place("Oslo")},
    });
    FormulaResult r = evaluate_formula("@Oslo.label + \"-\" + @Rome.country + \"-\" + @Oslo.id", base_context(), resolver);
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.value, Value("Oslo-FR-id-Oslo"));
    // one lookup per distinct mention, issued up front in source order
    EXPECT_EQ(resolver->asked(), (std::vector<std::string>{"Oslo", "Rome"}));
    EXPECT_EQ(r.dependencies, (std::vector<std::string>{"@Oslo", "@Rome"}));
}

TEST(MentionResolution, ResolverTakesPrecedenceOverContext) {
    auto resolver = std::make_shared<TableResolver>(std::map<std::string, MentionRecord>{});
    FormulaResult r = evaluate_formula("@Paris", base_context(), resolver);
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.value.is_null());
}

TEST(MentionResolution, CompletesOnOtherThreads) {
    auto resolver = std::make_shared<SlowResolver>();
    EvaluationOptions opts;
    opts.timeout = std::chrono::milliseconds(5000);
    FormulaResult r = evaluate_formula("@A.label + @B.label", base_context(), resolver, opts);
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.value, Value("AB"));
}

TEST(MentionResolution, FailedLookupIsAsyncError) {
    FormulaResult r = evaluate_formula("1 + @Paris", base_context(), std::make_shared<FailingResolver>(false));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::AsyncError);
    EXPECT_NE(r.error.value_or("").find("service down"), std::string::npos);
    EXPECT_NE(r.error.value_or("").find("(at position 4)"), std::string::npos);
}

TEST(MentionResolution, ThrowingResolverIsAsyncError) {
    FormulaResult r = evaluate_formula("@Paris", base_context(), std::make_shared<FailingResolver>(true));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::AsyncError);
    EXPECT_NE(r.error.value_or("").find("resolver offline"), std::string::npos);
}

TEST(MentionResolution, NonStandardResolverFailuresAreAsyncErrors) {
    for (bool direct : {true, false}) {
        FormulaResult r = evaluate_formula("@Paris.label", base_context(), std::make_shared<ThrowsIntResolver>(direct));
        EXPECT_FALSE(r.success) << direct;
        EXPECT_EQ(r.error_code, ErrorCode::AsyncError) << direct;
        EXPECT_EQ(r.error.value_or(""), "Failed to resolve @Paris: unknown error (at position 0)") << direct;
    }
}

TEST(MentionResolution, UnusedBranchDoesNotWaitOnFailure) {
    FormulaResult r = evaluate_formula("1 ? 2 : @Paris", base_context(), std::make_shared<FailingResolver>(false));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, Value(2));
}

TEST(MentionResolution, Timeout) {
    auto resolver = std::make_shared<SilentResolver>();
    EvaluationOptions opts;
    opts.timeout = std::chrono::milliseconds(20);
    const auto started = std::chrono::steady_clock::now();
    FormulaResult r = evaluate_formula("Distance(@Paris, @London)", base_context(), resolver, opts);
    const auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_code, ErrorCode::Timeout);
    EXPECT_EQ(r.error.value_or(""), "Timed out resolving @Paris (at position 9)");
    EXPECT_LT(waited, std::chrono::seconds(5));
}

TEST(MentionResolution, NoTimeoutWhenLookupsAreReady) {
    auto resolver = std::make_shared<TableResolver>(std::map<std::string, MentionRecord>{{"Rome", place("Rome")}});
    EvaluationOptions opts;
    opts.timeout = std::chrono::milliseconds(1);
    FormulaResult r = evaluate_formula("@Rome.label", base_context(), resolver, opts);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, Value("Rome"));
}

TEST(ErrorCodes, UpperSnakeNames) {
    EXPECT_STREQ(to_string(ErrorCode::ParseError), "PARSE_ERROR");
    EXPECT_STREQ(to_string(ErrorCode::DivisionByZero), "DIVISION_BY_ZERO");
    EXPECT_STREQ(to_string(ErrorCode::CircularReference), "CIRCULAR_REFERENCE");
    EXPECT_STREQ(to_string(ErrorCode::Timeout), "TIMEOUT");
}

} // namespace
