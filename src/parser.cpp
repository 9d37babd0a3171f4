#include "formula/parser.hpp"
#include "formula/lexer.hpp"
#include "formula/log.hpp"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

namespace formula {

namespace {

// Deepest nesting of parentheses, calls, unary minus and operator chains.
constexpr std::size_t kMaxDepth = 256;

// Binding power of binary operators; 0 means "not a binary operator".
int precedence(const Token& t) {
    if (t.kind != TokKind::Operator) return 0;
    const std::string& s = t.text;
    if (s == "*" || s == "/" || s == "%") return 3;
    if (s == "+" || s == "-") return 2;
    return 1; // = == != <> < > <= >=
}

BinaryOp binary_op(const std::string& s) {
    if (s == "+")  return BinaryOp::Add;
    if (s == "-")  return BinaryOp::Sub;
    if (s == "*")  return BinaryOp::Mul;
    if (s == "/")  return BinaryOp::Div;
    if (s == "%")  return BinaryOp::Mod;
    if (s == "=")  return BinaryOp::Eq;
    if (s == "==") return BinaryOp::EqEq;
    if (s == "!=") return BinaryOp::NotEq;
    if (s == "<>") return BinaryOp::LessGreater;
    if (s == "<")  return BinaryOp::Less;
    if (s == ">")  return BinaryOp::Greater;
    if (s == "<=") return BinaryOp::LessEq;
    return BinaryOp::GreaterEq;
}

class Parser {
public:
    explicit Parser(std::string_view input) : toks_(tokenize(input)) {}

    NodePtr parse_formula() {
        if (peek().kind == TokKind::End) throw error("Empty formula", peek());
        NodePtr e = parse_expression();
        if (peek().kind != TokKind::End) throw error(fmt::format("Unexpected '{}' after end of expression", peek().text), peek());
        return e;
    }

private:
    const Token& peek() const { return toks_[i_]; }
    const Token& advance() {
        const Token& t = toks_[i_];
        if (t.kind != TokKind::End) ++i_;
        return t;
    }
    bool accept_punct(const char* p) {
        if (!peek().is(TokKind::Punctuation, p)) return false;
        ++i_;
        return true;
    }
    void expect_punct(const char* p, const char* what) {
        if (!accept_punct(p)) throw error(fmt::format("Expected '{}' {}", p, what), peek());
    }

    static FormulaError error(const std::string& msg, const Token& at) {
        return FormulaError(msg, ErrorCode::ParseError, at.position);
    }

    void descend(const Token& at) {
        if (++depth_ > kMaxDepth) throw error("Expression nested too deeply", at);
    }

    // One level of nesting for as long as it lives.
    class Nest {
    public:
        Nest(Parser& p, const Token& at) : p_(p) { p_.descend(at); }
        ~Nest() { --p_.depth_; }
        Nest(const Nest&) = delete;
        Nest& operator=(const Nest&) = delete;

    private:
        Parser& p_;
    };

    // conditional := binary(1) [ '?' expression ':' expression ]
    NodePtr parse_expression() {
        Nest nest(*this, peek());
        NodePtr cond = parse_binary(1);
        const Token& q = peek();
        if (!q.is(TokKind::Punctuation, "?")) return cond;
        std::size_t pos = q.position;
        advance();
        NodePtr a = parse_expression();
        expect_punct(":", "in conditional expression");
        NodePtr b = parse_expression();
        return make_node(Conditional{std::move(cond), std::move(a), std::move(b)}, pos);
    }

    // Precedence climbing; every binary tier is left-associative.
    // Each link of a chain deepens the left spine, so it counts as nesting.
    NodePtr parse_binary(int min_prec) {
        NodePtr lhs = parse_unary();
        std::size_t chain = 0;
        for (;;) {
            const Token& op = peek();
            int p = precedence(op);
            if (p == 0 || p < min_prec) break;
            descend(op);
            ++chain;
            std::size_t pos = op.position;
            BinaryOp bop = binary_op(op.text);
            advance();
            NodePtr rhs = parse_binary(p + 1);
            lhs = make_node(Binary{bop, std::move(lhs), std::move(rhs)}, pos);
        }
        depth_ -= chain;
        return lhs;
    }

    NodePtr parse_unary() {
        const Token& t = peek();
        if (t.is(TokKind::Operator, "-")) {
            Nest nest(*this, t);
            std::size_t pos = t.position;
            advance();
            return make_node(Unary{UnaryOp::Neg, parse_unary()}, pos);
        }
        return parse_postfix();
    }

    NodePtr parse_postfix() {
        NodePtr e = parse_primary();
        std::size_t chain = 0;
        while (peek().is(TokKind::Punctuation, ".")) {
            descend(peek());
            ++chain;
            std::size_t pos = advance().position;
            const Token& name = peek();
            if (name.kind != TokKind::Ident) throw error("Expected property name after '.'", name);
            e = make_node(Member{std::move(e), name.text}, pos);
            advance();
        }
        depth_ -= chain;
        return e;
    }

    std::vector<NodePtr> parse_list(const char* close, const char* what) {
        std::vector<NodePtr> items;
        if (accept_punct(close)) return items;
        for (;;) {
            items.push_back(parse_expression());
            if (accept_punct(",")) continue;
            expect_punct(close, what);
            return items;
        }
    }

    NodePtr parse_primary() {
        const Token& t = peek();
        const std::size_t pos = t.position;

        switch (t.kind) {
            case TokKind::Number: {
                double v = t.number;
                advance();
                return make_node(Literal{Value(v)}, pos);
            }
            case TokKind::String: {
                std::string s = t.text;
                advance();
                return make_node(Literal{Value(std::move(s))}, pos);
            }
            case TokKind::Mention: {
                std::string name = t.text;
                advance();
                return make_node(Mention{std::move(name)}, pos);
            }
            case TokKind::Ident: {
                std::string name = t.text;
                advance();
                if (accept_punct("(")) {
                    auto args = parse_list(")", "to close argument list");
                    return make_node(Call{std::move(name), std::move(args)}, pos);
                }
                return make_node(Identifier{std::move(name)}, pos);
            }
            case TokKind::Punctuation:
                if (t.text == "(") {
                    advance();
                    NodePtr e = parse_expression();
                    expect_punct(")", "to close '('");
                    return e;
                }
                if (t.text == "[") {
                    advance();
                    auto elems = parse_list("]", "to close '['");
                    return make_node(ArrayLiteral{std::move(elems)}, pos);
                }
                if (t.text == "\"" || t.text == "'") throw error("Unterminated string literal", t);
                throw error(fmt::format("Unexpected '{}'", t.text), t);
            case TokKind::Operator:
                throw error(fmt::format("Expected operand before '{}'", t.text), t);
            case TokKind::End:
                throw error("Unexpected end of formula", t);
        }
        throw error("Unexpected token", t);
    }

    std::vector<Token> toks_;
    std::size_t i_{0};
    std::size_t depth_{0};
};

void add_unique(std::vector<std::string>& v, std::string s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(std::move(s));
}

// Source-order traversal; Member contributes only its root.
void collect(const Node& n, ParsedFormula& out) {
    if (auto* id = std::get_if<Identifier>(&n.data)) {
        add_unique(out.dependencies, id->name);
    } else if (auto* m = std::get_if<Mention>(&n.data)) {
        add_unique(out.mention_dependencies, "@" + m->name);
    } else if (auto* mem = std::get_if<Member>(&n.data)) {
        collect(*mem->object, out);
    } else if (auto* c = std::get_if<Call>(&n.data)) {
        for (const auto& a : c->arguments) collect(*a, out);
    } else if (auto* u = std::get_if<Unary>(&n.data)) {
        collect(*u->operand, out);
    } else if (auto* b = std::get_if<Binary>(&n.data)) {
        collect(*b->left, out);
        collect(*b->right, out);
    } else if (auto* k = std::get_if<Conditional>(&n.data)) {
        collect(*k->condition, out);
        collect(*k->when_true, out);
        collect(*k->when_false, out);
    } else if (auto* arr = std::get_if<ArrayLiteral>(&n.data)) {
        for (const auto& e : arr->elements) collect(*e, out);
    }
}

} // namespace

ParsedFormula parse(std::string_view input) {
    ParsedFormula p;
    p.source = std::string(input);
    try {
        p.ast = Parser(input).parse_formula();
    } catch (const FormulaError& e) {
        logger()->debug("parse failed for '{}': {}", input, e.what());
        throw;
    }
    collect(*p.ast, p);
    return p;
}

} // namespace formula
