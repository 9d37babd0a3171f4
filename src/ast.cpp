#include "formula/ast.hpp"

#include <fmt/format.h>

namespace formula {

const char* to_string(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:         return "+";
        case BinaryOp::Sub:         return "-";
        case BinaryOp::Mul:         return "*";
        case BinaryOp::Div:         return "/";
        case BinaryOp::Mod:         return "%";
        case BinaryOp::Eq:          return "=";
        case BinaryOp::EqEq:        return "==";
        case BinaryOp::NotEq:       return "!=";
        case BinaryOp::LessGreater: return "<>";
        case BinaryOp::Less:        return "<";
        case BinaryOp::Greater:     return ">";
        case BinaryOp::LessEq:      return "<=";
        case BinaryOp::GreaterEq:   return ">=";
    }
    return "?";
}

bool is_comparison(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
            return false;
        default:
            return true;
    }
}

static bool same(const NodePtr& a, const NodePtr& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

static bool same(const std::vector<NodePtr>& a, const std::vector<NodePtr>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (!same(a[i], b[i])) return false;
    return true;
}

bool operator==(const Node& a, const Node& b) {
    if (a.position != b.position || a.data.index() != b.data.index()) return false;

    if (auto* x = std::get_if<Literal>(&a.data))
        return x->value == std::get<Literal>(b.data).value;
    if (auto* x = std::get_if<Identifier>(&a.data))
        return x->name == std::get<Identifier>(b.data).name;
    if (auto* x = std::get_if<Mention>(&a.data))
        return x->name == std::get<Mention>(b.data).name;
    if (auto* x = std::get_if<Member>(&a.data)) {
        const auto& y = std::get<Member>(b.data);
        return x->property == y.property && same(x->object, y.object);
    }
    if (auto* x = std::get_if<Call>(&a.data)) {
        const auto& y = std::get<Call>(b.data);
        return x->name == y.name && same(x->arguments, y.arguments);
    }
    if (auto* x = std::get_if<Unary>(&a.data)) {
        const auto& y = std::get<Unary>(b.data);
        return x->op == y.op && same(x->operand, y.operand);
    }
    if (auto* x = std::get_if<Binary>(&a.data)) {
        const auto& y = std::get<Binary>(b.data);
        return x->op == y.op && same(x->left, y.left) && same(x->right, y.right);
    }
    if (auto* x = std::get_if<Conditional>(&a.data)) {
        const auto& y = std::get<Conditional>(b.data);
        return same(x->condition, y.condition) && same(x->when_true, y.when_true) &&
               same(x->when_false, y.when_false);
    }
    const auto& x = std::get<ArrayLiteral>(a.data);
    return same(x.elements, std::get<ArrayLiteral>(b.data).elements);
}

static std::string join_nodes(const std::vector<NodePtr>& nodes) {
    std::string out;
    for (const auto& n : nodes) {
        out += ' ';
        out += to_string(*n);
    }
    return out;
}

std::string to_string(const Node& n) {
    if (auto* x = std::get_if<Literal>(&n.data))
        return x->value.is_string() ? to_json(x->value) : to_display_string(x->value);
    if (auto* x = std::get_if<Identifier>(&n.data)) return x->name;
    if (auto* x = std::get_if<Mention>(&n.data)) return "@" + x->name;
    if (auto* x = std::get_if<Member>(&n.data))
        return fmt::format("(. {} {})", to_string(*x->object), x->property);
    if (auto* x = std::get_if<Call>(&n.data))
        return fmt::format("(call {}{})", x->name, join_nodes(x->arguments));
    if (auto* x = std::get_if<Unary>(&n.data))
        return fmt::format("(neg {})", to_string(*x->operand));
    if (auto* x = std::get_if<Binary>(&n.data))
        return fmt::format("({} {} {})", to_string(x->op), to_string(*x->left), to_string(*x->right));
    if (auto* x = std::get_if<Conditional>(&n.data))
        return fmt::format("(? {} {} {})", to_string(*x->condition), to_string(*x->when_true),
                           to_string(*x->when_false));
    std::string inner = join_nodes(std::get<ArrayLiteral>(n.data).elements);
    if (!inner.empty()) inner.erase(0, 1);
    return "[" + inner + "]";
}

} // namespace formula
