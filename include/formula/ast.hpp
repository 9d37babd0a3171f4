#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "formula/value.hpp"

namespace formula {

struct Node;
using NodePtr = std::unique_ptr<const Node>;

enum class UnaryOp { Neg };

enum class BinaryOp {
    Add, Sub, Mul, Div, Mod,
    // comparisons keep their source spelling
    Eq,        // =
    EqEq,      // ==
    NotEq,     // !=
    LessGreater, // <>
    Less, Greater, LessEq, GreaterEq,
};

/// Source spelling, e.g. "<>".
const char* to_string(BinaryOp op);
bool is_comparison(BinaryOp op);

struct Literal      { Value value; };                 // number or string
struct Identifier   { std::string name; };
struct Mention      { std::string name; };            // without '@'
struct Member       { NodePtr object; std::string property; };
struct Call         { std::string name; std::vector<NodePtr> arguments; };
struct Unary        { UnaryOp op{UnaryOp::Neg}; NodePtr operand; };
struct Binary       { BinaryOp op{BinaryOp::Add}; NodePtr left; NodePtr right; };
struct Conditional  { NodePtr condition; NodePtr when_true; NodePtr when_false; };
struct ArrayLiteral { std::vector<NodePtr> elements; };

struct Node {
    using Variant = std::variant<Literal, Identifier, Mention, Member, Call, Unary, Binary, Conditional, ArrayLiteral>;

    Variant data;
    std::size_t position{0};
};

template <class T>
NodePtr make_node(T payload, std::size_t position) {
    return std::make_unique<const Node>(Node{Node::Variant{std::move(payload)}, position});
}

/// Deep structural equality, positions included.
bool operator==(const Node& a, const Node& b);
inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }

/// Compact s-expression rendering, e.g. (+ 1 (* 2 3)). Used in diagnostics and tests.
std::string to_string(const Node& n);

} // namespace formula
