#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "formula/ast.hpp"
#include "formula/error.hpp"

namespace formula {

struct ParsedFormula {
    NodePtr ast;
    std::vector<std::string> dependencies;         // field names, first-occurrence order
    std::vector<std::string> mention_dependencies; // "@Name", first-occurrence order
    std::string source;
};

/// Parse a formula into an AST plus its dependencies.
/// Throws FormulaError(ParseError) carrying the offending position.
ParsedFormula parse(std::string_view input);

} // namespace formula
