#pragma once

// =============================================================================
// AST printer: fully parenthesized rendering of Lux syntax trees
// =============================================================================
//
//   1 + 2 * 3      ->  (1 + (2 * 3))
//   (1 + 2) * 3    ->  ((group (1 + 2)) * 3)
//   -a             ->  (-a)
//   f(1, x)        ->  (call f 1 x)
//
// Used by `lux --ast` and by the parser tests to check precedence.
// =============================================================================

#include "ast.hpp"
#include <string>

namespace lux
{

    std::string printExpr(const Expr *expr);
    std::string printStmt(const Stmt *stmt);

    /// One line per top-level statement
    std::string printProgram(const Program &program);

} // namespace lux
