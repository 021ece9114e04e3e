#pragma once

// =============================================================================
// Resolver: static scope analysis run between parsing and execution
// =============================================================================
// Walks the AST once and, for every Variable read and Assign target that
// names a local, computes how many frames outward its binding lives. The
// result is keyed by the node itself, so two same-named variables in
// different places never collide.
//
// Scope model (kept in lock-step with the Interpreter):
//   - every `{ ... }` block pushes one scope
//   - a function pushes ONE scope holding its parameters and the top-level
//     declarations of its body
//   - the global scope is not tracked; anything not found is a global
//
// Problems are collected as Diagnostics. Entries are handed to the
// Interpreter only when the whole program resolved cleanly.
// =============================================================================

#include "../parser/ast.hpp"
#include "../lib/errors/error.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lux
{

    class Interpreter;

    class Resolver
    {
    public:
        explicit Resolver(Interpreter &interp);

        /// Resolve a whole program. Returns the diagnostics found (empty on
        /// success); on success the depth table has been committed.
        std::vector<Diagnostic> resolve(const Program &program);

    private:
        Interpreter &interp_;

        // name -> "fully initialized"
        std::vector<std::unordered_map<std::string, bool>> scopes_;
        std::vector<Diagnostic> diagnostics_;
        std::vector<std::pair<const Expr *, int>> pending_;
        int functionDepth_ = 0;

        void beginScope();
        void endScope();
        void declare(const std::string &name);
        void define(const std::string &name);
        void resolveLocal(const Expr *expr, const std::string &name);

        void resolveStmts(const std::vector<StmtPtr> &stmts);
        void resolveStmt(const Stmt *stmt);
        void resolveExpr(const Expr *expr);
        void resolveFunction(const FnDef *fn);

        void error(const std::string &message, Span span);
    };

} // namespace lux
