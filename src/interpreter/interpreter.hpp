#pragma once

// =============================================================================
// Interpreter: Lux's tree-walking evaluator
// =============================================================================
//
// Walks the AST produced by the Parser and executes it.
//
// Design choices:
//   - Lexical scoping: closures capture their definition environment.
//   - Block scoping: every `{ ... }` block creates a child Environment.
//   - Local variables are looked up at the frame distance the Resolver
//     computed for that exact Variable/Assign node. Anything the resolver did
//     not record is a global.
//   - `return` travels back up as an ExecResult, not as an exception.
//     Exceptions are reserved for real runtime errors (LuxError).
//   - Output of `print` goes to an injected stream so tests can capture it.
//   - Every Program passed to run() is retained, so closures and resolution
//     entries that point into earlier REPL lines stay valid.
//
// =============================================================================

#include "environment.hpp"
#include "value.hpp"
#include "../parser/ast.hpp"
#include "../lib/errors/error.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lux
{

    // ---- Outcome of executing one statement -------------------------------

    struct ExecResult
    {
        enum class Kind
        {
            NORMAL,    // fell through; value is set only for expression statements
            RETURNING, // a `return` is unwinding to the enclosing call
        };

        Kind kind = Kind::NORMAL;
        std::optional<Value> value;

        static ExecResult normal(std::optional<Value> v = std::nullopt)
        {
            return ExecResult{Kind::NORMAL, std::move(v)};
        }
        static ExecResult returning(Value v)
        {
            return ExecResult{Kind::RETURNING, std::move(v)};
        }

        bool isReturn() const { return kind == Kind::RETURNING; }
    };

    // ========================================================================
    // Interpreter
    // ========================================================================

    class Interpreter
    {
    public:
        explicit Interpreter(std::ostream &out = std::cout);
        ~Interpreter();

        Interpreter(const Interpreter &) = delete;
        Interpreter &operator=(const Interpreter &) = delete;

        /// Execute a resolved program. The interpreter takes ownership of it.
        /// Returns the value of the final statement when that statement is an
        /// expression statement, otherwise nothing.
        /// Throws LuxError on a runtime error; statements already executed keep
        /// their effects.
        std::optional<Value> run(Program program);

        /// Record that `expr` refers to a local `depth` frames above the frame
        /// in which it is evaluated. Called by the Resolver.
        void resolve(const Expr *expr, int depth);

        /// Number of resolved local references (testing)
        size_t resolvedCount() const { return locals_.size(); }

        /// Depth recorded for `expr`; empty for globals and unresolved nodes
        std::optional<int> resolvedDepth(const Expr *expr) const
        {
            auto it = locals_.find(expr);
            if (it == locals_.end())
                return std::nullopt;
            return it->second;
        }

        /// Access to the global environment (testing / REPL / stdlib)
        Environment &globals() { return *globals_; }

        /// Register a native function in the global scope
        void defineNative(const std::string &name, size_t arity, NativeFn fn);

    private:
        std::ostream &out_;
        std::shared_ptr<Environment> globals_;
        std::shared_ptr<Environment> current_;
        std::unordered_map<const Expr *, int> locals_;
        std::vector<std::unique_ptr<Program>> programs_;

        // ---- Statement execution -------------------------------------------

        ExecResult exec(const Stmt *stmt);
        ExecResult execBlock(const std::vector<StmtPtr> &stmts, std::shared_ptr<Environment> env);
        ExecResult execIf(const IfStmt *node);
        ExecResult execWhile(const WhileStmt *node);
        void execVar(const VarStmt *node);
        void execPrint(const PrintStmt *node);
        void execFnDef(const FnDef *node);

        // ---- Expression evaluation -----------------------------------------

        Value eval(const Expr *expr);
        Value evalUnary(const UnaryExpr *node);
        Value evalBinary(const BinaryExpr *node);
        Value evalLogical(const LogicalExpr *node);
        Value evalVariable(const Variable *node);
        Value evalAssign(const Assign *node);
        Value evalCall(const CallExpr *node);

        // ---- Helpers -------------------------------------------------------

        Value callFunction(const Callable &fn, std::vector<Value> &args, Span span);
    };

} // namespace lux
