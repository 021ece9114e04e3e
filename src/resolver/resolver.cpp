#include "resolver.hpp"
#include "../interpreter/interpreter.hpp"

namespace lux
{

    Resolver::Resolver(Interpreter &interp) : interp_(interp) {}

    std::vector<Diagnostic> Resolver::resolve(const Program &program)
    {
        scopes_.clear();
        diagnostics_.clear();
        pending_.clear();
        functionDepth_ = 0;

        resolveStmts(program.statements);

        if (diagnostics_.empty())
        {
            for (auto &entry : pending_)
                interp_.resolve(entry.first, entry.second);
        }
        pending_.clear();
        return diagnostics_;
    }

    // ========================================================================
    // Scope bookkeeping
    // ========================================================================

    void Resolver::beginScope()
    {
        scopes_.emplace_back();
    }

    void Resolver::endScope()
    {
        scopes_.pop_back();
    }

    void Resolver::declare(const std::string &name)
    {
        if (scopes_.empty())
            return;
        scopes_.back()[name] = false;
    }

    void Resolver::define(const std::string &name)
    {
        if (scopes_.empty())
            return;
        scopes_.back()[name] = true;
    }

    void Resolver::resolveLocal(const Expr *expr, const std::string &name)
    {
        for (size_t i = scopes_.size(); i-- > 0;)
        {
            if (scopes_[i].count(name))
            {
                pending_.emplace_back(expr, static_cast<int>(scopes_.size() - 1 - i));
                return;
            }
        }
        // Not found: global, looked up by name at runtime
    }

    void Resolver::error(const std::string &message, Span span)
    {
        diagnostics_.emplace_back(message, span);
    }

    // ========================================================================
    // Statements
    // ========================================================================

    void Resolver::resolveStmts(const std::vector<StmtPtr> &stmts)
    {
        for (const auto &stmt : stmts)
            resolveStmt(stmt.get());
    }

    void Resolver::resolveStmt(const Stmt *stmt)
    {
        if (auto *s = dynamic_cast<const BlockStmt *>(stmt))
        {
            beginScope();
            resolveStmts(s->statements);
            endScope();
        }
        else if (auto *s = dynamic_cast<const VarStmt *>(stmt))
        {
            declare(s->name);
            resolveExpr(s->init.get());
            define(s->name);
        }
        else if (auto *s = dynamic_cast<const FnDef *>(stmt))
        {
            // Defined before the body is visited so the function can recurse
            declare(s->name);
            define(s->name);
            resolveFunction(s);
        }
        else if (auto *s = dynamic_cast<const ExprStmt *>(stmt))
        {
            resolveExpr(s->expr.get());
        }
        else if (auto *s = dynamic_cast<const PrintStmt *>(stmt))
        {
            resolveExpr(s->expr.get());
        }
        else if (auto *s = dynamic_cast<const IfStmt *>(stmt))
        {
            resolveExpr(s->condition.get());
            resolveStmt(s->thenBranch.get());
            if (s->elseBranch)
                resolveStmt(s->elseBranch.get());
        }
        else if (auto *s = dynamic_cast<const WhileStmt *>(stmt))
        {
            resolveExpr(s->condition.get());
            resolveStmt(s->body.get());
        }
        else if (auto *s = dynamic_cast<const ReturnStmt *>(stmt))
        {
            if (functionDepth_ == 0)
                error("Can't return from top-level code.", s->span);
            resolveExpr(s->value.get());
        }
    }

    void Resolver::resolveFunction(const FnDef *fn)
    {
        functionDepth_++;
        beginScope();
        for (const auto &param : fn->params)
        {
            declare(param);
            define(param);
        }
        // The body shares the parameter scope; see Interpreter::callFunction
        resolveStmts(fn->body->statements);
        endScope();
        functionDepth_--;
    }

    // ========================================================================
    // Expressions
    // ========================================================================

    void Resolver::resolveExpr(const Expr *expr)
    {
        if (auto *e = dynamic_cast<const Variable *>(expr))
        {
            if (!scopes_.empty())
            {
                auto it = scopes_.back().find(e->name);
                if (it != scopes_.back().end() && !it->second)
                    error("Can't read local variable '" + e->name + "' in its own initializer.",
                          e->span);
            }
            resolveLocal(e, e->name);
        }
        else if (auto *e = dynamic_cast<const Assign *>(expr))
        {
            resolveExpr(e->value.get());
            resolveLocal(e, e->name);
        }
        else if (auto *e = dynamic_cast<const BinaryExpr *>(expr))
        {
            resolveExpr(e->left.get());
            resolveExpr(e->right.get());
        }
        else if (auto *e = dynamic_cast<const LogicalExpr *>(expr))
        {
            resolveExpr(e->left.get());
            resolveExpr(e->right.get());
        }
        else if (auto *e = dynamic_cast<const UnaryExpr *>(expr))
        {
            resolveExpr(e->operand.get());
        }
        else if (auto *e = dynamic_cast<const Grouping *>(expr))
        {
            resolveExpr(e->inner.get());
        }
        else if (auto *e = dynamic_cast<const CallExpr *>(expr))
        {
            resolveExpr(e->callee.get());
            for (const auto &arg : e->args)
                resolveExpr(arg.get());
        }
        // Literals reference nothing
    }

} // namespace lux
