#pragma once

#include "../lib/position/span.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lux
{

    // ============================================================
    // Forward declarations & smart-pointer aliases
    // ============================================================

    struct Expr;
    struct Stmt;

    using ExprPtr = std::unique_ptr<Expr>;
    using StmtPtr = std::unique_ptr<Stmt>;

    // ============================================================
    // Base classes
    // ============================================================

    struct Expr
    {
        Span span;
        virtual ~Expr() = default;
    };

    struct Stmt
    {
        Span span;
        virtual ~Stmt() = default;
    };

    // ============================================================
    // Expression nodes
    // ============================================================

    struct NumberLiteral : Expr
    {
        double value;
        explicit NumberLiteral(double v, Span sp = Span()) : value(v) { span = sp; }
    };

    struct StringLiteral : Expr
    {
        std::string value;
        explicit StringLiteral(std::string v, Span sp = Span())
            : value(std::move(v)) { span = sp; }
    };

    struct BoolLiteral : Expr
    {
        bool value;
        explicit BoolLiteral(bool v, Span sp = Span()) : value(v) { span = sp; }
    };

    struct NilLiteral : Expr
    {
        explicit NilLiteral(Span sp = Span()) { span = sp; }
    };

    struct Grouping : Expr
    {
        ExprPtr inner;
        explicit Grouping(ExprPtr e, Span sp = Span()) : inner(std::move(e)) { span = sp; }
    };

    struct UnaryExpr : Expr
    {
        std::string op; // "!" or "-"
        ExprPtr operand;
        UnaryExpr(std::string o, ExprPtr operand, Span sp = Span())
            : op(std::move(o)), operand(std::move(operand)) { span = sp; }
    };

    // span is the operator token's span
    struct BinaryExpr : Expr
    {
        ExprPtr left;
        std::string op; // +, -, *, /, ==, !=, >, >=, <, <=
        ExprPtr right;
        BinaryExpr(ExprPtr l, std::string o, ExprPtr r, Span sp = Span())
            : left(std::move(l)), op(std::move(o)), right(std::move(r)) { span = sp; }
    };

    // Short-circuit `and` / `or`; kept apart from BinaryExpr because the right
    // operand is evaluated conditionally
    struct LogicalExpr : Expr
    {
        ExprPtr left;
        std::string op; // "and" or "or"
        ExprPtr right;
        LogicalExpr(ExprPtr l, std::string o, ExprPtr r, Span sp = Span())
            : left(std::move(l)), op(std::move(o)), right(std::move(r)) { span = sp; }
    };

    struct Variable : Expr
    {
        std::string name;
        explicit Variable(std::string n, Span sp = Span()) : name(std::move(n)) { span = sp; }
    };

    struct Assign : Expr
    {
        std::string name;
        ExprPtr value;
        Assign(std::string n, ExprPtr v, Span sp = Span())
            : name(std::move(n)), value(std::move(v)) { span = sp; }
    };

    struct CallExpr : Expr
    {
        ExprPtr callee;
        std::vector<ExprPtr> args;
        CallExpr(ExprPtr callee, std::vector<ExprPtr> args, Span sp = Span())
            : callee(std::move(callee)), args(std::move(args)) { span = sp; }
    };

    // ============================================================
    // Statement nodes
    // ============================================================

    struct ExprStmt : Stmt
    {
        ExprPtr expr;
        explicit ExprStmt(ExprPtr e, Span sp = Span()) : expr(std::move(e)) { span = sp; }
    };

    struct PrintStmt : Stmt
    {
        ExprPtr expr;
        explicit PrintStmt(ExprPtr e, Span sp = Span()) : expr(std::move(e)) { span = sp; }
    };

    // A missing initializer is stored as a NilLiteral
    struct VarStmt : Stmt
    {
        std::string name;
        ExprPtr init;
        VarStmt(std::string n, ExprPtr init, Span sp = Span())
            : name(std::move(n)), init(std::move(init)) { span = sp; }
    };

    struct BlockStmt : Stmt
    {
        std::vector<StmtPtr> statements;
        explicit BlockStmt(std::vector<StmtPtr> stmts, Span sp = Span())
            : statements(std::move(stmts)) { span = sp; }
    };

    struct IfStmt : Stmt
    {
        ExprPtr condition;
        StmtPtr thenBranch;
        StmtPtr elseBranch; // nullptr when there is no else
        IfStmt(ExprPtr cond, StmtPtr thenB, StmtPtr elseB, Span sp = Span())
            : condition(std::move(cond)), thenBranch(std::move(thenB)),
              elseBranch(std::move(elseB)) { span = sp; }
    };

    struct WhileStmt : Stmt
    {
        ExprPtr condition;
        StmtPtr body;
        WhileStmt(ExprPtr cond, StmtPtr body, Span sp = Span())
            : condition(std::move(cond)), body(std::move(body)) { span = sp; }
    };

    struct FnDef : Stmt
    {
        std::string name;
        std::vector<std::string> params;
        std::unique_ptr<BlockStmt> body;
        FnDef(std::string name, std::vector<std::string> params,
              std::unique_ptr<BlockStmt> body, Span sp = Span())
            : name(std::move(name)), params(std::move(params)), body(std::move(body)) { span = sp; }
    };

    // A bare `return;` is stored with a NilLiteral value
    struct ReturnStmt : Stmt
    {
        ExprPtr value;
        explicit ReturnStmt(ExprPtr v, Span sp = Span()) : value(std::move(v)) { span = sp; }
    };

    // ============================================================
    // Top-level program
    // ============================================================

    struct Program
    {
        std::vector<StmtPtr> statements;
    };

} // namespace lux
