#include "ast_printer.hpp"
#include "../interpreter/value.hpp"

namespace lux
{

    std::string printExpr(const Expr *expr)
    {
        if (!expr)
            return "<null>";

        if (auto *n = dynamic_cast<const NumberLiteral *>(expr))
            return formatNumber(n->value);
        if (auto *n = dynamic_cast<const StringLiteral *>(expr))
            return "\"" + n->value + "\"";
        if (auto *n = dynamic_cast<const BoolLiteral *>(expr))
            return n->value ? "true" : "false";
        if (dynamic_cast<const NilLiteral *>(expr))
            return "nil";
        if (auto *n = dynamic_cast<const Grouping *>(expr))
            return "(group " + printExpr(n->inner.get()) + ")";
        if (auto *n = dynamic_cast<const UnaryExpr *>(expr))
            return "(" + n->op + printExpr(n->operand.get()) + ")";
        if (auto *n = dynamic_cast<const BinaryExpr *>(expr))
            return "(" + printExpr(n->left.get()) + " " + n->op + " " + printExpr(n->right.get()) + ")";
        if (auto *n = dynamic_cast<const LogicalExpr *>(expr))
            return "(" + printExpr(n->left.get()) + " " + n->op + " " + printExpr(n->right.get()) + ")";
        if (auto *n = dynamic_cast<const Variable *>(expr))
            return n->name;
        if (auto *n = dynamic_cast<const Assign *>(expr))
            return "(= " + n->name + " " + printExpr(n->value.get()) + ")";
        if (auto *n = dynamic_cast<const CallExpr *>(expr))
        {
            std::string out = "(call " + printExpr(n->callee.get());
            for (auto &arg : n->args)
                out += " " + printExpr(arg.get());
            return out + ")";
        }

        return "<?>";
    }

    static std::string printBody(const std::vector<StmtPtr> &stmts)
    {
        std::string out;
        for (auto &s : stmts)
            out += " " + printStmt(s.get());
        return out;
    }

    std::string printStmt(const Stmt *stmt)
    {
        if (!stmt)
            return "<null>";

        if (auto *n = dynamic_cast<const ExprStmt *>(stmt))
            return "(; " + printExpr(n->expr.get()) + ")";
        if (auto *n = dynamic_cast<const PrintStmt *>(stmt))
            return "(print " + printExpr(n->expr.get()) + ")";
        if (auto *n = dynamic_cast<const VarStmt *>(stmt))
            return "(var " + n->name + " " + printExpr(n->init.get()) + ")";
        if (auto *n = dynamic_cast<const BlockStmt *>(stmt))
            return "(block" + printBody(n->statements) + ")";
        if (auto *n = dynamic_cast<const IfStmt *>(stmt))
        {
            std::string out = "(if " + printExpr(n->condition.get()) + " " + printStmt(n->thenBranch.get());
            if (n->elseBranch)
                out += " " + printStmt(n->elseBranch.get());
            return out + ")";
        }
        if (auto *n = dynamic_cast<const WhileStmt *>(stmt))
            return "(while " + printExpr(n->condition.get()) + " " + printStmt(n->body.get()) + ")";
        if (auto *n = dynamic_cast<const FnDef *>(stmt))
        {
            std::string out = "(fun " + n->name + " (";
            for (size_t i = 0; i < n->params.size(); i++)
            {
                if (i > 0)
                    out += " ";
                out += n->params[i];
            }
            return out + ")" + printBody(n->body->statements) + ")";
        }
        if (auto *n = dynamic_cast<const ReturnStmt *>(stmt))
            return "(return " + printExpr(n->value.get()) + ")";

        return "<?>";
    }

    std::string printProgram(const Program &program)
    {
        std::string out;
        for (auto &s : program.statements)
            out += printStmt(s.get()) + "\n";
        return out;
    }

} // namespace lux
