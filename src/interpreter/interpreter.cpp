#include "interpreter.hpp"
#include "../builtins/stdlib.hpp"

namespace lux
{

    // ========================================================================
    // Construction
    // ========================================================================

    Interpreter::Interpreter(std::ostream &out)
        : out_(out), globals_(std::make_shared<Environment>()), current_(globals_)
    {
        loadStdlib(*this);
    }

    Interpreter::~Interpreter()
    {
        // Global closures capture the global frame; break those cycles
        globals_->clear();
    }

    void Interpreter::defineNative(const std::string &name, size_t arity, NativeFn fn)
    {
        globals_->define(name, Value::makeCallable(Callable::makeNative(name, arity, std::move(fn))));
    }

    void Interpreter::resolve(const Expr *expr, int depth)
    {
        locals_[expr] = depth;
    }

    // ========================================================================
    // run: top-level entry point
    // ========================================================================

    std::optional<Value> Interpreter::run(Program program)
    {
        programs_.push_back(std::make_unique<Program>(std::move(program)));
        const Program &prog = *programs_.back();

        current_ = globals_;
        std::optional<Value> last;
        for (const auto &stmt : prog.statements)
        {
            ExecResult result = exec(stmt.get());
            last = result.value;
            if (result.isReturn())
                break;
        }
        return last;
    }

    // ========================================================================
    // Statement execution
    // ========================================================================

    ExecResult Interpreter::exec(const Stmt *stmt)
    {
        if (auto *p = dynamic_cast<const ExprStmt *>(stmt))
            return ExecResult::normal(eval(p->expr.get()));
        if (auto *p = dynamic_cast<const PrintStmt *>(stmt))
        {
            execPrint(p);
            return ExecResult::normal();
        }
        if (auto *p = dynamic_cast<const VarStmt *>(stmt))
        {
            execVar(p);
            return ExecResult::normal();
        }
        if (auto *p = dynamic_cast<const BlockStmt *>(stmt))
            return execBlock(p->statements, Environment::extend(current_));
        if (auto *p = dynamic_cast<const IfStmt *>(stmt))
            return execIf(p);
        if (auto *p = dynamic_cast<const WhileStmt *>(stmt))
            return execWhile(p);
        if (auto *p = dynamic_cast<const FnDef *>(stmt))
        {
            execFnDef(p);
            return ExecResult::normal();
        }
        if (auto *p = dynamic_cast<const ReturnStmt *>(stmt))
            return ExecResult::returning(eval(p->value.get()));

        throw RuntimeError("Unknown statement type", stmt->span);
    }

    ExecResult Interpreter::execBlock(const std::vector<StmtPtr> &stmts, std::shared_ptr<Environment> env)
    {
        auto savedEnv = current_;
        current_ = std::move(env);
        try
        {
            for (const auto &stmt : stmts)
            {
                ExecResult result = exec(stmt.get());
                if (result.isReturn())
                {
                    current_ = savedEnv;
                    return result;
                }
            }
        }
        catch (...)
        {
            current_ = savedEnv;
            throw;
        }
        current_ = savedEnv;
        return ExecResult::normal();
    }

    void Interpreter::execPrint(const PrintStmt *node)
    {
        Value value = eval(node->expr.get());
        out_ << value.toString() << std::endl;
    }

    void Interpreter::execVar(const VarStmt *node)
    {
        Value value = eval(node->init.get());
        current_->define(node->name, std::move(value));
    }

    ExecResult Interpreter::execIf(const IfStmt *node)
    {
        if (eval(node->condition.get()).truthy())
            return exec(node->thenBranch.get());
        if (node->elseBranch)
            return exec(node->elseBranch.get());
        return ExecResult::normal();
    }

    ExecResult Interpreter::execWhile(const WhileStmt *node)
    {
        while (eval(node->condition.get()).truthy())
        {
            ExecResult result = exec(node->body.get());
            if (result.isReturn())
                return result;
        }
        return ExecResult::normal();
    }

    void Interpreter::execFnDef(const FnDef *node)
    {
        // The closure captures the frame it is defined in, which is also the
        // frame it is bound in, so it can call itself recursively
        auto fn = Callable::makeClosure(node, current_);
        current_->define(node->name, Value::makeCallable(std::move(fn)));
    }

    // ========================================================================
    // Expression evaluation
    // ========================================================================

    Value Interpreter::eval(const Expr *expr)
    {
        if (auto *n = dynamic_cast<const NumberLiteral *>(expr))
            return Value::makeNumber(n->value);
        if (auto *n = dynamic_cast<const StringLiteral *>(expr))
            return Value::makeString(n->value);
        if (auto *n = dynamic_cast<const BoolLiteral *>(expr))
            return Value::makeBool(n->value);
        if (dynamic_cast<const NilLiteral *>(expr))
            return Value::makeNil();
        if (auto *n = dynamic_cast<const Grouping *>(expr))
            return eval(n->inner.get());
        if (auto *n = dynamic_cast<const UnaryExpr *>(expr))
            return evalUnary(n);
        if (auto *n = dynamic_cast<const BinaryExpr *>(expr))
            return evalBinary(n);
        if (auto *n = dynamic_cast<const LogicalExpr *>(expr))
            return evalLogical(n);
        if (auto *n = dynamic_cast<const Variable *>(expr))
            return evalVariable(n);
        if (auto *n = dynamic_cast<const Assign *>(expr))
            return evalAssign(n);
        if (auto *n = dynamic_cast<const CallExpr *>(expr))
            return evalCall(n);

        throw RuntimeError("Unknown expression type", expr->span);
    }

    Value Interpreter::evalUnary(const UnaryExpr *node)
    {
        Value operand = eval(node->operand.get());

        if (node->op == "!")
            return Value::makeBool(!operand.truthy());

        // "-"
        if (!operand.isNumber())
            throw TypeError("Operand of '-' must be a number, got " +
                                std::string(operand.typeName()),
                            node->span);
        return Value::makeNumber(-operand.asNumber());
    }

    Value Interpreter::evalBinary(const BinaryExpr *node)
    {
        // Left operand is always evaluated first
        Value left = eval(node->left.get());
        Value right = eval(node->right.get());
        const std::string &op = node->op;

        if (op == "==")
            return Value::makeBool(left.equals(right));
        if (op == "!=")
            return Value::makeBool(!left.equals(right));

        if (op == "+")
        {
            if (left.isNumber() && right.isNumber())
                return Value::makeNumber(left.asNumber() + right.asNumber());
            if (left.isString() && right.isString())
                return Value::makeString(left.asString() + right.asString());
            throw TypeError("Operands of '+' must be two numbers or two strings, got " +
                                std::string(left.typeName()) + " and " + right.typeName(),
                            node->span);
        }

        // Everything else is numeric only
        if (!left.isNumber() || !right.isNumber())
            throw TypeError("Operands of '" + op + "' must be numbers, got " +
                                std::string(left.typeName()) + " and " + right.typeName(),
                            node->span);

        double a = left.asNumber();
        double b = right.asNumber();

        if (op == "-")
            return Value::makeNumber(a - b);
        if (op == "*")
            return Value::makeNumber(a * b);
        if (op == "/")
        {
            if (b == 0.0)
                throw DivisionByZeroError(node->span);
            return Value::makeNumber(a / b);
        }
        if (op == "<")
            return Value::makeBool(a < b);
        if (op == "<=")
            return Value::makeBool(a <= b);
        if (op == ">")
            return Value::makeBool(a > b);
        if (op == ">=")
            return Value::makeBool(a >= b);

        throw RuntimeError("Unknown binary operator '" + op + "'", node->span);
    }

    // `and` / `or` yield one of their operands, not a coerced boolean
    Value Interpreter::evalLogical(const LogicalExpr *node)
    {
        Value left = eval(node->left.get());

        if (node->op == "or")
        {
            if (left.truthy())
                return left;
        }
        else
        {
            if (!left.truthy())
                return left;
        }
        return eval(node->right.get());
    }

    Value Interpreter::evalVariable(const Variable *node)
    {
        std::optional<Value> value;
        auto it = locals_.find(node);
        if (it != locals_.end())
            value = current_->getAt(it->second, node->name);
        else
            value = globals_->get(node->name);

        if (!value)
            throw UndefinedVariableError(node->name, node->span);
        return *value;
    }

    Value Interpreter::evalAssign(const Assign *node)
    {
        Value value = eval(node->value.get());

        bool ok;
        auto it = locals_.find(node);
        if (it != locals_.end())
            ok = current_->assignAt(it->second, node->name, value);
        else
            ok = globals_->assign(node->name, value);

        if (!ok)
            throw UndefinedVariableError(node->name, node->span);
        return value;
    }

    Value Interpreter::evalCall(const CallExpr *node)
    {
        Value callee = eval(node->callee.get());

        std::vector<Value> args;
        args.reserve(node->args.size());
        for (const auto &arg : node->args)
            args.push_back(eval(arg.get()));

        if (!callee.isCallable())
            throw TypeError("Can only call functions, got " + std::string(callee.typeName()),
                            node->span);

        // Keep the callable alive for the duration of the call
        std::shared_ptr<Callable> fn = callee.asCallable();
        return callFunction(*fn, args, node->span);
    }

    // ========================================================================
    // Function calls
    // ========================================================================

    Value Interpreter::callFunction(const Callable &fn, std::vector<Value> &args, Span span)
    {
        if (args.size() != fn.arity)
            throw ArityError(fn.name, fn.arity, args.size(), span);

        if (fn.kind == Callable::Kind::NATIVE)
            return fn.native(args, span);

        // Lexical scoping: parent = the environment where the function was *defined*.
        // Parameters and the body's top-level declarations share this one frame.
        auto fnEnv = Environment::extend(fn.closure);
        for (size_t i = 0; i < fn.decl->params.size(); i++)
            fnEnv->define(fn.decl->params[i], std::move(args[i]));

        ExecResult result = execBlock(fn.decl->body->statements, std::move(fnEnv));
        if (result.isReturn() && result.value)
            return *result.value;
        return Value::makeNil();
    }

} // namespace lux
