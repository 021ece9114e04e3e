#include "value.hpp"
#include "environment.hpp"
#include "../parser/ast.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace lux
{

    const char *valueTypeName(ValueType t)
    {
        switch (t)
        {
        case ValueType::NIL:
            return "nil";
        case ValueType::BOOL:
            return "boolean";
        case ValueType::NUMBER:
            return "number";
        case ValueType::STRING:
            return "string";
        case ValueType::CALLABLE:
            return "function";
        }
        return "unknown";
    }

    // ========================================================================
    // Callable factories
    // ========================================================================

    std::shared_ptr<Callable> Callable::makeNative(std::string name, size_t arity, NativeFn fn)
    {
        auto c = std::make_shared<Callable>();
        c->kind = Kind::NATIVE;
        c->name = std::move(name);
        c->arity = arity;
        c->native = std::move(fn);
        return c;
    }

    std::shared_ptr<Callable> Callable::makeClosure(const FnDef *decl, std::shared_ptr<Environment> env)
    {
        auto c = std::make_shared<Callable>();
        c->kind = Kind::CLOSURE;
        c->name = decl->name;
        c->arity = decl->params.size();
        c->decl = decl;
        c->closure = std::move(env);
        return c;
    }

    // ========================================================================
    // Value factories
    // ========================================================================

    Value Value::makeNil()
    {
        return Value();
    }

    Value Value::makeBool(bool b)
    {
        Value v;
        v.type_ = ValueType::BOOL;
        v.bool_ = b;
        return v;
    }

    Value Value::makeNumber(double d)
    {
        Value v;
        v.type_ = ValueType::NUMBER;
        v.num_ = d;
        return v;
    }

    Value Value::makeString(const std::string &s)
    {
        Value v;
        v.type_ = ValueType::STRING;
        v.str_ = std::make_shared<const std::string>(s);
        return v;
    }

    Value Value::makeCallable(std::shared_ptr<Callable> fn)
    {
        Value v;
        v.type_ = ValueType::CALLABLE;
        v.fn_ = std::move(fn);
        return v;
    }

    // ========================================================================
    // Semantics
    // ========================================================================

    bool Value::truthy() const
    {
        switch (type_)
        {
        case ValueType::NIL:
            return false;
        case ValueType::BOOL:
            return bool_;
        default:
            return true;
        }
    }

    bool Value::equals(const Value &other) const
    {
        if (type_ != other.type_)
            return false;

        switch (type_)
        {
        case ValueType::NIL:
            return true;
        case ValueType::BOOL:
            return bool_ == other.bool_;
        case ValueType::NUMBER:
            return num_ == other.num_;
        case ValueType::STRING:
            return *str_ == *other.str_;
        case ValueType::CALLABLE:
            return fn_ == other.fn_;
        }
        return false;
    }

    // ========================================================================
    // Display
    // ========================================================================

    std::string formatNumber(double d)
    {
        if (std::isnan(d))
            return "nan";
        if (std::isinf(d))
            return d > 0 ? "inf" : "-inf";

        std::ostringstream oss;
        if (std::floor(d) == d)
        {
            oss << std::fixed << std::setprecision(0) << d;
            return oss.str();
        }

        // Shortest precision that survives a round trip
        for (int precision = 1; precision <= 17; precision++)
        {
            oss.str("");
            oss << std::setprecision(precision) << d;
            if (std::strtod(oss.str().c_str(), nullptr) == d)
                break;
        }
        return oss.str();
    }

    std::string Value::toString() const
    {
        switch (type_)
        {
        case ValueType::NIL:
            return "nil";
        case ValueType::BOOL:
            return bool_ ? "true" : "false";
        case ValueType::NUMBER:
            return formatNumber(num_);
        case ValueType::STRING:
            return *str_;
        case ValueType::CALLABLE:
            if (fn_->kind == Callable::Kind::NATIVE)
                return "<fun (native) " + fn_->name + ">";
            return "<fun " + fn_->name + ">";
        }
        return "";
    }

    std::string Value::repr() const
    {
        if (type_ == ValueType::STRING)
            return "\"" + *str_ + "\"";
        return toString();
    }

} // namespace lux
