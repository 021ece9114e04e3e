#pragma once

// =============================================================================
// Value: Lux's runtime value type
// =============================================================================
//
// A Value is one of five kinds, selected by a ValueType tag:
//
//   NIL       the absence of a value
//   BOOL      true / false
//   NUMBER    IEEE-754 double (there is no separate integer type)
//   STRING    immutable text
//   CALLABLE  a native function or a user closure
//
// Values are copied freely. Strings and callables share their payload, so a
// copy is a pointer copy plus a reference count bump.
//
// Truthiness: only nil and false are falsy. 0 and "" are truthy.
// =============================================================================

#include "../lib/position/span.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lux
{

    class Environment;
    struct Callable;
    struct FnDef;

    enum class ValueType : uint8_t
    {
        NIL = 0,
        BOOL,
        NUMBER,
        STRING,
        CALLABLE,
    };

    /// Human-readable type name for error messages
    const char *valueTypeName(ValueType t);

    // ========================================================================
    // Value
    // ========================================================================

    class Value
    {
    public:
        /// Default-constructed Value is nil
        Value() : type_(ValueType::NIL), bool_(false), num_(0.0) {}

        static Value makeNil();
        static Value makeBool(bool b);
        static Value makeNumber(double d);
        static Value makeString(const std::string &s);
        static Value makeCallable(std::shared_ptr<Callable> fn);

        ValueType type() const { return type_; }
        const char *typeName() const { return valueTypeName(type_); }

        bool isNil() const { return type_ == ValueType::NIL; }
        bool isBool() const { return type_ == ValueType::BOOL; }
        bool isNumber() const { return type_ == ValueType::NUMBER; }
        bool isString() const { return type_ == ValueType::STRING; }
        bool isCallable() const { return type_ == ValueType::CALLABLE; }

        // Accessors: callers must check the type first
        bool asBool() const { return bool_; }
        double asNumber() const { return num_; }
        const std::string &asString() const { return *str_; }
        const std::shared_ptr<Callable> &asCallable() const { return fn_; }

        /// nil and false are falsy, everything else is truthy
        bool truthy() const;

        /// Lux `==`: same kind and same value. Callables compare by identity,
        /// numbers follow IEEE-754 (nan != nan).
        bool equals(const Value &other) const;

        /// Display form used by `print`
        std::string toString() const;

        /// Like toString() but strings are quoted (REPL echo)
        std::string repr() const;

    private:
        ValueType type_;
        bool bool_;
        double num_;
        std::shared_ptr<const std::string> str_;
        std::shared_ptr<Callable> fn_;
    };

    /// Signature every native function must match.
    using NativeFn = std::function<Value(std::vector<Value> &args, Span span)>;

    // ========================================================================
    // Callable: the closed set of things that can be called
    // ========================================================================

    struct Callable
    {
        enum class Kind : uint8_t
        {
            NATIVE,
            CLOSURE,
        };

        Kind kind = Kind::NATIVE;
        std::string name;
        size_t arity = 0;

        // NATIVE only
        NativeFn native;

        // CLOSURE only. decl is non-owning: the Program that holds the FnDef is
        // retained by the interpreter for as long as the closure can be reached.
        const FnDef *decl = nullptr;
        std::shared_ptr<Environment> closure;

        static std::shared_ptr<Callable> makeNative(std::string name, size_t arity, NativeFn fn);
        static std::shared_ptr<Callable> makeClosure(const FnDef *decl, std::shared_ptr<Environment> env);
    };

    /// Integral values print without a decimal point ("3", "-0");
    /// everything else uses the shortest form that reads back exactly ("0.1").
    std::string formatNumber(double d);

} // namespace lux
