#pragma once

// =============================================================================
// Lux Error Hierarchy
// =============================================================================
// Lux has two independent error channels:
//
//   1. Diagnostics: compile-time problems found by the scanner, parser or
//      resolver. They are plain values collected in a list; nothing throws.
//
//   2. Runtime errors: problems found while evaluating. They all inherit
//      from LuxError (itself a std::runtime_error), so a single
//      `catch (LuxError&)` catches any of them. Each carries the span of the
//      expression that failed.
//
// Every report, whatever the channel, is rendered as:
//     [LUX ERROR] Line N - Category: message
// =============================================================================

#include "../position/span.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace lux
{

    // ========================================================================
    // Diagnostics (compile-time)
    // ========================================================================

    struct Diagnostic
    {
        std::string message;
        Span span;

        Diagnostic(std::string message, Span span)
            : message(std::move(message)), span(span) {}
    };

    /// Render a report line in the standard Lux format
    inline std::string formatReport(const std::string &category,
                                    const std::string &message, int line)
    {
        return "[LUX ERROR] Line " + std::to_string(line) + " - " +
               category + ": " + message;
    }

    // ========================================================================
    // Base: LuxError
    // ========================================================================

    class LuxError : public std::runtime_error
    {
    public:
        LuxError(const std::string &category, const std::string &message, Span span)
            : std::runtime_error(category + ": " + message),
              span_(span), category_(category), detail_(message) {}

        const Span &span() const noexcept { return span_; }
        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        Span span_;
        std::string category_;
        std::string detail_;
    };

    // ========================================================================
    // Runtime errors
    // ========================================================================

    /// Wrong operand types for an operator, or calling something that is not callable.
    class TypeError : public LuxError
    {
    public:
        TypeError(const std::string &message, Span span)
            : LuxError("TypeError", message, span) {}
    };

    /// Division by zero (integral or fractional zero alike).
    class DivisionByZeroError : public LuxError
    {
    public:
        explicit DivisionByZeroError(Span span)
            : LuxError("DivisionByZero", "Cannot divide by zero", span) {}
    };

    /// Read of, or assignment to, a name that was never defined.
    class UndefinedVariableError : public LuxError
    {
    public:
        UndefinedVariableError(const std::string &name, Span span)
            : LuxError("UndefinedVariable",
                       "Undefined variable '" + name + "'", span),
              name_(name) {}

        const std::string &name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    /// Wrong number of arguments passed to a callable.
    class ArityError : public LuxError
    {
    public:
        ArityError(const std::string &fnName, size_t expected, size_t got, Span span)
            : LuxError("ArityError",
                       "'" + fnName + "' expected " + std::to_string(expected) +
                           " arguments but got " + std::to_string(got),
                       span),
              expected_(expected), got_(got) {}

        size_t expected() const noexcept { return expected_; }
        size_t got() const noexcept { return got_; }

    private:
        size_t expected_;
        size_t got_;
    };

    /// Generic runtime failure (raised by native functions).
    class RuntimeError : public LuxError
    {
    public:
        RuntimeError(const std::string &message, Span span)
            : LuxError("RuntimeError", message, span) {}
    };

} // namespace lux
