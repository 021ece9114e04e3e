#pragma once

// =============================================================================
// Standard library: natives bound in the global scope of every interpreter
// =============================================================================
//
// To add a native:
//   write a lambda matching NativeFn and register it below with its arity.
//   The interpreter checks arity before the lambda runs.
//
// =============================================================================

#include "../interpreter/interpreter.hpp"
#include <chrono>

namespace lux
{

    inline void loadStdlib(Interpreter &interp)
    {
        // clock() -> milliseconds since the Unix epoch
        interp.defineNative("clock", 0, [](std::vector<Value> &, Span) -> Value
                            {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
            return Value::makeNumber(static_cast<double>(ms)); });
    }

} // namespace lux
