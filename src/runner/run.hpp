#pragma once

// =============================================================================
// Runner: the whole pipeline behind one call
// =============================================================================
//
//   source -> Scanner -> Parser -> Resolver -> Interpreter::run
//
// Compile-time diagnostics stop the pipeline before anything executes. A
// runtime error stops the current run; effects of statements that already ran
// (globals defined, output printed) are kept, which is what lets a REPL
// session continue after an error.
//
// Reports go to an error stream, one per line:
//     [LUX ERROR] Line 3 - SyntaxError: Expected ';' after value but found 'print'
// =============================================================================

#include "../interpreter/interpreter.hpp"
#include "../lib/errors/error.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace lux
{

    enum class RunStatus
    {
        OK,
        COMPILE_ERROR, // scanner, parser or resolver diagnostics
        RUNTIME_ERROR,
    };

    struct RunOutcome
    {
        RunStatus status = RunStatus::OK;
        std::optional<Value> value; // last expression-statement value, OK only
        std::vector<std::string> reports;
    };

    /// Run `source` against `interp` and describe what happened.
    /// Every report is also written to `err`.
    RunOutcome runDetailed(const std::string &source, Interpreter &interp, std::ostream &err = std::cerr);

    /// Run `source`; the last produced value, or nothing on failure.
    std::optional<Value> run(const std::string &source, Interpreter &interp, std::ostream &err = std::cerr);

    /// Scan, parse and resolve without executing. Returns formatted reports
    /// (empty when the source is clean).
    std::vector<std::string> check(const std::string &source);

} // namespace lux
