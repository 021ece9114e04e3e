// =============================================================================
// Lux: main entry point
// =============================================================================
//
// Usage:
//   lux                   Start the interactive REPL
//   lux repl              Same
//   lux <file.lux>        Execute a Lux script
//   lux run <file.lux>    Same
//   lux --check <file>    Scan, parse and resolve only; report diagnostics
//   lux --ast <file>      Print the parsed syntax tree
//   lux --tokens <file>   Print the token stream
//   lux --version         Print version information
//   lux --help            Print usage help
//
// Exit codes:
//   0   success
//   64  usage error
//   65  compile-time diagnostics (syntax or resolution)
//   70  runtime error
//   74  input file could not be read
//
// =============================================================================

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "lexer/scanner.hpp"
#include "parser/parser.hpp"
#include "parser/ast_printer.hpp"
#include "runner/run.hpp"
#include "repl/repl.hpp"

namespace
{

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 64;
    constexpr int EXIT_COMPILE_ERROR = 65;
    constexpr int EXIT_RUNTIME_ERROR = 70;
    constexpr int EXIT_SOFTWARE = 70;
    constexpr int EXIT_IO_ERROR = 74;

    // ---- Helpers ------------------------------------------------------------

    std::optional<std::string> readFile(const std::string &path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f.is_open())
        {
            std::cerr << "Error: Cannot open file '" << path << "'\n";
            return std::nullopt;
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    void printVersion()
    {
        std::cout << "Lux Language v" << LUX_VERSION << "\n";
    }

    void printHelp()
    {
        std::cout << "Usage:\n";
        std::cout << "  lux                   Start interactive REPL\n";
        std::cout << "  lux repl              Start interactive REPL\n";
        std::cout << "  lux <file.lux>        Execute a Lux script\n";
        std::cout << "  lux run <file.lux>    Execute a Lux script\n";
        std::cout << "  lux --check <file>    Check for errors without running\n";
        std::cout << "  lux --ast <file>      Print the syntax tree\n";
        std::cout << "  lux --tokens <file>   Print the token stream\n";
        std::cout << "  lux --version         Show version\n";
        std::cout << "  lux --help            Show this help\n";
    }

    // ---- Execute a file -----------------------------------------------------

    int executeFile(const std::string &path)
    {
        std::optional<std::string> source = readFile(path);
        if (!source)
            return EXIT_IO_ERROR;

        lux::Interpreter interpreter;
        lux::RunOutcome outcome = lux::runDetailed(*source, interpreter, std::cerr);
        switch (outcome.status)
        {
        case lux::RunStatus::OK:
            return EXIT_OK;
        case lux::RunStatus::COMPILE_ERROR:
            return EXIT_COMPILE_ERROR;
        case lux::RunStatus::RUNTIME_ERROR:
            return EXIT_RUNTIME_ERROR;
        }
        return EXIT_SOFTWARE;
    }

    // ---- Check a file (no execution) ----------------------------------------

    int checkFile(const std::string &path)
    {
        std::optional<std::string> source = readFile(path);
        if (!source)
            return EXIT_IO_ERROR;

        std::vector<std::string> reports = lux::check(*source);
        for (auto &r : reports)
            std::cerr << r << "\n";
        return reports.empty() ? EXIT_OK : EXIT_COMPILE_ERROR;
    }

    // ---- Dump the syntax tree -----------------------------------------------

    int printAst(const std::string &path)
    {
        std::optional<std::string> source = readFile(path);
        if (!source)
            return EXIT_IO_ERROR;

        lux::Parser parser(lux::scan(*source));
        lux::Program program = parser.parse();
        if (parser.hadError())
        {
            lux::LineOffsets lines(*source);
            for (auto &d : parser.diagnostics())
                std::cerr << lux::formatReport("SyntaxError", d.message, lines.line(d.span.start)) << "\n";
            return EXIT_COMPILE_ERROR;
        }

        std::cout << lux::printProgram(program);
        return EXIT_OK;
    }

    // ---- Dump the token stream ----------------------------------------------

    int printTokens(const std::string &path)
    {
        std::optional<std::string> source = readFile(path);
        if (!source)
            return EXIT_IO_ERROR;

        lux::LineOffsets lines(*source);
        for (auto &tok : lux::scan(*source))
        {
            std::cout << lines.line(tok.span.start) << "\t"
                      << lux::tokenTypeToString(tok.type) << "\t" << tok.value << "\n";
        }
        return EXIT_OK;
    }

    int runRepl()
    {
        lux::Repl repl;
        repl.run();
        return EXIT_OK;
    }

    int dispatch(const std::vector<std::string> &args)
    {
        if (args.empty())
            return runRepl();

        const std::string &cmd = args[0];

        if (cmd == "--version" || cmd == "-v")
        {
            printVersion();
            return EXIT_OK;
        }
        if (cmd == "--help" || cmd == "-h")
        {
            printHelp();
            return EXIT_OK;
        }
        if (cmd == "repl" && args.size() == 1)
            return runRepl();
        if ((cmd == "--check" || cmd == "--ast" || cmd == "--tokens" || cmd == "run") && args.size() == 2)
        {
            if (cmd == "--check")
                return checkFile(args[1]);
            if (cmd == "--ast")
                return printAst(args[1]);
            if (cmd == "--tokens")
                return printTokens(args[1]);
            return executeFile(args[1]);
        }
        if (args.size() == 1 && !cmd.empty() && cmd[0] != '-')
            return executeFile(cmd);

        std::cerr << "Error: invalid arguments\n";
        printHelp();
        return EXIT_USAGE;
    }

} // namespace

// ---- Main -------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    try
    {
        return dispatch(args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_SOFTWARE;
    }
}
