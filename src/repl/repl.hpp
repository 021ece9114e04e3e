#pragma once

// =============================================================================
// Repl: interactive read-eval-print loop for Lux
// =============================================================================
// Features:
//   - One persistent Interpreter: variables and functions survive across lines
//   - Multi-line input: keeps reading while `{` are left open
//   - Echo of the last expression value in its debug form (strings quoted)
//   - :help, :reset, :quit commands; Ctrl+D (EOF) exits
//   - Colored prompt when attached to a terminal
// =============================================================================

#include "../runner/run.hpp"
#include <iostream>
#include <memory>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace lux
{

    // ANSI color codes
    namespace color
    {
        constexpr const char *RESET = "\033[0m";
        constexpr const char *BOLD = "\033[1m";
        constexpr const char *DIM = "\033[2m";
        constexpr const char *CYAN = "\033[36m";
        constexpr const char *YELLOW = "\033[33m";
    } // namespace color

    class Repl
    {
    public:
        Repl(std::istream &in = std::cin, std::ostream &out = std::cout, std::ostream &err = std::cerr)
            : in_(in), out_(out), err_(err),
              interpreter_(std::make_unique<Interpreter>(out)),
              useColor_(&in == &std::cin && isInteractive()) {}

        void run()
        {
            if (useColor_)
                printBanner();

            std::string accumulated;
            while (true)
            {
                out_ << (accumulated.empty() ? prompt() : contPrompt());
                out_.flush();

                std::string line;
                if (!std::getline(in_, line))
                    break;

                if (line.empty() && accumulated.empty())
                    continue;

                if (accumulated.empty())
                {
                    if (line == ":quit" || line == ":q" || line == "exit")
                        break;
                    if (handleCommand(line))
                        continue;
                }

                if (!accumulated.empty())
                    accumulated += "\n";
                accumulated += line;

                if (openBraces(accumulated) > 0)
                    continue;

                execute(accumulated);
                accumulated.clear();
            }

            if (useColor_)
                out_ << color::DIM << "Goodbye!" << color::RESET << std::endl;
        }

        /// Number of `{` not yet closed, ignoring strings and // comments
        static int openBraces(const std::string &code)
        {
            int depth = 0;
            bool inString = false;
            for (size_t i = 0; i < code.size(); i++)
            {
                char c = code[i];
                if (c == '"')
                {
                    inString = !inString;
                    continue;
                }
                if (inString)
                    continue;
                if (c == '/' && i + 1 < code.size() && code[i + 1] == '/')
                {
                    while (i < code.size() && code[i] != '\n')
                        i++;
                    continue;
                }
                if (c == '{')
                    depth++;
                else if (c == '}')
                    depth--;
            }
            return depth;
        }

    private:
        std::istream &in_;
        std::ostream &out_;
        std::ostream &err_;
        std::unique_ptr<Interpreter> interpreter_;
        bool useColor_;

        static bool isInteractive()
        {
#ifndef _WIN32
            return isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);
#else
            return false;
#endif
        }

        void printBanner()
        {
            out_ << color::CYAN << color::BOLD << "Lux" << color::RESET
                 << color::DIM << " interactive shell v" << LUX_VERSION << color::RESET << "\n";
            out_ << color::DIM << "Type :help for commands, Ctrl+D to exit" << color::RESET << "\n\n";
        }

        std::string prompt() const
        {
            if (!useColor_)
                return "> ";
            return std::string(color::CYAN) + color::BOLD + "lux" + color::RESET + "> ";
        }

        std::string contPrompt() const
        {
            if (!useColor_)
                return ".. ";
            return std::string(color::DIM) + ".. " + color::RESET;
        }

        bool handleCommand(const std::string &line)
        {
            if (line == ":help" || line == ":h")
            {
                out_ << "Commands:\n"
                     << "  :help    Show this help\n"
                     << "  :reset   Forget every variable and function\n"
                     << "  :quit    Leave the shell (also: exit, Ctrl+D)\n";
                return true;
            }
            if (line == ":reset")
            {
                interpreter_ = std::make_unique<Interpreter>(out_);
                if (useColor_)
                    out_ << color::YELLOW << "Environment reset." << color::RESET << "\n";
                else
                    out_ << "Environment reset.\n";
                return true;
            }
            return false;
        }

        void execute(const std::string &code)
        {
            std::optional<Value> value = lux::run(code, *interpreter_, err_);
            if (value)
                out_ << value->repr() << std::endl;
        }
    };

} // namespace lux
