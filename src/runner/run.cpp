#include "run.hpp"
#include "../lexer/scanner.hpp"
#include "../parser/parser.hpp"
#include "../resolver/resolver.hpp"
#include <sstream>

namespace lux
{

    namespace
    {

        void report(RunOutcome &outcome, std::ostream &err, const std::string &line)
        {
            outcome.reports.push_back(line);
            err << line << std::endl;
        }

        void reportDiagnostics(RunOutcome &outcome, std::ostream &err, const LineOffsets &lines,
                               const std::string &category, const std::vector<Diagnostic> &diags)
        {
            for (const auto &d : diags)
                report(outcome, err, formatReport(category, d.message, lines.line(d.span.start)));
        }

        // Front half of the pipeline. Returns false (and fills `outcome`) on diagnostics.
        bool compile(const std::string &source, Interpreter &interp, std::ostream &err,
                     const LineOffsets &lines, RunOutcome &outcome, Program &program)
        {
            Parser parser(scan(source));
            program = parser.parse();
            if (parser.hadError())
            {
                reportDiagnostics(outcome, err, lines, "SyntaxError", parser.diagnostics());
                outcome.status = RunStatus::COMPILE_ERROR;
                return false;
            }

            Resolver resolver(interp);
            std::vector<Diagnostic> diags = resolver.resolve(program);
            if (!diags.empty())
            {
                reportDiagnostics(outcome, err, lines, "ResolveError", diags);
                outcome.status = RunStatus::COMPILE_ERROR;
                return false;
            }
            return true;
        }

    } // namespace

    RunOutcome runDetailed(const std::string &source, Interpreter &interp, std::ostream &err)
    {
        RunOutcome outcome;
        LineOffsets lines(source);

        Program program;
        if (!compile(source, interp, err, lines, outcome, program))
            return outcome;

        try
        {
            outcome.value = interp.run(std::move(program));
        }
        catch (const LuxError &e)
        {
            report(outcome, err, formatReport(e.category(), e.detail(), lines.line(e.span().start)));
            outcome.status = RunStatus::RUNTIME_ERROR;
            outcome.value.reset();
        }
        return outcome;
    }

    std::optional<Value> run(const std::string &source, Interpreter &interp, std::ostream &err)
    {
        return runDetailed(source, interp, err).value;
    }

    std::vector<std::string> check(const std::string &source)
    {
        // A scratch interpreter receives the resolution table and is discarded
        std::ostringstream sink;
        Interpreter scratch(sink);
        RunOutcome outcome;
        Program program;
        compile(source, scratch, sink, LineOffsets(source), outcome, program);
        return outcome.reports;
    }

} // namespace lux
