// =============================================================================
// Resolver Tests
// =============================================================================
// Verifies static scope resolution: the frame distance recorded for each
// local reference, globals left unresolved, the self-initializer and
// top-level-return diagnostics, and that nothing is committed to the
// interpreter when resolution fails.
// =============================================================================

#include "../src/interpreter/interpreter.hpp"
#include "../src/lexer/scanner.hpp"
#include "../src/parser/parser.hpp"
#include "../src/resolver/resolver.hpp"
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace lux;

// ---- Minimal test framework ------------------------------------------------

static int g_passed = 0;
static int g_failed = 0;

static void runTest(const std::string &name, std::function<void()> fn)
{
    try
    {
        fn();
        std::cout << "  PASS: " << name << "\n";
        g_passed++;
    }
    catch (const std::exception &e)
    {
        std::cout << "  FAIL: " << name << "\n        " << e.what() << "\n";
        g_failed++;
    }
}

#define XASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define XASSERT_EQ(a, b)                                 \
    do                                                   \
    {                                                    \
        if ((a) != (b))                                  \
        {                                                \
            std::ostringstream os;                       \
            os << "Expected [" << (a) << "] == [" << (b) \
               << "] (line " << __LINE__ << ")";         \
            throw std::runtime_error(os.str());          \
        }                                                \
    } while (0)

// Helper: parse source, failing the test on any syntax diagnostic
static Program parseOk(const std::string &source)
{
    Parser parser(scan(source));
    Program program = parser.parse();
    if (parser.hadError())
        throw std::runtime_error("unexpected syntax error: " + parser.diagnostics()[0].message);
    return program;
}

static std::vector<Diagnostic> resolveSource(const std::string &source, Interpreter &interp)
{
    Program program = parseOk(source);
    Resolver resolver(interp);
    return resolver.resolve(program);
}

// The expression of the n-th statement, which must be a print
static const Expr *printed(const std::vector<StmtPtr> &stmts, size_t n)
{
    auto *p = dynamic_cast<const PrintStmt *>(stmts.at(n).get());
    if (!p)
        throw std::runtime_error("statement is not a print");
    return p->expr.get();
}

static const BlockStmt *blockAt(const std::vector<StmtPtr> &stmts, size_t n)
{
    auto *b = dynamic_cast<const BlockStmt *>(stmts.at(n).get());
    if (!b)
        throw std::runtime_error("statement is not a block");
    return b;
}

// ============================================================================
// Section 1: Depths
// ============================================================================

static void testDepths()
{
    std::cout << "\n===== Resolved Depths =====\n";

    runTest("globals are not recorded", []()
            {
        Interpreter interp;
        auto diags = resolveSource("var g = 1; print g; g = 2;", interp);
        XASSERT(diags.empty());
        XASSERT_EQ(interp.resolvedCount(), (size_t)0); });

    runTest("local in same block is depth 0", []()
            {
        Interpreter interp;
        Program program = parseOk("{ var a = 1; print a; }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        const Expr *use = printed(blockAt(program.statements, 0)->statements, 1);
        XASSERT(interp.resolvedDepth(use) == 0); });

    runTest("local one block out is depth 1", []()
            {
        Interpreter interp;
        Program program = parseOk("{ var a = 1; { print a; } }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        const BlockStmt *inner = blockAt(blockAt(program.statements, 0)->statements, 1);
        XASSERT(interp.resolvedDepth(printed(inner->statements, 0)) == 1); });

    runTest("parameters and body locals share one frame", []()
            {
        Interpreter interp;
        Program program = parseOk("fun f(x) { var y = x; print y; }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        auto *fn = dynamic_cast<const FnDef *>(program.statements[0].get());
        XASSERT(fn != nullptr);
        auto *var = dynamic_cast<const VarStmt *>(fn->body->statements[0].get());
        XASSERT(interp.resolvedDepth(var->init.get()) == 0);
        XASSERT(interp.resolvedDepth(printed(fn->body->statements, 1)) == 0); });

    runTest("captured variable is one frame out", []()
            {
        Interpreter interp;
        Program program = parseOk("fun outer() { var n = 0; fun inner() { print n; } }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        auto *outer = dynamic_cast<const FnDef *>(program.statements[0].get());
        auto *inner = dynamic_cast<const FnDef *>(outer->body->statements[1].get());
        XASSERT(inner != nullptr);
        XASSERT(interp.resolvedDepth(printed(inner->body->statements, 0)) == 1); });

    runTest("assignment targets are resolved", []()
            {
        Interpreter interp;
        Program program = parseOk("{ var a = 1; { a = 2; } }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        const BlockStmt *inner = blockAt(blockAt(program.statements, 0)->statements, 1);
        auto *stmt = dynamic_cast<const ExprStmt *>(inner->statements[0].get());
        XASSERT(interp.resolvedDepth(stmt->expr.get()) == 1); });

    runTest("same name at different depths is tracked per reference", []()
            {
        Interpreter interp;
        Program program = parseOk("{ var x = 1; { print x; } } { var x = 2; print x; }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        const BlockStmt *first = blockAt(blockAt(program.statements, 0)->statements, 1);
        const BlockStmt *second = blockAt(program.statements, 1);
        XASSERT(interp.resolvedDepth(printed(first->statements, 0)) == 1);
        XASSERT(interp.resolvedDepth(printed(second->statements, 1)) == 0);
        XASSERT_EQ(interp.resolvedCount(), (size_t)2); });

    runTest("shadowing resolves to the innermost binding", []()
            {
        Interpreter interp;
        Program program = parseOk("{ var a = 1; { var a = 2; print a; } }");
        Resolver resolver(interp);
        XASSERT(resolver.resolve(program).empty());
        const BlockStmt *inner = blockAt(blockAt(program.statements, 0)->statements, 1);
        XASSERT(interp.resolvedDepth(printed(inner->statements, 1)) == 0); });
}

// ============================================================================
// Section 2: Diagnostics
// ============================================================================

static void testDiagnostics()
{
    std::cout << "\n===== Resolver Diagnostics =====\n";

    runTest("local read in its own initializer", []()
            {
        Interpreter interp;
        auto diags = resolveSource("{ var a = a; }", interp);
        XASSERT_EQ(diags.size(), (size_t)1);
        XASSERT_EQ(diags[0].message, std::string("Can't read local variable 'a' in its own initializer.")); });

    runTest("global self-initializer is allowed", []()
            {
        Interpreter interp;
        XASSERT(resolveSource("var a = a;", interp).empty()); });

    runTest("shadowing initializer may read the outer variable", []()
            {
        Interpreter interp;
        auto diags = resolveSource("{ var a = 1; { var b = a; } }", interp);
        XASSERT(diags.empty()); });

    runTest("resolution continues after a diagnostic", []()
            {
        Interpreter interp;
        auto diags = resolveSource("{ var a = a; var b = b; }", interp);
        XASSERT_EQ(diags.size(), (size_t)2); });

    runTest("return at top level", []()
            {
        Interpreter interp;
        auto diags = resolveSource("return 1;", interp);
        XASSERT_EQ(diags.size(), (size_t)1);
        XASSERT_EQ(diags[0].message, std::string("Can't return from top-level code.")); });

    runTest("return inside a function is fine", []()
            {
        Interpreter interp;
        XASSERT(resolveSource("fun f() { if (true) { return 1; } return 2; }", interp).empty()); });

    runTest("failed resolution commits nothing", []()
            {
        Interpreter interp;
        auto diags = resolveSource("{ var a = 1; print a; var b = b; }", interp);
        XASSERT_EQ(diags.size(), (size_t)1);
        XASSERT_EQ(interp.resolvedCount(), (size_t)0); });

    runTest("diagnostic span points at the reference", []()
            {
        Interpreter interp;
        auto diags = resolveSource("{ var a = a; }", interp);
        XASSERT_EQ(diags.size(), (size_t)1);
        XASSERT_EQ(diags[0].span.start, (size_t)10);
        XASSERT_EQ(diags[0].span.end, (size_t)11); });
}

int main()
{
    testDepths();
    testDiagnostics();

    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << "\n";
    std::cout << "============================================\n";

    return g_failed == 0 ? 0 : 1;
}
