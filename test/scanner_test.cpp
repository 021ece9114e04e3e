// =============================================================================
// Scanner Tests
// =============================================================================
// Verifies tokenization: operators, keywords, literals, comments, byte-offset
// spans over UTF-8 input, and the lexical error tokens. Also covers the
// offset -> line table used when reporting.
// =============================================================================

#include "../src/lexer/scanner.hpp"
#include "../src/lib/position/span.hpp"
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

static std::vector<TokenType> typesOf(const std::string &source)
{
    std::vector<TokenType> out;
    for (auto &t : scan(source))
        out.push_back(t.type);
    return out;
}

// ============================================================================
// Section 1: Punctuation & Operators
// ============================================================================

static void testOperators()
{
    std::cout << "\n===== Punctuation & Operators =====\n";

    runTest("single-character tokens", []()
            {
        auto types = typesOf("(){},.-+;/*");
        std::vector<TokenType> expected = {
            TokenType::LPAREN, TokenType::RPAREN, TokenType::LBRACE, TokenType::RBRACE,
            TokenType::COMMA, TokenType::DOT, TokenType::MINUS, TokenType::PLUS,
            TokenType::SEMICOLON, TokenType::SLASH, TokenType::STAR};
        XASSERT(types == expected); });

    runTest("one or two character operators", []()
            {
        auto types = typesOf("! != = == < <= > >=");
        std::vector<TokenType> expected = {
            TokenType::BANG, TokenType::BANG_EQUAL, TokenType::EQUAL, TokenType::EQUAL_EQUAL,
            TokenType::LESS, TokenType::LESS_EQUAL, TokenType::GREATER, TokenType::GREATER_EQUAL};
        XASSERT(types == expected); });

    runTest("operator spans are byte ranges", []()
            {
        auto tokens = scan("a >= b");
        XASSERT_EQ(tokens.size(), (size_t)3);
        XASSERT_EQ(tokens[1].span.start, (size_t)2);
        XASSERT_EQ(tokens[1].span.end, (size_t)4);
        XASSERT_EQ(tokens[1].value, std::string(">=")); });

    runTest("token type display names", []()
            {
        XASSERT_EQ(tokenTypeToString(TokenType::BANG_EQUAL), std::string("!="));
        XASSERT_EQ(tokenTypeToString(TokenType::IDENTIFIER), std::string("identifier"));
        XASSERT_EQ(tokenTypeToString(TokenType::WHILE), std::string("while"));
        XASSERT_EQ(tokenTypeToString(TokenType::EOF_TOKEN), std::string("EOF")); });

    runTest("empty source yields no tokens", []()
            { XASSERT(scan("").empty()); });

    runTest("no trailing end-of-input token", []()
            {
        auto tokens = scan("print 1;");
        XASSERT_EQ(tokens.size(), (size_t)3);
        XASSERT(tokens.back().type == TokenType::SEMICOLON); });
}

// ============================================================================
// Section 2: Keywords & Identifiers
// ============================================================================

static void testKeywords()
{
    std::cout << "\n===== Keywords & Identifiers =====\n";

    runTest("every keyword is recognized", []()
            {
        auto types = typesOf("and class else false fun for if nil or print return super this true var while");
        std::vector<TokenType> expected = {
            TokenType::AND, TokenType::CLASS, TokenType::ELSE, TokenType::FALSE_KW,
            TokenType::FUN, TokenType::FOR, TokenType::IF, TokenType::NIL,
            TokenType::OR, TokenType::PRINT, TokenType::RETURN, TokenType::SUPER,
            TokenType::THIS, TokenType::TRUE_KW, TokenType::VAR, TokenType::WHILE};
        XASSERT(types == expected); });

    runTest("keyword prefix is an identifier", []()
            {
        auto tokens = scan("orchid fun_1 _x");
        XASSERT_EQ(tokens.size(), (size_t)3);
        for (auto &t : tokens)
            XASSERT(t.type == TokenType::IDENTIFIER);
        XASSERT_EQ(tokens[0].value, std::string("orchid"));
        XASSERT_EQ(tokens[1].value, std::string("fun_1")); });
}

// ============================================================================
// Section 3: Literals
// ============================================================================

static void testLiterals()
{
    std::cout << "\n===== Literals =====\n";

    runTest("integer and decimal numbers", []()
            {
        auto tokens = scan("42 3.25");
        XASSERT_EQ(tokens.size(), (size_t)2);
        XASSERT(tokens[0].type == TokenType::NUMBER);
        XASSERT_EQ(tokens[0].value, std::string("42"));
        XASSERT_EQ(tokens[1].value, std::string("3.25")); });

    runTest("trailing dot is not part of the number", []()
            {
        auto types = typesOf("1.");
        std::vector<TokenType> expected = {TokenType::NUMBER, TokenType::DOT};
        XASSERT(types == expected); });

    runTest("string value excludes quotes, span includes them", []()
            {
        auto tokens = scan("\"hi\"");
        XASSERT_EQ(tokens.size(), (size_t)1);
        XASSERT(tokens[0].type == TokenType::STRING);
        XASSERT_EQ(tokens[0].value, std::string("hi"));
        XASSERT_EQ(tokens[0].span.start, (size_t)0);
        XASSERT_EQ(tokens[0].span.end, (size_t)4); });

    runTest("strings may span lines", []()
            {
        auto tokens = scan("\"a\nb\"");
        XASSERT_EQ(tokens.size(), (size_t)1);
        XASSERT_EQ(tokens[0].value, std::string("a\nb")); });

    runTest("unterminated string runs to end of input", []()
            {
        auto tokens = scan("print \"abc");
        XASSERT_EQ(tokens.size(), (size_t)2);
        XASSERT(tokens[1].type == TokenType::UNTERMINATED_STRING);
        XASSERT_EQ(tokens[1].value, std::string("abc"));
        XASSERT_EQ(tokens[1].span.start, (size_t)6);
        XASSERT_EQ(tokens[1].span.end, (size_t)10); });
}

// ============================================================================
// Section 4: Comments, Whitespace & UTF-8
// ============================================================================

static void testCommentsAndUtf8()
{
    std::cout << "\n===== Comments, Whitespace & UTF-8 =====\n";

    runTest("line comment is skipped", []()
            {
        auto tokens = scan("1 // two\n3");
        XASSERT_EQ(tokens.size(), (size_t)2);
        XASSERT_EQ(tokens[1].value, std::string("3"));
        XASSERT_EQ(tokens[1].span.start, (size_t)9); });

    runTest("comment at end of input", []()
            { XASSERT(scan("// nothing here").empty()); });

    runTest("unknown character keeps its full UTF-8 sequence", []()
            {
        auto tokens = scan("\xc3\xa9");
        XASSERT_EQ(tokens.size(), (size_t)1);
        XASSERT(tokens[0].type == TokenType::UNKNOWN_CHAR);
        XASSERT_EQ(tokens[0].value, std::string("\xc3\xa9"));
        XASSERT_EQ(tokens[0].span.end, (size_t)2); });

    runTest("offsets after multi-byte text are byte offsets", []()
            {
        auto tokens = scan("\"\xe2\x82\xac\" x");
        XASSERT_EQ(tokens.size(), (size_t)2);
        XASSERT_EQ(tokens[0].span.end, (size_t)5);
        XASSERT_EQ(tokens[1].span.start, (size_t)6);
        XASSERT_EQ(tokens[1].span.end, (size_t)7); });

    runTest("unknown ASCII character", []()
            {
        auto tokens = scan("a @ b");
        XASSERT_EQ(tokens.size(), (size_t)3);
        XASSERT(tokens[1].type == TokenType::UNKNOWN_CHAR);
        XASSERT_EQ(tokens[1].value, std::string("@")); });
}

// ============================================================================
// Section 5: Line Offsets
// ============================================================================

static void testLineOffsets()
{
    std::cout << "\n===== Line Offsets =====\n";

    runTest("offsets map to 1-indexed lines", []()
            {
        LineOffsets lines("a\nb\n\nc");
        XASSERT_EQ(lines.line(0), 1);
        XASSERT_EQ(lines.line(1), 1); // the newline belongs to its own line
        XASSERT_EQ(lines.line(2), 2);
        XASSERT_EQ(lines.line(4), 3);
        XASSERT_EQ(lines.line(5), 4);
        XASSERT_EQ(lines.lineCount(), (size_t)4); });

    runTest("offsets past the end clamp to the last line", []()
            {
        LineOffsets lines("x\ny");
        XASSERT_EQ(lines.line(100), 2); });

    runTest("empty source is one line", []()
            {
        LineOffsets lines("");
        XASSERT_EQ(lines.line(0), 1); });
}

int main()
{
    testOperators();
    testKeywords();
    testLiterals();
    testCommentsAndUtf8();
    testLineOffsets();

    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << "\n";
    std::cout << "============================================\n";

    return g_failed == 0 ? 0 : 1;
}
