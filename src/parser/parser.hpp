#pragma once

#include "ast.hpp"
#include "../lexer/token.hpp"
#include "../lib/errors/error.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace lux
{

    /// Recursive-descent parser with precedence climbing.
    ///
    /// The parser never throws on a syntax error. It records a Diagnostic and
    /// returns nullptr from the failing production; parse() then discards
    /// tokens up to the next statement boundary and carries on, so every
    /// malformed statement is reported once.
    class Parser
    {
    public:
        explicit Parser(const std::vector<Token> &tokens);

        /// Parse the whole token stream. The returned Program is only
        /// meaningful when hadError() is false.
        Program parse();

        bool hadError() const { return !diagnostics_.empty(); }
        const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

        static constexpr size_t MAX_ARGS = 255;

    private:
        std::vector<Token> tokens_;
        size_t pos_;
        Token eof_;
        int blockDepth_;
        std::vector<Diagnostic> diagnostics_;

        // Token navigation (forward only, no backtracking)
        const Token &peek() const;
        const Token &previous() const;
        bool isAtEnd() const;
        const Token &advance();
        bool check(TokenType type) const;
        bool is(TokenType type);
        bool oneOf(std::initializer_list<TokenType> types);
        const Token *expect(TokenType type, const std::string &what);

        void error(const std::string &message, Span span);
        void errorAt(const Token &token, const std::string &expected);

        // Error recovery: skip past the next ';'
        void synchronize();

        // Statements
        StmtPtr declaration();
        StmtPtr funDeclaration();
        StmtPtr varDeclaration();
        StmtPtr statement();
        StmtPtr forStatement();
        StmtPtr ifStatement();
        StmtPtr whileStatement();
        StmtPtr printStatement();
        StmtPtr returnStatement();
        StmtPtr expressionStatement();
        std::unique_ptr<BlockStmt> block();

        // Expressions (lowest to highest binding power)
        ExprPtr expression();
        ExprPtr assignment();
        ExprPtr logicOr();
        ExprPtr logicAnd();
        ExprPtr equality();
        ExprPtr comparison();
        ExprPtr term();
        ExprPtr factor();
        ExprPtr unary();
        ExprPtr call();
        ExprPtr finishCall(ExprPtr callee);
        ExprPtr primary();
    };

} // namespace lux
