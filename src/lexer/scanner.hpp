#pragma once

#include "token.hpp"
#include <string>
#include <vector>

namespace lux
{

    /// Turns source text into span-tagged tokens in a single left-to-right pass.
    /// Lexical problems become UNTERMINATED_STRING / UNKNOWN_CHAR tokens; the
    /// scanner itself never fails. No EOF token is appended.
    class Scanner
    {
    public:
        explicit Scanner(const std::string &source);
        std::vector<Token> scan();

    private:
        std::string source_;
        size_t pos_;

        char current() const;
        char peek(int offset = 1) const;
        void advance();
        bool isAtEnd() const;

        void skipLineComment();

        Token readNumber();
        Token readString();
        Token readIdentifierOrKeyword();
        Token readUnknownChar();

        // Emit a one- or two-character operator: `two` if the next char is `second`
        Token readOperator(TokenType one, char second, TokenType two);

        static TokenType lookupKeyword(const std::string &word);
        static size_t utf8Length(unsigned char lead);
        static bool isAlpha(char c);
        static bool isDigit(char c);
        static bool isAlphaNumeric(char c);
    };

    /// Convenience wrapper: scan a whole source string.
    std::vector<Token> scan(const std::string &source);

} // namespace lux
