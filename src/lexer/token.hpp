#pragma once

#include "../lib/position/span.hpp"
#include <string>
#include <unordered_map>
#include <utility>

namespace lux
{

    enum class TokenType
    {
        // Single-character tokens
        LPAREN,    // (
        RPAREN,    // )
        LBRACE,    // {
        RBRACE,    // }
        COMMA,     // ,
        DOT,       // .
        MINUS,     // -
        PLUS,      // +
        SEMICOLON, // ;
        SLASH,     // /
        STAR,      // *

        // One or two character tokens
        BANG,          // !
        BANG_EQUAL,    // !=
        EQUAL,         // =
        EQUAL_EQUAL,   // ==
        GREATER,       // >
        GREATER_EQUAL, // >=
        LESS,          // <
        LESS_EQUAL,    // <=

        // Literals
        IDENTIFIER,
        STRING,
        NUMBER,

        // Keywords
        AND,
        CLASS,
        ELSE,
        FALSE_KW,
        FUN,
        FOR,
        IF,
        NIL,
        OR,
        PRINT,
        RETURN,
        SUPER,
        THIS,
        TRUE_KW,
        VAR,
        WHILE,

        // Lexical error sentinels (the scanner never throws)
        UNTERMINATED_STRING,
        UNKNOWN_CHAR,

        // Only ever produced by out-of-range lookups, never by the scanner
        EOF_TOKEN
    };

    inline const std::unordered_map<int, std::string> &tokenTypeNames()
    {
        static const std::unordered_map<int, std::string> map = {
            {(int)TokenType::LPAREN, "("},
            {(int)TokenType::RPAREN, ")"},
            {(int)TokenType::LBRACE, "{"},
            {(int)TokenType::RBRACE, "}"},
            {(int)TokenType::COMMA, ","},
            {(int)TokenType::DOT, "."},
            {(int)TokenType::MINUS, "-"},
            {(int)TokenType::PLUS, "+"},
            {(int)TokenType::SEMICOLON, ";"},
            {(int)TokenType::SLASH, "/"},
            {(int)TokenType::STAR, "*"},
            {(int)TokenType::BANG, "!"},
            {(int)TokenType::BANG_EQUAL, "!="},
            {(int)TokenType::EQUAL, "="},
            {(int)TokenType::EQUAL_EQUAL, "=="},
            {(int)TokenType::GREATER, ">"},
            {(int)TokenType::GREATER_EQUAL, ">="},
            {(int)TokenType::LESS, "<"},
            {(int)TokenType::LESS_EQUAL, "<="},
            {(int)TokenType::IDENTIFIER, "identifier"},
            {(int)TokenType::STRING, "string"},
            {(int)TokenType::NUMBER, "number"},
            {(int)TokenType::AND, "and"},
            {(int)TokenType::CLASS, "class"},
            {(int)TokenType::ELSE, "else"},
            {(int)TokenType::FALSE_KW, "false"},
            {(int)TokenType::FUN, "fun"},
            {(int)TokenType::FOR, "for"},
            {(int)TokenType::IF, "if"},
            {(int)TokenType::NIL, "nil"},
            {(int)TokenType::OR, "or"},
            {(int)TokenType::PRINT, "print"},
            {(int)TokenType::RETURN, "return"},
            {(int)TokenType::SUPER, "super"},
            {(int)TokenType::THIS, "this"},
            {(int)TokenType::TRUE_KW, "true"},
            {(int)TokenType::VAR, "var"},
            {(int)TokenType::WHILE, "while"},
            {(int)TokenType::UNTERMINATED_STRING, "unterminated-string"},
            {(int)TokenType::UNKNOWN_CHAR, "unknown-char"},
            {(int)TokenType::EOF_TOKEN, "EOF"},
        };
        return map;
    }

    inline std::string tokenTypeToString(TokenType type)
    {
        auto &names = tokenTypeNames();
        auto it = names.find((int)type);
        if (it != names.end())
            return it->second;
        return "UNKNOWN";
    }

    // value holds the identifier spelling, the string contents (without
    // quotes), the number's source text, or the offending character for
    // UNKNOWN_CHAR. Punctuation and keywords leave it as the lexeme.
    struct Token
    {
        TokenType type;
        std::string value;
        Span span;

        Token(TokenType type, std::string value, Span span)
            : type(type), value(std::move(value)), span(span) {}
    };

} // namespace lux
