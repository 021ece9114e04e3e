#include "scanner.hpp"
#include <unordered_map>

namespace lux
{

    // ---- Keyword table (fixed) --------------------------------------------------

    static const std::unordered_map<std::string, TokenType> &keywordMap()
    {
        static const std::unordered_map<std::string, TokenType> map = {
            {"and", TokenType::AND},
            {"class", TokenType::CLASS},
            {"else", TokenType::ELSE},
            {"false", TokenType::FALSE_KW},
            {"fun", TokenType::FUN},
            {"for", TokenType::FOR},
            {"if", TokenType::IF},
            {"nil", TokenType::NIL},
            {"or", TokenType::OR},
            {"print", TokenType::PRINT},
            {"return", TokenType::RETURN},
            {"super", TokenType::SUPER},
            {"this", TokenType::THIS},
            {"true", TokenType::TRUE_KW},
            {"var", TokenType::VAR},
            {"while", TokenType::WHILE},
        };
        return map;
    }

    // ---- Constructor ------------------------------------------------------------

    Scanner::Scanner(const std::string &source)
        : source_(source), pos_(0) {}

    std::vector<Token> scan(const std::string &source)
    {
        Scanner scanner(source);
        return scanner.scan();
    }

    // ---- Character helpers ------------------------------------------------------

    char Scanner::current() const
    {
        if (isAtEnd())
            return '\0';
        return source_[pos_];
    }

    char Scanner::peek(int offset) const
    {
        size_t idx = pos_ + offset;
        if (idx >= source_.size())
            return '\0';
        return source_[idx];
    }

    void Scanner::advance()
    {
        if (!isAtEnd())
            pos_++;
    }

    bool Scanner::isAtEnd() const
    {
        return pos_ >= source_.size();
    }

    bool Scanner::isAlpha(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool Scanner::isDigit(char c)
    {
        return c >= '0' && c <= '9';
    }

    bool Scanner::isAlphaNumeric(char c)
    {
        return isAlpha(c) || isDigit(c);
    }

    // Byte length of the UTF-8 sequence introduced by `lead`.
    // Stray continuation bytes count as one byte each.
    size_t Scanner::utf8Length(unsigned char lead)
    {
        if (lead < 0x80)
            return 1;
        if ((lead & 0xE0) == 0xC0)
            return 2;
        if ((lead & 0xF0) == 0xE0)
            return 3;
        if ((lead & 0xF8) == 0xF0)
            return 4;
        return 1;
    }

    // ---- Comments ---------------------------------------------------------------

    void Scanner::skipLineComment()
    {
        // The newline itself is left for the whitespace branch
        while (!isAtEnd() && current() != '\n')
            advance();
    }

    // ---- Token readers ----------------------------------------------------------

    Token Scanner::readOperator(TokenType one, char second, TokenType two)
    {
        size_t start = pos_;
        advance();
        if (current() == second)
        {
            advance();
            return Token(two, source_.substr(start, 2), Span(start, pos_));
        }
        return Token(one, source_.substr(start, 1), Span(start, pos_));
    }

    Token Scanner::readNumber()
    {
        size_t start = pos_;

        while (!isAtEnd() && isDigit(current()))
            advance();

        // "1." stays NUMBER DOT; only "1.5" is a decimal
        if (current() == '.' && isDigit(peek(1)))
        {
            advance(); // consume '.'
            while (!isAtEnd() && isDigit(current()))
                advance();
        }

        return Token(TokenType::NUMBER, source_.substr(start, pos_ - start), Span(start, pos_));
    }

    Token Scanner::readString()
    {
        size_t start = pos_;
        advance(); // consume opening "

        while (!isAtEnd() && current() != '"')
            advance();

        if (isAtEnd())
        {
            return Token(TokenType::UNTERMINATED_STRING,
                         source_.substr(start + 1), Span(start, pos_));
        }

        advance(); // consume closing "
        return Token(TokenType::STRING,
                     source_.substr(start + 1, pos_ - start - 2), Span(start, pos_));
    }

    Token Scanner::readIdentifierOrKeyword()
    {
        size_t start = pos_;
        while (!isAtEnd() && isAlphaNumeric(current()))
            advance();

        std::string word = source_.substr(start, pos_ - start);
        TokenType type = lookupKeyword(word);
        return Token(type, std::move(word), Span(start, pos_));
    }

    Token Scanner::readUnknownChar()
    {
        size_t start = pos_;
        size_t len = utf8Length(static_cast<unsigned char>(current()));
        if (start + len > source_.size())
            len = source_.size() - start;
        pos_ += len;
        return Token(TokenType::UNKNOWN_CHAR, source_.substr(start, len), Span(start, pos_));
    }

    TokenType Scanner::lookupKeyword(const std::string &word)
    {
        auto &kw = keywordMap();
        auto it = kw.find(word);
        if (it != kw.end())
            return it->second;
        return TokenType::IDENTIFIER;
    }

    // ---- Main scan loop ---------------------------------------------------------

    std::vector<Token> Scanner::scan()
    {
        std::vector<Token> tokens;

        while (!isAtEnd())
        {
            char c = current();
            size_t start = pos_;

            // --- Single-character tokens ---
            TokenType single = TokenType::EOF_TOKEN;
            switch (c)
            {
            case '(':
                single = TokenType::LPAREN;
                break;
            case ')':
                single = TokenType::RPAREN;
                break;
            case '{':
                single = TokenType::LBRACE;
                break;
            case '}':
                single = TokenType::RBRACE;
                break;
            case ',':
                single = TokenType::COMMA;
                break;
            case '.':
                single = TokenType::DOT;
                break;
            case '-':
                single = TokenType::MINUS;
                break;
            case '+':
                single = TokenType::PLUS;
                break;
            case ';':
                single = TokenType::SEMICOLON;
                break;
            case '*':
                single = TokenType::STAR;
                break;
            default:
                break;
            }
            if (single != TokenType::EOF_TOKEN)
            {
                advance();
                tokens.emplace_back(single, std::string(1, c), Span(start, pos_));
                continue;
            }

            // --- One or two character operators ---
            if (c == '!')
            {
                tokens.push_back(readOperator(TokenType::BANG, '=', TokenType::BANG_EQUAL));
                continue;
            }
            if (c == '=')
            {
                tokens.push_back(readOperator(TokenType::EQUAL, '=', TokenType::EQUAL_EQUAL));
                continue;
            }
            if (c == '<')
            {
                tokens.push_back(readOperator(TokenType::LESS, '=', TokenType::LESS_EQUAL));
                continue;
            }
            if (c == '>')
            {
                tokens.push_back(readOperator(TokenType::GREATER, '=', TokenType::GREATER_EQUAL));
                continue;
            }

            // --- Slash or // line comment ---
            if (c == '/')
            {
                if (peek(1) == '/')
                {
                    skipLineComment();
                }
                else
                {
                    advance();
                    tokens.emplace_back(TokenType::SLASH, "/", Span(start, pos_));
                }
                continue;
            }

            // --- Whitespace ---
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            {
                advance();
                continue;
            }

            // --- String literal ---
            if (c == '"')
            {
                tokens.push_back(readString());
                continue;
            }

            // --- Number literal ---
            if (isDigit(c))
            {
                tokens.push_back(readNumber());
                continue;
            }

            // --- Identifier or keyword ---
            if (isAlpha(c))
            {
                tokens.push_back(readIdentifierOrKeyword());
                continue;
            }

            // Unknown character: one whole UTF-8 sequence
            tokens.push_back(readUnknownChar());
        }

        return tokens;
    }

} // namespace lux
