#include "parser.hpp"
#include <cstdlib>

namespace lux
{

    // ============================================================
    // Constructor
    // ============================================================

    Parser::Parser(const std::vector<Token> &tokens)
        : tokens_(tokens), pos_(0),
          eof_(TokenType::EOF_TOKEN, "",
               tokens.empty() ? Span() : Span(tokens.back().span.end, tokens.back().span.end)),
          blockDepth_(0) {}

    // ============================================================
    // Token navigation
    // ============================================================

    const Token &Parser::peek() const
    {
        if (pos_ >= tokens_.size())
            return eof_;
        return tokens_[pos_];
    }

    const Token &Parser::previous() const
    {
        if (pos_ == 0)
            return eof_;
        return tokens_[pos_ - 1];
    }

    bool Parser::isAtEnd() const
    {
        return pos_ >= tokens_.size();
    }

    const Token &Parser::advance()
    {
        if (!isAtEnd())
            pos_++;
        return previous();
    }

    bool Parser::check(TokenType type) const
    {
        return peek().type == type;
    }

    bool Parser::is(TokenType type)
    {
        if (!check(type))
            return false;
        advance();
        return true;
    }

    bool Parser::oneOf(std::initializer_list<TokenType> types)
    {
        for (TokenType type : types)
        {
            if (check(type))
            {
                advance();
                return true;
            }
        }
        return false;
    }

    const Token *Parser::expect(TokenType type, const std::string &what)
    {
        if (check(type))
            return &advance();
        errorAt(peek(), what);
        return nullptr;
    }

    // ============================================================
    // Diagnostics
    // ============================================================

    void Parser::error(const std::string &message, Span span)
    {
        diagnostics_.emplace_back(message, span);
    }

    void Parser::errorAt(const Token &token, const std::string &expected)
    {
        // Lexical sentinels explain themselves better than "expected X"
        if (token.type == TokenType::UNTERMINATED_STRING)
        {
            error("Unterminated string.", token.span);
            return;
        }
        if (token.type == TokenType::UNKNOWN_CHAR)
        {
            error("Unexpected character '" + token.value + "'.", token.span);
            return;
        }

        std::string found;
        if (token.type == TokenType::EOF_TOKEN)
            found = "end of input";
        else if (token.type == TokenType::STRING)
            found = "'\"" + token.value + "\"'";
        else
            found = "'" + token.value + "'";

        error("Expected " + expected + " but found " + found, token.span);
    }

    // ============================================================
    // Error recovery: discard up to and including the next ';'.
    // Inside a block we also stop in front of '}' so the block can close.
    // ============================================================

    void Parser::synchronize()
    {
        while (!isAtEnd())
        {
            if (blockDepth_ > 0 && check(TokenType::RBRACE))
                return;
            if (advance().type == TokenType::SEMICOLON)
                return;
        }
    }

    // ============================================================
    // Top-level parse
    // ============================================================

    Program Parser::parse()
    {
        Program program;
        while (!isAtEnd())
        {
            StmtPtr stmt = declaration();
            if (stmt)
                program.statements.push_back(std::move(stmt));
            else
                synchronize();
        }
        return program;
    }

    // ============================================================
    // Declarations
    // ============================================================

    StmtPtr Parser::declaration()
    {
        if (is(TokenType::FUN))
            return funDeclaration();
        if (is(TokenType::VAR))
            return varDeclaration();
        return statement();
    }

    StmtPtr Parser::funDeclaration()
    {
        Span keyword = previous().span;

        const Token *name = expect(TokenType::IDENTIFIER, "function name");
        if (!name)
            return nullptr;
        if (!expect(TokenType::LPAREN, "'(' after function name"))
            return nullptr;

        std::vector<std::string> params;
        if (!check(TokenType::RPAREN))
        {
            do
            {
                if (params.size() >= MAX_ARGS)
                    error("Can't have more than 255 parameters.", peek().span);
                const Token *param = expect(TokenType::IDENTIFIER, "parameter name");
                if (!param)
                    return nullptr;
                params.push_back(param->value);
            } while (is(TokenType::COMMA));
        }
        if (!expect(TokenType::RPAREN, "')' after parameters"))
            return nullptr;

        if (!check(TokenType::LBRACE))
        {
            errorAt(peek(), "'{' before function body");
            return nullptr;
        }
        auto body = block();
        if (!body)
            return nullptr;

        return std::make_unique<FnDef>(name->value, std::move(params), std::move(body),
                                       Span::merge(keyword, name->span));
    }

    StmtPtr Parser::varDeclaration()
    {
        Span keyword = previous().span;

        const Token *name = expect(TokenType::IDENTIFIER, "variable name");
        if (!name)
            return nullptr;

        ExprPtr init;
        if (is(TokenType::EQUAL))
        {
            init = expression();
            if (!init)
                return nullptr;
        }
        else
        {
            init = std::make_unique<NilLiteral>(name->span);
        }

        if (!expect(TokenType::SEMICOLON, "';' after variable declaration"))
            return nullptr;
        return std::make_unique<VarStmt>(name->value, std::move(init),
                                         Span::merge(keyword, name->span));
    }

    // ============================================================
    // Statements
    // ============================================================

    StmtPtr Parser::statement()
    {
        switch (peek().type)
        {
        case TokenType::FOR:
            return forStatement();
        case TokenType::IF:
            return ifStatement();
        case TokenType::PRINT:
            return printStatement();
        case TokenType::RETURN:
            return returnStatement();
        case TokenType::WHILE:
            return whileStatement();
        case TokenType::LBRACE:
            return block();
        default:
            return expressionStatement();
        }
    }

    // for (init; cond; incr) body  is rewritten here into
    //   { init; while (cond) { body; incr; } }
    // so there is no For node downstream.
    StmtPtr Parser::forStatement()
    {
        Span keyword = advance().span; // consume FOR
        if (!expect(TokenType::LPAREN, "'(' after 'for'"))
            return nullptr;

        StmtPtr initializer;
        if (is(TokenType::SEMICOLON))
        {
            // no initializer
        }
        else if (is(TokenType::VAR))
        {
            initializer = varDeclaration();
            if (!initializer)
                return nullptr;
        }
        else
        {
            initializer = expressionStatement();
            if (!initializer)
                return nullptr;
        }

        ExprPtr condition;
        if (!check(TokenType::SEMICOLON))
        {
            condition = expression();
            if (!condition)
                return nullptr;
        }
        else
        {
            condition = std::make_unique<BoolLiteral>(true, peek().span);
        }
        if (!expect(TokenType::SEMICOLON, "';' after loop condition"))
            return nullptr;

        ExprPtr increment;
        if (!check(TokenType::RPAREN))
        {
            increment = expression();
            if (!increment)
                return nullptr;
        }
        if (!expect(TokenType::RPAREN, "')' after for clauses"))
            return nullptr;

        StmtPtr body = statement();
        if (!body)
            return nullptr;

        if (increment)
        {
            Span incSpan = increment->span;
            std::vector<StmtPtr> stmts;
            stmts.push_back(std::move(body));
            stmts.push_back(std::make_unique<ExprStmt>(std::move(increment), incSpan));
            body = std::make_unique<BlockStmt>(std::move(stmts), keyword);
        }

        StmtPtr loop = std::make_unique<WhileStmt>(std::move(condition), std::move(body), keyword);

        if (initializer)
        {
            std::vector<StmtPtr> stmts;
            stmts.push_back(std::move(initializer));
            stmts.push_back(std::move(loop));
            loop = std::make_unique<BlockStmt>(std::move(stmts), keyword);
        }

        return loop;
    }

    StmtPtr Parser::ifStatement()
    {
        Span keyword = advance().span; // consume IF
        if (!expect(TokenType::LPAREN, "'(' after 'if'"))
            return nullptr;
        ExprPtr condition = expression();
        if (!condition)
            return nullptr;
        if (!expect(TokenType::RPAREN, "')' after if condition"))
            return nullptr;

        StmtPtr thenBranch = statement();
        if (!thenBranch)
            return nullptr;

        StmtPtr elseBranch;
        if (is(TokenType::ELSE))
        {
            elseBranch = statement();
            if (!elseBranch)
                return nullptr;
        }

        return std::make_unique<IfStmt>(std::move(condition), std::move(thenBranch),
                                        std::move(elseBranch), keyword);
    }

    StmtPtr Parser::whileStatement()
    {
        Span keyword = advance().span; // consume WHILE
        if (!expect(TokenType::LPAREN, "'(' after 'while'"))
            return nullptr;
        ExprPtr condition = expression();
        if (!condition)
            return nullptr;
        if (!expect(TokenType::RPAREN, "')' after while condition"))
            return nullptr;

        StmtPtr body = statement();
        if (!body)
            return nullptr;
        return std::make_unique<WhileStmt>(std::move(condition), std::move(body), keyword);
    }

    StmtPtr Parser::printStatement()
    {
        Span keyword = advance().span; // consume PRINT
        ExprPtr value = expression();
        if (!value)
            return nullptr;
        if (!expect(TokenType::SEMICOLON, "';' after value"))
            return nullptr;
        return std::make_unique<PrintStmt>(std::move(value), keyword);
    }

    StmtPtr Parser::returnStatement()
    {
        Span keyword = advance().span; // consume RETURN

        ExprPtr value;
        if (check(TokenType::SEMICOLON))
        {
            value = std::make_unique<NilLiteral>(keyword);
        }
        else
        {
            value = expression();
            if (!value)
                return nullptr;
        }

        if (!expect(TokenType::SEMICOLON, "';' after return value"))
            return nullptr;
        return std::make_unique<ReturnStmt>(std::move(value), keyword);
    }

    StmtPtr Parser::expressionStatement()
    {
        ExprPtr expr = expression();
        if (!expr)
            return nullptr;
        Span span = expr->span;
        if (!expect(TokenType::SEMICOLON, "';' after expression"))
            return nullptr;
        return std::make_unique<ExprStmt>(std::move(expr), span);
    }

    // ============================================================
    // Block: '{' declaration* '}'
    // A bad statement inside the block is recovered from locally so the
    // closing brace still matches.
    // ============================================================

    std::unique_ptr<BlockStmt> Parser::block()
    {
        Span open = advance().span; // consume '{'
        blockDepth_++;

        std::vector<StmtPtr> stmts;
        while (!check(TokenType::RBRACE) && !isAtEnd())
        {
            StmtPtr stmt = declaration();
            if (stmt)
                stmts.push_back(std::move(stmt));
            else
                synchronize();
        }

        blockDepth_--;
        const Token *close = expect(TokenType::RBRACE, "'}' after block");
        if (!close)
            return nullptr;
        return std::make_unique<BlockStmt>(std::move(stmts), Span::merge(open, close->span));
    }

    // ============================================================
    // Expression parsing: precedence climbing
    // ============================================================

    ExprPtr Parser::expression()
    {
        return assignment();
    }

    // Right-associative: a = b = c parses as a = (b = c)
    ExprPtr Parser::assignment()
    {
        ExprPtr expr = logicOr();
        if (!expr)
            return nullptr;

        if (check(TokenType::EQUAL))
        {
            Span equals = advance().span;
            ExprPtr value = assignment();
            if (!value)
                return nullptr;

            if (auto *target = dynamic_cast<Variable *>(expr.get()))
                return std::make_unique<Assign>(target->name, std::move(value), target->span);

            // Reported, but the statement itself still parses
            error("Invalid assignment target.", equals);
        }
        return expr;
    }

    ExprPtr Parser::logicOr()
    {
        ExprPtr left = logicAnd();
        if (!left)
            return nullptr;
        while (is(TokenType::OR))
        {
            Span op = previous().span;
            ExprPtr right = logicAnd();
            if (!right)
                return nullptr;
            left = std::make_unique<LogicalExpr>(std::move(left), "or", std::move(right), op);
        }
        return left;
    }

    ExprPtr Parser::logicAnd()
    {
        ExprPtr left = equality();
        if (!left)
            return nullptr;
        while (is(TokenType::AND))
        {
            Span op = previous().span;
            ExprPtr right = equality();
            if (!right)
                return nullptr;
            left = std::make_unique<LogicalExpr>(std::move(left), "and", std::move(right), op);
        }
        return left;
    }

    ExprPtr Parser::equality()
    {
        ExprPtr left = comparison();
        if (!left)
            return nullptr;
        while (oneOf({TokenType::BANG_EQUAL, TokenType::EQUAL_EQUAL}))
        {
            const Token &op = previous();
            ExprPtr right = comparison();
            if (!right)
                return nullptr;
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.span);
        }
        return left;
    }

    ExprPtr Parser::comparison()
    {
        ExprPtr left = term();
        if (!left)
            return nullptr;
        while (oneOf({TokenType::GREATER, TokenType::GREATER_EQUAL,
                      TokenType::LESS, TokenType::LESS_EQUAL}))
        {
            const Token &op = previous();
            ExprPtr right = term();
            if (!right)
                return nullptr;
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.span);
        }
        return left;
    }

    ExprPtr Parser::term()
    {
        ExprPtr left = factor();
        if (!left)
            return nullptr;
        while (oneOf({TokenType::MINUS, TokenType::PLUS}))
        {
            const Token &op = previous();
            ExprPtr right = factor();
            if (!right)
                return nullptr;
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.span);
        }
        return left;
    }

    ExprPtr Parser::factor()
    {
        ExprPtr left = unary();
        if (!left)
            return nullptr;
        while (oneOf({TokenType::SLASH, TokenType::STAR}))
        {
            const Token &op = previous();
            ExprPtr right = unary();
            if (!right)
                return nullptr;
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.span);
        }
        return left;
    }

    ExprPtr Parser::unary()
    {
        if (oneOf({TokenType::BANG, TokenType::MINUS}))
        {
            const Token &op = previous();
            ExprPtr operand = unary();
            if (!operand)
                return nullptr;
            return std::make_unique<UnaryExpr>(op.value, std::move(operand), op.span);
        }
        return call();
    }

    ExprPtr Parser::call()
    {
        ExprPtr expr = primary();
        if (!expr)
            return nullptr;
        while (check(TokenType::LPAREN))
        {
            expr = finishCall(std::move(expr));
            if (!expr)
                return nullptr;
        }
        return expr;
    }

    ExprPtr Parser::finishCall(ExprPtr callee)
    {
        advance(); // consume '('

        std::vector<ExprPtr> args;
        if (!check(TokenType::RPAREN))
        {
            do
            {
                if (args.size() >= MAX_ARGS)
                    error("Can't have more than 255 arguments.", peek().span);
                ExprPtr arg = expression();
                if (!arg)
                    return nullptr;
                args.push_back(std::move(arg));
            } while (is(TokenType::COMMA));
        }

        const Token *close = expect(TokenType::RPAREN, "')' after arguments");
        if (!close)
            return nullptr;

        Span span = Span::merge(callee->span, close->span);
        return std::make_unique<CallExpr>(std::move(callee), std::move(args), span);
    }

    // ============================================================
    // Primary expressions
    // ============================================================

    ExprPtr Parser::primary()
    {
        const Token &tok = peek();

        switch (tok.type)
        {
        case TokenType::FALSE_KW:
            advance();
            return std::make_unique<BoolLiteral>(false, tok.span);
        case TokenType::TRUE_KW:
            advance();
            return std::make_unique<BoolLiteral>(true, tok.span);
        case TokenType::NIL:
            advance();
            return std::make_unique<NilLiteral>(tok.span);
        case TokenType::NUMBER:
        {
            advance();
            // strtod rather than stod: an out-of-range literal becomes inf, not an exception
            double val = std::strtod(tok.value.c_str(), nullptr);
            return std::make_unique<NumberLiteral>(val, tok.span);
        }
        case TokenType::STRING:
            advance();
            return std::make_unique<StringLiteral>(tok.value, tok.span);
        case TokenType::IDENTIFIER:
            advance();
            return std::make_unique<Variable>(tok.value, tok.span);
        case TokenType::LPAREN:
        {
            Span open = advance().span;
            ExprPtr inner = expression();
            if (!inner)
                return nullptr;
            const Token *close = expect(TokenType::RPAREN, "')' after expression");
            if (!close)
                return nullptr;
            return std::make_unique<Grouping>(std::move(inner), Span::merge(open, close->span));
        }
        case TokenType::CLASS:
        case TokenType::THIS:
        case TokenType::SUPER:
            error("'" + tok.value + "' is reserved; Lux has no classes.", tok.span);
            return nullptr;
        default:
            errorAt(tok, "expression");
            return nullptr;
        }
    }

} // namespace lux
