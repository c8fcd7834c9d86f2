#include "TendaParser.hpp"
#include "TendaCaptureAnalysis.hpp"

#include <cmath>

namespace tenda {

// ============================================================
// Конструктор
// ============================================================

Parser::Parser(const std::vector<Token> &tokens)
    : tokens_(tokens)
{
    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_INPUT) {
        Token eof;
        eof.type = TokenType::END_OF_INPUT;
        eof.value = "";
        eof.line = tokens_.empty() ? 1 : tokens_.back().line;
        eof.col = 0;
        tokens_.push_back(eof);
    }
}

// ============================================================
// Навигация по токенам
// ============================================================

SourceSpan Parser::loc() const
{
    return {current().line, current().col};
}

const Token &Parser::current() const
{
    if (pos_ >= tokens_.size())
        return tokens_.back();
    return tokens_[pos_];
}

const Token &Parser::peekToken(int off) const
{
    size_t p = pos_ + static_cast<size_t>(off);
    if (p >= tokens_.size())
        return tokens_.back();
    return tokens_[p];
}

bool Parser::isAtEnd() const
{
    return current().type == TokenType::END_OF_INPUT;
}

bool Parser::check(TokenType t) const
{
    return current().type == t;
}

bool Parser::match(TokenType t)
{
    if (check(t)) {
        pos_++;
        return true;
    }
    return false;
}

Token Parser::consume(TokenType t, const std::string &what)
{
    if (check(t))
        return tokens_[pos_++];
    std::string found = isAtEnd() ? "fim do arquivo"
                        : check(TokenType::NEWLINE) ? "quebra de linha"
                                                    : "'" + current().value + "'";
    error("esperado " + what + ", encontrado " + found);
}

void Parser::skipNewlines()
{
    while (check(TokenType::NEWLINE))
        pos_++;
}

bool Parser::isTerminator(std::initializer_list<TokenType> terminators) const
{
    auto cur = current().type;
    for (auto t : terminators) {
        if (cur == t)
            return true;
    }
    return false;
}

void Parser::error(const std::string &msg) const
{
    throw SyntaxError(msg, current().line, current().col);
}

void Parser::error(const std::string &msg, SourceSpan at) const
{
    throw SyntaxError(msg, at.line, at.col);
}

double Parser::parseDouble(const std::string &text, SourceSpan at)
{
    try {
        return std::stod(text);
    } catch (const std::exception &) {
        throw SyntaxError("número inválido '" + text + "'", at.line, at.col);
    }
}

ASTNodePtr Parser::makeBinary(NodeType type, Operator op, ASTNodePtr lhs, ASTNodePtr rhs)
{
    auto node = makeNode(type, lhs->span);
    node->op = op;
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return node;
}

// ============================================================
// Точка входа
// ============================================================

ASTNodePtr Parser::parse()
{
    auto program = makeNode(NodeType::PROGRAM, loc());
    skipNewlines();
    while (!isAtEnd()) {
        program->children.push_back(parseStatement());
        skipNewlines();
    }
    CaptureAnalyzer::annotate(*program);
    return program;
}

// ============================================================
// Statements
// ============================================================

ASTNodePtr Parser::parseStatement()
{
    switch (current().type) {
    case TokenType::KW_LET:
        return parseLet();
    case TokenType::KW_FUNCTION:
        if (peekToken(1).type == TokenType::IDENTIFIER)
            return parseFunctionDecl();
        return parseExpressionStatement();
    case TokenType::KW_IF:
        return parseIf();
    case TokenType::KW_WHILE:
        return parseWhile();
    case TokenType::KW_FOR:
        return parseForEach();
    case TokenType::KW_RETURN:
        return parseReturn();
    case TokenType::KW_TRY:
        return parseTry();
    case TokenType::KW_IMPORT:
        return parseImport();
    case TokenType::KW_EXPORT:
        return parseExport();
    case TokenType::KW_BREAK:
    case TokenType::KW_CONTINUE: {
        auto at = loc();
        bool isBreak = check(TokenType::KW_BREAK);
        if (loopDepth_ == 0)
            error(std::string("'") + (isBreak ? "pare" : "continue") + "' fora de um laço");
        pos_++;
        return makeNode(isBreak ? NodeType::BREAK_STMT : NodeType::CONTINUE_STMT, at);
    }
    case TokenType::KW_RAISE: {
        auto node = makeNode(NodeType::RAISE_STMT, loc());
        pos_++;
        node->children.push_back(parseExpression());
        return node;
    }
    case TokenType::KW_DO: {
        pos_++;
        auto block = parseBlock({TokenType::KW_END});
        consume(TokenType::KW_END, "'fim'");
        return block;
    }
    default:
        return parseExpressionStatement();
    }
}

ASTNodePtr Parser::parseExpressionStatement()
{
    auto node = makeNode(NodeType::EXPR_STMT, loc());
    node->children.push_back(parseExpression());
    return node;
}

ASTNodePtr Parser::parseLet()
{
    auto at = loc();
    consume(TokenType::KW_LET, "'seja'");
    auto name = consume(TokenType::IDENTIFIER, "nome da variável");

    // seja f(a, b) = ...
    if (check(TokenType::LPAREN)) {
        auto node = makeNode(NodeType::FUNCTION_DECL, at);
        node->strValue = name.value;
        node->params = parseParams();
        consume(TokenType::ASSIGN, "'='");
        node->children.push_back(parseFunctionBody(true));
        return node;
    }

    auto node = makeNode(NodeType::LET_DECL, at);
    node->strValue = name.value;
    consume(TokenType::ASSIGN, "'='");
    node->children.push_back(parseExpression());
    return node;
}

ASTNodePtr Parser::parseFunctionDecl()
{
    auto node = makeNode(NodeType::FUNCTION_DECL, loc());
    consume(TokenType::KW_FUNCTION, "'função'");
    node->strValue = consume(TokenType::IDENTIFIER, "nome da função").value;
    node->params = parseParams();
    node->children.push_back(parseFunctionBody(false));
    return node;
}

ASTNodePtr Parser::parseIf()
{
    auto node = makeNode(NodeType::IF_STMT, loc());
    consume(TokenType::KW_IF, "'se'");

    auto cond = parseExpression();
    consume(TokenType::KW_THEN, "'então'");
    auto body = parseBlock({TokenType::KW_ELSE, TokenType::KW_END});
    node->branches.push_back({std::move(cond), std::move(body)});

    while (match(TokenType::KW_ELSE)) {
        // "senão se" na mesma linha continua a mesma cadeia
        if (match(TokenType::KW_IF)) {
            auto elifCond = parseExpression();
            consume(TokenType::KW_THEN, "'então'");
            auto elifBody = parseBlock({TokenType::KW_ELSE, TokenType::KW_END});
            node->branches.push_back({std::move(elifCond), std::move(elifBody)});
            continue;
        }
        node->elseBranch = parseBlock({TokenType::KW_END});
        break;
    }
    consume(TokenType::KW_END, "'fim'");
    return node;
}

ASTNodePtr Parser::parseWhile()
{
    auto node = makeNode(NodeType::WHILE_STMT, loc());
    consume(TokenType::KW_WHILE, "'enquanto'");
    node->children.push_back(parseExpression());
    consume(TokenType::KW_DO, "'faça'");

    loopDepth_++;
    node->children.push_back(parseBlock({TokenType::KW_END}));
    loopDepth_--;

    consume(TokenType::KW_END, "'fim'");
    return node;
}

ASTNodePtr Parser::parseForEach()
{
    auto node = makeNode(NodeType::FOR_EACH_STMT, loc());
    consume(TokenType::KW_FOR, "'para'");
    consume(TokenType::KW_EACH, "'cada'");
    node->strValue = consume(TokenType::IDENTIFIER, "nome da variável").value;
    consume(TokenType::KW_IN, "'em'");
    node->children.push_back(parseExpression());
    consume(TokenType::KW_DO, "'faça'");

    loopDepth_++;
    node->children.push_back(parseBlock({TokenType::KW_END}));
    loopDepth_--;

    consume(TokenType::KW_END, "'fim'");
    return node;
}

ASTNodePtr Parser::parseReturn()
{
    auto node = makeNode(NodeType::RETURN_STMT, loc());
    if (functionDepth_ == 0)
        error("'retorna' fora de uma função");
    consume(TokenType::KW_RETURN, "'retorna'");
    if (!isTerminator({TokenType::NEWLINE,
                       TokenType::KW_END,
                       TokenType::KW_ELSE,
                       TokenType::KW_CATCH,
                       TokenType::END_OF_INPUT}))
        node->children.push_back(parseExpression());
    return node;
}

ASTNodePtr Parser::parseTry()
{
    auto node = makeNode(NodeType::TRY_STMT, loc());
    consume(TokenType::KW_TRY, "'tente'");
    node->children.push_back(parseBlock({TokenType::KW_CATCH}));
    consume(TokenType::KW_CATCH, "'capture'");
    // the error name must stay on the 'capture' line
    if (check(TokenType::IDENTIFIER))
        node->strValue = tokens_[pos_++].value;
    node->children.push_back(parseBlock({TokenType::KW_END}));
    consume(TokenType::KW_END, "'fim'");
    return node;
}

ASTNodePtr Parser::parseImport()
{
    auto node = makeNode(NodeType::IMPORT_STMT, loc());
    if (blockDepth_ > 0 || functionDepth_ > 0)
        error("'importe' só é permitido no nível superior");
    consume(TokenType::KW_IMPORT, "'importe'");
    node->strValue = consume(TokenType::STRING, "nome do módulo entre aspas").value;
    return node;
}

ASTNodePtr Parser::parseExport()
{
    auto at = loc();
    if (blockDepth_ > 0 || functionDepth_ > 0)
        error("'exporte' só é permitido no nível superior");
    consume(TokenType::KW_EXPORT, "'exporte'");

    ASTNodePtr decl;
    if (check(TokenType::KW_LET))
        decl = parseLet();
    else if (check(TokenType::KW_FUNCTION) && peekToken(1).type == TokenType::IDENTIFIER)
        decl = parseFunctionDecl();
    else
        error("esperado uma declaração após 'exporte'", at);
    decl->exported = true;
    return decl;
}

ASTNodePtr Parser::parseBlock(std::initializer_list<TokenType> terminators)
{
    auto block = makeNode(NodeType::BLOCK, loc());
    blockDepth_++;
    skipNewlines();
    while (!isTerminator(terminators)) {
        if (isAtEnd())
            error("bloco não terminado, esperado 'fim'");
        block->children.push_back(parseStatement());
        skipNewlines();
    }
    blockDepth_--;
    return block;
}

// ============================================================
// Функции
// ============================================================

std::vector<ParamDecl> Parser::parseParams()
{
    std::vector<ParamDecl> params;
    consume(TokenType::LPAREN, "'('");
    bool sawDefault = false;
    while (!check(TokenType::RPAREN)) {
        ParamDecl p;
        p.span = loc();
        p.name = consume(TokenType::IDENTIFIER, "nome do parâmetro").value;
        for (auto &other : params) {
            if (other.name == p.name)
                error("parâmetro '" + p.name + "' repetido", p.span);
        }
        if (match(TokenType::ASSIGN)) {
            p.defaultValue = parseOr();
            sawDefault = true;
        } else if (sawDefault) {
            error("parâmetro '" + p.name + "' sem valor padrão após parâmetro com valor padrão",
                  p.span);
        }
        params.push_back(std::move(p));
        if (!match(TokenType::COMMA))
            break;
    }
    consume(TokenType::RPAREN, "')'");
    return params;
}

ASTNodePtr Parser::wrapImplicitReturn(ASTNodePtr expr)
{
    auto block = makeNode(NodeType::BLOCK, expr->span);
    auto ret = makeNode(NodeType::RETURN_STMT, expr->span);
    ret->children.push_back(std::move(expr));
    block->children.push_back(std::move(ret));
    return block;
}

// declaredWithAssign: "seja f(x) = faça ... fim" | "seja f(x) = expr"
// otherwise:          "função (x) ... fim"      | "função (x) -> expr"
ASTNodePtr Parser::parseFunctionBody(bool declaredWithAssign)
{
    int savedLoops = loopDepth_;
    loopDepth_ = 0;
    functionDepth_++;

    ASTNodePtr body;
    if (declaredWithAssign ? match(TokenType::KW_DO) : !match(TokenType::ARROW)) {
        body = parseBlock({TokenType::KW_END});
        consume(TokenType::KW_END, "'fim'");
    } else {
        body = wrapImplicitReturn(parseExpression());
    }

    functionDepth_--;
    loopDepth_ = savedLoops;
    return body;
}

ASTNodePtr Parser::parseAnonFunc()
{
    auto node = makeNode(NodeType::ANON_FUNC, loc());
    if (match(TokenType::KW_DO)) {
        // faça ... fim: function without parameters
        int savedLoops = loopDepth_;
        loopDepth_ = 0;
        functionDepth_++;
        node->children.push_back(parseBlock({TokenType::KW_END}));
        consume(TokenType::KW_END, "'fim'");
        functionDepth_--;
        loopDepth_ = savedLoops;
        return node;
    }
    consume(TokenType::KW_FUNCTION, "'função'");
    node->params = parseParams();
    node->children.push_back(parseFunctionBody(false));
    return node;
}

// ============================================================
// Expressions
// ============================================================

ASTNodePtr Parser::parseExpression()
{
    return parseAssignment();
}

ASTNodePtr Parser::parseAssignment()
{
    auto lhs = parseOr();
    if (!check(TokenType::ASSIGN))
        return lhs;

    auto at = loc();
    if (lhs->type != NodeType::IDENTIFIER && lhs->type != NodeType::INDEX)
        error("alvo de atribuição inválido", at);
    pos_++;
    auto rhs = parseAssignment();
    auto node = makeNode(NodeType::ASSIGN, lhs->span);
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return node;
}

ASTNodePtr Parser::parseOr()
{
    auto lhs = parseAnd();
    while (match(TokenType::KW_OR))
        lhs = makeBinary(NodeType::LOGICAL_OP, Operator::OR, std::move(lhs), parseAnd());
    return lhs;
}

ASTNodePtr Parser::parseAnd()
{
    auto lhs = parseEquality();
    while (match(TokenType::KW_AND))
        lhs = makeBinary(NodeType::LOGICAL_OP, Operator::AND, std::move(lhs), parseEquality());
    return lhs;
}

ASTNodePtr Parser::parseEquality()
{
    auto lhs = parseComparison();
    while (true) {
        Operator op;
        if (match(TokenType::KW_IS)) {
            op = Operator::EQ;
        } else if (match(TokenType::KW_HAS)) {
            op = Operator::HAS;
        } else if (check(TokenType::KW_NOT) && peekToken(1).type == TokenType::KW_IS) {
            pos_ += 2;
            op = Operator::NEQ;
        } else if (check(TokenType::KW_NOT) && peekToken(1).type == TokenType::KW_HAS) {
            pos_ += 2;
            op = Operator::NOT_HAS;
        } else {
            break;
        }
        lhs = makeBinary(NodeType::BINARY_OP, op, std::move(lhs), parseComparison());
    }
    return lhs;
}

ASTNodePtr Parser::parseComparison()
{
    auto lhs = parseRange();
    while (true) {
        Operator op;
        if (match(TokenType::LT))
            op = Operator::LT;
        else if (match(TokenType::LEQ))
            op = Operator::LEQ;
        else if (match(TokenType::GT))
            op = Operator::GT;
        else if (match(TokenType::GEQ))
            op = Operator::GEQ;
        else
            break;
        lhs = makeBinary(NodeType::BINARY_OP, op, std::move(lhs), parseRange());
    }
    return lhs;
}

ASTNodePtr Parser::parseRange()
{
    auto lhs = parseTerm();
    if (match(TokenType::KW_UNTIL))
        lhs = makeBinary(NodeType::BINARY_OP, Operator::RANGE, std::move(lhs), parseTerm());
    return lhs;
}

ASTNodePtr Parser::parseTerm()
{
    auto lhs = parseFactor();
    while (true) {
        Operator op;
        if (match(TokenType::PLUS))
            op = Operator::ADD;
        else if (match(TokenType::MINUS))
            op = Operator::SUB;
        else
            break;
        lhs = makeBinary(NodeType::BINARY_OP, op, std::move(lhs), parseFactor());
    }
    return lhs;
}

ASTNodePtr Parser::parseFactor()
{
    auto lhs = parseExponent();
    while (true) {
        Operator op;
        if (match(TokenType::STAR))
            op = Operator::MUL;
        else if (match(TokenType::SLASH))
            op = Operator::DIV;
        else if (match(TokenType::PERCENT))
            op = Operator::MOD;
        else
            break;
        lhs = makeBinary(NodeType::BINARY_OP, op, std::move(lhs), parseExponent());
    }
    return lhs;
}

ASTNodePtr Parser::parseExponent()
{
    auto lhs = parseUnary();
    while (match(TokenType::CARET))
        lhs = makeBinary(NodeType::BINARY_OP, Operator::POW, std::move(lhs), parseUnary());
    return lhs;
}

ASTNodePtr Parser::parseUnary()
{
    if (check(TokenType::MINUS) || check(TokenType::KW_NOT)) {
        auto node = makeNode(NodeType::UNARY_OP, loc());
        node->op = check(TokenType::MINUS) ? Operator::NEG : Operator::NOT;
        pos_++;
        node->children.push_back(parseUnary());
        return node;
    }
    return parsePostfix();
}

ASTNodePtr Parser::parsePostfix()
{
    auto expr = parsePrimary();
    while (true) {
        if (check(TokenType::LPAREN)) {
            auto call = makeNode(NodeType::CALL, loc());
            pos_++;
            call->children.push_back(std::move(expr));
            while (!check(TokenType::RPAREN)) {
                call->children.push_back(parseExpression());
                if (!match(TokenType::COMMA))
                    break;
            }
            consume(TokenType::RPAREN, "')'");
            expr = std::move(call);
        } else if (check(TokenType::LBRACKET)) {
            auto index = makeNode(NodeType::INDEX, loc());
            pos_++;
            index->children.push_back(std::move(expr));
            index->children.push_back(parseExpression());
            consume(TokenType::RBRACKET, "']'");
            expr = std::move(index);
        } else if (check(TokenType::DOT)) {
            auto index = makeNode(NodeType::INDEX, loc());
            pos_++;
            auto field = consume(TokenType::IDENTIFIER, "nome do campo");
            auto key = makeNode(NodeType::STRING_LITERAL, field.line, field.col);
            key->strValue = field.value;
            index->children.push_back(std::move(expr));
            index->children.push_back(std::move(key));
            expr = std::move(index);
        } else {
            break;
        }
    }
    return expr;
}

ASTNodePtr Parser::parsePrimary()
{
    auto at = loc();
    switch (current().type) {
    case TokenType::NUMBER: {
        auto node = makeNode(NodeType::NUMBER_LITERAL, at);
        node->numValue = parseDouble(current().value, at);
        pos_++;
        return node;
    }
    case TokenType::STRING: {
        auto node = makeNode(NodeType::STRING_LITERAL, at);
        node->strValue = current().value;
        pos_++;
        return node;
    }
    case TokenType::KW_TRUE:
    case TokenType::KW_FALSE: {
        auto node = makeNode(NodeType::BOOL_LITERAL, at);
        node->boolValue = check(TokenType::KW_TRUE);
        pos_++;
        return node;
    }
    case TokenType::KW_NIL:
        pos_++;
        return makeNode(NodeType::NIL_LITERAL, at);
    case TokenType::IDENTIFIER: {
        auto node = makeNode(NodeType::IDENTIFIER, at);
        node->strValue = current().value;
        pos_++;
        return node;
    }
    case TokenType::LPAREN: {
        pos_++;
        auto inner = parseExpression();
        consume(TokenType::RPAREN, "')'");
        return inner;
    }
    case TokenType::LBRACKET:
        return parseListLiteral();
    case TokenType::LBRACE:
        return parseMapLiteral();
    case TokenType::KW_FUNCTION:
    case TokenType::KW_DO:
        return parseAnonFunc();
    case TokenType::END_OF_INPUT:
        error("fim inesperado do arquivo");
    case TokenType::NEWLINE:
        error("quebra de linha inesperada");
    default:
        error("token inesperado '" + current().value + "'");
    }
}

ASTNodePtr Parser::parseListLiteral()
{
    auto node = makeNode(NodeType::LIST_LITERAL, loc());
    consume(TokenType::LBRACKET, "'['");
    while (!check(TokenType::RBRACKET)) {
        node->children.push_back(parseExpression());
        if (!match(TokenType::COMMA))
            break;
    }
    consume(TokenType::RBRACKET, "']'");
    return node;
}

ASTNodePtr Parser::parseMapLiteral()
{
    auto node = makeNode(NodeType::MAP_LITERAL, loc());
    consume(TokenType::LBRACE, "'{'");
    while (!check(TokenType::RBRACE)) {
        auto key = parseOr();
        consume(TokenType::COLON, "':'");
        auto value = parseExpression();
        node->branches.push_back({std::move(key), std::move(value)});
        if (!match(TokenType::COMMA))
            break;
    }
    consume(TokenType::RBRACE, "'}'");
    return node;
}

} // namespace tenda
