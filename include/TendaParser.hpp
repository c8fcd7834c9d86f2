#pragma once

#include "TendaAst.hpp"
#include "TendaLexer.hpp"
#include <initializer_list>
#include <vector>

namespace tenda {

class Parser
{
public:
    explicit Parser(const std::vector<Token> &tokens);
    // Parses the whole unit and runs capture analysis on it
    ASTNodePtr parse();

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    // Контекст для статических проверок
    int functionDepth_ = 0;
    int loopDepth_ = 0;
    int blockDepth_ = 0;

    SourceSpan loc() const;

    // Утилиты навигации по токенам
    const Token &current() const;
    const Token &peekToken(int off = 0) const;
    bool isAtEnd() const;
    bool check(TokenType t) const;
    bool match(TokenType t);
    Token consume(TokenType t, const std::string &what);
    void skipNewlines();
    bool isTerminator(std::initializer_list<TokenType> terminators) const;
    [[noreturn]] void error(const std::string &msg) const;
    [[noreturn]] void error(const std::string &msg, SourceSpan at) const;

    static double parseDouble(const std::string &text, SourceSpan at);

    // Statements
    ASTNodePtr parseStatement();
    ASTNodePtr parseLet();
    ASTNodePtr parseFunctionDecl();
    ASTNodePtr parseIf();
    ASTNodePtr parseWhile();
    ASTNodePtr parseForEach();
    ASTNodePtr parseReturn();
    ASTNodePtr parseTry();
    ASTNodePtr parseImport();
    ASTNodePtr parseExport();
    ASTNodePtr parseExpressionStatement();
    ASTNodePtr parseBlock(std::initializer_list<TokenType> terminators);

    // Функции
    std::vector<ParamDecl> parseParams();
    ASTNodePtr parseFunctionBody(bool declaredWithAssign);
    ASTNodePtr wrapImplicitReturn(ASTNodePtr expr);

    // Expressions (low to high)
    ASTNodePtr parseExpression();
    ASTNodePtr parseAssignment();
    ASTNodePtr parseOr();
    ASTNodePtr parseAnd();
    ASTNodePtr parseEquality();   // é, não é, tem, não tem
    ASTNodePtr parseComparison(); // < <= > >=
    ASTNodePtr parseRange();      // até
    ASTNodePtr parseTerm();       // + -
    ASTNodePtr parseFactor();     // * / %
    ASTNodePtr parseExponent();   // ^
    ASTNodePtr parseUnary();      // - não
    ASTNodePtr parsePostfix();    // () [] .
    ASTNodePtr parsePrimary();

    ASTNodePtr parseListLiteral();
    ASTNodePtr parseMapLiteral();
    ASTNodePtr parseAnonFunc();

    static ASTNodePtr makeBinary(NodeType type, Operator op, ASTNodePtr lhs, ASTNodePtr rhs);
};

} // namespace tenda
