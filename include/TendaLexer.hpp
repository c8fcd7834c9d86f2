#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace tenda {

enum class TokenType {
    NUMBER,
    STRING,
    IDENTIFIER,
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,
    CARET,
    ASSIGN,
    LT,
    GT,
    LEQ,
    GEQ,
    LPAREN,
    RPAREN,
    LBRACKET,
    RBRACKET,
    LBRACE,
    RBRACE,
    COMMA,
    COLON,
    DOT,
    ARROW,
    NEWLINE,
    KW_LET,
    KW_FUNCTION,
    KW_IF,
    KW_THEN,
    KW_ELSE,
    KW_END,
    KW_WHILE,
    KW_DO,
    KW_FOR,
    KW_EACH,
    KW_IN,
    KW_RETURN,
    KW_BREAK,
    KW_CONTINUE,
    KW_AND,
    KW_OR,
    KW_NOT,
    KW_IS,
    KW_HAS,
    KW_UNTIL,
    KW_TRUE,
    KW_FALSE,
    KW_NIL,
    KW_TRY,
    KW_CATCH,
    KW_RAISE,
    KW_IMPORT,
    KW_EXPORT,
    END_OF_INPUT
};

struct Token
{
    TokenType type;
    std::string value;
    int line = 0;
    int col = 0;
};

// Thrown by the lexer and the parser
class SyntaxError : public std::runtime_error
{
public:
    SyntaxError(const std::string &msg, int line, int col);

    const std::string &message() const { return message_; }
    int line() const { return line_; }
    int col() const { return col_; }

private:
    std::string message_;
    int line_;
    int col_;
};

class Lexer
{
public:
    explicit Lexer(const std::string &source);
    std::vector<Token> tokenize();

private:
    std::string src_;
    size_t pos_ = 0;
    int line_ = 1;
    int col_ = 1;
    std::vector<Token> tokens_;
    std::vector<char> bracketStack_;

    char peek() const;
    char peek(int offset) const;
    char advance();

    void pushBracket(char open);
    void popBracket(char close);

    void skipSpacesAndComments();
    void skipBlockComment();
    void addToken(TokenType type, const std::string &val, int line, int col);

    void readNumber();
    void readString(int startLine, int startCol);
    void readIdentifier();
    bool readOperator();

    [[noreturn]] void error(const std::string &msg);
    [[noreturn]] void error(const std::string &msg, int line, int col);

    static bool isDigit(char c);
    static bool isIdentStart(char c);
    static bool isIdentChar(char c);
    static char closingFor(char open);
};

} // namespace tenda
