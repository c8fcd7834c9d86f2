#include "TendaLexer.hpp"

#include <cctype>
#include <unordered_map>

namespace tenda {

// ─── SyntaxError ────────────────────────────────────────────────────────

SyntaxError::SyntaxError(const std::string &msg, int line, int col)
    : std::runtime_error(msg + " (linha " + std::to_string(line) + ", coluna "
                         + std::to_string(col) + ")")
    , message_(msg)
    , line_(line)
    , col_(col)
{}

// ─── safe ctype wrappers (avoid UB with signed char > 127) ──────────────

bool Lexer::isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c));
}

// Любой байт UTF-8 вне ASCII считается буквой: "número", "maiúsculas"
bool Lexer::isIdentStart(char c)
{
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool Lexer::isIdentChar(char c)
{
    return isIdentStart(c) || isDigit(c);
}

// ─── error helpers ──────────────────────────────────────────────────────

void Lexer::error(const std::string &msg)
{
    throw SyntaxError(msg, line_, col_);
}

void Lexer::error(const std::string &msg, int line, int col)
{
    throw SyntaxError(msg, line, col);
}

// ─── constructor / basic methods ────────────────────────────────────────

Lexer::Lexer(const std::string &source)
    : src_(source)
{}

char Lexer::peek() const
{
    return pos_ < src_.size() ? src_[pos_] : '\0';
}

char Lexer::peek(int offset) const
{
    int p = static_cast<int>(pos_) + offset;
    if (p < 0 || static_cast<size_t>(p) >= src_.size())
        return '\0';
    return src_[static_cast<size_t>(p)];
}

char Lexer::advance()
{
    if (pos_ >= src_.size())
        return '\0';
    char c = src_[pos_++];
    if (c == '\n') {
        line_++;
        col_ = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        // continuation bytes of a UTF-8 sequence share the column
        col_++;
    }
    return c;
}

void Lexer::addToken(TokenType type, const std::string &val, int line, int col)
{
    tokens_.push_back({type, val, line, col});
}

// ─── bracket tracking ──────────────────────────────────────────────────

char Lexer::closingFor(char open)
{
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    case '{':
        return '}';
    default:
        return '?';
    }
}

void Lexer::pushBracket(char open)
{
    bracketStack_.push_back(open);
}

void Lexer::popBracket(char close)
{
    if (bracketStack_.empty())
        error("'" + std::string(1, close) + "' sem abertura correspondente");
    char expected = closingFor(bracketStack_.back());
    if (close != expected)
        error("esperado '" + std::string(1, expected) + "', encontrado '" + std::string(1, close)
              + "'");
    bracketStack_.pop_back();
}

// ─── whitespace / comments ─────────────────────────────────────────────

void Lexer::skipBlockComment()
{
    int startLine = line_;
    int startCol = col_;
    advance(); // '/'
    advance(); // '*'
    while (pos_ < src_.size()) {
        if (peek() == '*' && peek(1) == '/') {
            advance();
            advance();
            return;
        }
        advance();
    }
    error("comentário de bloco não terminado", startLine, startCol);
}

void Lexer::skipSpacesAndComments()
{
    while (pos_ < src_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r') {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < src_.size() && peek() != '\n')
                advance();
        } else if (c == '/' && peek(1) == '*') {
            skipBlockComment();
        } else {
            break;
        }
    }
}

// ─── literals ───────────────────────────────────────────────────────────

void Lexer::readNumber()
{
    int startLine = line_;
    int startCol = col_;
    size_t start = pos_;

    while (isDigit(peek()))
        advance();
    // "1.5": но не "lista.tamanho" и не "1." в конце
    if (peek() == '.' && isDigit(peek(1))) {
        advance();
        while (isDigit(peek()))
            advance();
    }
    if (isIdentStart(peek()))
        error("número malformado", startLine, startCol);

    addToken(TokenType::NUMBER, src_.substr(start, pos_ - start), startLine, startCol);
}

void Lexer::readString(int startLine, int startCol)
{
    advance(); // opening "
    std::string value;
    while (true) {
        if (pos_ >= src_.size() || peek() == '\n')
            error("texto não terminado", startLine, startCol);
        char c = advance();
        if (c == '"')
            break;
        if (c != '\\') {
            value += c;
            continue;
        }
        char esc = advance();
        switch (esc) {
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case 'r':
            value += '\r';
            break;
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '0':
            value += '\0';
            break;
        default:
            error("sequência de escape inválida '\\" + std::string(1, esc) + "'");
        }
    }
    addToken(TokenType::STRING, value, startLine, startCol);
}

void Lexer::readIdentifier()
{
    int startLine = line_;
    int startCol = col_;
    size_t start = pos_;

    while (pos_ < src_.size() && isIdentChar(peek()))
        advance();

    std::string word = src_.substr(start, pos_ - start);

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"seja", TokenType::KW_LET},
        {"função", TokenType::KW_FUNCTION},
        {"se", TokenType::KW_IF},
        {"então", TokenType::KW_THEN},
        {"senão", TokenType::KW_ELSE},
        {"fim", TokenType::KW_END},
        {"enquanto", TokenType::KW_WHILE},
        {"faça", TokenType::KW_DO},
        {"para", TokenType::KW_FOR},
        {"cada", TokenType::KW_EACH},
        {"em", TokenType::KW_IN},
        {"retorna", TokenType::KW_RETURN},
        {"pare", TokenType::KW_BREAK},
        {"continue", TokenType::KW_CONTINUE},
        {"e", TokenType::KW_AND},
        {"ou", TokenType::KW_OR},
        {"não", TokenType::KW_NOT},
        {"é", TokenType::KW_IS},
        {"tem", TokenType::KW_HAS},
        {"até", TokenType::KW_UNTIL},
        {"verdadeiro", TokenType::KW_TRUE},
        {"falso", TokenType::KW_FALSE},
        {"Nada", TokenType::KW_NIL},
        {"tente", TokenType::KW_TRY},
        {"capture", TokenType::KW_CATCH},
        {"lance", TokenType::KW_RAISE},
        {"importe", TokenType::KW_IMPORT},
        {"exporte", TokenType::KW_EXPORT},
    };

    auto it = keywords.find(word);
    if (it != keywords.end())
        addToken(it->second, word, startLine, startCol);
    else
        addToken(TokenType::IDENTIFIER, word, startLine, startCol);
}

// ─── read operators / punctuation ───────────────────────────────────────

bool Lexer::readOperator()
{
    int ln = line_;
    int cl = col_;
    char c = peek();
    char n = peek(1);

    auto two = [&](TokenType t, const char *text) {
        advance();
        advance();
        addToken(t, text, ln, cl);
        return true;
    };
    auto one = [&](TokenType t) {
        advance();
        addToken(t, std::string(1, c), ln, cl);
        return true;
    };

    switch (c) {
    case '>':
        return n == '=' ? two(TokenType::GEQ, ">=") : one(TokenType::GT);
    case '<':
        return n == '=' ? two(TokenType::LEQ, "<=") : one(TokenType::LT);
    case '-':
        return n == '>' ? two(TokenType::ARROW, "->") : one(TokenType::MINUS);
    case '+':
        return one(TokenType::PLUS);
    case '*':
        return one(TokenType::STAR);
    case '/':
        return one(TokenType::SLASH);
    case '%':
        return one(TokenType::PERCENT);
    case '^':
        return one(TokenType::CARET);
    case '=':
        return one(TokenType::ASSIGN);
    case ',':
        return one(TokenType::COMMA);
    case ':':
        return one(TokenType::COLON);
    case '.':
        return one(TokenType::DOT);
    case '(':
        pushBracket(c);
        return one(TokenType::LPAREN);
    case '[':
        pushBracket(c);
        return one(TokenType::LBRACKET);
    case '{':
        pushBracket(c);
        return one(TokenType::LBRACE);
    case ')':
        popBracket(c);
        return one(TokenType::RPAREN);
    case ']':
        popBracket(c);
        return one(TokenType::RBRACKET);
    case '}':
        popBracket(c);
        return one(TokenType::RBRACE);
    default:
        return false;
    }
}

// ─── main loop ──────────────────────────────────────────────────────────

std::vector<Token> Lexer::tokenize()
{
    tokens_.clear();
    bracketStack_.clear();
    pos_ = 0;
    line_ = 1;
    col_ = 1;

    while (pos_ < src_.size()) {
        skipSpacesAndComments();
        if (pos_ >= src_.size())
            break;

        char c = peek();

        // ── Newline: ignored inside brackets, collapsed otherwise ──
        if (c == '\n') {
            if (bracketStack_.empty() && !tokens_.empty()
                && tokens_.back().type != TokenType::NEWLINE)
                addToken(TokenType::NEWLINE, "\\n", line_, col_);
            advance();
            continue;
        }

        if (isDigit(c)) {
            readNumber();
            continue;
        }

        if (c == '"') {
            readString(line_, col_);
            continue;
        }

        if (isIdentStart(c)) {
            readIdentifier();
            continue;
        }

        if (readOperator())
            continue;

        error("caractere inesperado '" + std::string(1, c) + "'");
    }

    if (!bracketStack_.empty())
        error("'" + std::string(1, bracketStack_.back()) + "' não foi fechado");

    addToken(TokenType::END_OF_INPUT, "", line_, col_);
    return tokens_;
}

} // namespace tenda
