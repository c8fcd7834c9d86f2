#include "TendaLexer.hpp"
#include <gtest/gtest.h>

using namespace tenda;

// ============================================================
// Вспомогательные функции
// ============================================================

static std::vector<Token> lex(const std::string &src)
{
    Lexer lexer(src);
    return lexer.tokenize();
}

static void expectTokenTypes(const std::string &src, const std::vector<TokenType> &expected)
{
    auto tokens = lex(src);
    ASSERT_EQ(tokens.size(), expected.size()) << "Source: \"" << src << "\"";
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i])
            << "Token #" << i << " in \"" << src << "\", value=\"" << tokens[i].value << "\"";
    }
}

static void expectSingleToken(const std::string &src, TokenType type, const std::string &value = "")
{
    auto tokens = lex(src);
    ASSERT_EQ(tokens.size(), 2u) << "Source: \"" << src << "\"";
    EXPECT_EQ(tokens[0].type, type);
    if (!value.empty()) {
        EXPECT_EQ(tokens[0].value, value);
    }
    EXPECT_EQ(tokens[1].type, TokenType::END_OF_INPUT);
}

// ============================================================
// Пустой / тривиальный ввод
// ============================================================

TEST(Lexer, EmptyInput)
{
    auto tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::END_OF_INPUT);
}

TEST(Lexer, WhitespaceOnly)
{
    expectTokenTypes("   \t  \r", {TokenType::END_OF_INPUT});
}

TEST(Lexer, LeadingNewlinesAreDropped)
{
    expectTokenTypes("\n\n\n", {TokenType::END_OF_INPUT});
    expectTokenTypes("\n\nx", {TokenType::IDENTIFIER, TokenType::END_OF_INPUT});
}

TEST(Lexer, ConsecutiveNewlinesCollapse)
{
    expectTokenTypes("a\n\n\nb",
                     {TokenType::IDENTIFIER,
                      TokenType::NEWLINE,
                      TokenType::IDENTIFIER,
                      TokenType::END_OF_INPUT});
}

// ============================================================
// Числа
// ============================================================

TEST(Lexer, Integer)
{
    expectSingleToken("42", TokenType::NUMBER, "42");
}

TEST(Lexer, Decimal)
{
    expectSingleToken("3.14", TokenType::NUMBER, "3.14");
}

TEST(Lexer, TrailingDotIsNotPartOfNumber)
{
    expectTokenTypes("1.x",
                     {TokenType::NUMBER, TokenType::DOT, TokenType::IDENTIFIER, TokenType::END_OF_INPUT});
}

TEST(Lexer, NumberFollowedByLetterIsMalformed)
{
    try {
        lex("12abc");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError &e) {
        EXPECT_EQ(e.message(), "número malformado");
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(e.col(), 1);
    }
}

// ============================================================
// Строки
// ============================================================

TEST(Lexer, SimpleString)
{
    expectSingleToken("\"olá\"", TokenType::STRING, "olá");
}

TEST(Lexer, EmptyString)
{
    auto tokens = lex("\"\"");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_TRUE(tokens[0].value.empty());
}

TEST(Lexer, StringEscapes)
{
    auto tokens = lex(R"("a\nb\t\"c\"\\")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].value, "a\nb\t\"c\"\\");
}

TEST(Lexer, InvalidEscapeThrows)
{
    EXPECT_THROW(lex(R"("\q")"), SyntaxError);
}

TEST(Lexer, UnterminatedStringThrows)
{
    EXPECT_THROW(lex("\"abc"), SyntaxError);
    EXPECT_THROW(lex("\"abc\ndef\""), SyntaxError);
}

// ============================================================
// Идентификаторы и ключевые слова
// ============================================================

TEST(Lexer, AccentedIdentifier)
{
    expectSingleToken("número", TokenType::IDENTIFIER, "número");
    expectSingleToken("maiúsculas", TokenType::IDENTIFIER, "maiúsculas");
}

TEST(Lexer, IdentifierWithDigitsAndUnderscore)
{
    expectSingleToken("para_cada2", TokenType::IDENTIFIER, "para_cada2");
}

TEST(Lexer, Keywords)
{
    expectSingleToken("seja", TokenType::KW_LET);
    expectSingleToken("função", TokenType::KW_FUNCTION);
    expectSingleToken("senão", TokenType::KW_ELSE);
    expectSingleToken("faça", TokenType::KW_DO);
    expectSingleToken("até", TokenType::KW_UNTIL);
    expectSingleToken("é", TokenType::KW_IS);
    expectSingleToken("não", TokenType::KW_NOT);
    expectSingleToken("Nada", TokenType::KW_NIL);
    expectSingleToken("tente", TokenType::KW_TRY);
    expectSingleToken("capture", TokenType::KW_CATCH);
    expectSingleToken("lance", TokenType::KW_RAISE);
    expectSingleToken("exporte", TokenType::KW_EXPORT);
}

TEST(Lexer, KeywordPrefixIsIdentifier)
{
    expectSingleToken("sejam", TokenType::IDENTIFIER, "sejam");
    expectSingleToken("fimx", TokenType::IDENTIFIER, "fimx");
}

TEST(Lexer, LetStatement)
{
    expectTokenTypes("seja x = 1",
                     {TokenType::KW_LET,
                      TokenType::IDENTIFIER,
                      TokenType::ASSIGN,
                      TokenType::NUMBER,
                      TokenType::END_OF_INPUT});
}

TEST(Lexer, NegatedEquality)
{
    expectTokenTypes("a não é b",
                     {TokenType::IDENTIFIER,
                      TokenType::KW_NOT,
                      TokenType::KW_IS,
                      TokenType::IDENTIFIER,
                      TokenType::END_OF_INPUT});
}

// ============================================================
// Операторы и пунктуация
// ============================================================

TEST(Lexer, Operators)
{
    expectTokenTypes("+ - * / % ^ = < > <= >= ->",
                     {TokenType::PLUS,
                      TokenType::MINUS,
                      TokenType::STAR,
                      TokenType::SLASH,
                      TokenType::PERCENT,
                      TokenType::CARET,
                      TokenType::ASSIGN,
                      TokenType::LT,
                      TokenType::GT,
                      TokenType::LEQ,
                      TokenType::GEQ,
                      TokenType::ARROW,
                      TokenType::END_OF_INPUT});
}

TEST(Lexer, Punctuation)
{
    expectTokenTypes("( ) [ ] { } , : .",
                     {TokenType::LPAREN,
                      TokenType::RPAREN,
                      TokenType::LBRACKET,
                      TokenType::RBRACKET,
                      TokenType::LBRACE,
                      TokenType::RBRACE,
                      TokenType::COMMA,
                      TokenType::COLON,
                      TokenType::DOT,
                      TokenType::END_OF_INPUT});
}

TEST(Lexer, FieldAccess)
{
    expectTokenTypes("Lista.tamanho",
                     {TokenType::IDENTIFIER, TokenType::DOT, TokenType::IDENTIFIER, TokenType::END_OF_INPUT});
}

TEST(Lexer, UnexpectedCharacter)
{
    try {
        lex("x @ y");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError &e) {
        EXPECT_EQ(e.message(), "caractere inesperado '@'");
        EXPECT_EQ(e.col(), 3);
        EXPECT_NE(std::string(e.what()).find("(linha 1, coluna 3)"), std::string::npos);
    }
}

// ============================================================
// Скобки и переводы строк
// ============================================================

TEST(Lexer, NewlinesInsideBracketsAreIgnored)
{
    expectTokenTypes("[1,\n 2\n]",
                     {TokenType::LBRACKET,
                      TokenType::NUMBER,
                      TokenType::COMMA,
                      TokenType::NUMBER,
                      TokenType::RBRACKET,
                      TokenType::END_OF_INPUT});
}

TEST(Lexer, NewlineAfterClosingBracketIsKept)
{
    expectTokenTypes("f(\n)\ng",
                     {TokenType::IDENTIFIER,
                      TokenType::LPAREN,
                      TokenType::RPAREN,
                      TokenType::NEWLINE,
                      TokenType::IDENTIFIER,
                      TokenType::END_OF_INPUT});
}

TEST(Lexer, MismatchedBracketThrows)
{
    EXPECT_THROW(lex("(]"), SyntaxError);
}

TEST(Lexer, UnopenedBracketThrows)
{
    EXPECT_THROW(lex("x)"), SyntaxError);
}

TEST(Lexer, UnclosedBracketThrows)
{
    EXPECT_THROW(lex("{\"a\": [1"), SyntaxError);
}

// ============================================================
// Комментарии
// ============================================================

TEST(Lexer, LineComment)
{
    expectTokenTypes("1 // comentário\n2",
                     {TokenType::NUMBER, TokenType::NEWLINE, TokenType::NUMBER, TokenType::END_OF_INPUT});
}

TEST(Lexer, BlockCommentSpanningLines)
{
    expectTokenTypes("/* a\n b */ 3", {TokenType::NUMBER, TokenType::END_OF_INPUT});
}

TEST(Lexer, UnterminatedBlockCommentThrows)
{
    EXPECT_THROW(lex("1 /* sem fim"), SyntaxError);
}

// ============================================================
// Позиции
// ============================================================

TEST(Lexer, LineAndColumnTracking)
{
    auto tokens = lex("seja x\n  y");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[1].line, 1);
    EXPECT_EQ(tokens[1].col, 6);
    EXPECT_EQ(tokens[3].line, 2);
    EXPECT_EQ(tokens[3].col, 3);
}

TEST(Lexer, MultibyteCharactersCountAsOneColumn)
{
    auto tokens = lex("é x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[1].col, 3);
}
