// include/TendaAst.hpp
#pragma once

#include "TendaSpan.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tenda {

enum class NodeType {
    // Statements
    PROGRAM,
    BLOCK,
    LET_DECL,
    FUNCTION_DECL,
    IF_STMT,
    WHILE_STMT,
    FOR_EACH_STMT,
    RETURN_STMT,
    BREAK_STMT,
    CONTINUE_STMT,
    TRY_STMT,
    RAISE_STMT,
    IMPORT_STMT,
    EXPR_STMT,
    // Expressions
    NUMBER_LITERAL,
    STRING_LITERAL,
    BOOL_LITERAL,
    NIL_LITERAL,
    IDENTIFIER,
    BINARY_OP,
    LOGICAL_OP,
    UNARY_OP,
    ASSIGN,
    CALL,
    INDEX,
    LIST_LITERAL,
    MAP_LITERAL,
    ANON_FUNC,
};

enum class Operator {
    NONE,
    ADD,
    SUB,
    MUL,
    DIV,
    MOD,
    POW,
    EQ,
    NEQ,
    LT,
    LEQ,
    GT,
    GEQ,
    RANGE,
    HAS,
    NOT_HAS,
    AND,
    OR,
    NEG,
    NOT,
};

const char *operatorSymbol(Operator op);

struct ASTNode;
using ASTNodePtr = std::unique_ptr<ASTNode>;

struct ParamDecl
{
    std::string name;
    bool captured = false;
    ASTNodePtr defaultValue;
    SourceSpan span;
};

// Field usage by node type:
//   LET_DECL        strValue = name, children[0] = value
//   FUNCTION_DECL   strValue = name, params, children[0] = body (BLOCK)
//   IF_STMT         branches (cond, BLOCK), elseBranch
//   WHILE_STMT      children = {cond, BLOCK}
//   FOR_EACH_STMT   strValue = item, children = {iterable, BLOCK}
//   TRY_STMT        strValue = catch name (may be empty), children = {BLOCK, BLOCK}
//   IMPORT_STMT     strValue = module id
//   BINARY_OP etc.  op, children = operands
//   ASSIGN          children = {target, value}
//   CALL            children[0] = callee, rest = arguments
//   INDEX           children = {object, key}
//   MAP_LITERAL     branches (key, value)
//   ANON_FUNC       params, children[0] = body (BLOCK)
struct ASTNode
{
    NodeType type;
    SourceSpan span;
    std::string strValue;
    double numValue = 0;
    bool boolValue = false;
    Operator op = Operator::NONE;

    // Binding introduced by this node is referenced from a nested function
    bool captured = false;
    bool exported = false;

    std::vector<ASTNodePtr> children;
    std::vector<ParamDecl> params;

    std::vector<std::pair<ASTNodePtr, ASTNodePtr>> branches;
    ASTNodePtr elseBranch;

    explicit ASTNode(NodeType t)
        : type(t)
    {}
};

ASTNodePtr makeNode(NodeType t, int line, int col);
ASTNodePtr makeNode(NodeType t, SourceSpan span);

} // namespace tenda
