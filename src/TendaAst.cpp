// src/TendaAst.cpp
#include "TendaAst.hpp"

namespace tenda {

// ============================================================
// Фабрики узлов
// ============================================================

ASTNodePtr makeNode(NodeType t, int line, int col)
{
    auto node = std::make_unique<ASTNode>(t);
    node->span = {line, col};
    return node;
}

ASTNodePtr makeNode(NodeType t, SourceSpan span)
{
    auto node = std::make_unique<ASTNode>(t);
    node->span = span;
    return node;
}

const char *operatorSymbol(Operator op)
{
    switch (op) {
    case Operator::NONE:
        return "";
    case Operator::ADD:
        return "+";
    case Operator::SUB:
    case Operator::NEG:
        return "-";
    case Operator::MUL:
        return "*";
    case Operator::DIV:
        return "/";
    case Operator::MOD:
        return "%";
    case Operator::POW:
        return "^";
    case Operator::EQ:
        return "é";
    case Operator::NEQ:
        return "não é";
    case Operator::LT:
        return "<";
    case Operator::LEQ:
        return "<=";
    case Operator::GT:
        return ">";
    case Operator::GEQ:
        return ">=";
    case Operator::RANGE:
        return "até";
    case Operator::HAS:
        return "tem";
    case Operator::NOT_HAS:
        return "não tem";
    case Operator::AND:
        return "e";
    case Operator::OR:
        return "ou";
    case Operator::NOT:
        return "não";
    }
    return "?";
}

} // namespace tenda
