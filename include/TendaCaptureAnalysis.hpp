#pragma once

#include "TendaAst.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tenda {

// Marks every binding (declaration, parameter, loop item, catch name) that is
// referenced from a function nested deeper than the one declaring it. The
// evaluator creates those bindings as Shared cells.
class CaptureAnalyzer
{
public:
    static void annotate(ASTNode &program);

private:
    struct Binding
    {
        bool *captured;
        int functionLevel;
    };

    struct Scope
    {
        int functionLevel;
        std::unordered_map<std::string, Binding> bindings;
    };

    std::vector<Scope> scopes_;
    int functionLevel_ = 0;

    void pushScope();
    void popScope();
    void declare(const std::string &name, bool *captured);
    void reference(const std::string &name);

    void visit(ASTNode *node);
    void visitChildren(ASTNode *node);
    void visitFunction(std::vector<ParamDecl> &params,
                       ASTNode *body,
                       const std::string &selfName = {},
                       bool *selfCaptured = nullptr);
};

} // namespace tenda
