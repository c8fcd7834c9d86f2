#include "TendaCaptureAnalysis.hpp"

namespace tenda {

void CaptureAnalyzer::annotate(ASTNode &program)
{
    CaptureAnalyzer analyzer;
    analyzer.pushScope();
    analyzer.visitChildren(&program);
    analyzer.popScope();
}

void CaptureAnalyzer::pushScope()
{
    scopes_.push_back({functionLevel_, {}});
}

void CaptureAnalyzer::popScope()
{
    scopes_.pop_back();
}

void CaptureAnalyzer::declare(const std::string &name, bool *captured)
{
    scopes_.back().bindings[name] = {captured, scopes_.back().functionLevel};
}

void CaptureAnalyzer::reference(const std::string &name)
{
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->bindings.find(name);
        if (found == it->bindings.end())
            continue;
        if (found->second.functionLevel < functionLevel_)
            *found->second.captured = true;
        return;
    }
    // unresolved: prelude name or a global declared later
}

void CaptureAnalyzer::visitChildren(ASTNode *node)
{
    for (auto &child : node->children)
        visit(child.get());
    for (auto &[first, second] : node->branches) {
        visit(first.get());
        visit(second.get());
    }
    if (node->elseBranch)
        visit(node->elseBranch.get());
}

void CaptureAnalyzer::visitFunction(std::vector<ParamDecl> &params,
                                    ASTNode *body,
                                    const std::string &selfName,
                                    bool *selfCaptured)
{
    functionLevel_++;
    pushScope();
    // the self name shares the flag of the declaration that introduced it
    if (!selfName.empty())
        declare(selfName, selfCaptured);
    for (auto &p : params) {
        if (p.defaultValue)
            visit(p.defaultValue.get());
        declare(p.name, &p.captured);
    }
    visit(body);
    popScope();
    functionLevel_--;
}

void CaptureAnalyzer::visit(ASTNode *node)
{
    if (!node)
        return;

    switch (node->type) {
    case NodeType::BLOCK:
        pushScope();
        visitChildren(node);
        popScope();
        break;

    case NodeType::LET_DECL: {
        // the initializer cannot see the name being declared; a function
        // initializer sees it as its own self name
        ASTNode *init = node->children[0].get();
        if (init->type == NodeType::ANON_FUNC)
            visitFunction(init->params, init->children[0].get(), node->strValue, &node->captured);
        else
            visit(init);
        declare(node->strValue, &node->captured);
        break;
    }

    case NodeType::FUNCTION_DECL:
        declare(node->strValue, &node->captured);
        visitFunction(node->params, node->children[0].get(), node->strValue, &node->captured);
        break;

    case NodeType::ANON_FUNC:
        visitFunction(node->params, node->children[0].get());
        break;

    case NodeType::FOR_EACH_STMT:
        visit(node->children[0].get());
        pushScope();
        declare(node->strValue, &node->captured);
        visit(node->children[1].get());
        popScope();
        break;

    case NodeType::TRY_STMT:
        visit(node->children[0].get());
        pushScope();
        if (!node->strValue.empty())
            declare(node->strValue, &node->captured);
        visit(node->children[1].get());
        popScope();
        break;

    case NodeType::IDENTIFIER:
        reference(node->strValue);
        break;

    default:
        visitChildren(node);
        break;
    }
}

} // namespace tenda
