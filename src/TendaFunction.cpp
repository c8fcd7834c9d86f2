// src/TendaFunction.cpp
#include "TendaFunction.hpp"

#include <algorithm>

namespace tenda {

size_t requiredArity(const std::vector<FunctionParam> &params)
{
    size_t n = 0;
    for (auto &p : params) {
        if (p.variadic || p.optional)
            break;
        ++n;
    }
    return n;
}

size_t maximumArity(const std::vector<FunctionParam> &params)
{
    if (!params.empty() && params.back().variadic)
        return VARIADIC;
    return params.size();
}

// ============================================================
// Построение замыкания
// ============================================================

std::shared_ptr<const Function> makeFunction(const Stack &stack,
                                             std::vector<FunctionParam> params,
                                             std::shared_ptr<const ASTNode> body,
                                             FunctionMetadata metadata)
{
    auto fn = std::make_shared<Function>();

    auto isParam = [&params](const std::string &name) {
        return std::any_of(params.begin(), params.end(), [&name](const FunctionParam &p) {
            return p.name == name;
        });
    };

    // Innermost binding wins, so outer scopes never overwrite.
    // Owned cells are invisible outside their scope and are skipped.
    stack.forEachReachable([&](const Environment &env) {
        env.forEach([&](const std::string &name, const ValueCell &cell) {
            if (!cell.isShared() || isParam(name) || fn->captured.has(name))
                return;
            fn->captured.upsert(name, cell);
        });
    });

    fn->params = std::move(params);
    fn->body = std::move(body);
    fn->moduleScope = stack.currentModuleScope();
    fn->selfName = std::move(metadata.selfName);
    fn->selfCaptured = metadata.selfCaptured;
    fn->displayName = std::move(metadata.displayName);
    fn->span = metadata.span;
    return fn;
}

std::shared_ptr<const NativeFunction> makeNative(const std::string &name,
                                                 const std::vector<std::string> &params,
                                                 NativeFunc func,
                                                 bool variadic)
{
    auto fn = std::make_shared<NativeFunction>();
    fn->name = name;
    for (auto &p : params) {
        FunctionParam param;
        param.name = p;
        // "nome?" marks an optional trailing parameter
        if (!p.empty() && p.back() == '?') {
            param.name.pop_back();
            param.optional = true;
        }
        fn->params.push_back(param);
    }
    if (variadic && !fn->params.empty())
        fn->params.back().variadic = true;
    fn->func = std::move(func);
    return fn;
}

} // namespace tenda
