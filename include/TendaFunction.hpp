// include/TendaFunction.hpp
#pragma once

#include "TendaAst.hpp"
#include "TendaEnvironment.hpp"
#include "TendaSignal.hpp"
#include "TendaStack.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace tenda {

class Engine;

constexpr size_t VARIADIC = std::numeric_limits<size_t>::max();

struct FunctionParam
{
    std::string name;
    bool captured = false;
    bool optional = false;
    bool variadic = false;
    // Points into the tree owned by Function::body
    const ASTNode *defaultValue = nullptr;
};

size_t requiredArity(const std::vector<FunctionParam> &params);
size_t maximumArity(const std::vector<FunctionParam> &params);

struct FunctionMetadata
{
    // Bound into the call frame on every invocation; Shared when a nested
    // function refers to it
    std::string selfName;
    bool selfCaptured = false;
    std::string displayName;
    SourceSpan span;
};

// Interpreted closure
struct Function
{
    std::vector<FunctionParam> params;
    Environment captured;
    std::shared_ptr<const ASTNode> body;
    // Globals of the module the function was defined in
    std::weak_ptr<Environment> moduleScope;
    std::string selfName;
    bool selfCaptured = false;
    std::string displayName;
    SourceSpan span;
};

using NativeFunc = std::function<EvalResult(Engine &, std::vector<Value> &)>;

struct NativeFunction
{
    std::string name;
    std::vector<FunctionParam> params;
    NativeFunc func;
};

std::shared_ptr<const Function> makeFunction(const Stack &stack,
                                             std::vector<FunctionParam> params,
                                             std::shared_ptr<const ASTNode> body,
                                             FunctionMetadata metadata = {});

std::shared_ptr<const NativeFunction> makeNative(const std::string &name,
                                                 const std::vector<std::string> &params,
                                                 NativeFunc func,
                                                 bool variadic = false);

} // namespace tenda
