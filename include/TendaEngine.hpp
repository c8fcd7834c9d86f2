#pragma once

#include "TendaAst.hpp"
#include "TendaDiagnostic.hpp"
#include "TendaEnvironment.hpp"
#include "TendaFunction.hpp"
#include "TendaSignal.hpp"
#include "TendaStack.hpp"
#include "TendaValue.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenda {

// Host-side wrapper of an unrecovered Diagnostic (thrown by Engine::eval only)
class RuntimeError : public std::runtime_error
{
public:
    explicit RuntimeError(Diagnostic d);
    const Diagnostic &diagnostic() const { return diagnostic_; }

private:
    Diagnostic diagnostic_;
};

struct ExecutionResult
{
    bool ok = true;
    Value value;
    Diagnostic diagnostic;

    explicit operator bool() const { return ok; }
};

// Upper bound accepted by Engine::setMaxRecursionDepth
constexpr size_t MAX_RECURSION_DEPTH = 10000;
// Host stack an evaluation may use before calls fail with StackOverflow.
// Sized for the usual 8 MiB main-thread stack; lower it for smaller threads.
constexpr size_t DEFAULT_STACK_BUDGET = 4 * 1024 * 1024;

class Engine
{
public:
    Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(Engine &&) = delete;

    using OutputFunc = std::function<void(const std::string &)>;
    // Reads one line without the terminator; false at end of input
    using InputFunc = std::function<bool(std::string &line)>;
    // Fills source and returns true when the module exists
    using ModuleResolver = std::function<bool(const std::string &id, std::string &source)>;

    // Outermost, read-only scope shared by every module (see Prelude::install)
    void installPrelude(std::shared_ptr<const Environment> prelude);

    void registerFunction(const std::string &name,
                          const std::vector<std::string> &params,
                          NativeFunc func,
                          bool variadic = false);

    void setVariable(const std::string &name, Value val);
    const ValueCell *getVariable(const std::string &name) const;

    // Parse errors throw SyntaxError; runtime failures are reported in the result
    ExecutionResult run(const std::string &code);
    ExecutionResult run(std::shared_ptr<const ASTNode> program);

    // Like run(), but throws RuntimeError on failure
    Value eval(const std::string &code);

    // Call contract shared by interpreted and native callables
    EvalResult callValue(const Value &callee, std::vector<Value> args, SourceSpan span = {});

    void setOutputFunc(OutputFunc f);
    void output(const std::string &s);
    void setInputFunc(InputFunc f);
    bool input(std::string &line);

    // Clamped to [1, MAX_RECURSION_DEPTH]
    void setMaxRecursionDepth(int depth);
    size_t maxRecursionDepth() const { return maxRecursionDepth_; }
    void setStackBudget(size_t bytes) { stackBudget_ = bytes; }
    void setModuleResolver(ModuleResolver resolver);

    size_t stackDepth() const { return stack_->depth(); }

private:
    struct ModuleRecord
    {
        std::shared_ptr<Environment> scope;
        std::shared_ptr<const ASTNode> program;
        std::vector<std::string> exports;
        bool loading = false;
    };

    std::shared_ptr<const Environment> prelude_;
    std::shared_ptr<Environment> globals_;
    std::unique_ptr<Stack> mainStack_;
    Stack *stack_ = nullptr;
    // Tree that owns the nodes currently executing
    std::shared_ptr<const ASTNode> tree_;

    std::unordered_map<std::string, ModuleRecord> modules_;
    ModuleResolver moduleResolver_;

    OutputFunc outputFunc_;
    InputFunc inputFunc_;
    size_t maxRecursionDepth_ = 500;
    size_t stackBudget_ = DEFAULT_STACK_BUDGET;
    // Host stack address at the outermost call, 0 when idle
    uintptr_t stackBase_ = 0;

    // Restores a member on scope exit
    template<typename T>
    class Restore
    {
    public:
        Restore(T &slot, T value)
            : slot_(slot)
            , saved_(std::move(slot))
        {
            slot_ = std::move(value);
        }
        ~Restore() { slot_ = std::move(saved_); }

        Restore(const Restore &) = delete;
        Restore &operator=(const Restore &) = delete;

    private:
        T &slot_;
        T saved_;
    };

    // Statements
    ControlSignal execute(const ASTNode &node);
    ControlSignal executeStatements(const ASTNode &node);
    ControlSignal executeBlock(const ASTNode &node);
    ControlSignal execLet(const ASTNode &node);
    ControlSignal execFunctionDecl(const ASTNode &node);
    ControlSignal execIf(const ASTNode &node);
    ControlSignal execWhile(const ASTNode &node);
    ControlSignal execForEach(const ASTNode &node);
    ControlSignal execIteration(const ASTNode &node, Value item);
    ControlSignal execReturn(const ASTNode &node);
    ControlSignal execTry(const ASTNode &node);
    ControlSignal execRaise(const ASTNode &node);
    ControlSignal execImport(const ASTNode &node);
    ControlSignal execExpression(const ASTNode &node);

    // Expressions
    EvalResult evaluate(const ASTNode &node);
    EvalResult evalIdentifier(const ASTNode &node);
    EvalResult evalBinary(const ASTNode &node);
    EvalResult evalLogical(const ASTNode &node);
    EvalResult evalUnary(const ASTNode &node);
    EvalResult evalAssign(const ASTNode &node);
    EvalResult evalCall(const ASTNode &node);
    EvalResult evalIndex(const ASTNode &node);
    EvalResult evalList(const ASTNode &node);
    EvalResult evalMap(const ASTNode &node);

    EvalResult assignTo(const ASTNode &target, Value val);
    EvalResult declareBinding(const ASTNode &node, const std::string &name, Value val);

    // Функции
    std::shared_ptr<const Function> buildFunction(const ASTNode &node,
                                                  const std::string &name,
                                                  bool selfCaptured);
    EvalResult callFunction(const std::shared_ptr<const Function> &fn,
                            std::vector<Value> &args,
                            SourceSpan span);
    EvalResult callNative(const std::shared_ptr<const NativeFunction> &fn,
                          std::vector<Value> &args,
                          SourceSpan span);

    bool enterCall(uintptr_t here) const;

    // Модули
    EvalResult loadModule(const std::string &id, ModuleRecord *&record);
};

} // namespace tenda
