// src/TendaEngine.cpp
#include "TendaEngine.hpp"
#include "TendaLexer.hpp"
#include "TendaOperators.hpp"
#include "TendaParser.hpp"
#include "TendaReporter.hpp"

#include <algorithm>
#include <iostream>

namespace tenda {

// ============================================================
// RuntimeError
// ============================================================
RuntimeError::RuntimeError(Diagnostic d)
    : std::runtime_error(Reporter::describe(d))
    , diagnostic_(std::move(d))
{}

// ============================================================
// Engine: конфигурация
// ============================================================
Engine::Engine()
    : prelude_(std::make_shared<const Environment>())
    , globals_(std::make_shared<Environment>())
{
    mainStack_ = std::make_unique<Stack>(globals_, prelude_);
    mainStack_->setMaxCallDepth(maxRecursionDepth_);
    stack_ = mainStack_.get();
}

void Engine::installPrelude(std::shared_ptr<const Environment> prelude)
{
    if (stack_->depth() != 0)
        throw std::logic_error("installPrelude during execution");
    prelude_ = std::move(prelude);
    mainStack_ = std::make_unique<Stack>(globals_, prelude_);
    mainStack_->setMaxCallDepth(maxRecursionDepth_);
    stack_ = mainStack_.get();
}

void Engine::registerFunction(const std::string &name,
                              const std::vector<std::string> &params,
                              NativeFunc func,
                              bool variadic)
{
    globals_->upsert(name,
                     ValueCell::owned(Value::native(makeNative(name, params, std::move(func), variadic))));
}

void Engine::setVariable(const std::string &name, Value val)
{
    // existing Shared cells keep their identity, closures see the new value
    if (!globals_->assign(name, val))
        globals_->upsert(name, ValueCell::owned(std::move(val)));
}

const ValueCell *Engine::getVariable(const std::string &name) const
{
    if (auto *cell = globals_->lookup(name))
        return cell;
    return prelude_->lookup(name);
}

void Engine::setOutputFunc(OutputFunc f)
{
    outputFunc_ = std::move(f);
}

void Engine::setInputFunc(InputFunc f)
{
    inputFunc_ = std::move(f);
}

void Engine::setMaxRecursionDepth(int depth)
{
    if (depth < 1)
        maxRecursionDepth_ = 1;
    else
        maxRecursionDepth_ = std::min(static_cast<size_t>(depth), MAX_RECURSION_DEPTH);
    mainStack_->setMaxCallDepth(maxRecursionDepth_);
}

void Engine::setModuleResolver(ModuleResolver resolver)
{
    moduleResolver_ = std::move(resolver);
}

// ============================================================
// Ввод / вывод
// ============================================================
void Engine::output(const std::string &s)
{
    if (outputFunc_)
        outputFunc_(s);
    else
        std::cout << s;
}

bool Engine::input(std::string &line)
{
    if (inputFunc_)
        return inputFunc_(line);
    std::cout.flush();
    return static_cast<bool>(std::getline(std::cin, line));
}

// ============================================================
// Точка входа
// ============================================================
ExecutionResult Engine::run(const std::string &code)
{
    Lexer lexer(code);
    Parser parser(lexer.tokenize());
    std::shared_ptr<const ASTNode> program = parser.parse();
    return run(std::move(program));
}

ExecutionResult Engine::run(std::shared_ptr<const ASTNode> program)
{
    ExecutionResult result;
    Restore<std::shared_ptr<const ASTNode>> tree(tree_, program);

    for (auto &stmt : program->children) {
        auto signal = execute(*stmt);
        switch (signal.kind) {
        case ControlSignal::Kind::Normal:
            result.value = std::move(signal.value);
            break;
        case ControlSignal::Kind::Return:
            result.value = std::move(signal.value);
            return result;
        case ControlSignal::Kind::Break:
        case ControlSignal::Kind::Continue:
            return result;
        case ControlSignal::Kind::Raised:
            result.ok = false;
            result.diagnostic = std::move(signal.diagnostic());
            return result;
        }
    }
    return result;
}

Value Engine::eval(const std::string &code)
{
    auto result = run(code);
    if (!result)
        throw RuntimeError(std::move(result.diagnostic));
    return std::move(result.value);
}

// ============================================================
// Statements
// ============================================================
ControlSignal Engine::execute(const ASTNode &node)
{
    switch (node.type) {
    case NodeType::PROGRAM:
        return executeStatements(node);
    case NodeType::BLOCK:
        return executeBlock(node);
    case NodeType::LET_DECL:
        return execLet(node);
    case NodeType::FUNCTION_DECL:
        return execFunctionDecl(node);
    case NodeType::IF_STMT:
        return execIf(node);
    case NodeType::WHILE_STMT:
        return execWhile(node);
    case NodeType::FOR_EACH_STMT:
        return execForEach(node);
    case NodeType::RETURN_STMT:
        return execReturn(node);
    case NodeType::BREAK_STMT:
        return ControlSignal::brk();
    case NodeType::CONTINUE_STMT:
        return ControlSignal::cont();
    case NodeType::TRY_STMT:
        return execTry(node);
    case NodeType::RAISE_STMT:
        return execRaise(node);
    case NodeType::IMPORT_STMT:
        return execImport(node);
    case NodeType::EXPR_STMT:
        return execExpression(*node.children[0]);
    case NodeType::NUMBER_LITERAL:
    case NodeType::STRING_LITERAL:
    case NodeType::BOOL_LITERAL:
    case NodeType::NIL_LITERAL:
    case NodeType::IDENTIFIER:
    case NodeType::BINARY_OP:
    case NodeType::LOGICAL_OP:
    case NodeType::UNARY_OP:
    case NodeType::ASSIGN:
    case NodeType::CALL:
    case NodeType::INDEX:
    case NodeType::LIST_LITERAL:
    case NodeType::MAP_LITERAL:
    case NodeType::ANON_FUNC:
        return execExpression(node);
    }
    throw std::logic_error("unknown node type");
}

ControlSignal Engine::execExpression(const ASTNode &node)
{
    auto r = evaluate(node);
    if (!r)
        return ControlSignal::raised(std::move(r.diagnostic()));
    return ControlSignal::normal(std::move(r.value()));
}

ControlSignal Engine::executeStatements(const ASTNode &node)
{
    Value last;
    for (auto &stmt : node.children) {
        auto signal = execute(*stmt);
        if (!signal.isNormal())
            return signal;
        last = std::move(signal.value);
    }
    return ControlSignal::normal(std::move(last));
}

ControlSignal Engine::executeBlock(const ASTNode &node)
{
    FrameGuard frame(*stack_, StackFrame::block());
    return executeStatements(node);
}

EvalResult Engine::declareBinding(const ASTNode &node, const std::string &name, Value val)
{
    auto cell = node.captured ? ValueCell::shared(std::move(val)) : ValueCell::owned(std::move(val));
    if (!stack_->declare(name, std::move(cell)))
        return Diagnostic::alreadyDeclared(name).at(node.span);
    return Value::nil();
}

ControlSignal Engine::execLet(const ASTNode &node)
{
    const ASTNode &init = *node.children[0];

    // seja f = função(...): the function can call itself as f
    EvalResult r = init.type == NodeType::ANON_FUNC
                       ? EvalResult(Value::function(buildFunction(init, node.strValue, node.captured)))
                       : evaluate(init);
    if (!r)
        return ControlSignal::raised(std::move(r.diagnostic()));

    auto declared = declareBinding(node, node.strValue, std::move(r.value()));
    if (!declared)
        return ControlSignal::raised(std::move(declared.diagnostic()));
    return ControlSignal::normal();
}

ControlSignal Engine::execFunctionDecl(const ASTNode &node)
{
    auto fn = buildFunction(node, node.strValue, node.captured);
    auto declared = declareBinding(node, node.strValue, Value::function(std::move(fn)));
    if (!declared)
        return ControlSignal::raised(std::move(declared.diagnostic()));
    return ControlSignal::normal();
}

ControlSignal Engine::execIf(const ASTNode &node)
{
    for (auto &[cond, body] : node.branches) {
        auto c = evaluate(*cond);
        if (!c)
            return ControlSignal::raised(std::move(c.diagnostic()));
        if (c.value().truthy())
            return executeBlock(*body);
    }
    if (node.elseBranch)
        return executeBlock(*node.elseBranch);
    return ControlSignal::normal();
}

ControlSignal Engine::execWhile(const ASTNode &node)
{
    while (true) {
        auto c = evaluate(*node.children[0]);
        if (!c)
            return ControlSignal::raised(std::move(c.diagnostic()));
        if (!c.value().truthy())
            break;

        auto signal = executeBlock(*node.children[1]);
        switch (signal.kind) {
        case ControlSignal::Kind::Break:
            return ControlSignal::normal();
        case ControlSignal::Kind::Return:
        case ControlSignal::Kind::Raised:
            return signal;
        case ControlSignal::Kind::Normal:
        case ControlSignal::Kind::Continue:
            break;
        }
    }
    return ControlSignal::normal();
}

// Break ends the loop normally, Return and Raised leave it
static bool endsLoop(ControlSignal &signal)
{
    switch (signal.kind) {
    case ControlSignal::Kind::Break:
        signal = ControlSignal::normal();
        return true;
    case ControlSignal::Kind::Return:
    case ControlSignal::Kind::Raised:
        return true;
    case ControlSignal::Kind::Normal:
    case ControlSignal::Kind::Continue:
        break;
    }
    return false;
}

ControlSignal Engine::execIteration(const ASTNode &node, Value item)
{
    // fresh binding per iteration: closures capture this iteration's item
    FrameGuard frame(*stack_, StackFrame::block());
    stack_->innermost().upsert(node.strValue,
                               node.captured ? ValueCell::shared(std::move(item))
                                             : ValueCell::owned(std::move(item)));
    return executeBlock(*node.children[1]);
}

ControlSignal Engine::execForEach(const ASTNode &node)
{
    auto iterable = evaluate(*node.children[0]);
    if (!iterable)
        return ControlSignal::raised(std::move(iterable.diagnostic()));

    if (iterable.value().isRange()) {
        // bounds are exact integers, so start + i never loses precision
        auto r = iterable.value().asRange();
        for (uint64_t i = 0, n = r.size(); i < n; ++i) {
            auto signal = execIteration(node, Value::number(static_cast<double>(r.start) + static_cast<double>(i)));
            if (endsLoop(signal))
                return signal;
        }
        return ControlSignal::normal();
    }

    std::vector<Value> items;
    if (!iterationItems(iterable.value(), items))
        return ControlSignal::raised(
            Diagnostic::notIterable(iterable.value().kind()).at(node.children[0]->span));

    for (auto &item : items) {
        auto signal = execIteration(node, std::move(item));
        if (endsLoop(signal))
            return signal;
    }
    return ControlSignal::normal();
}

ControlSignal Engine::execReturn(const ASTNode &node)
{
    if (node.children.empty())
        return ControlSignal::ret(Value::nil());
    auto r = evaluate(*node.children[0]);
    if (!r)
        return ControlSignal::raised(std::move(r.diagnostic()));
    return ControlSignal::ret(std::move(r.value()));
}

// Value bound to the "capture" name
static Value caughtValue(const Diagnostic &d)
{
    if (d.kind == DiagnosticKind::UserRaised)
        return d.payload;
    ValueMap err;
    err.set(MapKey::fromText("tipo"), Value::text(diagnosticKindName(d.kind)));
    err.set(MapKey::fromText("mensagem"), Value::text(Reporter::describe(d)));
    return Value::map(std::move(err));
}

ControlSignal Engine::execTry(const ASTNode &node)
{
    auto signal = executeBlock(*node.children[0]);
    if (signal.kind != ControlSignal::Kind::Raised || signal.diagnostic().isFatal())
        return signal;

    FrameGuard frame(*stack_, StackFrame::block());
    if (!node.strValue.empty()) {
        Value err = caughtValue(signal.diagnostic());
        stack_->innermost().upsert(node.strValue,
                                   node.captured ? ValueCell::shared(std::move(err))
                                                 : ValueCell::owned(std::move(err)));
    }
    return executeBlock(*node.children[1]);
}

ControlSignal Engine::execRaise(const ASTNode &node)
{
    auto r = evaluate(*node.children[0]);
    if (!r)
        return ControlSignal::raised(std::move(r.diagnostic()));
    return ControlSignal::raised(Diagnostic::userRaised(std::move(r.value())).at(node.span));
}

// ============================================================
// Модули
// ============================================================
ControlSignal Engine::execImport(const ASTNode &node)
{
    ModuleRecord *record = nullptr;
    auto loaded = loadModule(node.strValue, record);
    if (!loaded)
        return ControlSignal::raised(std::move(loaded.diagnostic().at(node.span)));

    // cells are copied as they are: Shared stays aliased with the module
    for (auto &name : record->exports) {
        auto *cell = record->scope->lookup(name);
        if (!cell)
            continue;
        if (!stack_->declare(name, *cell))
            return ControlSignal::raised(Diagnostic::alreadyDeclared(name).at(node.span));
    }
    return ControlSignal::normal();
}

EvalResult Engine::loadModule(const std::string &id, ModuleRecord *&record)
{
    auto it = modules_.find(id);
    if (it != modules_.end()) {
        if (it->second.loading)
            return Diagnostic::importCycle(id);
        record = &it->second;
        return Value::nil();
    }

    std::string source;
    if (!moduleResolver_ || !moduleResolver_(id, source))
        return Diagnostic::moduleNotFound(id);

    std::shared_ptr<const ASTNode> program;
    try {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        program = parser.parse();
    } catch (const SyntaxError &e) {
        return Diagnostic::invalidModule(id, e.message(), {e.line(), e.col()});
    }

    auto &rec = modules_[id];
    rec.scope = std::make_shared<Environment>();
    rec.program = program;
    rec.loading = true;

    Stack moduleStack(rec.scope, prelude_);
    moduleStack.setMaxCallDepth(maxRecursionDepth_);
    {
        Restore<Stack *> stack(stack_, &moduleStack);
        Restore<std::shared_ptr<const ASTNode>> tree(tree_, program);

        for (auto &stmt : program->children) {
            auto signal = execute(*stmt);
            if (signal.kind == ControlSignal::Kind::Raised) {
                auto d = std::move(signal.diagnostic());
                d.trace.push_back({"módulo " + id, {}});
                modules_.erase(id);
                return d;
            }
        }
    }

    for (auto &stmt : program->children) {
        if (stmt->exported)
            rec.exports.push_back(stmt->strValue);
    }
    rec.loading = false;
    record = &rec;
    return Value::nil();
}

// ============================================================
// Expressions
// ============================================================
EvalResult Engine::evaluate(const ASTNode &node)
{
    switch (node.type) {
    case NodeType::NUMBER_LITERAL:
        return Value::number(node.numValue);
    case NodeType::STRING_LITERAL:
        return Value::text(node.strValue);
    case NodeType::BOOL_LITERAL:
        return Value::boolean(node.boolValue);
    case NodeType::NIL_LITERAL:
        return Value::nil();
    case NodeType::IDENTIFIER:
        return evalIdentifier(node);
    case NodeType::BINARY_OP:
        return evalBinary(node);
    case NodeType::LOGICAL_OP:
        return evalLogical(node);
    case NodeType::UNARY_OP:
        return evalUnary(node);
    case NodeType::ASSIGN:
        return evalAssign(node);
    case NodeType::CALL:
        return evalCall(node);
    case NodeType::INDEX:
        return evalIndex(node);
    case NodeType::LIST_LITERAL:
        return evalList(node);
    case NodeType::MAP_LITERAL:
        return evalMap(node);
    case NodeType::ANON_FUNC:
        return Value::function(buildFunction(node, "", false));
    case NodeType::PROGRAM:
    case NodeType::BLOCK:
    case NodeType::LET_DECL:
    case NodeType::FUNCTION_DECL:
    case NodeType::IF_STMT:
    case NodeType::WHILE_STMT:
    case NodeType::FOR_EACH_STMT:
    case NodeType::RETURN_STMT:
    case NodeType::BREAK_STMT:
    case NodeType::CONTINUE_STMT:
    case NodeType::TRY_STMT:
    case NodeType::RAISE_STMT:
    case NodeType::IMPORT_STMT:
    case NodeType::EXPR_STMT:
        break;
    }
    throw std::logic_error("statement node in expression position");
}

EvalResult Engine::evalIdentifier(const ASTNode &node)
{
    auto *cell = stack_->resolve(node.strValue);
    if (!cell)
        return Diagnostic::undefinedVariable(node.strValue).at(node.span);
    return cell->read();
}

EvalResult Engine::evalBinary(const ASTNode &node)
{
    auto lhs = evaluate(*node.children[0]);
    if (!lhs)
        return lhs;
    auto rhs = evaluate(*node.children[1]);
    if (!rhs)
        return rhs;
    auto r = applyBinary(node.op, lhs.value(), rhs.value());
    if (!r)
        r.diagnostic().at(node.span);
    return r;
}

EvalResult Engine::evalLogical(const ASTNode &node)
{
    auto lhs = evaluate(*node.children[0]);
    if (!lhs)
        return lhs;
    bool decided = node.op == Operator::OR ? lhs.value().truthy() : !lhs.value().truthy();
    if (decided)
        return lhs;
    return evaluate(*node.children[1]);
}

EvalResult Engine::evalUnary(const ASTNode &node)
{
    auto operand = evaluate(*node.children[0]);
    if (!operand)
        return operand;
    auto r = applyUnary(node.op, operand.value());
    if (!r)
        r.diagnostic().at(node.span);
    return r;
}

EvalResult Engine::evalAssign(const ASTNode &node)
{
    auto val = evaluate(*node.children[1]);
    if (!val)
        return val;
    return assignTo(*node.children[0], std::move(val.value()));
}

EvalResult Engine::assignTo(const ASTNode &target, Value val)
{
    if (target.type == NodeType::IDENTIFIER) {
        switch (stack_->assign(target.strValue, val)) {
        case AssignStatus::Ok:
            return val;
        case AssignStatus::Undefined:
            return Diagnostic::undefinedVariable(target.strValue).at(target.span);
        case AssignStatus::Immutable:
            return Diagnostic::immutableBinding(target.strValue).at(target.span);
        }
    }

    // a[i][j] = v: chain[0] is the outermost access
    std::vector<const ASTNode *> chain;
    const ASTNode *root = &target;
    while (root->type == NodeType::INDEX) {
        chain.push_back(root);
        root = root->children[0].get();
    }

    auto base = evaluate(*root);
    if (!base)
        return base;

    std::vector<Value> keys;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        auto key = evaluate(*(*it)->children[1]);
        if (!key)
            return key;
        keys.push_back(std::move(key.value()));
    }

    // containers[k] is indexed by keys[k]; chain.rbegin() is the innermost access
    std::vector<Value> containers;
    containers.push_back(std::move(base.value()));
    for (size_t k = 0; k + 1 < keys.size(); ++k) {
        auto next = indexValue(containers[k], keys[k]);
        if (!next)
            return next.diagnostic().at(chain[chain.size() - 1 - k]->span);
        containers.push_back(std::move(next.value()));
    }

    Value current = val;
    for (size_t k = keys.size(); k-- > 0;) {
        auto stored = storeIndex(containers[k], keys[k], std::move(current));
        if (!stored)
            return stored.diagnostic().at(chain[chain.size() - 1 - k]->span);
        current = std::move(containers[k]);
    }

    if (root->type == NodeType::IDENTIFIER) {
        auto written = assignTo(*root, std::move(current));
        if (!written)
            return written;
    }
    return val;
}

EvalResult Engine::evalCall(const ASTNode &node)
{
    auto callee = evaluate(*node.children[0]);
    if (!callee)
        return callee;

    std::vector<Value> args;
    args.reserve(node.children.size() - 1);
    for (size_t i = 1; i < node.children.size(); ++i) {
        auto arg = evaluate(*node.children[i]);
        if (!arg)
            return arg;
        args.push_back(std::move(arg.value()));
    }
    return callValue(callee.value(), std::move(args), node.span);
}

EvalResult Engine::evalIndex(const ASTNode &node)
{
    auto obj = evaluate(*node.children[0]);
    if (!obj)
        return obj;
    auto key = evaluate(*node.children[1]);
    if (!key)
        return key;
    auto r = indexValue(obj.value(), key.value());
    if (!r)
        r.diagnostic().at(node.span);
    return r;
}

EvalResult Engine::evalList(const ASTNode &node)
{
    std::vector<Value> items;
    items.reserve(node.children.size());
    for (auto &child : node.children) {
        auto item = evaluate(*child);
        if (!item)
            return item;
        items.push_back(std::move(item.value()));
    }
    return Value::list(std::move(items));
}

EvalResult Engine::evalMap(const ASTNode &node)
{
    ValueMap entries;
    for (auto &[keyNode, valueNode] : node.branches) {
        auto key = evaluate(*keyNode);
        if (!key)
            return key;
        MapKey k;
        if (!MapKey::fromValue(key.value(), k))
            return Diagnostic::invalidIndex("{}", key.value()).at(keyNode->span);
        auto val = evaluate(*valueNode);
        if (!val)
            return val;
        entries.set(k, std::move(val.value()));
    }
    return Value::map(std::move(entries));
}

// ============================================================
// Функции
// ============================================================
std::shared_ptr<const Function> Engine::buildFunction(const ASTNode &node,
                                                     const std::string &name,
                                                     bool selfCaptured)
{
    std::vector<FunctionParam> params;
    params.reserve(node.params.size());
    for (auto &decl : node.params) {
        FunctionParam p;
        p.name = decl.name;
        p.captured = decl.captured;
        p.optional = decl.defaultValue != nullptr;
        p.defaultValue = decl.defaultValue.get();
        params.push_back(std::move(p));
    }

    FunctionMetadata meta;
    meta.selfName = name;
    meta.selfCaptured = selfCaptured;
    meta.displayName = name;
    meta.span = node.span;

    // aliasing pointer: keeps the whole tree alive as long as the closure
    std::shared_ptr<const ASTNode> body(tree_, node.children[0].get());
    return makeFunction(*stack_, std::move(params), std::move(body), std::move(meta));
}

// Address inside the caller's host stack frame
static uintptr_t hostStackPointer()
{
#if (defined(__GNUC__) || defined(__clang__)) && !defined(__EMSCRIPTEN__)
    // the real frame, also under sanitizers that move locals off the stack
    return reinterpret_cast<uintptr_t>(__builtin_frame_address(0));
#else
    volatile char marker = 0;
    return reinterpret_cast<uintptr_t>(&marker);
#endif
}

// false when the host stack used since the outermost call is over budget
bool Engine::enterCall(uintptr_t here) const
{
    size_t used = stackBase_ > here ? stackBase_ - here : here - stackBase_;
    return used <= stackBudget_;
}

EvalResult Engine::callValue(const Value &callee, std::vector<Value> args, SourceSpan span)
{
    switch (callee.kind()) {
    case ValueKind::Function:
        return callFunction(callee.asFunction(), args, span);
    case ValueKind::Native:
        return callNative(callee.asNative(), args, span);
    case ValueKind::Number:
    case ValueKind::Text:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::List:
    case ValueKind::Map:
    case ValueKind::Range:
        break;
    }
    return Diagnostic::typeMismatch("chamada", {callee.kind()}).at(span);
}

EvalResult Engine::callFunction(const std::shared_ptr<const Function> &fn,
                                std::vector<Value> &args,
                                SourceSpan span)
{
    size_t lo = requiredArity(fn->params);
    size_t hi = maximumArity(fn->params);
    if (args.size() < lo || args.size() > hi)
        return Diagnostic::arityMismatch(lo, hi, args.size()).at(span);

    const std::string name = fn->displayName.empty() ? "função anônima" : fn->displayName;

    uintptr_t here = hostStackPointer();
    Restore<uintptr_t> base(stackBase_, stackBase_ ? stackBase_ : here);
    if (!enterCall(here))
        return Diagnostic::stackOverflow(stack_->callDepth()).at(span);

    FrameGuard frame(*stack_, StackFrame::call(name, fn->captured, fn->moduleScope.lock()));
    if (!frame.active())
        return Diagnostic::stackOverflow(stack_->maxCallDepth()).at(span);
    Restore<std::shared_ptr<const ASTNode>> tree(tree_, fn->body);

    Environment &env = stack_->innermost();
    // bound before the parameters, so a parameter of the same name wins
    if (!fn->selfName.empty())
        env.upsert(fn->selfName,
                   fn->selfCaptured ? ValueCell::shared(Value::function(fn))
                                    : ValueCell::owned(Value::function(fn)));

    for (size_t i = 0; i < fn->params.size(); ++i) {
        auto &p = fn->params[i];
        Value v;
        if (i < args.size()) {
            v = std::move(args[i]);
        } else if (p.defaultValue) {
            // evaluated in the call frame: earlier parameters are visible
            auto d = evaluate(*p.defaultValue);
            if (!d) {
                d.diagnostic().trace.push_back({name, span});
                return d;
            }
            v = std::move(d.value());
        }
        env.upsert(p.name, p.captured ? ValueCell::shared(std::move(v)) : ValueCell::owned(std::move(v)));
    }

    auto signal = executeBlock(*fn->body);
    switch (signal.kind) {
    case ControlSignal::Kind::Return:
        return std::move(signal.value);
    case ControlSignal::Kind::Raised:
        signal.diagnostic().trace.push_back({name, span});
        return std::move(signal.diagnostic());
    case ControlSignal::Kind::Normal:
    case ControlSignal::Kind::Break:
    case ControlSignal::Kind::Continue:
        break;
    }
    return Value::nil();
}

EvalResult Engine::callNative(const std::shared_ptr<const NativeFunction> &fn,
                              std::vector<Value> &args,
                              SourceSpan span)
{
    size_t lo = requiredArity(fn->params);
    size_t hi = maximumArity(fn->params);
    if (args.size() < lo || args.size() > hi)
        return Diagnostic::arityMismatch(lo, hi, args.size()).at(span);

    uintptr_t here = hostStackPointer();
    Restore<uintptr_t> base(stackBase_, stackBase_ ? stackBase_ : here);
    if (!enterCall(here))
        return Diagnostic::stackOverflow(stack_->callDepth()).at(span);

    FrameGuard frame(*stack_, StackFrame::call(fn->name, Environment(), stack_->currentModuleScope()));
    if (!frame.active())
        return Diagnostic::stackOverflow(stack_->maxCallDepth()).at(span);

    auto r = fn->func(*this, args);
    if (!r)
        r.diagnostic().at(span);
    return r;
}

} // namespace tenda
