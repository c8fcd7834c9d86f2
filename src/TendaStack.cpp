// src/TendaStack.cpp
#include "TendaStack.hpp"

#include <stdexcept>

namespace tenda {

// ============================================================
// StackFrame
// ============================================================
StackFrame StackFrame::block()
{
    return StackFrame();
}

StackFrame StackFrame::call(std::string calleeName,
                            Environment seed,
                            std::shared_ptr<Environment> moduleScope)
{
    StackFrame f;
    f.env = std::move(seed);
    f.kind = FrameKind::Call;
    f.calleeName = std::move(calleeName);
    f.moduleScope = std::move(moduleScope);
    return f;
}

// ============================================================
// Stack
// ============================================================
Stack::Stack(std::shared_ptr<Environment> globals, std::shared_ptr<const Environment> prelude)
    : globals_(std::move(globals))
    , prelude_(std::move(prelude))
{
    if (!globals_)
        globals_ = std::make_shared<Environment>();
    if (!prelude_)
        prelude_ = std::make_shared<const Environment>();
}

bool Stack::push(StackFrame frame)
{
    if (frame.kind == FrameKind::Call) {
        if (callDepth_ >= maxCallDepth_)
            return false;
        ++callDepth_;
    }
    frames_.push_back(std::move(frame));
    return true;
}

void Stack::pop()
{
    if (frames_.empty())
        throw std::logic_error("Stack::pop on empty stack");
    if (frames_.back().kind == FrameKind::Call)
        --callDepth_;
    frames_.pop_back();
}

Environment &Stack::innermost()
{
    return frames_.empty() ? *globals_ : frames_.back().env;
}

size_t Stack::boundary() const
{
    for (size_t i = frames_.size(); i-- > 0;) {
        if (frames_[i].kind == FrameKind::Call)
            return i;
    }
    return 0;
}

Environment &Stack::scopeBehind(size_t b) const
{
    if (b < frames_.size() && frames_[b].kind == FrameKind::Call && frames_[b].moduleScope)
        return *frames_[b].moduleScope;
    return *globals_;
}

bool Stack::declare(const std::string &name, ValueCell cell)
{
    return innermost().declare(name, std::move(cell));
}

const ValueCell *Stack::resolve(const std::string &name) const
{
    size_t b = boundary();
    for (size_t i = frames_.size(); i-- > b;) {
        if (auto *cell = frames_[i].env.lookup(name))
            return cell;
    }
    if (auto *cell = scopeBehind(b).lookup(name))
        return cell;
    return prelude_->lookup(name);
}

AssignStatus Stack::assign(const std::string &name, Value val)
{
    size_t b = boundary();
    for (size_t i = frames_.size(); i-- > b;) {
        if (frames_[i].env.assign(name, val))
            return AssignStatus::Ok;
    }
    if (scopeBehind(b).assign(name, std::move(val)))
        return AssignStatus::Ok;
    if (prelude_->has(name))
        return AssignStatus::Immutable;
    return AssignStatus::Undefined;
}

void Stack::forEachReachable(const std::function<void(const Environment &)> &fn) const
{
    size_t b = boundary();
    for (size_t i = frames_.size(); i-- > b;)
        fn(frames_[i].env);
}

std::shared_ptr<Environment> Stack::currentModuleScope() const
{
    size_t b = boundary();
    if (b < frames_.size() && frames_[b].kind == FrameKind::Call && frames_[b].moduleScope)
        return frames_[b].moduleScope;
    return globals_;
}

} // namespace tenda
