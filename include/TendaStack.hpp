// include/TendaStack.hpp
#pragma once

#include "TendaEnvironment.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace tenda {

enum class FrameKind { Block, Call };

struct StackFrame
{
    Environment env;
    FrameKind kind = FrameKind::Block;
    // Call frames only
    std::string calleeName;
    std::shared_ptr<Environment> moduleScope;

    static StackFrame block();
    static StackFrame call(std::string calleeName,
                           Environment seed,
                           std::shared_ptr<Environment> moduleScope);
};

enum class AssignStatus { Ok, Undefined, Immutable };

class Stack
{
public:
    Stack(std::shared_ptr<Environment> globals, std::shared_ptr<const Environment> prelude);

    Stack(const Stack &) = delete;
    Stack &operator=(const Stack &) = delete;

    // false when a call frame would exceed the call-depth ceiling
    bool push(StackFrame frame);
    void pop();

    size_t depth() const { return frames_.size(); }
    size_t callDepth() const { return callDepth_; }

    void setMaxCallDepth(size_t depth) { maxCallDepth_ = depth; }
    size_t maxCallDepth() const { return maxCallDepth_; }

    // Innermost environment: top frame, or the module globals when empty
    Environment &innermost();

    bool declare(const std::string &name, ValueCell cell);
    AssignStatus assign(const std::string &name, Value val);
    const ValueCell *resolve(const std::string &name) const;

    // Environments visible without crossing a call boundary, innermost first.
    // The module scope and prelude are not included.
    void forEachReachable(const std::function<void(const Environment &)> &fn) const;

    // Module scope of the code currently running
    std::shared_ptr<Environment> currentModuleScope() const;

    const std::shared_ptr<Environment> &globals() const { return globals_; }
    const std::shared_ptr<const Environment> &prelude() const { return prelude_; }

private:
    std::shared_ptr<Environment> globals_;
    std::shared_ptr<const Environment> prelude_;
    std::deque<StackFrame> frames_;
    size_t callDepth_ = 0;
    size_t maxCallDepth_ = 500;

    // Index of the nearest call frame, or 0 when running at module level
    size_t boundary() const;
    Environment &scopeBehind(size_t boundary) const;
};

// Scoped frame activation: pops on every exit path.
class FrameGuard
{
public:
    FrameGuard(Stack &stack, StackFrame frame)
        : stack_(stack)
        , active_(stack.push(std::move(frame)))
    {}
    ~FrameGuard()
    {
        if (active_)
            stack_.pop();
    }

    FrameGuard(const FrameGuard &) = delete;
    FrameGuard &operator=(const FrameGuard &) = delete;

    // false when the push was refused (call-depth ceiling)
    bool active() const { return active_; }

private:
    Stack &stack_;
    bool active_;
};

} // namespace tenda
