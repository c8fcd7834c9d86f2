// include/TendaSignal.hpp
#pragma once

#include "TendaDiagnostic.hpp"
#include "TendaValue.hpp"

#include <memory>
#include <utility>

namespace tenda {

// Result of an expression: a Value or a Diagnostic (heap-allocated)
class EvalResult
{
public:
    EvalResult(Value v)
        : value_(std::move(v))
    {}
    EvalResult(Diagnostic d)
        : diagnostic_(std::make_unique<Diagnostic>(std::move(d)))
    {}

    EvalResult(const EvalResult &o)
        : value_(o.value_)
        , diagnostic_(o.diagnostic_ ? std::make_unique<Diagnostic>(*o.diagnostic_) : nullptr)
    {}
    EvalResult &operator=(const EvalResult &o)
    {
        if (this != &o) {
            value_ = o.value_;
            diagnostic_ = o.diagnostic_ ? std::make_unique<Diagnostic>(*o.diagnostic_) : nullptr;
        }
        return *this;
    }
    EvalResult(EvalResult &&) = default;
    EvalResult &operator=(EvalResult &&) = default;

    explicit operator bool() const { return !diagnostic_; }
    bool failed() const { return diagnostic_ != nullptr; }

    const Value &value() const { return value_; }
    Value &value() { return value_; }
    // Only valid when failed()
    const Diagnostic &diagnostic() const { return *diagnostic_; }
    Diagnostic &diagnostic() { return *diagnostic_; }

private:
    Value value_;
    std::unique_ptr<Diagnostic> diagnostic_;
};

// Outcome of a statement. Everything but Normal short-circuits the
// enclosing sequence.
struct ControlSignal
{
    enum class Kind { Normal, Return, Break, Continue, Raised };

    Kind kind = Kind::Normal;
    Value value;

    ControlSignal() = default;
    ControlSignal(const ControlSignal &o)
        : kind(o.kind)
        , value(o.value)
        , diagnostic_(o.diagnostic_ ? std::make_unique<Diagnostic>(*o.diagnostic_) : nullptr)
    {}
    ControlSignal &operator=(const ControlSignal &o)
    {
        if (this != &o) {
            kind = o.kind;
            value = o.value;
            diagnostic_ = o.diagnostic_ ? std::make_unique<Diagnostic>(*o.diagnostic_) : nullptr;
        }
        return *this;
    }
    ControlSignal(ControlSignal &&) = default;
    ControlSignal &operator=(ControlSignal &&) = default;

    static ControlSignal normal(Value v = Value())
    {
        ControlSignal s;
        s.value = std::move(v);
        return s;
    }
    static ControlSignal ret(Value v)
    {
        ControlSignal s;
        s.kind = Kind::Return;
        s.value = std::move(v);
        return s;
    }
    static ControlSignal brk()
    {
        ControlSignal s;
        s.kind = Kind::Break;
        return s;
    }
    static ControlSignal cont()
    {
        ControlSignal s;
        s.kind = Kind::Continue;
        return s;
    }
    static ControlSignal raised(Diagnostic d)
    {
        ControlSignal s;
        s.kind = Kind::Raised;
        s.diagnostic_ = std::make_unique<Diagnostic>(std::move(d));
        return s;
    }

    bool isNormal() const { return kind == Kind::Normal; }

    // Only valid when kind == Raised
    const Diagnostic &diagnostic() const { return *diagnostic_; }
    Diagnostic &diagnostic() { return *diagnostic_; }

private:
    std::unique_ptr<Diagnostic> diagnostic_;
};

} // namespace tenda
