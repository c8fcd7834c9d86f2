// include/TendaDiagnostic.hpp
#pragma once

#include "TendaSpan.hpp"
#include "TendaValue.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tenda {

enum class DiagnosticKind {
    AlreadyDeclared,
    UndefinedVariable,
    TypeMismatch,
    ArityMismatch,
    DivisionByZero,
    UserRaised,
    StackOverflow,
    IndexOutOfBounds,
    InvalidIndex,
    KeyNotFound,
    NotIterable,
    InvalidRangeBound,
    ImmutableBinding,
    ModuleNotFound,
    ImportCycle,
    InvalidModule,
};

const char *diagnosticKindName(DiagnosticKind k);

struct TraceEntry
{
    std::string function;
    SourceSpan span;
};

// Structured runtime failure. Holds payload only, the Reporter formats it.
struct Diagnostic
{
    DiagnosticKind kind = DiagnosticKind::UserRaised;
    SourceSpan span;

    // AlreadyDeclared, UndefinedVariable, ImmutableBinding, module kinds
    std::string name;
    // TypeMismatch, NotIterable, InvalidIndex: operator or builtin
    std::string operation;
    std::vector<ValueKind> operands;
    // ArityMismatch; maxArity == npos means variadic
    size_t minArity = 0;
    size_t maxArity = 0;
    size_t foundArity = 0;
    // IndexOutOfBounds
    uint64_t length = 0;
    // UserRaised: raised value; KeyNotFound / index kinds: offending key
    Value payload;
    // InvalidModule: syntax error reason and its position inside the module
    std::string detail;
    SourceSpan origin;

    std::vector<TraceEntry> trace;

    bool isFatal() const { return kind == DiagnosticKind::StackOverflow; }

    static Diagnostic alreadyDeclared(const std::string &name);
    static Diagnostic undefinedVariable(const std::string &name);
    static Diagnostic immutableBinding(const std::string &name);
    static Diagnostic typeMismatch(const std::string &operation, std::vector<ValueKind> operands);
    static Diagnostic arityMismatch(size_t minArity, size_t maxArity, size_t found);
    static Diagnostic divisionByZero();
    static Diagnostic userRaised(Value payload);
    static Diagnostic stackOverflow(size_t depth);
    static Diagnostic indexOutOfBounds(Value index, uint64_t length);
    static Diagnostic invalidIndex(const std::string &operation, Value index);
    static Diagnostic keyNotFound(Value key);
    static Diagnostic notIterable(ValueKind kind);
    static Diagnostic invalidRangeBound(Value bound);
    static Diagnostic moduleNotFound(const std::string &module);
    static Diagnostic importCycle(const std::string &module);
    static Diagnostic invalidModule(const std::string &module, const std::string &reason, SourceSpan origin);

    Diagnostic &at(SourceSpan s)
    {
        if (!span.valid())
            span = s;
        return *this;
    }
};

} // namespace tenda
