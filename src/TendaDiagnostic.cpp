// src/TendaDiagnostic.cpp
#include "TendaDiagnostic.hpp"

namespace tenda {

const char *diagnosticKindName(DiagnosticKind k)
{
    switch (k) {
    case DiagnosticKind::AlreadyDeclared:
        return "JáDeclarada";
    case DiagnosticKind::UndefinedVariable:
        return "VariávelNãoDefinida";
    case DiagnosticKind::TypeMismatch:
        return "TiposIncompatíveis";
    case DiagnosticKind::ArityMismatch:
        return "NúmeroDeArgumentos";
    case DiagnosticKind::DivisionByZero:
        return "DivisãoPorZero";
    case DiagnosticKind::UserRaised:
        return "ErroDoUsuário";
    case DiagnosticKind::StackOverflow:
        return "EstouroDePilha";
    case DiagnosticKind::IndexOutOfBounds:
        return "ÍndiceForaDosLimites";
    case DiagnosticKind::InvalidIndex:
        return "ÍndiceInválido";
    case DiagnosticKind::KeyNotFound:
        return "ChaveNãoEncontrada";
    case DiagnosticKind::NotIterable:
        return "NãoIterável";
    case DiagnosticKind::InvalidRangeBound:
        return "LimiteDeIntervaloInválido";
    case DiagnosticKind::ImmutableBinding:
        return "VariávelImutável";
    case DiagnosticKind::ModuleNotFound:
        return "MóduloNãoEncontrado";
    case DiagnosticKind::ImportCycle:
        return "ImportaçãoCircular";
    case DiagnosticKind::InvalidModule:
        return "MóduloInválido";
    }
    return "Erro";
}

// ============================================================
// Фабрики
// ============================================================

static Diagnostic make(DiagnosticKind k)
{
    Diagnostic d;
    d.kind = k;
    return d;
}

Diagnostic Diagnostic::alreadyDeclared(const std::string &name)
{
    auto d = make(DiagnosticKind::AlreadyDeclared);
    d.name = name;
    return d;
}

Diagnostic Diagnostic::undefinedVariable(const std::string &name)
{
    auto d = make(DiagnosticKind::UndefinedVariable);
    d.name = name;
    return d;
}

Diagnostic Diagnostic::immutableBinding(const std::string &name)
{
    auto d = make(DiagnosticKind::ImmutableBinding);
    d.name = name;
    return d;
}

Diagnostic Diagnostic::typeMismatch(const std::string &operation, std::vector<ValueKind> operands)
{
    auto d = make(DiagnosticKind::TypeMismatch);
    d.operation = operation;
    d.operands = std::move(operands);
    return d;
}

Diagnostic Diagnostic::arityMismatch(size_t minArity, size_t maxArity, size_t found)
{
    auto d = make(DiagnosticKind::ArityMismatch);
    d.minArity = minArity;
    d.maxArity = maxArity;
    d.foundArity = found;
    return d;
}

Diagnostic Diagnostic::divisionByZero()
{
    return make(DiagnosticKind::DivisionByZero);
}

Diagnostic Diagnostic::userRaised(Value payload)
{
    auto d = make(DiagnosticKind::UserRaised);
    d.payload = std::move(payload);
    return d;
}

Diagnostic Diagnostic::stackOverflow(size_t depth)
{
    auto d = make(DiagnosticKind::StackOverflow);
    d.length = depth;
    return d;
}

Diagnostic Diagnostic::indexOutOfBounds(Value index, uint64_t length)
{
    auto d = make(DiagnosticKind::IndexOutOfBounds);
    d.payload = std::move(index);
    d.length = length;
    return d;
}

Diagnostic Diagnostic::invalidIndex(const std::string &operation, Value index)
{
    auto d = make(DiagnosticKind::InvalidIndex);
    d.operation = operation;
    d.operands = {index.kind()};
    d.payload = std::move(index);
    return d;
}

Diagnostic Diagnostic::keyNotFound(Value key)
{
    auto d = make(DiagnosticKind::KeyNotFound);
    d.payload = std::move(key);
    return d;
}

Diagnostic Diagnostic::notIterable(ValueKind kind)
{
    auto d = make(DiagnosticKind::NotIterable);
    d.operands = {kind};
    return d;
}

Diagnostic Diagnostic::invalidRangeBound(Value bound)
{
    auto d = make(DiagnosticKind::InvalidRangeBound);
    d.payload = std::move(bound);
    return d;
}

Diagnostic Diagnostic::moduleNotFound(const std::string &module)
{
    auto d = make(DiagnosticKind::ModuleNotFound);
    d.name = module;
    return d;
}

Diagnostic Diagnostic::importCycle(const std::string &module)
{
    auto d = make(DiagnosticKind::ImportCycle);
    d.name = module;
    return d;
}

Diagnostic Diagnostic::invalidModule(const std::string &module, const std::string &reason, SourceSpan origin)
{
    auto d = make(DiagnosticKind::InvalidModule);
    d.name = module;
    d.detail = reason;
    d.origin = origin;
    return d;
}

} // namespace tenda
