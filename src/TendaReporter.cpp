#include "TendaReporter.hpp"

#include <sstream>

namespace tenda {

static std::string kindList(const std::vector<ValueKind> &kinds)
{
    std::string out;
    for (size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0)
            out += i + 1 == kinds.size() ? " e " : ", ";
        out += std::string("'") + kindName(kinds[i]) + "'";
    }
    return out;
}

static std::string arityText(const Diagnostic &d)
{
    if (d.maxArity == d.minArity)
        return std::to_string(d.minArity);
    if (d.maxArity == static_cast<size_t>(-1))
        return "pelo menos " + std::to_string(d.minArity);
    return "de " + std::to_string(d.minArity) + " a " + std::to_string(d.maxArity);
}

std::string Reporter::describe(const Diagnostic &d)
{
    switch (d.kind) {
    case DiagnosticKind::AlreadyDeclared:
        return "a variável '" + d.name + "' já foi declarada neste escopo";
    case DiagnosticKind::UndefinedVariable:
        return "a variável '" + d.name + "' não está definida";
    case DiagnosticKind::TypeMismatch:
        if (d.operands.size() == 1)
            return "operação '" + d.operation + "' não é suportada para o tipo "
                   + kindList(d.operands);
        return "operação '" + d.operation + "' não é suportada entre os tipos "
               + kindList(d.operands);
    case DiagnosticKind::ArityMismatch:
        return "esperado " + arityText(d) + " argumento(s), recebido "
               + std::to_string(d.foundArity);
    case DiagnosticKind::DivisionByZero:
        return "divisão por zero";
    case DiagnosticKind::UserRaised:
        if (d.payload.isMap()) {
            auto *msg = d.payload.asMap().find(MapKey::fromText("mensagem"));
            if (msg)
                return msg->toString();
        }
        return d.payload.toString();
    case DiagnosticKind::StackOverflow:
        return "estouro de pilha: limite de " + std::to_string(d.length)
               + " chamadas aninhadas excedido";
    case DiagnosticKind::IndexOutOfBounds:
        return "índice " + d.payload.toString() + " fora dos limites (tamanho "
               + std::to_string(d.length) + ")";
    case DiagnosticKind::InvalidIndex:
        return "índice inválido " + d.payload.repr() + " do tipo " + kindList(d.operands);
    case DiagnosticKind::KeyNotFound:
        return "chave " + d.payload.repr() + " não encontrada";
    case DiagnosticKind::NotIterable:
        return "valor do tipo " + kindList(d.operands) + " não é iterável";
    case DiagnosticKind::InvalidRangeBound:
        return "limite de intervalo inválido: " + d.payload.toString()
               + " (esperado um número inteiro)";
    case DiagnosticKind::ImmutableBinding:
        return "'" + d.name + "' é embutida e não pode ser reatribuída";
    case DiagnosticKind::ModuleNotFound:
        return "módulo '" + d.name + "' não encontrado";
    case DiagnosticKind::ImportCycle:
        return "importação circular do módulo '" + d.name + "'";
    case DiagnosticKind::InvalidModule:
        return "erro de sintaxe no módulo '" + d.name + "' (linha " + std::to_string(d.origin.line)
               + ", coluna " + std::to_string(d.origin.col) + "): " + d.detail;
    }
    return "erro desconhecido";
}

std::string Reporter::excerpt(const std::string &source, int line, int col)
{
    if (line <= 0)
        return "";
    std::istringstream in(source);
    std::string text;
    for (int i = 0; i < line; ++i) {
        if (!std::getline(in, text))
            return "";
    }
    std::string gutter = std::to_string(line) + " | ";
    std::string out = gutter + text + "\n";
    out += std::string(gutter.size() + static_cast<size_t>(col > 0 ? col - 1 : 0), ' ') + "^\n";
    return out;
}

std::string Reporter::render(const Diagnostic &d,
                             const std::string &sourceName,
                             const std::string &source)
{
    std::ostringstream os;
    os << "erro [" << diagnosticKindName(d.kind) << "]: " << describe(d) << "\n";
    if (d.span.valid()) {
        os << "  --> " << sourceName << ":" << d.span.line << ":" << d.span.col << "\n";
        os << excerpt(source, d.span.line, d.span.col);
    }

    if (!d.trace.empty()) {
        os << "rastreamento (chamada mais recente primeiro):\n";
        size_t shown = 0;
        for (auto &entry : d.trace) {
            if (shown == MaxTraceEntries) {
                os << "  ... mais " << (d.trace.size() - shown) << " chamada(s)\n";
                break;
            }
            os << "  em " << entry.function;
            if (entry.span.valid())
                os << " (" << sourceName << ":" << entry.span.line << ":" << entry.span.col
                   << ")";
            os << "\n";
            ++shown;
        }
    }
    return os.str();
}

std::string Reporter::render(const SyntaxError &e,
                             const std::string &sourceName,
                             const std::string &source)
{
    std::ostringstream os;
    os << "erro de sintaxe: " << e.message() << "\n";
    os << "  --> " << sourceName << ":" << e.line() << ":" << e.col() << "\n";
    os << excerpt(source, e.line(), e.col());
    return os.str();
}

} // namespace tenda
