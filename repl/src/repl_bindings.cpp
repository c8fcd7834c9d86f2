#include <emscripten/bind.h>
#include <memory>
#include <string>

#include "TendaEngine.hpp"
#include "TendaLexer.hpp"
#include "TendaPrelude.hpp"
#include "TendaReporter.hpp"

// ════════════════════════════════════════════════
// Сессия REPL
// ════════════════════════════════════════════════

class ReplSession {
public:
    ReplSession() { reset(); }

    std::string execute(const std::string& code) {
        output_.clear();
        std::string result;
        try {
            auto r = engine_->run(code);
            if (!r)
                result = tenda::Reporter::render(r.diagnostic, "<repl>", code);
            else if (!r.value.isNil())
                result = r.value.repr();
        } catch (const tenda::SyntaxError& e) {
            result = tenda::Reporter::render(e, "<repl>", code);
        }

        std::string all = output_;
        if (!result.empty()) {
            if (!all.empty() && all.back() != '\n') all += '\n';
            all += result;
        }
        while (!all.empty() && (all.back() == '\n' || all.back() == ' '))
            all.pop_back();
        return all;
    }

    void reset() {
        engine_ = std::make_unique<tenda::Engine>();
        tenda::Prelude::install(*engine_);
        engine_->setOutputFunc([this](const std::string& s) { output_ += s; });
    }

    std::string complete(const std::string& partial) {
        if (partial.empty()) return "";

        static const char* words[] = {
            // Palavras-chave
            "seja", "função", "se", "então", "senão", "fim", "enquanto",
            "faça", "para", "cada", "em", "retorna", "pare", "continue",
            "tente", "capture", "lance", "importe", "exporte",
            "verdadeiro", "falso", "Nada",
            // Prelúdio
            "exiba", "escreva", "leia", "entrada", "tipo", "texto", "número", "tamanho", "infinito", "NaN",
            "Saída", "Lista", "Texto", "Matemática", "Erro",
            nullptr
        };

        std::string result;
        for (int i = 0; words[i]; ++i) {
            std::string w = words[i];
            if (w.compare(0, partial.size(), partial) == 0) {
                if (!result.empty()) result += ',';
                result += w;
            }
        }
        return result;
    }

private:
    std::unique_ptr<tenda::Engine> engine_;
    std::string output_;
};

// ════════════════════════════════════════════════
// Глобальная сессия и экспортируемые функции
// ════════════════════════════════════════════════

static std::unique_ptr<ReplSession> g_session;

std::string repl_init() {
    g_session = std::make_unique<ReplSession>();
    return "Tenda\n"
           "Digite o código abaixo. Enter executa.\n"
           "Shift+Enter para várias linhas. Tab completa.\n";
}

std::string repl_execute(const std::string& input) {
    if (!g_session) repl_init();

    size_t start = input.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = input.find_last_not_of(" \t\n\r");
    std::string trimmed = input.substr(start, end - start + 1);

    if (trimmed == "limpe") return "__CLEAR__";

    return g_session->execute(trimmed);
}

std::string repl_complete(const std::string& partial) {
    if (!g_session) return "";
    return g_session->complete(partial);
}

std::string repl_reset() {
    if (g_session) g_session->reset();
    return "Sessão reiniciada.";
}

EMSCRIPTEN_BINDINGS(tenda_repl) {
    emscripten::function("repl_init",     &repl_init);
    emscripten::function("repl_execute",  &repl_execute);
    emscripten::function("repl_complete", &repl_complete);
    emscripten::function("repl_reset",    &repl_reset);
}
