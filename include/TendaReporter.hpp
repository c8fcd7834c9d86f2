#pragma once

#include "TendaDiagnostic.hpp"
#include "TendaLexer.hpp"

#include <cstddef>
#include <string>

namespace tenda {

// Renders diagnostics as user-facing text
class Reporter
{
public:
    // One-line message, without location
    static std::string describe(const Diagnostic &d);

    // Message, location, source excerpt with a caret, traceback
    static std::string render(const Diagnostic &d,
                              const std::string &sourceName,
                              const std::string &source);

    static std::string render(const SyntaxError &e,
                              const std::string &sourceName,
                              const std::string &source);

    // Traceback entries shown at most; the rest are summarized
    static constexpr size_t MaxTraceEntries = 16;

private:
    static std::string excerpt(const std::string &source, int line, int col);
};

} // namespace tenda
