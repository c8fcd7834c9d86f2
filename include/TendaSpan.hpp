// include/TendaSpan.hpp
#pragma once

namespace tenda {

struct SourceSpan
{
    int line = 0;
    int col = 0;

    bool valid() const { return line > 0; }
};

} // namespace tenda
