// include/TendaCell.hpp
#pragma once

#include "TendaValue.hpp"

#include <memory>

namespace tenda {

// Storage slot of a binding.
// Owned: private value, copied on read, replaced wholesale on write.
// Shared: reference-counted slot; every copy of the cell aliases it, so a write
// through one holder is visible to all of them. Closures only ever capture
// Shared cells.
class ValueCell
{
public:
    ValueCell();

    static ValueCell owned(Value v);
    static ValueCell shared(Value v);

    bool isShared() const { return shared_ != nullptr; }

    Value read() const;
    void write(Value v);

    // Borrow without copying
    const Value &peek() const;

    // Same Shared slot (identity, not value equality)
    bool aliases(const ValueCell &o) const;

private:
    Value owned_;
    std::shared_ptr<Value> shared_;
};

} // namespace tenda
