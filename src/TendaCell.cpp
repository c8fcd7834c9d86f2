// src/TendaCell.cpp
#include "TendaCell.hpp"

namespace tenda {

ValueCell::ValueCell() = default;

ValueCell ValueCell::owned(Value v)
{
    ValueCell c;
    c.owned_ = std::move(v);
    return c;
}

ValueCell ValueCell::shared(Value v)
{
    ValueCell c;
    c.shared_ = std::make_shared<Value>(std::move(v));
    return c;
}

Value ValueCell::read() const
{
    return shared_ ? *shared_ : owned_;
}

void ValueCell::write(Value v)
{
    if (shared_)
        *shared_ = std::move(v);
    else
        owned_ = std::move(v);
}

const Value &ValueCell::peek() const
{
    return shared_ ? *shared_ : owned_;
}

bool ValueCell::aliases(const ValueCell &o) const
{
    return shared_ && shared_ == o.shared_;
}

} // namespace tenda
