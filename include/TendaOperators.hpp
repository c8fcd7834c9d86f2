#pragma once

#include "TendaAst.hpp"
#include "TendaSignal.hpp"
#include "TendaValue.hpp"

#include <string>
#include <vector>

namespace tenda {

// Operator semantics. Failures come back as diagnostics without a span.
EvalResult applyBinary(Operator op, const Value &lhs, const Value &rhs);
EvalResult applyUnary(Operator op, const Value &operand);

// obj[key] / obj.key
EvalResult indexValue(const Value &obj, const Value &key);
// obj[key] = val, detaching obj if its payload is shared. Returns the stored value.
EvalResult storeIndex(Value &obj, const Value &key, Value val);

// Elements of a list (its items) or a map (its keys) visited by "para cada".
// False for anything else; ranges are walked without materializing them.
bool iterationItems(const Value &v, std::vector<Value> &out);

// Number of UTF-8 code points
size_t utf8Length(const std::string &s);

} // namespace tenda
