#include "TendaOperators.hpp"

#include <cmath>

namespace tenda {

// ============================================================
// Вспомогательные функции
// ============================================================

static Diagnostic mismatch(Operator op, const Value &lhs, const Value &rhs)
{
    return Diagnostic::typeMismatch(operatorSymbol(op), {lhs.kind(), rhs.kind()});
}

size_t utf8Length(const std::string &s)
{
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

// Code point at the given position, as text
static std::string utf8At(const std::string &s, size_t index)
{
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
            continue;
        if (n == index) {
            size_t j = i + 1;
            while (j < s.size() && (static_cast<unsigned char>(s[j]) & 0xC0) == 0x80)
                ++j;
            return s.substr(i, j - i);
        }
        ++n;
    }
    return {};
}

static bool compareValues(Operator op, const Value &lhs, const Value &rhs, bool &result)
{
    int cmp;
    if (lhs.isNumber() && rhs.isNumber()) {
        double a = lhs.asNumber();
        double b = rhs.asNumber();
        switch (op) {
        case Operator::LT:
            result = a < b;
            return true;
        case Operator::LEQ:
            result = a <= b;
            return true;
        case Operator::GT:
            result = a > b;
            return true;
        default:
            result = a >= b;
            return true;
        }
    }
    if (lhs.isText() && rhs.isText())
        cmp = lhs.asText().compare(rhs.asText());
    else
        return false;

    switch (op) {
    case Operator::LT:
        result = cmp < 0;
        break;
    case Operator::LEQ:
        result = cmp <= 0;
        break;
    case Operator::GT:
        result = cmp > 0;
        break;
    default:
        result = cmp >= 0;
        break;
    }
    return true;
}

static EvalResult contains(Operator op, const Value &container, const Value &item)
{
    bool found = false;
    switch (container.kind()) {
    case ValueKind::List:
        for (auto &v : container.asList()) {
            if (v == item) {
                found = true;
                break;
            }
        }
        break;
    case ValueKind::Map: {
        MapKey key;
        found = MapKey::fromValue(item, key) && container.asMap().contains(key);
        break;
    }
    case ValueKind::Text:
        if (!item.isText())
            return mismatch(op, container, item);
        found = container.asText().find(item.asText()) != std::string::npos;
        break;
    case ValueKind::Range: {
        auto r = container.asRange();
        found = item.isInteger() && item.asNumber() >= static_cast<double>(r.start)
                && item.asNumber() <= static_cast<double>(r.end);
        break;
    }
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::Function:
    case ValueKind::Native:
        return mismatch(op, container, item);
    }
    return Value::boolean(op == Operator::HAS ? found : !found);
}

// ============================================================
// Бинарные операторы
// ============================================================

EvalResult applyBinary(Operator op, const Value &lhs, const Value &rhs)
{
    switch (op) {
    case Operator::ADD:
        if (lhs.isNumber() && rhs.isNumber())
            return Value::number(lhs.asNumber() + rhs.asNumber());
        if (lhs.isText() || rhs.isText())
            return Value::text(lhs.toString() + rhs.toString());
        if (lhs.isList() && rhs.isList()) {
            auto items = lhs.asList();
            items.insert(items.end(), rhs.asList().begin(), rhs.asList().end());
            return Value::list(std::move(items));
        }
        return mismatch(op, lhs, rhs);

    case Operator::SUB:
    case Operator::MUL:
    case Operator::DIV:
    case Operator::MOD:
    case Operator::POW: {
        if (!lhs.isNumber() || !rhs.isNumber())
            return mismatch(op, lhs, rhs);
        double a = lhs.asNumber();
        double b = rhs.asNumber();
        switch (op) {
        case Operator::SUB:
            return Value::number(a - b);
        case Operator::MUL:
            return Value::number(a * b);
        case Operator::DIV:
            if (b == 0.0)
                return Diagnostic::divisionByZero();
            return Value::number(a / b);
        case Operator::MOD:
            if (b == 0.0)
                return Diagnostic::divisionByZero();
            return Value::number(std::fmod(a, b));
        default:
            return Value::number(std::pow(a, b));
        }
    }

    case Operator::EQ:
        return Value::boolean(lhs == rhs);
    case Operator::NEQ:
        return Value::boolean(lhs != rhs);

    case Operator::LT:
    case Operator::LEQ:
    case Operator::GT:
    case Operator::GEQ: {
        bool result = false;
        if (!compareValues(op, lhs, rhs, result))
            return mismatch(op, lhs, rhs);
        return Value::boolean(result);
    }

    case Operator::RANGE:
        if (!lhs.isNumber() || !rhs.isNumber())
            return mismatch(op, lhs, rhs);
        if (!lhs.isInteger())
            return Diagnostic::invalidRangeBound(lhs);
        if (!rhs.isInteger())
            return Diagnostic::invalidRangeBound(rhs);
        return Value::range(static_cast<int64_t>(lhs.asNumber()),
                            static_cast<int64_t>(rhs.asNumber()));

    case Operator::HAS:
    case Operator::NOT_HAS:
        return contains(op, lhs, rhs);

    // short-circuit operators are evaluated by the engine
    case Operator::AND:
    case Operator::OR:
    case Operator::NONE:
    case Operator::NEG:
    case Operator::NOT:
        break;
    }
    return mismatch(op, lhs, rhs);
}

EvalResult applyUnary(Operator op, const Value &operand)
{
    switch (op) {
    case Operator::NEG:
        if (!operand.isNumber())
            return Diagnostic::typeMismatch(operatorSymbol(op), {operand.kind()});
        return Value::number(-operand.asNumber());
    case Operator::NOT:
        return Value::boolean(!operand.truthy());
    default:
        return Diagnostic::typeMismatch(operatorSymbol(op), {operand.kind()});
    }
}

// ============================================================
// Индексация
// ============================================================

// Valid list/text position, or a diagnostic
static bool checkPosition(const Value &key, uint64_t length, Diagnostic &err)
{
    if (!key.isInteger() || key.asNumber() < 0) {
        err = Diagnostic::invalidIndex("[]", key);
        return false;
    }
    if (key.asNumber() >= static_cast<double>(length)) {
        err = Diagnostic::indexOutOfBounds(key, length);
        return false;
    }
    return true;
}

EvalResult indexValue(const Value &obj, const Value &key)
{
    Diagnostic err;
    switch (obj.kind()) {
    case ValueKind::List: {
        auto &items = obj.asList();
        if (!checkPosition(key, items.size(), err))
            return err;
        return items[static_cast<size_t>(key.asNumber())];
    }
    case ValueKind::Text: {
        auto &s = obj.asText();
        if (!checkPosition(key, utf8Length(s), err))
            return err;
        return Value::text(utf8At(s, static_cast<size_t>(key.asNumber())));
    }
    case ValueKind::Range: {
        auto r = obj.asRange();
        if (!checkPosition(key, r.size(), err))
            return err;
        return Value::number(static_cast<double>(r.start) + key.asNumber());
    }
    case ValueKind::Map: {
        MapKey k;
        if (!MapKey::fromValue(key, k))
            return Diagnostic::invalidIndex("[]", key);
        auto *found = obj.asMap().find(k);
        if (!found)
            return Diagnostic::keyNotFound(key);
        return *found;
    }
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::Function:
    case ValueKind::Native:
        break;
    }
    return Diagnostic::typeMismatch("[]", {obj.kind(), key.kind()});
}

EvalResult storeIndex(Value &obj, const Value &key, Value val)
{
    Diagnostic err;
    switch (obj.kind()) {
    case ValueKind::List: {
        if (!checkPosition(key, obj.asList().size(), err))
            return err;
        obj.listMut()[static_cast<size_t>(key.asNumber())] = val;
        return val;
    }
    case ValueKind::Map: {
        MapKey k;
        if (!MapKey::fromValue(key, k))
            return Diagnostic::invalidIndex("[]", key);
        obj.mapMut().set(k, val);
        return val;
    }
    case ValueKind::Text:
    case ValueKind::Range:
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::Function:
    case ValueKind::Native:
        break;
    }
    return Diagnostic::typeMismatch("[]=", {obj.kind(), key.kind()});
}

bool iterationItems(const Value &v, std::vector<Value> &out)
{
    switch (v.kind()) {
    case ValueKind::List:
        out = v.asList();
        return true;
    case ValueKind::Map:
        out.clear();
        for (auto &entry : v.asMap())
            out.push_back(entry.first.toValue());
        return true;
    case ValueKind::Range:
    case ValueKind::Text:
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::Function:
    case ValueKind::Native:
        break;
    }
    return false;
}

} // namespace tenda
