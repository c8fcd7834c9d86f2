// src/TendaValue.cpp
#include "TendaValue.hpp"
#include "TendaFunction.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tenda {

// ============================================================
// ValueKind helpers
// ============================================================
const char *kindName(ValueKind k)
{
    switch (k) {
    case ValueKind::Number:
        return "número";
    case ValueKind::Text:
        return "texto";
    case ValueKind::Boolean:
        return "lógico";
    case ValueKind::Nil:
        return "Nada";
    case ValueKind::List:
        return "lista";
    case ValueKind::Map:
        return "dicionário";
    case ValueKind::Range:
        return "intervalo";
    case ValueKind::Function:
    case ValueKind::Native:
        return "função";
    }
    return "desconhecido";
}

std::string formatNumber(double v)
{
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v > 0 ? "infinito" : "-infinito";
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", v);
        // -0 печатается как 0
        return std::string(buf) == "-0" ? "0" : buf;
    }
    // Кратчайшее представление, которое читается обратно в то же число
    char buf[40];
    for (int prec = 1; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
        if (std::strtod(buf, nullptr) == v)
            break;
    }
    return buf;
}

// ============================================================
// Value: фабрики
// ============================================================
Value::Value() = default;

Value Value::number(double v)
{
    Value r;
    r.kind_ = ValueKind::Number;
    r.number_ = v;
    return r;
}

Value Value::boolean(bool v)
{
    Value r;
    r.kind_ = ValueKind::Boolean;
    r.boolean_ = v;
    return r;
}

Value Value::text(std::string s)
{
    Value r;
    r.kind_ = ValueKind::Text;
    r.text_ = std::move(s);
    return r;
}

Value Value::nil()
{
    return Value();
}

Value Value::list(std::vector<Value> items)
{
    Value r;
    r.kind_ = ValueKind::List;
    r.list_ = std::make_shared<std::vector<Value>>(std::move(items));
    return r;
}

Value Value::map(ValueMap entries)
{
    Value r;
    r.kind_ = ValueKind::Map;
    r.map_ = std::make_shared<ValueMap>(std::move(entries));
    return r;
}

Value Value::range(int64_t start, int64_t end)
{
    Value r;
    r.kind_ = ValueKind::Range;
    r.range_ = {start, end};
    return r;
}

Value Value::function(std::shared_ptr<const Function> fn)
{
    Value r;
    r.kind_ = ValueKind::Function;
    r.function_ = std::move(fn);
    return r;
}

Value Value::native(std::shared_ptr<const NativeFunction> fn)
{
    Value r;
    r.kind_ = ValueKind::Native;
    r.native_ = std::move(fn);
    return r;
}

// ============================================================
// Value: доступ
// ============================================================
bool Value::isInteger() const
{
    return kind_ == ValueKind::Number && std::isfinite(number_)
           && number_ == std::floor(number_) && std::fabs(number_) <= MAX_EXACT_INTEGER;
}

const std::vector<Value> &Value::asList() const
{
    static const std::vector<Value> empty;
    return list_ ? *list_ : empty;
}

const ValueMap &Value::asMap() const
{
    static const ValueMap empty;
    return map_ ? *map_ : empty;
}

std::vector<Value> &Value::listMut()
{
    if (!list_)
        list_ = std::make_shared<std::vector<Value>>();
    else if (list_.use_count() > 1)
        list_ = std::make_shared<std::vector<Value>>(*list_);
    return *list_;
}

ValueMap &Value::mapMut()
{
    if (!map_)
        map_ = std::make_shared<ValueMap>();
    else if (map_.use_count() > 1)
        map_ = std::make_shared<ValueMap>(*map_);
    return *map_;
}

bool Value::truthy() const
{
    switch (kind_) {
    case ValueKind::Number:
        return number_ != 0.0;
    case ValueKind::Boolean:
        return boolean_;
    case ValueKind::Nil:
        return false;
    case ValueKind::Text:
    case ValueKind::List:
    case ValueKind::Map:
    case ValueKind::Range:
    case ValueKind::Function:
    case ValueKind::Native:
        return true;
    }
    return true;
}

// ============================================================
// Value: отображение
// ============================================================
std::string Value::toString() const
{
    switch (kind_) {
    case ValueKind::Number:
        return formatNumber(number_);
    case ValueKind::Text:
        return text_;
    case ValueKind::Boolean:
        return boolean_ ? "verdadeiro" : "falso";
    case ValueKind::Nil:
        return "Nada";
    case ValueKind::List: {
        std::string out = "[";
        bool first = true;
        for (auto &item : asList()) {
            if (!first)
                out += ", ";
            out += item.repr();
            first = false;
        }
        return out + "]";
    }
    case ValueKind::Map: {
        std::string out = "{";
        bool first = true;
        for (auto &[key, val] : asMap()) {
            if (!first)
                out += ", ";
            out += key.repr() + ": " + val.repr();
            first = false;
        }
        return out + "}";
    }
    case ValueKind::Range:
        return std::to_string(range_.start) + " até " + std::to_string(range_.end);
    case ValueKind::Function:
        if (function_ && !function_->displayName.empty())
            return "<função " + function_->displayName + ">";
        return "<função anônima>";
    case ValueKind::Native:
        return "<função nativa " + (native_ ? native_->name : std::string()) + ">";
    }
    return "";
}

std::string Value::repr() const
{
    if (kind_ != ValueKind::Text)
        return toString();
    std::string out = "\"";
    for (char c : text_) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out + "\"";
}

bool Value::operator==(const Value &o) const
{
    if (kind_ != o.kind_)
        return false;
    switch (kind_) {
    case ValueKind::Number:
        return number_ == o.number_;
    case ValueKind::Text:
        return text_ == o.text_;
    case ValueKind::Boolean:
        return boolean_ == o.boolean_;
    case ValueKind::Nil:
        return true;
    case ValueKind::List:
        return list_ == o.list_ || asList() == o.asList();
    case ValueKind::Map:
        return map_ == o.map_ || asMap() == o.asMap();
    case ValueKind::Range:
        return range_.start == o.range_.start && range_.end == o.range_.end;
    case ValueKind::Function:
        return function_ == o.function_;
    case ValueKind::Native:
        return native_ == o.native_;
    }
    return false;
}

// ============================================================
// MapKey
// ============================================================
MapKey MapKey::fromText(std::string s)
{
    MapKey k;
    k.isText = true;
    k.text = std::move(s);
    return k;
}

MapKey MapKey::fromInteger(int64_t n)
{
    MapKey k;
    k.isText = false;
    k.number = n;
    return k;
}

bool MapKey::fromValue(const Value &v, MapKey &out)
{
    if (v.isText()) {
        out = fromText(v.asText());
        return true;
    }
    if (v.isInteger()) {
        out = fromInteger(static_cast<int64_t>(v.asNumber()));
        return true;
    }
    return false;
}

Value MapKey::toValue() const
{
    return isText ? Value::text(text) : Value::number(static_cast<double>(number));
}

std::string MapKey::repr() const
{
    return toValue().repr();
}

bool MapKey::operator==(const MapKey &o) const
{
    if (isText != o.isText)
        return false;
    return isText ? text == o.text : number == o.number;
}

// ============================================================
// ValueMap
// ============================================================
const Value *ValueMap::find(const MapKey &key) const
{
    for (auto &entry : entries_) {
        if (entry.first == key)
            return &entry.second;
    }
    return nullptr;
}

Value *ValueMap::find(const MapKey &key)
{
    for (auto &entry : entries_) {
        if (entry.first == key)
            return &entry.second;
    }
    return nullptr;
}

void ValueMap::set(const MapKey &key, Value val)
{
    if (auto *existing = find(key)) {
        *existing = std::move(val);
        return;
    }
    entries_.emplace_back(key, std::move(val));
}

bool ValueMap::erase(const MapKey &key)
{
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

bool ValueMap::operator==(const ValueMap &o) const
{
    if (entries_.size() != o.entries_.size())
        return false;
    for (auto &[key, val] : entries_) {
        auto *other = o.find(key);
        if (!other || !(*other == val))
            return false;
    }
    return true;
}

} // namespace tenda
