// include/TendaValue.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tenda {

struct Function;
struct NativeFunction;
class ValueMap;

enum class ValueKind { Number, Text, Boolean, Nil, List, Map, Range, Function, Native };

const char *kindName(ValueKind k);

// Largest magnitude a double holds with every integer below it exact (2^53)
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;

struct RangeBounds
{
    int64_t start = 0;
    int64_t end = 0; // inclusive; a descending range is empty

    uint64_t size() const
    {
        return end >= start ? static_cast<uint64_t>(end) - static_cast<uint64_t>(start) + 1 : 0;
    }
};

class Value
{
public:
    Value();

    // Factories
    static Value number(double v);
    static Value boolean(bool v);
    static Value text(std::string s);
    static Value nil();
    static Value list(std::vector<Value> items = {});
    static Value map(ValueMap entries);
    static Value range(int64_t start, int64_t end);
    static Value function(std::shared_ptr<const Function> fn);
    static Value native(std::shared_ptr<const NativeFunction> fn);

    ValueKind kind() const { return kind_; }
    const char *kindName() const { return tenda::kindName(kind_); }

    bool isNumber() const { return kind_ == ValueKind::Number; }
    bool isText() const { return kind_ == ValueKind::Text; }
    bool isBoolean() const { return kind_ == ValueKind::Boolean; }
    bool isNil() const { return kind_ == ValueKind::Nil; }
    bool isList() const { return kind_ == ValueKind::List; }
    bool isMap() const { return kind_ == ValueKind::Map; }
    bool isRange() const { return kind_ == ValueKind::Range; }
    bool isCallable() const
    {
        return kind_ == ValueKind::Function || kind_ == ValueKind::Native;
    }

    // Integral number within +-MAX_EXACT_INTEGER (indices, ranges, map keys)
    bool isInteger() const;

    double asNumber() const { return number_; }
    bool asBoolean() const { return boolean_; }
    const std::string &asText() const { return text_; }
    const std::vector<Value> &asList() const;
    const ValueMap &asMap() const;
    RangeBounds asRange() const { return range_; }
    const std::shared_ptr<const Function> &asFunction() const { return function_; }
    const std::shared_ptr<const NativeFunction> &asNative() const { return native_; }

    // Copy-on-write access: detaches the payload if another Value shares it
    std::vector<Value> &listMut();
    ValueMap &mapMut();

    bool truthy() const;

    // Display form (exiba / texto)
    std::string toString() const;
    // Like toString, but texts are quoted (elements of lists and maps)
    std::string repr() const;

    bool operator==(const Value &o) const;
    bool operator!=(const Value &o) const { return !(*this == o); }

private:
    ValueKind kind_ = ValueKind::Nil;
    double number_ = 0;
    bool boolean_ = false;
    std::string text_;
    std::shared_ptr<std::vector<Value>> list_;
    std::shared_ptr<ValueMap> map_;
    RangeBounds range_;
    std::shared_ptr<const Function> function_;
    std::shared_ptr<const NativeFunction> native_;
};

std::string formatNumber(double v);

// Map keys are texts or integral numbers
struct MapKey
{
    bool isText = true;
    std::string text;
    int64_t number = 0;

    static MapKey fromText(std::string s);
    static MapKey fromInteger(int64_t n);
    static bool fromValue(const Value &v, MapKey &out);

    Value toValue() const;
    std::string repr() const;

    bool operator==(const MapKey &o) const;
};

// Insertion-ordered map
class ValueMap
{
public:
    using Entry = std::pair<MapKey, Value>;

    const Value *find(const MapKey &key) const;
    Value *find(const MapKey &key);
    bool contains(const MapKey &key) const { return find(key) != nullptr; }
    void set(const MapKey &key, Value val);
    bool erase(const MapKey &key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    bool operator==(const ValueMap &o) const;

private:
    std::vector<Entry> entries_;
};

} // namespace tenda
