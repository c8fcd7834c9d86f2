// include/TendaEnvironment.hpp
#pragma once

#include "TendaCell.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tenda {

// One lexical scope. Lookups are local: walking the scope chain is the
// Stack's job.
class Environment
{
public:
    // false if the name is already declared in this scope
    bool declare(const std::string &name, ValueCell cell);
    // Insert or overwrite unconditionally
    void upsert(const std::string &name, ValueCell cell);

    ValueCell *lookup(const std::string &name);
    const ValueCell *lookup(const std::string &name) const;

    // false if the name is not declared in this scope
    bool assign(const std::string &name, Value val);

    bool has(const std::string &name) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Iterate in insertion order
    void forEach(const std::function<void(const std::string &, const ValueCell &)> &fn) const;

    std::vector<std::string> names() const;

private:
    std::vector<std::pair<std::string, ValueCell>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace tenda
