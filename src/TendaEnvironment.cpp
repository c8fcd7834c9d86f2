// src/TendaEnvironment.cpp
#include "TendaEnvironment.hpp"

namespace tenda {

bool Environment::declare(const std::string &name, ValueCell cell)
{
    if (index_.count(name))
        return false;
    upsert(name, std::move(cell));
    return true;
}

void Environment::upsert(const std::string &name, ValueCell cell)
{
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(cell);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(name, std::move(cell));
}

ValueCell *Environment::lookup(const std::string &name)
{
    auto it = index_.find(name);
    return (it != index_.end()) ? &entries_[it->second].second : nullptr;
}

const ValueCell *Environment::lookup(const std::string &name) const
{
    auto it = index_.find(name);
    return (it != index_.end()) ? &entries_[it->second].second : nullptr;
}

bool Environment::assign(const std::string &name, Value val)
{
    auto *cell = lookup(name);
    if (!cell)
        return false;
    cell->write(std::move(val));
    return true;
}

bool Environment::has(const std::string &name) const
{
    return index_.count(name) > 0;
}

void Environment::forEach(
    const std::function<void(const std::string &, const ValueCell &)> &fn) const
{
    for (auto &[name, cell] : entries_)
        fn(name, cell);
}

std::vector<std::string> Environment::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto &entry : entries_)
        result.push_back(entry.first);
    return result;
}

} // namespace tenda
