#include "storage/store.hpp"

#include <utility>

namespace nestkv {

std::optional<std::string> Store::get(std::string_view key) const {
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Store::set(std::string key, std::string value) {
    auto it = map_.find(key);
    if (it != map_.end()) {
        if (it->second == value) {
            return;
        }
        frequencies_.decrease(it->second);
        frequencies_.increase(value);
        it->second = std::move(value);
        return;
    }
    frequencies_.increase(value);
    map_.emplace(std::move(key), std::move(value));
}

bool Store::del(std::string_view key) {
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return false;
    }
    frequencies_.decrease(it->second);
    map_.erase(it);
    return true;
}

void Store::assign(std::string key, std::string value) {
    map_.insert_or_assign(std::move(key), std::move(value));
}

bool Store::erase(std::string_view key) {
    return map_.erase(std::string(key)) > 0;
}

void Store::fold(const FrequencyDelta& delta) {
    for (const auto& [value, count] : delta.entries()) {
        frequencies_.modify(value, count);
    }
}

std::uint64_t Store::count(std::string_view value) const {
    return frequencies_.count(value);
}

} // namespace nestkv
