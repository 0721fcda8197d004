#include "transaction/transaction_layer.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace nestkv {

void TransactionLayer::write(History& history, const std::string& key, HistoryEntry entry) {
    auto& entries = history[key];

    if (keys_.insert(key).second) {
        entries.push_back(std::move(entry));
        return;
    }

    // Already claimed by this layer: its entry must be the last one.
    if (entries.empty()) {
        throw std::logic_error(fmt::format(
            "layer owns key '{}' but the key has no history", key));
    }
    entries.back() = std::move(entry);
}

bool TransactionLayer::owns(std::string_view key) const {
    return keys_.find(std::string(key)) != keys_.end();
}

} // namespace nestkv
