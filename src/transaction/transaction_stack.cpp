#include "transaction/transaction_stack.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace nestkv {

TransactionStack::TransactionStack(Store& store) : store_(store) {}

std::optional<HistoryEntry> TransactionStack::get(std::string_view key) const {
    auto it = history_.find(std::string(key));
    if (it == history_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

void TransactionStack::set(const std::string& key,
                           const std::optional<std::string>& old_value,
                           std::string new_value) {
    if (!active()) {
        return;
    }

    delta_.decrease(old_value);
    delta_.increase(new_value);
    layers_.back().write(history_, key, Written{std::move(new_value)});
}

void TransactionStack::unset(const std::string& key,
                             const std::optional<std::string>& old_value) {
    if (!active() || !old_value.has_value()) {
        return;
    }

    layers_.back().write(history_, key, Deleted{});
    delta_.decrease(old_value);
}

std::int64_t TransactionStack::num_equal_to(std::string_view value) const {
    return delta_.count(value);
}

void TransactionStack::begin() {
    layers_.emplace_back();
    spdlog::debug("TransactionStack: begin, depth={}", layers_.size());
}

void TransactionStack::rollback() {
    if (!active()) {
        throw std::logic_error("rollback with no open transaction");
    }

    // The outermost layer's entries are the whole history.
    if (layers_.size() == 1) {
        spdlog::debug("TransactionStack: rollback of outermost layer, {} keys discarded",
                      history_.size());
        clear();
        return;
    }

    TransactionLayer top = std::move(layers_.back());
    layers_.pop_back();

    for (const auto& key : top.keys()) {
        auto it = history_.find(key);
        if (it == history_.end() || it->second.empty()) {
            throw std::logic_error(fmt::format(
                "rolled-back layer owns key '{}' but the key has no history", key));
        }

        auto& entries = it->second;
        const std::optional<std::string> undone = value_of(entries.back());
        entries.pop_back();

        // What the key reads as now: an enclosing layer's entry, else the Store.
        const std::optional<std::string> restored =
            entries.empty() ? store_.get(key) : value_of(entries.back());

        delta_.increase(restored);
        delta_.decrease(undone);

        if (entries.empty()) {
            history_.erase(it);
        }
    }

    spdlog::debug("TransactionStack: rollback, {} keys restored, depth={}",
                  top.size(), layers_.size());
}

std::size_t TransactionStack::commit() {
    if (!active()) {
        throw std::logic_error("commit with no open transaction");
    }

    std::size_t applied = 0;
    for (const auto& [key, entries] : history_) {
        if (entries.empty()) {
            throw std::logic_error(fmt::format("key '{}' has an empty history", key));
        }

        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;

                if constexpr (std::is_same_v<T, Written>) {
                    store_.assign(key, e.value);
                } else if constexpr (std::is_same_v<T, Deleted>) {
                    store_.erase(key);
                }
            },
            entries.back());
        ++applied;
    }

    store_.fold(delta_);

    spdlog::debug("TransactionStack: commit of {} layers, {} keys applied",
                  layers_.size(), applied);
    clear();
    return applied;
}

void TransactionStack::clear() noexcept {
    layers_.clear();
    history_.clear();
    delta_.clear();
}

} // namespace nestkv
