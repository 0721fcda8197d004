#pragma once

#include "transaction/history.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace nestkv {

// ── TransactionLayer ─────────────────────────────────────────────────────────
//
// One BEGIN block.  The layer does not hold values itself: those live in the
// stack-wide History.  It owns the set of keys whose *last* history entry it
// wrote, i.e. the entries it must pop when it is rolled back.
//
// A layer contributes at most one entry per key.  The first write to a key
// appends; every later write from the same layer overwrites that entry.

class TransactionLayer {
public:
    // Records `entry` as this layer's value for `key` in `history`.
    void write(History& history, const std::string& key, HistoryEntry entry);

    // True if this layer owns the last history entry of `key`.
    [[nodiscard]] bool owns(std::string_view key) const;

    [[nodiscard]] const std::unordered_set<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

private:
    std::unordered_set<std::string> keys_;
};

} // namespace nestkv
