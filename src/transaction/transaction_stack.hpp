#pragma once

#include "storage/frequency_index.hpp"
#include "storage/store.hpp"
#include "transaction/history.hpp"
#include "transaction/transaction_layer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nestkv {

// ── TransactionStack ─────────────────────────────────────────────────────────
//
// The nested BEGIN blocks of a session.
//
// State shared by all open layers:
//   history_ – per key, one entry for each open layer that wrote it, oldest
//              first.  The last entry is the merged value across the stack.
//   delta_   – net frequency change of all open layers relative to store_.
// Each TransactionLayer only remembers which keys' last entries it owns.
//
// Cost model:
//   - get/set/unset are O(1) in the number of layers.
//   - rollback() of a layer is O(keys written by that layer).
//   - commit() is O(keys written by any open layer).
//
// Callers (Engine) resolve the pre-write value of a key through the merged
// view and pass it in as `old_value`; the stack does not look it up itself.
//
// Not thread-safe.

class TransactionStack {
public:
    explicit TransactionStack(Store& store);

    TransactionStack(const TransactionStack&)            = delete;
    TransactionStack& operator=(const TransactionStack&) = delete;

    // Returns the last history entry for `key`, or std::nullopt if no open
    // layer wrote it (the caller then falls through to the Store).
    [[nodiscard]] std::optional<HistoryEntry> get(std::string_view key) const;

    // Records `new_value` for `key` in the top layer.  No-op without a layer.
    void set(const std::string& key, const std::optional<std::string>& old_value,
             std::string new_value);

    // Records a deletion of `key` in the top layer.  No-op without a layer or
    // if `old_value` is already absent.
    void unset(const std::string& key, const std::optional<std::string>& old_value);

    // Net count change of `value` across all open layers.  Only meaningful
    // added to Store::count().
    [[nodiscard]] std::int64_t num_equal_to(std::string_view value) const;

    // Opens a new innermost layer.
    void begin();

    // Discards the innermost layer.  Throws std::logic_error if none is open.
    void rollback();

    // Applies the merged writes of all open layers to the Store, folds delta_
    // into its frequency index and closes every layer.  Returns the number of
    // keys applied.  Throws std::logic_error if no layer is open.
    std::size_t commit();

    [[nodiscard]] bool active() const noexcept { return !layers_.empty(); }
    [[nodiscard]] std::size_t depth() const noexcept { return layers_.size(); }

    [[nodiscard]] const History& history() const noexcept { return history_; }
    [[nodiscard]] const FrequencyDelta& delta() const noexcept { return delta_; }

private:
    void clear() noexcept;

    Store&                        store_;
    std::vector<TransactionLayer> layers_;
    History                       history_;
    FrequencyDelta                delta_;
};

} // namespace nestkv
