#pragma once

#include "storage/store.hpp"
#include "transaction/transaction_stack.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nestkv {

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Facade over the committed Store and the TransactionStack.  Every mutating
// call first resolves the key's current (merged) value, then routes the write
// to the innermost open layer, or straight to the Store when no transaction
// is open.
//
// Invariant, after every call and for every value v:
//   store().count(v) + transactions().num_equal_to(v)
//     == number of keys whose merged value is v
//
// One Engine per session; not thread-safe.

class Engine {
public:
    Engine();

    // Not copyable or movable – transactions_ refers to store_.
    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // Merged view: innermost layer that wrote `key`, else the Store.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // No-op if `key` already holds `value`.
    void set(const std::string& key, std::string value);

    // No-op if `key` is already absent.
    void unset(const std::string& key);

    // Number of keys whose merged value is `value`.
    [[nodiscard]] std::uint64_t num_equal_to(std::string_view value) const;

    void begin();

    // Return false when no transaction is open.
    bool rollback();
    bool commit();

    [[nodiscard]] bool in_transaction() const noexcept { return transactions_.active(); }
    [[nodiscard]] std::size_t depth() const noexcept { return transactions_.depth(); }

    [[nodiscard]] const Store& store() const noexcept { return store_; }
    [[nodiscard]] const TransactionStack& transactions() const noexcept { return transactions_; }

private:
    Store            store_;
    TransactionStack transactions_;
};

} // namespace nestkv
