#pragma once

#include "storage/frequency_index.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nestkv {

// Committed base state: key -> value plus the frequency index over the values
// currently held.
//
// Two write paths exist:
//   - set() / del() keep the frequency index in step themselves.  Used for
//     writes made while no transaction is open.
//   - assign() / erase() touch only the map.  Used by commit, which applies
//     the transactions' final values and then folds their aggregate
//     FrequencyDelta in one go via fold().
//
// Not thread-safe: a session has exactly one caller.
class Store {
public:
    Store() = default;

    // Not copyable – the transaction stack holds a reference to its Store.
    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Inserts or overwrites `key` with `value`, updating frequencies.
    void set(std::string key, std::string value);

    // Removes `key`, updating frequencies. Returns true if the key existed.
    bool del(std::string_view key);

    // Map-only writes; frequencies are reconciled separately through fold().
    void assign(std::string key, std::string value);
    bool erase(std::string_view key);

    // Adds every (value, delta) of `delta` into the frequency index.
    void fold(const FrequencyDelta& delta);

    // Number of keys whose committed value is `value`.
    [[nodiscard]] std::uint64_t count(std::string_view value) const;

    [[nodiscard]] const FrequencyIndex& frequencies() const noexcept { return frequencies_; }

    // Returns the number of stored key-value pairs.
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    // Returns a full copy of the committed map.
    [[nodiscard]] std::unordered_map<std::string, std::string> snapshot() const { return map_; }

private:
    std::unordered_map<std::string, std::string> map_;
    FrequencyIndex frequencies_;
};

} // namespace nestkv
