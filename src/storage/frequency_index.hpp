#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <spdlog/fmt/fmt.h>

namespace nestkv {

// ── BasicFrequencyIndex ──────────────────────────────────────────────────────
//
// Reverse index: value -> number of keys currently holding that value.
//
// The index is sparse: an entry whose count reaches exactly zero is erased, so
// count() of an unknown value is simply 0.  Absent values (std::nullopt) are
// never indexed; increasing or decreasing "nothing" is a no-op.
//
// `Count` selects the flavour:
//   - unsigned: an absolute index (the committed Store).  A count can never
//     drop below zero; attempting it is an invariant violation.
//   - signed:   a relative delta (open transactions vs. the Store).  Entries
//     may legitimately go negative.

template <typename Count>
class BasicFrequencyIndex {
    static_assert(std::is_integral_v<Count>, "frequency counts must be integral");

public:
    using count_type = Count;
    using map_type   = std::unordered_map<std::string, Count>;

    static constexpr bool kRelative = std::is_signed_v<Count>;

    void increase(const std::optional<std::string>& value) { modify(value, 1); }
    void decrease(const std::optional<std::string>& value) { modify(value, -1); }

    // Adds `delta` to the count of `value`.  No-op for an absent value.
    // Throws std::logic_error if an absolute index would go negative.
    void modify(const std::optional<std::string>& value, std::int64_t delta) {
        if (!value.has_value() || delta == 0) {
            return;
        }

        auto it = counts_.find(*value);
        const std::int64_t current = (it == counts_.end()) ? 0 : static_cast<std::int64_t>(it->second);
        const std::int64_t next    = current + delta;

        if constexpr (!kRelative) {
            if (next < 0) {
                throw std::logic_error(fmt::format(
                    "frequency of '{}' would drop below zero ({} {:+})", *value, current, delta));
            }
        }

        if (next == 0) {
            if (it != counts_.end()) {
                counts_.erase(it);
            }
            return;
        }

        if (it == counts_.end()) {
            counts_.emplace(*value, static_cast<Count>(next));
        } else {
            it->second = static_cast<Count>(next);
        }
    }

    // Returns the count for `value`, 0 if it is not indexed.
    [[nodiscard]] Count count(std::string_view value) const {
        auto it = counts_.find(std::string(value));
        return it == counts_.end() ? Count{0} : it->second;
    }

    [[nodiscard]] const map_type& entries() const noexcept { return counts_; }

    [[nodiscard]] std::size_t size() const noexcept { return counts_.size(); }
    [[nodiscard]] bool empty() const noexcept { return counts_.empty(); }

    void clear() noexcept { counts_.clear(); }

private:
    map_type counts_;
};

// Absolute counts over the committed Store.
using FrequencyIndex = BasicFrequencyIndex<std::uint64_t>;

// Net contribution of all open transaction layers relative to the Store.
using FrequencyDelta = BasicFrequencyIndex<std::int64_t>;

} // namespace nestkv
