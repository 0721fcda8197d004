#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace nestkv {

// ── History entries ───────────────────────────────────────────────────────────
//
// One entry per open layer that wrote a key.  `Deleted` means the key does not
// exist as of that layer, which is different from the key having no history at
// all (untouched by every open layer).

struct Written {
    std::string value;
};

struct Deleted {};

using HistoryEntry = std::variant<Written, Deleted>;

// Per-key sequence of entries, oldest enclosing layer first.  The last entry is
// the key's current value across all open layers.
using History = std::unordered_map<std::string, std::vector<HistoryEntry>>;

[[nodiscard]] inline std::optional<std::string> value_of(const HistoryEntry& entry) {
    if (const auto* w = std::get_if<Written>(&entry)) {
        return w->value;
    }
    return std::nullopt;
}

} // namespace nestkv
