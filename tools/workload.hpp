#pragma once

#include <cstddef>
#include <string>

namespace nestkv::bench {

// Key written by cycle `i`.  Every layer of a nested run reuses the same keys.
inline std::string cycle_key(std::size_t i) {
    return "key" + std::to_string(i);
}

// Value written by cycle `i` in layer `layer` (0 when no transaction is open).
// Adjacent layers never agree on a key's value, so each nested layer records
// its own history entry for every key it touches.
inline std::string cycle_value(std::size_t i, std::size_t layer) {
    return "val" + std::to_string((i + layer) % 64);
}

} // namespace nestkv::bench
