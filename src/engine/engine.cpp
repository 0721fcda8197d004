#include "engine/engine.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace nestkv {

Engine::Engine() : transactions_(store_) {}

std::optional<std::string> Engine::get(std::string_view key) const {
    if (transactions_.active()) {
        if (auto entry = transactions_.get(key)) {
            return value_of(*entry);
        }
    }
    return store_.get(key);
}

void Engine::set(const std::string& key, std::string value) {
    const auto old_value = get(key);
    if (old_value == value) {
        return;
    }

    if (transactions_.active()) {
        transactions_.set(key, old_value, std::move(value));
    } else {
        store_.set(key, std::move(value));
    }
}

void Engine::unset(const std::string& key) {
    const auto old_value = get(key);
    if (!old_value.has_value()) {
        return;
    }

    if (transactions_.active()) {
        transactions_.unset(key, old_value);
    } else {
        store_.del(key);
    }
}

std::uint64_t Engine::num_equal_to(std::string_view value) const {
    const auto total = static_cast<std::int64_t>(store_.count(value)) +
                       transactions_.num_equal_to(value);
    if (total < 0) {
        throw std::logic_error(fmt::format(
            "negative merged frequency for '{}': {}", value, total));
    }
    return static_cast<std::uint64_t>(total);
}

void Engine::begin() {
    transactions_.begin();
}

bool Engine::rollback() {
    if (!transactions_.active()) {
        spdlog::debug("Engine: rollback requested with no open transaction");
        return false;
    }
    transactions_.rollback();
    return true;
}

bool Engine::commit() {
    if (!transactions_.active()) {
        spdlog::debug("Engine: commit requested with no open transaction");
        return false;
    }
    transactions_.commit();
    return true;
}

} // namespace nestkv
