#include "console/command.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace nestkv::console {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Split `line` on runs of whitespace.  Leading/trailing whitespace (including
// a CR from CRLF input) produces no empty tokens.
std::vector<std::string_view> tokenize(std::string_view line) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && is_space(line[pos])) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < line.size() && !is_space(line[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(line.substr(start, pos - start));
        }
    }
    return tokens;
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

ErrorResp arity_error(std::string_view verb, std::size_t expected, std::size_t got) {
    return ErrorResp{fmt::format("{} takes {} argument(s), got {}", verb, expected, got)};
}

} // namespace

// ── is_blank ──────────────────────────────────────────────────────────────────

bool is_blank(std::string_view line) noexcept {
    for (char c : line) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    const auto tokens = tokenize(line);
    if (tokens.empty()) {
        return ErrorResp{"empty command"};
    }

    const std::string verb = to_upper(tokens.front());
    const std::size_t argc = tokens.size() - 1;

    // END ignores its arguments.
    if (verb == "END") {
        return EndCmd{};
    }

    // ── GET name ──────────────────────────────────────────────────────────────
    if (verb == "GET") {
        if (argc != 1) {
            return arity_error(verb, 1, argc);
        }
        return GetCmd{std::string(tokens[1])};
    }

    // ── SET name value ────────────────────────────────────────────────────────
    if (verb == "SET") {
        if (argc != 2) {
            return arity_error(verb, 2, argc);
        }
        return SetCmd{std::string(tokens[1]), std::string(tokens[2])};
    }

    // ── UNSET name ────────────────────────────────────────────────────────────
    if (verb == "UNSET") {
        if (argc != 1) {
            return arity_error(verb, 1, argc);
        }
        return UnsetCmd{std::string(tokens[1])};
    }

    // ── NUMEQUALTO value ──────────────────────────────────────────────────────
    if (verb == "NUMEQUALTO") {
        if (argc != 1) {
            return arity_error(verb, 1, argc);
        }
        return NumEqualToCmd{std::string(tokens[1])};
    }

    // ── BEGIN / ROLLBACK / COMMIT ─────────────────────────────────────────────
    if (verb == "BEGIN") {
        if (argc != 0) {
            return arity_error(verb, 0, argc);
        }
        return BeginCmd{};
    }

    if (verb == "ROLLBACK") {
        if (argc != 0) {
            return arity_error(verb, 0, argc);
        }
        return RollbackCmd{};
    }

    if (verb == "COMMIT") {
        if (argc != 0) {
            return arity_error(verb, 0, argc);
        }
        return CommitCmd{};
    }

    return ErrorResp{"unknown command: " + std::string(tokens.front())};
}

// ── serialize_response ────────────────────────────────────────────────────────

std::string serialize_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, SilentResp>) {
                return {};
            } else if constexpr (std::is_same_v<T, ValueResp>) {
                return r.value + "\n";
            } else if constexpr (std::is_same_v<T, NullResp>) {
                return std::string(kNullText) + "\n";
            } else if constexpr (std::is_same_v<T, CountResp>) {
                return std::to_string(r.count) + "\n";
            } else if constexpr (std::is_same_v<T, NoTransactionResp>) {
                return std::string(kNoTransactionText) + "\n";
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return std::string(kInvalidText) + "\n";
            }
        },
        response);
}

} // namespace nestkv::console
