#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace nestkv::console {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single input line.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct SetCmd {
    std::string key;
    std::string value;
};

struct GetCmd {
    std::string key;
};

struct UnsetCmd {
    std::string key;
};

struct NumEqualToCmd {
    std::string value;
};

struct BeginCmd {};
struct RollbackCmd {};
struct CommitCmd {};
struct EndCmd {};

using Command = std::variant<SetCmd, GetCmd, UnsetCmd, NumEqualToCmd, BeginCmd, RollbackCmd,
                             CommitCmd, EndCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

// Command succeeded and prints nothing.
struct SilentResp {};

struct ValueResp {
    std::string value;
};

// GET of an absent key.
struct NullResp {};

struct CountResp {
    std::uint64_t count;
};

struct NoTransactionResp {};

// Malformed line.  `message` is diagnostic only; the wire text is fixed.
struct ErrorResp {
    std::string message;
};

using Response =
    std::variant<SilentResp, ValueResp, NullResp, CountResp, NoTransactionResp, ErrorResp>;

inline constexpr std::string_view kNullText          = "NULL";
inline constexpr std::string_view kNoTransactionText = "NO TRANSACTION";
inline constexpr std::string_view kInvalidText       = "Invalid method or number of arguments";

// ── Protocol ──────────────────────────────────────────────────────────────────

// True if `line` holds no tokens at all.  Such lines are skipped silently.
[[nodiscard]] bool is_blank(std::string_view line) noexcept;

// Parse one line (without the trailing '\n') into a Command.  The verb is
// case-insensitive; tokens are separated by runs of whitespace.  Returns an
// ErrorResp for blank lines, unknown verbs and wrong argument counts.
//
// Pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// Serialize a Response into its output text, ending with '\n'.
// SilentResp serializes to the empty string.
[[nodiscard]] std::string serialize_response(const Response& response);

} // namespace nestkv::console
