#include "console/console.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace nestkv::console {

Console::Console(Engine& engine, std::istream& in, std::ostream& out, bool prompt)
    : engine_(engine), in_(in), out_(out), prompt_(prompt) {}

SessionSummary Console::run() {
    SessionSummary summary;
    std::string line;

    for (;;) {
        if (prompt_) {
            out_ << "> " << std::flush;
        }

        if (!std::getline(in_, line)) {
            spdlog::debug("Console: end of input after {} lines", summary.lines_read);
            break;
        }
        ++summary.lines_read;

        if (is_blank(line)) {
            continue;
        }

        spdlog::trace("Console: recv '{}'", line);

        auto parse_result = parse_command(line);

        if (const auto* cmd = std::get_if<Command>(&parse_result);
            cmd != nullptr && std::holds_alternative<EndCmd>(*cmd)) {
            ++summary.commands;
            summary.ended_by_command = true;
            spdlog::debug("Console: END after {} lines", summary.lines_read);
            break;
        }

        if (std::holds_alternative<ErrorResp>(parse_result)) {
            ++summary.errors;
            spdlog::debug("Console: line {} rejected: {}", summary.lines_read,
                          std::get<ErrorResp>(parse_result).message);
        } else {
            ++summary.commands;
        }

        const Response response = process_request(parse_result);

        const std::string wire = serialize_response(response);
        if (!wire.empty()) {
            spdlog::trace("Console: send '{}'", wire.substr(0, wire.size() - 1));
            out_ << wire;
        }
    }

    out_.flush();
    return summary;
}

Response Console::process_request(const std::variant<Command, ErrorResp>& parse_result) {
    if (const auto* err = std::get_if<ErrorResp>(&parse_result)) {
        return *err;
    }
    return dispatch(std::get<Command>(parse_result));
}

Response Console::dispatch(const Command& cmd) {
    return std::visit(
        [&](const auto& c) -> Response {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, GetCmd>) {
                auto val = engine_.get(c.key);
                if (!val.has_value()) {
                    return NullResp{};
                }
                return ValueResp{std::move(*val)};

            } else if constexpr (std::is_same_v<T, SetCmd>) {
                engine_.set(c.key, c.value);
                return SilentResp{};

            } else if constexpr (std::is_same_v<T, UnsetCmd>) {
                engine_.unset(c.key);
                return SilentResp{};

            } else if constexpr (std::is_same_v<T, NumEqualToCmd>) {
                return CountResp{engine_.num_equal_to(c.value)};

            } else if constexpr (std::is_same_v<T, BeginCmd>) {
                engine_.begin();
                return SilentResp{};

            } else if constexpr (std::is_same_v<T, RollbackCmd>) {
                if (!engine_.rollback()) {
                    return NoTransactionResp{};
                }
                return SilentResp{};

            } else if constexpr (std::is_same_v<T, CommitCmd>) {
                if (!engine_.commit()) {
                    return NoTransactionResp{};
                }
                return SilentResp{};

            } else if constexpr (std::is_same_v<T, EndCmd>) {
                return SilentResp{};
            }
        },
        cmd);
}

} // namespace nestkv::console
