#pragma once

#include "console/command.hpp"
#include "engine/engine.hpp"

#include <cstddef>
#include <iosfwd>
#include <variant>

namespace nestkv::console {

// Summary of a finished session.
struct SessionSummary {
    std::size_t lines_read{};       // every line consumed, blank ones included
    std::size_t commands{};         // lines that parsed into a command
    std::size_t errors{};           // lines answered with the invalid-command text
    bool        ended_by_command{}; // END seen (false: end of input)
};

// Line-oriented front end over one Engine.
//
// Reads commands from `in` until END or end of input, writes protocol output
// (values, NULL, counts, NO TRANSACTION, the invalid-command text) to `out`.
// Diagnostics go to spdlog, never to `out`.
//
// When `prompt` is set, "> " is written to `out` before each line is read.
class Console {
public:
    Console(Engine& engine, std::istream& in, std::ostream& out, bool prompt = false);

    Console(const Console&)            = delete;
    Console& operator=(const Console&) = delete;

    SessionSummary run();

    // Runs one parsed command against the engine.  EndCmd yields SilentResp;
    // terminating the loop is run()'s job.
    Response dispatch(const Command& cmd);

private:
    Response process_request(const std::variant<Command, ErrorResp>& parse_result);

    Engine&       engine_;
    std::istream& in_;
    std::ostream& out_;
    bool          prompt_;
};

} // namespace nestkv::console
