#pragma once

#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace nestkv {

// ── SessionConfig ─────────────────────────────────────────────────────────────
// Configuration for one nestkv session.
// Populated by parse_config() from CLI arguments.

struct SessionConfig {
    std::string input_path; // Command file; empty means stdin
    std::string log_level;  // spdlog level string
    bool        prompt{};   // Print "> " before reading each line
};

// Thrown by parse_config() when --help is given.  what() is the usage text.
class HelpRequested : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a SessionConfig.
//
// On success: returns a fully validated SessionConfig.
// On --help : throws HelpRequested carrying the usage text.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - --log-level is one of trace|debug|info|warn|error|critical|off
//   - --input, when given, is not empty

[[nodiscard]] SessionConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with nestkv options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace nestkv
