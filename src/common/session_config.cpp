#include "common/session_config.hpp"
#include "common/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace nestkv {

namespace {

// Validate the fully populated SessionConfig.
void validate(const SessionConfig& cfg, bool input_given) {
    if (!try_parse_log_level(cfg.log_level)) {
        throw std::runtime_error(fmt::format(
            "--log-level must be one of trace|debug|info|warn|error|critical|off, got '{}'",
            cfg.log_level));
    }

    if (input_given && cfg.input_path.empty()) {
        throw std::runtime_error("--input must not be empty");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("input,i",
            po::value<std::string>(),
            "Read commands from this file instead of stdin")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("prompt",
            po::bool_switch()->default_value(false),
            "Print '> ' before reading each command");
}

// ── parse_config ──────────────────────────────────────────────────────────────

SessionConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("nestkv options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: nestkv [options] [< commands]\n" << desc;
            throw HelpRequested(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    const bool input_given = vm.count("input") > 0;

    SessionConfig cfg;
    cfg.input_path = input_given ? vm["input"].as<std::string>() : std::string{};
    cfg.log_level  = vm["log-level"].as<std::string>();
    cfg.prompt     = vm["prompt"].as<bool>();

    validate(cfg, input_given);
    return cfg;
}

} // namespace nestkv
