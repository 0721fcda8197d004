#include "common/logger.hpp"
#include "common/session_config.hpp"
#include "console/console.hpp"
#include "engine/engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    nestkv::SessionConfig cfg;
    try {
        cfg = nestkv::parse_config(argc, argv);
    } catch (const nestkv::HelpRequested& help) {
        fprintf(stdout, "%s\n", help.what());
        return 0;
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    nestkv::init_default_logger(nestkv::parse_log_level(cfg.log_level));

    std::ifstream file;
    if (!cfg.input_path.empty()) {
        file.open(cfg.input_path);
        if (!file) {
            spdlog::error("nestkv: cannot open input file '{}'", cfg.input_path);
            fprintf(stderr, "Cannot open input file: %s\n", cfg.input_path.c_str());
            return 1;
        }
    }
    std::istream& in = cfg.input_path.empty() ? std::cin : file;

    spdlog::info("nestkv: session started, reading from {}",
                 cfg.input_path.empty() ? std::string("stdin") : cfg.input_path);

    try {
        nestkv::Engine engine;
        nestkv::console::Console console{engine, in, std::cout, cfg.prompt};

        const auto summary = console.run();

        if (engine.in_transaction()) {
            spdlog::warn("nestkv: {} open transaction(s) discarded at exit", engine.depth());
        }
        spdlog::info("nestkv: session ended ({}) after {} lines, {} commands, {} invalid",
                     summary.ended_by_command ? "END" : "end of input",
                     summary.lines_read, summary.commands, summary.errors);

    } catch (const std::logic_error& ex) {
        spdlog::critical("nestkv: internal invariant violated: {}", ex.what());
        return 2;
    } catch (const std::exception& ex) {
        spdlog::error("nestkv: exception: {}", ex.what());
        return 1;
    }

    return 0;
}
