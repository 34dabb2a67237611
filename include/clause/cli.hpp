#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace clause::cli {

    // nullopt means continue with `run`; otherwise the process exit code (2 on usage errors).
    std::optional<int> parse_cli(int argc, char** argv, engine_config& cfg);

    // Applies a JSON config file over `cfg`; throws std::runtime_error on unreadable
    // files or invalid values.
    void apply_config_file(const std::filesystem::path& path, engine_config& cfg);

    void print_config(const engine_config& cfg, std::ostream& os);

    // Loads the element tree named by `cfg.input` (or `in`), runs the engine and prints
    // the report. Returns the process exit code.
    int run(const engine_config& cfg, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace clause::cli
