#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace clause {

    using namespace std::string_view_literals;

    /*
     * Clause Engine Config Options
     *
     * Contract checks
     * - strict_raises: Escalate UnverifiedRaiseError from a warning to an error.
     * - redundancy_sensitivity: Overlap threshold of the redundancy heuristic (low|high).
     * - contract_mandatory_for_classes: Require a class-level CONTRACTS block unconditionally.
     *
     * Run
     * - jobs: Worker threads for per-element processing.
     * - include_facts: Attach extracted facts to every output record.
     *
     * Input
     * - input: Element tree JSON; absent or "-" reads stdin.
     *
     * Output
     * - output: Report shape ("table", "json" or "module_map").
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     * - config_file: Optional JSON file applied over defaults before flags.
     * - print_config: Print resolved config and exit.
     */

    enum class redundancy_sensitivity { low, high };
    enum class output_mode { table, json, module_map };

    inline constexpr std::string_view to_string(redundancy_sensitivity sensitivity) {
        switch (sensitivity) {
            case redundancy_sensitivity::low:
                return "low"sv;
            case redundancy_sensitivity::high:
                return "high"sv;
        }
        return "low"sv;
    }

    inline constexpr bool try_parse_redundancy_sensitivity(std::string_view text, redundancy_sensitivity& out) {
        if (utils::str_case_eq(text, "low"sv)) {
            out = redundancy_sensitivity::low;
            return true;
        }
        if (utils::str_case_eq(text, "high"sv)) {
            out = redundancy_sensitivity::high;
            return true;
        }
        return false;
    }

    // Fraction of a contract statement's content words that must reappear in the
    // matching entry description before the statement counts as a restatement.
    inline constexpr double overlap_threshold(redundancy_sensitivity sensitivity) {
        switch (sensitivity) {
            case redundancy_sensitivity::low:
                return 0.8;
            case redundancy_sensitivity::high:
                return 0.5;
        }
        return 0.8;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
            case output_mode::module_map:
                return "module_map"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        if (utils::str_case_eq(text, "module_map"sv) || utils::str_case_eq(text, "map"sv)) {
            out = output_mode::module_map;
            return true;
        }
        return false;
    }

    struct engine_config {
        bool strict_raises{false};
        redundancy_sensitivity sensitivity{redundancy_sensitivity::low};
        bool contract_mandatory_for_classes{false};

        unsigned jobs{1U};
        bool include_facts{false};

        std::optional<std::filesystem::path> input{};

        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};
        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
    };

}  // namespace clause
