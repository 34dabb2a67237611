#include "clause/cli.hpp"

#include "clause/engine.hpp"
#include "clause/format.hpp"
#include "clause/report.hpp"
#include "clause/tree.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace clause::literals;

namespace clause::cli::detail {

    // Every key is optional; absent keys leave the current value alone.
    struct persisted_config {
        int schema_version{1};
        std::optional<bool> strict_raises{};
        std::optional<std::string> redundancy_sensitivity{};
        std::optional<bool> contract_mandatory_for_classes{};
        std::optional<unsigned> jobs{};
        std::optional<bool> include_facts{};
        std::optional<std::string> output{};
    };

}  // namespace clause::cli::detail

namespace glz {

    template <>
    struct meta<clause::cli::detail::persisted_config> {
        using T = clause::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "strict_raises",
                       &T::strict_raises,
                       "redundancy_sensitivity",
                       &T::redundancy_sensitivity,
                       "contract_mandatory_for_classes",
                       &T::contract_mandatory_for_classes,
                       "jobs",
                       &T::jobs,
                       "include_facts",
                       &T::include_facts,
                       "output",
                       &T::output);
    };

}  // namespace glz

namespace clause::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static constexpr auto version = "clause 0.1.0"sv;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static std::string read_stream(std::istream& in) {
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static void apply_persisted_config(const persisted_config& data, engine_config& cfg) {
            if (data.strict_raises) {
                cfg.strict_raises = *data.strict_raises;
            }
            if (data.redundancy_sensitivity &&
                !try_parse_redundancy_sensitivity(*data.redundancy_sensitivity, cfg.sensitivity)) {
                throw std::runtime_error(
                        "invalid redundancy_sensitivity in config file: " + *data.redundancy_sensitivity);
            }
            if (data.contract_mandatory_for_classes) {
                cfg.contract_mandatory_for_classes = *data.contract_mandatory_for_classes;
            }
            if (data.jobs) {
                cfg.jobs = *data.jobs;
            }
            if (data.include_facts) {
                cfg.include_facts = *data.include_facts;
            }
            if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
                throw std::runtime_error("invalid output in config file: " + *data.output);
            }
        }

        static bool reads_stdin(const engine_config& cfg) {
            return !cfg.input || cfg.input->string() == "-"sv;
        }

    }  // namespace detail

    void apply_config_file(const std::filesystem::path& path, engine_config& cfg) {
        detail::persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read_json(data, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        detail::validate_supported_schema_version(data.schema_version, path);
        detail::apply_persisted_config(data, cfg);
        debug_log("applied config file ", path.string());
    }

    void print_config(const engine_config& cfg, std::ostream& os) {
        os << ("  strict_raises={}\n"
               "  redundancy_sensitivity={}\n"
               "  contract_mandatory_for_classes={}\n"
               "  jobs={}\n"
               "  include_facts={}\n"
               "  output={}\n"
               "  input={}\n"_format(
                       cfg.strict_raises,
                       cfg.sensitivity,
                       cfg.contract_mandatory_for_classes,
                       cfg.jobs,
                       cfg.include_facts,
                       cfg.output,
                       detail::reads_stdin(cfg) ? std::string{"-"} : cfg.input->string()));
    }

    int run(const engine_config& cfg, std::istream& in, std::ostream& out, std::ostream& err) {
        auto tree = detail::reads_stdin(cfg) ? load_tree(detail::read_stream(in)) : load_tree_file(*cfg.input);
        if (cfg.verbose) {
            err << "loaded {} top-level elements and {} bodies\n"_format(tree.elements.size(), tree.bodies.size());
        }

        auto records = run_engine(tree, cfg);
        auto totals = tally(records);

        switch (cfg.output) {
            case output_mode::json:
                out << render_json(records) << '\n';
                break;
            case output_mode::module_map:
                out << render_module_map(records);
                break;
            case output_mode::table:
                render_table(records, cfg.verbose, out);
                if (!cfg.quiet) {
                    out << render_summary(totals) << '\n';
                }
                break;
        }

        if (cfg.verbose) {
            err << render_summary(totals) << '\n';
        }
        return exit_status(records);
    }

    std::optional<int> parse_cli(int argc, char** argv, engine_config& cfg) {
        CLI::App app{"clause: contract documentation checker and synthesizer"};

        bool show_version = false;
        bool strict_raises = false;
        bool class_contracts = false;
        bool include_facts = false;
        std::string sensitivity_arg{};
        std::string output_arg{};
        std::optional<unsigned> jobs_arg{};
        std::string config_arg{};
        std::string input_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--strict-raises", strict_raises, "Report unverified RAISES entries as errors");
        app.add_option("--redundancy", sensitivity_arg, "Redundancy sensitivity: low|high");
        app.add_flag("--class-contracts", class_contracts, "Require CONTRACTS on every class");
        app.add_option("-j,--jobs", jobs_arg, "Worker threads (0 = hardware concurrency)");
        app.add_flag("--facts", include_facts, "Attach extracted facts to every record");
        app.add_option("--output", output_arg, "Output mode: table|json|module_map");
        app.add_option("--config", config_arg, "JSON config file applied before flags");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");
        app.add_option("input", input_arg, "Element tree JSON file, or - for stdin");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << detail::version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
            try {
                apply_config_file(*cfg.config_file, cfg);
            } catch (const std::runtime_error& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (!sensitivity_arg.empty() && !try_parse_redundancy_sensitivity(sensitivity_arg, cfg.sensitivity)) {
            std::cerr << "invalid --redundancy value: " << sensitivity_arg << " (expected low|high)\n";
            return std::optional<int>{2};
        }
        if (!output_arg.empty() && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json|module_map)\n";
            return std::optional<int>{2};
        }
        if (strict_raises) {
            cfg.strict_raises = true;
        }
        if (class_contracts) {
            cfg.contract_mandatory_for_classes = true;
        }
        if (include_facts) {
            cfg.include_facts = true;
        }
        if (jobs_arg) {
            cfg.jobs = *jobs_arg;
        }
        if (!input_arg.empty()) {
            cfg.input = input_arg;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace clause::cli
