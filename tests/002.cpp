#include "utils.hpp"

#include "clause/cli.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace clause::test {

    TEST_CASE("002: parse_cli accepts engine options", "[002][cli]") {
        engine_config cfg{};
        std::vector<std::string> args{
                "clause",
                "--strict-raises",
                "--redundancy",
                "high",
                "--class-contracts",
                "--jobs",
                "4",
                "--facts",
                "--output",
                "json",
                "tree.json"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.strict_raises);
        CHECK(cfg.sensitivity == redundancy_sensitivity::high);
        CHECK(cfg.contract_mandatory_for_classes);
        CHECK(cfg.jobs == 4U);
        CHECK(cfg.include_facts);
        CHECK(cfg.output == output_mode::json);
        REQUIRE(cfg.input);
        CHECK(cfg.input->string() == "tree.json");
    }

    TEST_CASE("002: parse_cli rejects invalid option combos", "[002][cli]") {
        SECTION("invalid sensitivity is rejected") {
            engine_config cfg{};
            std::vector<std::string> args{"clause", "--redundancy", "extreme"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("invalid output is rejected") {
            engine_config cfg{};
            std::vector<std::string> args{"clause", "--output", "yaml"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("quiet and verbose cannot be combined") {
            engine_config cfg{};
            std::vector<std::string> args{"clause", "--quiet", "--verbose"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        engine_config cfg{};
        std::vector<std::string> args{"clause", "--version"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        REQUIRE(result);
        CHECK(*result == 0);
    }

    TEST_CASE("002: config file applies before flags", "[002][cli]") {
        auto path = detail::write_temp_file(
                "clause_002_config.json",
                R"({"schema_version":1,"strict_raises":true,"redundancy_sensitivity":"high","jobs":3,"output":"module_map"})");

        SECTION("file values land in the config") {
            engine_config cfg{};
            cli::apply_config_file(path, cfg);
            CHECK(cfg.strict_raises);
            CHECK(cfg.sensitivity == redundancy_sensitivity::high);
            CHECK(cfg.jobs == 3U);
            CHECK(cfg.output == output_mode::module_map);
            CHECK_FALSE(cfg.contract_mandatory_for_classes);
        }

        SECTION("flags override the file") {
            engine_config cfg{};
            std::vector<std::string> args{"clause", "--config", path.string(), "--jobs", "2", "--redundancy", "low"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            CHECK(!result);
            REQUIRE(cfg.config_file);
            CHECK(cfg.strict_raises);
            CHECK(cfg.jobs == 2U);
            CHECK(cfg.sensitivity == redundancy_sensitivity::low);
            CHECK(cfg.output == output_mode::module_map);
        }

        std::filesystem::remove(path);
    }

    TEST_CASE("002: invalid config files throw", "[002][cli]") {
        SECTION("unknown enum value") {
            auto path = detail::write_temp_file("clause_002_bad_value.json", R"({"output":"xml"})");
            engine_config cfg{};
            CHECK_THROWS_AS(cli::apply_config_file(path, cfg), std::runtime_error);
            std::filesystem::remove(path);
        }

        SECTION("newer schema version") {
            auto path = detail::write_temp_file("clause_002_bad_version.json", R"({"schema_version":2})");
            engine_config cfg{};
            CHECK_THROWS_AS(cli::apply_config_file(path, cfg), std::runtime_error);
            std::filesystem::remove(path);
        }

        SECTION("missing file") {
            engine_config cfg{};
            CHECK_THROWS_AS(cli::apply_config_file("/nonexistent/clause.json", cfg), std::runtime_error);
        }
    }

    TEST_CASE("002: print_config lists resolved values", "[002][cli]") {
        engine_config cfg{};
        cfg.sensitivity = redundancy_sensitivity::high;
        cfg.jobs = 8U;

        std::ostringstream os{};
        cli::print_config(cfg, os);
        auto text = os.str();
        CHECK(text.find("redundancy_sensitivity=high\n") != std::string::npos);
        CHECK(text.find("jobs=8\n") != std::string::npos);
        CHECK(text.find("input=-\n") != std::string::npos);
    }

}  // namespace clause::test
