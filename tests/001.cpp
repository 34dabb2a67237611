#include "utils.hpp"

namespace clause::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: redundancy sensitivity parsing and thresholds", "[001][config]") {
        redundancy_sensitivity sensitivity = redundancy_sensitivity::low;

        REQUIRE(try_parse_redundancy_sensitivity("HIGH"sv, sensitivity));
        CHECK(sensitivity == redundancy_sensitivity::high);
        REQUIRE(try_parse_redundancy_sensitivity("low"sv, sensitivity));
        CHECK(sensitivity == redundancy_sensitivity::low);
        CHECK_FALSE(try_parse_redundancy_sensitivity("medium"sv, sensitivity));
        CHECK(sensitivity == redundancy_sensitivity::low);

        CHECK(overlap_threshold(redundancy_sensitivity::low) == 0.8);
        CHECK(overlap_threshold(redundancy_sensitivity::high) == 0.5);
        CHECK(overlap_threshold(redundancy_sensitivity::high) < overlap_threshold(redundancy_sensitivity::low));
    }

    TEST_CASE("001: output mode parsing", "[001][config]") {
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("module_map"sv, mode));
        CHECK(mode == output_mode::module_map);
        REQUIRE(try_parse_output_mode("map"sv, mode));
        CHECK(mode == output_mode::module_map);
        REQUIRE(try_parse_output_mode("table"sv, mode));
        CHECK(mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(redundancy_sensitivity::low) == "low"sv);
        CHECK(to_string(redundancy_sensitivity::high) == "high"sv);

        CHECK(to_string(output_mode::table) == "table"sv);
        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(output_mode::module_map) == "module_map"sv);

        CHECK(to_string(element_kind::module) == "module"sv);
        CHECK(to_string(element_kind::class_type) == "class"sv);
        CHECK(to_string(element_kind::method) == "method"sv);
        CHECK(to_string(element_kind::function) == "function"sv);

        CHECK(to_string(diagnostic_code::empty_contract_block) == "EmptyContractBlockError"sv);
        CHECK(to_string(diagnostic_code::argument_mismatch) == "ArgumentMismatchError"sv);
        CHECK(to_string(severity::error) == "error"sv);
        CHECK(to_string(record_status::unresolved) == "unresolved"sv);
        CHECK(to_string(return_shape::attribute_reference) == "attribute_reference"sv);
    }

    TEST_CASE("001: element kinds parse exactly", "[001][config]") {
        element_kind kind = element_kind::function;

        REQUIRE(try_parse_element_kind("class"sv, kind));
        CHECK(kind == element_kind::class_type);
        REQUIRE(try_parse_element_kind("method"sv, kind));
        CHECK(kind == element_kind::method);
        CHECK_FALSE(try_parse_element_kind("Class"sv, kind));
        CHECK_FALSE(try_parse_element_kind("property"sv, kind));

        CHECK(is_callable(element_kind::method));
        CHECK(is_callable(element_kind::function));
        CHECK_FALSE(is_callable(element_kind::class_type));
        CHECK_FALSE(is_callable(element_kind::module));
    }

    TEST_CASE("001: engine config defaults", "[001][config]") {
        engine_config cfg{};
        CHECK_FALSE(cfg.strict_raises);
        CHECK(cfg.sensitivity == redundancy_sensitivity::low);
        CHECK_FALSE(cfg.contract_mandatory_for_classes);
        CHECK(cfg.jobs == 1U);
        CHECK_FALSE(cfg.include_facts);
        CHECK(cfg.output == output_mode::table);
        CHECK_FALSE(cfg.input);
    }

    TEST_CASE("001: enums format by name", "[001][config]") {
        using namespace clause::literals;
        CHECK("{}/{}"_format(element_kind::class_type, severity::warning) == "class/warning");
        CHECK("{}"_format(section_id::postcondition) == "POSTCONDITION");
    }
}  // namespace clause::test
