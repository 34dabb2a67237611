#include "utils.hpp"

#include <vector>

namespace clause::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: registry lists required sections per kind", "[003][schema]") {
        const auto& module_rule = lookup_schema(element_kind::module);
        REQUIRE(module_rule.sections.size() == 2U);
        CHECK(module_rule.sections[0].section == section_id::purpose);
        CHECK(module_rule.sections[1].section == section_id::description);
        CHECK(module_rule.contracts == contracts_policy::not_applicable);

        const auto& class_rule = lookup_schema("class"sv);
        CHECK(class_rule.kind == element_kind::class_type);
        REQUIRE(class_rule.sections.size() == 3U);
        CHECK(class_rule.sections[2].section == section_id::attributes);
        CHECK(class_rule.contracts == contracts_policy::when_enforcing_invariants);

        const auto& method_rule = lookup_schema(element_kind::method);
        REQUIRE(method_rule.sections.size() == 4U);
        CHECK(method_rule.sections[2].section == section_id::arguments);
        CHECK(method_rule.sections[3].section == section_id::returns);
        CHECK(method_rule.contracts == contracts_policy::mandatory);
        CHECK(lookup_schema(element_kind::function).contracts == contracts_policy::mandatory);
    }

    TEST_CASE("003: unknown kinds fail the lookup", "[003][schema]") {
        CHECK_THROWS_AS(lookup_schema("property"sv), schema_lookup_error);
        CHECK_THROWS_AS(lookup_schema(static_cast<element_kind>(42)), schema_lookup_error);
    }

    TEST_CASE("003: legal contract subsections", "[003][schema]") {
        auto legal = legal_contract_subsections();
        REQUIRE(legal.size() == 3U);
        CHECK(legal[0] == section_id::precondition);
        CHECK(legal[1] == section_id::postcondition);
        CHECK(legal[2] == section_id::raises);

        CHECK(is_contract_subsection(section_id::raises));
        CHECK_FALSE(is_contract_subsection(section_id::returns));

        section_id id{};
        CHECK(try_parse_section_id("POSTCONDITION"sv, id));
        CHECK(id == section_id::postcondition);
        CHECK_FALSE(try_parse_section_id("Purpose"sv, id));
        CHECK_FALSE(try_parse_section_id("NOTES"sv, id));
    }

    TEST_CASE("003: required sections follow the signature", "[003][schema]") {
        SECTION("no parameters and no return type") {
            auto el = detail::function("tick", {});
            CHECK(required_sections(el) == std::vector{section_id::purpose, section_id::description});
        }

        SECTION("parameters and return type") {
            auto el = detail::function("add", {{"a", "int", false}, {"b", "int", false}}, "int");
            CHECK(required_sections(el) ==
                  std::vector{section_id::purpose, section_id::description, section_id::arguments, section_id::returns});
        }

        SECTION("class attributes") {
            element el{};
            el.kind = element_kind::class_type;
            el.qualified_path = "Account";
            CHECK(required_sections(el) == std::vector{section_id::purpose, section_id::description});
            el.attributes.push_back({"balance", "Money"});
            CHECK(required_sections(el) ==
                  std::vector{section_id::purpose, section_id::description, section_id::attributes});
        }
    }

    TEST_CASE("003: contracts requirement per kind", "[003][schema]") {
        element cls{};
        cls.kind = element_kind::class_type;
        element mod{};
        mod.kind = element_kind::module;
        auto fn = detail::function("f", {});

        CHECK(contracts_required(fn, false, false));
        CHECK_FALSE(contracts_required(mod, true, true));
        CHECK_FALSE(contracts_required(cls, false, false));
        CHECK(contracts_required(cls, true, false));
        CHECK(contracts_required(cls, false, true));
    }
}  // namespace clause::test
