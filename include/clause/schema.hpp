#pragma once

#include "element.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    using namespace std::string_view_literals;

    enum class section_id : uint8_t {
        purpose,
        description,
        attributes,
        arguments,
        returns,
        contracts,
        precondition,
        postcondition,
        raises,
    };

    inline constexpr std::string_view to_string(section_id id) {
        switch (id) {
            case section_id::purpose:
                return "PURPOSE"sv;
            case section_id::description:
                return "DESCRIPTION"sv;
            case section_id::attributes:
                return "ATTRIBUTES"sv;
            case section_id::arguments:
                return "ARGUMENTS"sv;
            case section_id::returns:
                return "RETURNS"sv;
            case section_id::contracts:
                return "CONTRACTS"sv;
            case section_id::precondition:
                return "PRECONDITION"sv;
            case section_id::postcondition:
                return "POSTCONDITION"sv;
            case section_id::raises:
                return "RAISES"sv;
        }
        return "PURPOSE"sv;
    }

    // Exact keyword match; headers are case sensitive.
    inline constexpr bool try_parse_section_id(std::string_view text, section_id& out) {
        constexpr section_id all[] = {
                section_id::purpose,
                section_id::description,
                section_id::attributes,
                section_id::arguments,
                section_id::returns,
                section_id::contracts,
                section_id::precondition,
                section_id::postcondition,
                section_id::raises};
        for (auto id : all) {
            if (to_string(id) == text) {
                out = id;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool is_contract_subsection(section_id id) {
        return id == section_id::precondition || id == section_id::postcondition || id == section_id::raises;
    }

    enum class requirement : uint8_t {
        always,
        when_signature_nonempty,
        when_return_type,
    };

    enum class contracts_policy : uint8_t {
        mandatory,
        when_enforcing_invariants,
        not_applicable,
    };

    inline constexpr std::string_view to_string(contracts_policy policy) {
        switch (policy) {
            case contracts_policy::mandatory:
                return "mandatory"sv;
            case contracts_policy::when_enforcing_invariants:
                return "when_enforcing_invariants"sv;
            case contracts_policy::not_applicable:
                return "not_applicable"sv;
        }
        return "not_applicable"sv;
    }

    struct section_rule {
        section_id section{section_id::purpose};
        requirement required{requirement::always};
    };

    struct schema_rule {
        element_kind kind{element_kind::function};
        std::span<const section_rule> sections{};
        contracts_policy contracts{contracts_policy::not_applicable};
    };

    class schema_lookup_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Throws schema_lookup_error for a kind outside the registry.
    const schema_rule& lookup_schema(element_kind kind);
    const schema_rule& lookup_schema(std::string_view kind_name);

    std::span<const section_id> legal_contract_subsections();

    // Required top-level sections of `el`, in schema order.
    std::vector<section_id> required_sections(const element& el);

    // Whether `el` must carry a CONTRACTS block, given whether it enforces invariants.
    bool contracts_required(const element& el, bool enforces_invariants, bool mandatory_for_classes);

}  // namespace clause
