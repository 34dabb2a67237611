#include "clause/schema.hpp"

#include "clause/format.hpp"

#include <array>

using namespace clause::literals;

namespace clause {

    namespace detail {

        static constexpr std::array module_sections{
                section_rule{section_id::purpose, requirement::always},
                section_rule{section_id::description, requirement::always}};

        static constexpr std::array class_sections{
                section_rule{section_id::purpose, requirement::always},
                section_rule{section_id::description, requirement::always},
                section_rule{section_id::attributes, requirement::when_signature_nonempty}};

        static constexpr std::array callable_sections{
                section_rule{section_id::purpose, requirement::always},
                section_rule{section_id::description, requirement::always},
                section_rule{section_id::arguments, requirement::when_signature_nonempty},
                section_rule{section_id::returns, requirement::when_return_type}};

        static constexpr std::array contract_subsections{
                section_id::precondition, section_id::postcondition, section_id::raises};

        static const std::array registry{
                schema_rule{element_kind::module, module_sections, contracts_policy::not_applicable},
                schema_rule{element_kind::class_type, class_sections, contracts_policy::when_enforcing_invariants},
                schema_rule{element_kind::method, callable_sections, contracts_policy::mandatory},
                schema_rule{element_kind::function, callable_sections, contracts_policy::mandatory}};

        static bool requirement_applies(requirement required, const element& el) {
            switch (required) {
                case requirement::always:
                    return true;
                case requirement::when_signature_nonempty:
                    return el.has_signature_entries();
                case requirement::when_return_type:
                    return el.return_type.has_value();
            }
            return true;
        }

    }  // namespace detail

    const schema_rule& lookup_schema(element_kind kind) {
        for (const auto& rule : detail::registry) {
            if (rule.kind == kind) {
                return rule;
            }
        }
        throw schema_lookup_error("no schema registered for element kind {}"_format(static_cast<int>(kind)));
    }

    const schema_rule& lookup_schema(std::string_view kind_name) {
        element_kind kind{};
        if (!try_parse_element_kind(kind_name, kind)) {
            throw schema_lookup_error("no schema registered for element kind '{}'"_format(kind_name));
        }
        return lookup_schema(kind);
    }

    std::span<const section_id> legal_contract_subsections() {
        return detail::contract_subsections;
    }

    std::vector<section_id> required_sections(const element& el) {
        std::vector<section_id> out{};
        for (const auto& rule : lookup_schema(el.kind).sections) {
            if (detail::requirement_applies(rule.required, el)) {
                out.push_back(rule.section);
            }
        }
        return out;
    }

    bool contracts_required(const element& el, bool enforces_invariants, bool mandatory_for_classes) {
        switch (lookup_schema(el.kind).contracts) {
            case contracts_policy::mandatory:
                return true;
            case contracts_policy::when_enforcing_invariants:
                return mandatory_for_classes || enforces_invariants;
            case contracts_policy::not_applicable:
                return false;
        }
        return false;
    }

}  // namespace clause
