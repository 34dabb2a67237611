#pragma once

#include "diagnostics.hpp"
#include "element.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    using namespace std::string_view_literals;

    enum class fact_kind : uint8_t { raises, mutates, returns, precondition_candidate };

    inline constexpr std::string_view to_string(fact_kind kind) {
        switch (kind) {
            case fact_kind::raises:
                return "raises"sv;
            case fact_kind::mutates:
                return "mutates"sv;
            case fact_kind::returns:
                return "returns"sv;
            case fact_kind::precondition_candidate:
                return "precondition_candidate"sv;
        }
        return "raises"sv;
    }

    enum class return_shape : uint8_t { none, literal, attribute_reference, call_result, computed_expression };

    inline constexpr std::string_view to_string(return_shape shape) {
        switch (shape) {
            case return_shape::none:
                return "none"sv;
            case return_shape::literal:
                return "literal"sv;
            case return_shape::attribute_reference:
                return "attribute_reference"sv;
            case return_shape::call_result:
                return "call_result"sv;
            case return_shape::computed_expression:
                return "computed_expression"sv;
        }
        return "computed_expression"sv;
    }

    inline constexpr auto unconditional_trigger = "unconditional"sv;

    struct fact {
        fact_kind kind{fact_kind::raises};
        std::string description{};
        std::string trigger_condition{};
        std::string subject{};
        std::string exception{};
        std::optional<return_shape> shape{};
        bool conditional{false};
        size_t ordinal{};
        size_t line{};
    };

    struct fact_set {
        std::vector<fact> facts{};
        std::vector<diagnostic> diagnostics{};
        bool body_available{false};

        std::vector<const fact*> of_kind(fact_kind kind) const {
            std::vector<const fact*> out{};
            for (const auto& f : facts) {
                if (f.kind == kind) {
                    out.push_back(&f);
                }
            }
            return out;
        }

        bool any(fact_kind kind) const {
            for (const auto& f : facts) {
                if (f.kind == kind) {
                    return true;
                }
            }
            return false;
        }
    };

    // Never throws for a well-formed element; an unreadable body yields no facts and an
    // UnreadableBody diagnostic. Class elements also receive the raise and precondition
    // facts of their constructor children.
    fact_set extract_facts(const element& el, const body_store& bodies);

    // True when the class-level facts show the class guarding its own state.
    bool enforces_invariants(const element& el, const fact_set& facts);

    // Text rendering of body expressions, shared with the synthesizer.
    std::string render_expression(const expression& expr);

    // Condition phrased over what it inspects: "argument X is absent" rather than `X is None`.
    std::string describe_condition(const expression& test, const element& el);

    expression negate_condition(const expression& test);

}  // namespace clause
