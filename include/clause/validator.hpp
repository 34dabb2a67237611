#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "element.hpp"
#include "facts.hpp"
#include "sections.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    // Runs every check in a fixed order and collects all diagnostics; empty means compliant.
    std::vector<diagnostic> validate(
            const element& el, const section_tree& tree, const fact_set& facts, const engine_config& cfg);

    // Reason a PRECONDITION/POSTCONDITION statement adds nothing beyond the signature and
    // the ARGUMENTS/ATTRIBUTES/RETURNS entries, or nullopt when it carries new information.
    std::optional<std::string> redundancy_reason(
            std::string_view statement, const element& el, const section_tree& tree, redundancy_sensitivity sensitivity);

    // Exception name of a RAISES entry (`Name - when ...`).
    std::string_view raised_name(std::string_view entry);

    // Whether a documented exception name is evidenced by a raises fact.
    bool raise_is_evidenced(std::string_view documented, const fact_set& facts);

}  // namespace clause
