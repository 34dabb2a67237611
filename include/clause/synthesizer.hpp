#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "element.hpp"
#include "facts.hpp"
#include "sections.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace clause {

    // A required section has neither author text nor anything derivable from facts.
    class synthesis_unresolved_error : public std::runtime_error {
      public:
        synthesis_unresolved_error(const std::string& message, std::string section)
                : std::runtime_error{message}, _section{std::move(section)} {}

        const std::string& section() const { return _section; }

      private:
        std::string _section;
    };

    /*
     * Regenerates the documentation of `el` in canonical form. Sections no diagnostic
     * points at are carried over; flagged or missing ones are rebuilt from the signature
     * and facts. The result parses back into the same sections and synthesizing it
     * again yields identical text.
     *
     * Throws synthesis_unresolved_error when PURPOSE, DESCRIPTION or a mandatory
     * CONTRACTS block cannot be produced.
     */
    std::string synthesize(
            const element& el,
            const section_tree& tree,
            const fact_set& facts,
            const std::vector<diagnostic>& diagnostics,
            const engine_config& cfg);

}  // namespace clause
