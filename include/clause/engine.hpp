#pragma once

#include "config.hpp"
#include "element.hpp"
#include "report.hpp"

#include <vector>

namespace clause {

    /*
     * Full pipeline for one element: parse its documentation, extract facts, validate,
     * and synthesize when anything was flagged. Parse errors and unresolved synthesis
     * end up as diagnostics on the record; schema_lookup_error propagates.
     */
    element_record process_element(const element& el, const body_store& bodies, const engine_config& cfg);

    /*
     * Processes every element of the tree on `cfg.jobs` threads (0 picks the hardware
     * concurrency). Records come back in tree pre-order whatever the scheduling. An
     * element that throws anything else is reported `failed` and the batch continues.
     *
     * Throws tree_error for a repeated qualified_path and rethrows the first
     * schema_lookup_error after all workers have stopped.
     */
    std::vector<element_record> run_engine(const element_tree& tree, const engine_config& cfg);

}  // namespace clause
