#include "clause/engine.hpp"

#include "clause/facts.hpp"
#include "clause/format.hpp"
#include "clause/schema.hpp"
#include "clause/sections.hpp"
#include "clause/synthesizer.hpp"
#include "clause/tree.hpp"
#include "clause/validator.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

using namespace clause::literals;

namespace clause {

    namespace detail {

        static std::optional<std::string> map_summary(const section_tree& tree) {
            if (tree.description && !internal::text::is_blank(*tree.description)) {
                return internal::text::collapse_spaces(*tree.description);
            }
            if (tree.purpose && !internal::text::is_blank(*tree.purpose)) {
                return internal::text::collapse_spaces(*tree.purpose);
            }
            return std::nullopt;
        }

        static unsigned worker_count(const engine_config& cfg, size_t elements) {
            unsigned jobs = cfg.jobs;
            if (jobs == 0U) {
                jobs = std::max(1U, std::thread::hardware_concurrency());
            }
            return static_cast<unsigned>(std::min<size_t>(jobs, std::max<size_t>(elements, 1U)));
        }

    }  // namespace detail

    element_record process_element(const element& el, const body_store& bodies, const engine_config& cfg) {
        element_record record{};
        record.qualified_path = el.qualified_path;
        record.name = el.name;
        record.kind = el.kind;
        record.span = el.span;

        section_tree tree{};
        bool parsed = true;
        try {
            tree = parse_documentation(el.existing_doc_text, el.kind);
        } catch (const parse_error& e) {
            parsed = false;
            record.diagnostics.push_back(
                    {diagnostic_code::parse_error, severity::warning, e.section(), e.line(), e.what()});
        }

        auto facts = extract_facts(el, bodies);
        record.diagnostics.insert(record.diagnostics.end(), facts.diagnostics.begin(), facts.diagnostics.end());

        auto findings = validate(el, tree, facts, cfg);
        record.diagnostics.insert(record.diagnostics.end(), findings.begin(), findings.end());
        record.summary = detail::map_summary(tree);

        if (parsed && findings.empty()) {
            record.status = record_status::compliant;
        }
        else {
            try {
                record.regenerated_text = synthesize(el, tree, facts, findings, cfg);
                record.status = record_status::regenerated;
            } catch (const synthesis_unresolved_error& e) {
                record.status = record_status::unresolved;
                record.diagnostics.push_back(
                        {diagnostic_code::synthesis_unresolved, severity::error, e.section(), std::nullopt, e.what()});
            }
        }

        if (cfg.include_facts) {
            record.facts = std::move(facts.facts);
        }
        return record;
    }

    std::vector<element_record> run_engine(const element_tree& tree, const engine_config& cfg) {
        auto elements = flatten(tree);
        std::vector<element_record> records(elements.size());
        std::vector<std::exception_ptr> fatal(elements.size());
        std::atomic<size_t> next{0U};

        auto work = [&] {
            for (auto i = next.fetch_add(1U); i < elements.size(); i = next.fetch_add(1U)) {
                const auto& el = *elements[i];
                try {
                    records[i] = process_element(el, tree.bodies, cfg);
                } catch (const schema_lookup_error&) {
                    fatal[i] = std::current_exception();
                } catch (const std::exception& e) {
                    auto& record = records[i];
                    record = element_record{};
                    record.qualified_path = el.qualified_path;
                    record.name = el.name;
                    record.kind = el.kind;
                    record.span = el.span;
                    record.status = record_status::failed;
                    record.diagnostics.push_back(
                            {diagnostic_code::element_failed,
                             severity::error,
                             {},
                             std::nullopt,
                             "{} failed: {}"_format(el.qualified_path, e.what())});
                } catch (...) {
                    fatal[i] = std::current_exception();
                }
            }
        };

        auto workers = detail::worker_count(cfg, elements.size());
        debug_log("processing ", elements.size(), " elements on ", workers, " workers");
        if (workers <= 1U) {
            work();
        }
        else {
            std::vector<std::jthread> pool{};
            pool.reserve(workers);
            for (unsigned w = 0U; w < workers; ++w) {
                pool.emplace_back(work);
            }
        }

        for (const auto& error : fatal) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
        return records;
    }

}  // namespace clause
