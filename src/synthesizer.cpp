#include "clause/synthesizer.hpp"

#include "clause/format.hpp"
#include "clause/schema.hpp"
#include "clause/validator.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace clause::literals;

namespace clause {

    namespace detail {

        namespace text = internal::text;

        static bool flagged(const std::vector<diagnostic>& diagnostics, section_id id) {
            auto name = to_string(id);
            return std::ranges::any_of(diagnostics, [&](const diagnostic& d) {
                return d.section == name && d.code != diagnostic_code::unconditional_raise &&
                       d.code != diagnostic_code::unreadable_body;
            });
        }

        static std::string_view bare_name(std::string_view name) {
            while (!name.empty() && name.front() == '*') {
                name.remove_prefix(1U);
            }
            return name;
        }

        static std::string_view exception_stem(std::string_view name) {
            if (auto dot = name.rfind('.'); dot != std::string_view::npos) {
                return name.substr(dot + 1U);
            }
            return name;
        }

        static void push_unique(std::vector<std::string>& out, std::string statement) {
            if (statement.empty() || std::ranges::find(out, statement) != out.end()) {
                return;
            }
            out.push_back(std::move(statement));
        }

        // A type that would not read back as one is kept as part of the description.
        static mapping_entry canonical_entry(std::string name, std::string type, std::string description) {
            mapping_entry entry{};
            entry.name = std::move(name);
            entry.type = text::collapse_spaces(type);
            entry.description = text::collapse_spaces(description);
            if (!entry.type.empty() && !entry.description.empty() && !text::looks_like_type(entry.type)) {
                entry.description = "{} - {}"_format(entry.type, entry.description);
                entry.type.clear();
            }
            return entry;
        }

        static std::vector<mapping_entry> rebuild_mapping(
                const element& el, const std::optional<std::vector<mapping_entry>>& documented) {
            std::vector<mapping_entry> out{};
            auto carry = [&](const std::string& name, const std::string& declared_type) {
                const mapping_entry* prior = documented ? find_entry(*documented, name) : nullptr;
                if (prior == nullptr && documented) {
                    // documented without the `*`/`**` prefix, or with a different one
                    for (const auto& entry : *documented) {
                        if (bare_name(entry.name) == bare_name(name)) {
                            prior = &entry;
                            break;
                        }
                    }
                }
                if (prior == nullptr) {
                    out.push_back(canonical_entry(name, declared_type, {}));
                    return;
                }
                if (declared_type.empty() || prior->type.empty() ||
                    text::collapse_spaces(prior->type) == text::collapse_spaces(declared_type)) {
                    auto type = declared_type.empty() ? prior->type : declared_type;
                    out.push_back(canonical_entry(name, std::move(type), prior->description));
                    return;
                }
                // the author's wording before ` - ` may not have been a type at all
                auto description = prior->description.empty() ? prior->type
                                                               : "{} - {}"_format(prior->type, prior->description);
                out.push_back(canonical_entry(name, declared_type, std::move(description)));
            };

            if (el.kind == element_kind::class_type) {
                for (const auto& attr : el.attributes) {
                    carry(attr.name, attr.type);
                }
            }
            else {
                for (const auto& param : el.parameters) {
                    carry(param.name, param.type);
                }
            }
            return out;
        }

        static std::optional<std::vector<mapping_entry>> synthesize_mapping(
                const element& el, const section_tree& tree, const std::vector<diagnostic>& diagnostics) {
            auto id = el.kind == element_kind::class_type ? section_id::attributes : section_id::arguments;
            const auto& documented = tree.mapping(el.kind);
            if (documented && !flagged(diagnostics, id)) {
                return documented;
            }
            if (!el.has_signature_entries()) {
                return std::nullopt;
            }
            return rebuild_mapping(el, documented);
        }

        static std::string return_value_text(const fact& f) {
            std::string_view description{f.description};
            if (f.shape) {
                auto prefix = to_string(*f.shape);
                if (description.starts_with(prefix) && description.substr(prefix.size()).starts_with(": ")) {
                    description.remove_prefix(prefix.size() + 2U);
                }
            }
            return std::string{description};
        }

        // A conditional return before the fact means the write does not happen on every path.
        static bool follows_early_return(const fact& f, const fact_set& facts) {
            return std::ranges::any_of(facts.facts, [&](const fact& other) {
                return other.kind == fact_kind::returns && other.conditional && other.ordinal < f.ordinal;
            });
        }

        static std::vector<std::string> precondition_candidates(const fact_set& facts) {
            std::vector<std::string> out{};
            for (const auto* f : facts.of_kind(fact_kind::precondition_candidate)) {
                if (!f->conditional) {
                    push_unique(out, f->description);
                }
            }
            return out;
        }

        static std::vector<std::string> postcondition_candidates(const fact_set& facts) {
            std::vector<std::string> out{};
            for (const auto* f : facts.of_kind(fact_kind::mutates)) {
                if (follows_early_return(*f, facts)) {
                    continue;
                }
                if (!f->conditional) {
                    push_unique(out, f->description);
                }
                else if (!f->trigger_condition.empty()) {
                    push_unique(out, "{} when {}"_format(f->description, f->trigger_condition));
                }
            }
            for (const auto* f : facts.of_kind(fact_kind::returns)) {
                if (f->shape == return_shape::none) {
                    continue;
                }
                auto value = return_value_text(*f);
                if (!f->conditional) {
                    push_unique(out, "returns {}"_format(value));
                }
                else if (!f->trigger_condition.empty()) {
                    push_unique(out, "returns {} when {}"_format(value, f->trigger_condition));
                }
            }
            return out;
        }

        static std::vector<std::string> synthesize_statements(
                const element& el,
                const section_tree& scope,
                const std::vector<std::string>& authored,
                bool section_flagged,
                std::vector<std::string> candidates,
                const engine_config& cfg) {
            std::vector<std::string> out{};
            for (const auto& statement : authored) {
                if (!redundancy_reason(statement, el, scope, cfg.sensitivity)) {
                    push_unique(out, statement);
                }
            }
            if (!authored.empty() && !section_flagged) {
                return out;
            }
            for (auto& candidate : candidates) {
                if (!redundancy_reason(candidate, el, scope, cfg.sensitivity)) {
                    push_unique(out, std::move(candidate));
                }
            }
            return out;
        }

        static std::vector<std::string> synthesize_raises(
                const std::vector<std::string>& authored, bool section_flagged, const fact_set& facts) {
            if (!authored.empty() && !section_flagged) {
                return authored;
            }
            if (!facts.body_available) {
                return authored;
            }

            std::vector<std::string> out{};
            std::vector<bool> used(authored.size(), false);
            for (const auto* f : facts.of_kind(fact_kind::raises)) {
                auto stem = exception_stem(f->exception);
                bool documented = false;
                for (size_t i = 0U; i < authored.size(); ++i) {
                    if (exception_stem(raised_name(authored[i])) != stem) {
                        continue;
                    }
                    documented = true;
                    if (!used[i]) {
                        used[i] = true;
                        push_unique(out, authored[i]);
                    }
                }
                if (!documented) {
                    push_unique(out, f->description);
                }
            }
            // unverified author entries stay; the validator keeps reporting them
            for (size_t i = 0U; i < authored.size(); ++i) {
                if (!used[i]) {
                    push_unique(out, authored[i]);
                }
            }
            return out;
        }

        // Redundancy is judged against the sections the serialized text will parse back to.
        static section_tree redundancy_scope(const section_tree& synthesized) {
            auto copy = synthesized;
            copy.contracts.reset();
            return copy;
        }

    }  // namespace detail

    std::string synthesize(
            const element& el,
            const section_tree& tree,
            const fact_set& facts,
            const std::vector<diagnostic>& diagnostics,
            const engine_config& cfg) {
        section_tree out{};

        if (!tree.purpose || internal::text::is_blank(*tree.purpose)) {
            throw synthesis_unresolved_error{
                    "{} {}: PURPOSE cannot be derived from the implementation"_format(el.kind, el.qualified_path),
                    std::string{to_string(section_id::purpose)}};
        }
        out.purpose = internal::text::collapse_spaces(*tree.purpose);

        if (tree.description && !internal::text::is_blank(*tree.description)) {
            auto description = internal::text::collapse_spaces(*tree.description);
            if (tree.preamble) {
                description = internal::text::append_text(internal::text::collapse_spaces(*tree.preamble), description);
            }
            out.description = std::move(description);
        }
        else if (tree.preamble && !internal::text::is_blank(*tree.preamble)) {
            out.description = internal::text::collapse_spaces(*tree.preamble);
        }
        else {
            throw synthesis_unresolved_error{
                    "{} {}: DESCRIPTION has no author text to draw from"_format(el.kind, el.qualified_path),
                    std::string{to_string(section_id::description)}};
        }

        if (el.kind == element_kind::class_type) {
            out.attributes = detail::synthesize_mapping(el, tree, diagnostics);
        }
        else if (is_callable(el.kind)) {
            out.arguments = detail::synthesize_mapping(el, tree, diagnostics);
        }

        if (tree.returns) {
            out.returns = internal::text::collapse_spaces(*tree.returns);
        }
        else if (el.return_type && is_callable(el.kind)) {
            out.returns = *el.return_type;
        }

        if (el.kind == element_kind::module) {
            if (tree.contracts && !tree.contracts->empty()) {
                out.contracts = tree.contracts;
            }
        }
        else {
            auto scope = detail::redundancy_scope(out);
            const contracts_block authored = tree.contracts.value_or(contracts_block{});

            contracts_block block{};
            block.preconditions = detail::synthesize_statements(
                    el,
                    scope,
                    authored.preconditions,
                    detail::flagged(diagnostics, section_id::precondition),
                    detail::precondition_candidates(facts),
                    cfg);
            block.postconditions = detail::synthesize_statements(
                    el,
                    scope,
                    authored.postconditions,
                    detail::flagged(diagnostics, section_id::postcondition),
                    detail::postcondition_candidates(facts),
                    cfg);
            block.raises = detail::synthesize_raises(
                    authored.raises, detail::flagged(diagnostics, section_id::raises), facts);

            if (!block.empty()) {
                out.contracts = std::move(block);
            }
            else if (contracts_required(el, enforces_invariants(el, facts), cfg.contract_mandatory_for_classes)) {
                throw synthesis_unresolved_error{
                        "{} {}: CONTRACTS is required but no statement could be derived"_format(
                                el.kind, el.qualified_path),
                        std::string{to_string(section_id::contracts)}};
            }
        }

        auto text = serialize_sections(out);
        debug_log("synthesized ", el.qualified_path, " (", text.size(), " bytes)");
        return text;
    }

}  // namespace clause
