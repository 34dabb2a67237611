#include "clause/validator.hpp"

#include "clause/format.hpp"
#include "clause/schema.hpp"

#include "internal/text.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace clause::literals;

namespace clause {

    namespace detail {

        namespace text = internal::text;

        static constexpr std::array stopwords{
                "a"sv,     "an"sv,        "the"sv,    "is"sv,    "are"sv,   "be"sv,       "been"sv,     "must"sv,
                "should"sv, "will"sv,     "of"sv,     "to"sv,    "and"sv,   "or"sv,       "it"sv,       "its"sv,
                "this"sv,  "that"sv,      "with"sv,   "for"sv,   "in"sv,    "on"sv,       "by"sv,       "as"sv,
                "value"sv, "valid"sv,     "given"sv,  "argument"sv, "parameter"sv, "instance"sv, "type"sv, "s"sv};

        static constexpr std::array return_words{"return"sv, "returns"sv, "returned"sv, "result"sv};

        static bool is_stopword(std::string_view word) {
            return std::ranges::find(stopwords, word) != stopwords.end();
        }

        static std::string strip_stars(std::string_view name) {
            while (!name.empty() && name.front() == '*') {
                name.remove_prefix(1U);
            }
            return std::string{name};
        }

        // Something a contract statement may talk about, with what the signature and
        // the mapping sections already say of it.
        struct contract_subject {
            std::vector<std::string> names{};
            std::vector<std::string> type_words{};
            std::string description{};
            std::string_view section{};
        };

        static void append_type_words(std::vector<std::string>& out, std::string_view type) {
            for (auto& word : text::words(type)) {
                if (std::ranges::find(out, word) == out.end()) {
                    out.push_back(std::move(word));
                }
            }
        }

        static std::vector<contract_subject> collect_subjects(const element& el, const section_tree& tree) {
            std::vector<contract_subject> subjects{};
            const auto& documented = tree.mapping(el.kind);
            auto section = el.kind == element_kind::class_type ? to_string(section_id::attributes)
                                                               : to_string(section_id::arguments);

            auto add = [&](std::string_view name, std::string_view declared_type) {
                contract_subject subject{};
                subject.names.push_back(utils::to_lower(strip_stars(name)));
                subject.section = section;
                append_type_words(subject.type_words, declared_type);
                if (documented) {
                    if (const auto* entry = find_entry(*documented, name)) {
                        append_type_words(subject.type_words, entry->type);
                        subject.description = entry->description;
                    }
                }
                subjects.push_back(std::move(subject));
            };

            if (el.kind == element_kind::class_type) {
                for (const auto& attr : el.attributes) {
                    add(attr.name, attr.type);
                }
            }
            else {
                for (const auto& param : el.parameters) {
                    add(param.name, param.type);
                }
            }
            if (documented) {
                for (const auto& entry : *documented) {
                    bool declared = std::ranges::any_of(subjects, [&](const contract_subject& s) {
                        return s.names.front() == utils::to_lower(strip_stars(entry.name));
                    });
                    if (!declared) {
                        add(entry.name, {});
                    }
                }
            }

            if (el.return_type || tree.returns) {
                contract_subject result{};
                for (auto word : return_words) {
                    result.names.emplace_back(word);
                }
                result.section = to_string(section_id::returns);
                if (el.return_type) {
                    append_type_words(result.type_words, *el.return_type);
                }
                if (tree.returns) {
                    std::string_view returns_text{*tree.returns};
                    if (auto dash = returns_text.find(" - "); dash != std::string_view::npos) {
                        append_type_words(result.type_words, returns_text.substr(0U, dash));
                        result.description = std::string{returns_text.substr(dash + 3U)};
                    }
                    else {
                        result.description = *tree.returns;
                    }
                }
                subjects.push_back(std::move(result));
            }
            return subjects;
        }

        static std::vector<std::string> content_words(const std::vector<std::string>& words, const element& el) {
            auto instance = el.instance_name();
            std::vector<std::string> out{};
            for (const auto& word : words) {
                if (is_stopword(word) || (instance && word == utils::to_lower(*instance))) {
                    continue;
                }
                if (std::ranges::find(out, word) == out.end()) {
                    out.push_back(word);
                }
            }
            return out;
        }

        static void check_required_sections(const element& el, const section_tree& tree, std::vector<diagnostic>& out) {
            for (auto id : required_sections(el)) {
                if (!tree.has(id)) {
                    out.push_back(
                            {diagnostic_code::missing_section,
                             severity::warning,
                             std::string{to_string(id)},
                             std::nullopt,
                             "{} {} is missing required section {}"_format(el.kind, el.qualified_path, id)});
                }
            }
        }

        static void check_unknown_sections(const section_tree& tree, std::vector<diagnostic>& out) {
            for (const auto& unknown : tree.unknown_sections) {
                section_id id{};
                std::string message{};
                if (try_parse_section_id(unknown.name, id) && is_contract_subsection(id) && !unknown.nested) {
                    message = "{} is only legal inside CONTRACTS"_format(unknown.name);
                }
                else if (unknown.nested) {
                    message = "{} is not a CONTRACTS subsection (expected PRECONDITION, POSTCONDITION or RAISES)"_format(
                            unknown.name);
                }
                else {
                    message = "unknown section {}"_format(unknown.name);
                }
                out.push_back(
                        {diagnostic_code::unknown_section, severity::warning, unknown.name, unknown.line, std::move(message)});
            }
        }

        static void check_formatting(const section_tree& tree, std::vector<diagnostic>& out) {
            for (const auto& blank : tree.blank_separators) {
                out.push_back(
                        {diagnostic_code::formatting,
                         severity::warning,
                         blank.section,
                         blank.line,
                         "blank line before {} separates consecutive sections"_format(blank.section)});
            }
        }

        static void check_empty_contracts(const section_tree& tree, std::vector<diagnostic>& out) {
            if (tree.contracts && tree.contracts->empty()) {
                out.push_back(
                        {diagnostic_code::empty_contract_block,
                         severity::warning,
                         std::string{to_string(section_id::contracts)},
                         std::nullopt,
                         "CONTRACTS block has no statements; omit the block entirely"});
            }
        }

        static void check_redundancy(
                const element& el, const section_tree& tree, const engine_config& cfg, std::vector<diagnostic>& out) {
            if (!tree.contracts) {
                return;
            }
            for (auto id : {section_id::precondition, section_id::postcondition}) {
                for (const auto& statement : tree.contracts->statements(id)) {
                    if (auto reason = redundancy_reason(statement, el, tree, cfg.sensitivity)) {
                        out.push_back(
                                {diagnostic_code::redundant_contract,
                                 severity::warning,
                                 std::string{to_string(id)},
                                 std::nullopt,
                                 "'{}' {}"_format(statement, *reason)});
                    }
                }
            }
        }

        static void check_raises(
                const section_tree& tree, const fact_set& facts, const engine_config& cfg, std::vector<diagnostic>& out) {
            if (!tree.contracts || !facts.body_available) {
                return;
            }
            for (const auto& entry : tree.contracts->raises) {
                auto name = raised_name(entry);
                if (raise_is_evidenced(name, facts)) {
                    continue;
                }
                out.push_back(
                        {diagnostic_code::unverified_raise,
                         cfg.strict_raises ? severity::error : severity::warning,
                         std::string{to_string(section_id::raises)},
                         std::nullopt,
                         "{} is documented but no raise of it was found in the implementation"_format(name)});
            }
        }

        static void check_contracts_present(
                const element& el,
                const section_tree& tree,
                const fact_set& facts,
                const engine_config& cfg,
                std::vector<diagnostic>& out) {
            if (tree.contracts) {
                return;
            }
            if (!contracts_required(el, enforces_invariants(el, facts), cfg.contract_mandatory_for_classes)) {
                return;
            }
            out.push_back(
                    {diagnostic_code::missing_contracts,
                     severity::warning,
                     std::string{to_string(section_id::contracts)},
                     std::nullopt,
                     "{} {} requires a CONTRACTS block"_format(el.kind, el.qualified_path)});
        }

        static void check_mapping_keys(const element& el, const section_tree& tree, std::vector<diagnostic>& out) {
            const auto& documented = tree.mapping(el.kind);
            if (!documented) {
                return;
            }
            if (el.kind == element_kind::class_type && el.attributes.empty()) {
                return;
            }

            std::vector<std::string> declared{};
            if (el.kind == element_kind::class_type) {
                for (const auto& attr : el.attributes) {
                    declared.push_back(strip_stars(attr.name));
                }
            }
            else {
                for (const auto& param : el.parameters) {
                    declared.push_back(strip_stars(param.name));
                }
            }

            auto section = el.kind == element_kind::class_type ? section_id::attributes : section_id::arguments;
            for (const auto& entry : *documented) {
                if (std::ranges::find(declared, strip_stars(entry.name)) == declared.end()) {
                    out.push_back(
                            {diagnostic_code::argument_mismatch,
                             severity::warning,
                             std::string{to_string(section)},
                             entry.line,
                             "{} documents '{}' which the signature does not declare"_format(section, entry.name)});
                }
            }
            for (const auto& name : declared) {
                bool found = std::ranges::any_of(
                        *documented, [&](const mapping_entry& entry) { return strip_stars(entry.name) == name; });
                if (!found) {
                    out.push_back(
                            {diagnostic_code::argument_mismatch,
                             severity::warning,
                             std::string{to_string(section)},
                             std::nullopt,
                             "'{}' is declared but not documented in {}"_format(name, section)});
                }
            }
        }

    }  // namespace detail

    std::string_view raised_name(std::string_view entry) {
        entry = internal::text::trim_ascii(entry);
        if (auto dash = entry.find(" - "); dash != std::string_view::npos) {
            entry = entry.substr(0U, dash);
        }
        return internal::text::trim_ascii(entry);
    }

    bool raise_is_evidenced(std::string_view documented, const fact_set& facts) {
        auto last = [](std::string_view dotted) {
            if (auto dot = dotted.rfind('.'); dot != std::string_view::npos) {
                return dotted.substr(dot + 1U);
            }
            return dotted;
        };
        for (const auto* f : facts.of_kind(fact_kind::raises)) {
            if (f->exception == documented || last(f->exception) == last(documented)) {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> redundancy_reason(
            std::string_view statement, const element& el, const section_tree& tree, redundancy_sensitivity sensitivity) {
        auto words = internal::text::words(statement);
        if (words.empty()) {
            return std::nullopt;
        }
        auto lowered = utils::to_lower(internal::text::collapse_spaces(statement));

        for (const auto& subject : detail::collect_subjects(el, tree)) {
            bool mentioned = std::ranges::any_of(
                    subject.names, [&](const std::string& name) { return internal::text::contains_word(words, name); });
            if (!mentioned) {
                continue;
            }

            for (const auto& type_word : subject.type_words) {
                bool names_subject = std::ranges::find(subject.names, type_word) != subject.names.end();
                if (!names_subject && !detail::is_stopword(type_word) &&
                    internal::text::contains_word(words, type_word)) {
                    return "restates the declared type of {} already visible in {}"_format(
                            subject.names.front(), subject.section);
                }
            }

            if (subject.description.empty()) {
                continue;
            }

            auto description = utils::to_lower(internal::text::collapse_spaces(subject.description));
            if (internal::text::words(description).size() >= 2U && lowered.find(description) != std::string::npos) {
                return "repeats the {} entry for {} verbatim"_format(subject.section, subject.names.front());
            }

            auto content = detail::content_words(words, el);
            std::erase_if(content, [&](const std::string& word) {
                return std::ranges::find(subject.names, word) != subject.names.end();
            });
            auto described = detail::content_words(internal::text::words(description), el);
            if (content.empty() || described.empty()) {
                continue;
            }
            auto shared = std::ranges::count_if(
                    content, [&](const std::string& word) { return internal::text::contains_word(described, word); });
            auto ratio = static_cast<double>(shared) / static_cast<double>(content.size());
            if (ratio >= overlap_threshold(sensitivity)) {
                return "paraphrases the {} entry for {}"_format(subject.section, subject.names.front());
            }
        }
        return std::nullopt;
    }

    std::vector<diagnostic> validate(
            const element& el, const section_tree& tree, const fact_set& facts, const engine_config& cfg) {
        std::vector<diagnostic> out{};
        detail::check_required_sections(el, tree, out);
        detail::check_unknown_sections(tree, out);
        detail::check_formatting(tree, out);
        detail::check_empty_contracts(tree, out);
        detail::check_redundancy(el, tree, cfg, out);
        detail::check_raises(tree, facts, cfg, out);
        detail::check_contracts_present(el, tree, facts, cfg, out);
        detail::check_mapping_keys(el, tree, out);
        debug_log(el.qualified_path, ": ", out.size(), " diagnostics");
        return out;
    }

}  // namespace clause
