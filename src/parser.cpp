#include "clause/sections.hpp"

#include "clause/format.hpp"

#include "internal/text.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace clause::literals;

namespace clause {

    const std::vector<std::string>& contracts_block::statements(section_id id) const {
        switch (id) {
            case section_id::precondition:
                return preconditions;
            case section_id::postcondition:
                return postconditions;
            default:
                return raises;
        }
    }

    std::vector<std::string>& contracts_block::statements(section_id id) {
        switch (id) {
            case section_id::precondition:
                return preconditions;
            case section_id::postcondition:
                return postconditions;
            default:
                return raises;
        }
    }

    bool section_tree::has(section_id id) const {
        if (is_contract_subsection(id)) {
            return contracts && !contracts->statements(id).empty();
        }
        for (auto seen : header_order) {
            if (seen == id) {
                return true;
            }
        }
        return false;
    }

    const mapping_entry* find_entry(const std::vector<mapping_entry>& entries, std::string_view name) {
        for (const auto& entry : entries) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }

    namespace detail {

        namespace text = internal::text;

        struct header_token {
            std::string name{};
            std::string rest{};
        };

        // `WORD:` at the start of a trimmed line, WORD being two or more of [A-Z0-9_]
        static std::optional<header_token> parse_header(std::string_view trimmed) {
            if (trimmed.empty() || trimmed.front() < 'A' || trimmed.front() > 'Z') {
                return std::nullopt;
            }
            size_t i = 0U;
            while (i < trimmed.size() && text::is_upper_ident_char(trimmed[i])) {
                ++i;
            }
            if (i < 2U || i >= trimmed.size() || trimmed[i] != ':') {
                return std::nullopt;
            }
            auto rest = trimmed.substr(i + 1U);
            if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t') {
                return std::nullopt;
            }
            return header_token{std::string{trimmed.substr(0U, i)}, std::string{text::trim_ascii(rest)}};
        }

        static bool is_entry_name_char(char c) {
            return text::is_ident_char(c) || c == '*' || c == '.';
        }

        // `name: rest`; name may carry the `*`/`**` prefixes of variadic parameters
        static std::optional<std::pair<std::string, std::string>> split_entry(std::string_view trimmed) {
            auto colon = trimmed.find(':');
            if (colon == std::string_view::npos || colon == 0U) {
                return std::nullopt;
            }
            auto name = trimmed.substr(0U, colon);
            for (char c : name) {
                if (!is_entry_name_char(c)) {
                    return std::nullopt;
                }
            }
            return std::pair{std::string{name}, std::string{text::trim_ascii(trimmed.substr(colon + 1U))}};
        }

        static mapping_entry make_entry(std::string name, std::string_view rest, size_t line) {
            mapping_entry entry{};
            entry.name = std::move(name);
            entry.line = line;
            // `type -` is a type with no description, `- text` a description with no type
            if (rest == "-" || rest.ends_with(" -")) {
                entry.type = text::collapse_spaces(rest.substr(0U, rest.size() - 1U));
            }
            else if (rest.starts_with("- ")) {
                entry.description = text::collapse_spaces(rest.substr(2U));
            }
            else if (auto dash = rest.find(" - ");
                     dash != std::string_view::npos && text::looks_like_type(rest.substr(0U, dash))) {
                entry.type = text::collapse_spaces(rest.substr(0U, dash));
                entry.description = text::collapse_spaces(rest.substr(dash + 3U));
            }
            else if (text::looks_like_type(rest)) {
                entry.type = text::collapse_spaces(rest);
            }
            else {
                entry.description = text::collapse_spaces(rest);
            }
            return entry;
        }

        enum class cursor : uint8_t { none, known, unknown };

        struct parser_state {
            section_tree tree{};
            std::optional<size_t> top_indent{};
            cursor top{cursor::none};
            section_id section{section_id::purpose};

            cursor sub{cursor::none};
            section_id subsection{section_id::precondition};
            std::optional<size_t> sub_indent{};

            std::vector<section_id> seen_subsections{};

            std::optional<size_t> entry_indent{};
            std::optional<size_t> pending_blank{};

            bool seen_header() const { return top != cursor::none; }

            void note_separator(std::string_view header) {
                if (pending_blank && seen_header()) {
                    tree.blank_separators.push_back({*pending_blank, std::string{header}});
                }
                pending_blank.reset();
            }

            std::optional<std::vector<mapping_entry>>& mapping_for(section_id id) {
                return id == section_id::attributes ? tree.attributes : tree.arguments;
            }

            void open_top(section_id id, size_t line) {
                if (tree.has(id)) {
                    throw parse_error(
                            "repeated section header {} at line {}"_format(id, line), line, std::string{to_string(id)});
                }
                tree.header_order.push_back(id);
                top = cursor::known;
                section = id;
                sub = cursor::none;
                sub_indent.reset();
                entry_indent.reset();

                switch (id) {
                    case section_id::purpose:
                        tree.purpose = std::string{};
                        break;
                    case section_id::description:
                        tree.description = std::string{};
                        break;
                    case section_id::attributes:
                    case section_id::arguments:
                        mapping_for(id) = std::vector<mapping_entry>{};
                        break;
                    case section_id::returns:
                        tree.returns = std::string{};
                        break;
                    case section_id::contracts:
                        tree.contracts = contracts_block{};
                        break;
                    default:
                        break;
                }
            }

            void open_unknown(std::string name, size_t line, bool nested) {
                tree.unknown_sections.push_back({std::move(name), line, nested});
                if (nested) {
                    sub = cursor::unknown;
                }
                else {
                    top = cursor::unknown;
                    sub = cursor::none;
                    sub_indent.reset();
                }
            }

            void open_sub(section_id id, size_t line) {
                for (const auto& seen : seen_subsections) {
                    if (seen == id) {
                        throw parse_error(
                                "repeated subsection {} at line {}"_format(id, line), line, std::string{to_string(id)});
                    }
                }
                seen_subsections.push_back(id);
                sub = cursor::known;
                subsection = id;
            }

            void add_mapping_line(std::string_view trimmed, size_t indent, size_t line, bool inline_text) {
                auto& entries = *mapping_for(section);
                auto split = split_entry(trimmed);
                bool starts_entry = split && (inline_text || !entry_indent || indent <= *entry_indent);
                if (starts_entry) {
                    if (find_entry(entries, split->first) != nullptr) {
                        throw parse_error(
                                "duplicate entry '{}' in {} at line {}"_format(split->first, section, line),
                                line,
                                std::string{to_string(section)});
                    }
                    if (!inline_text && !entry_indent) {
                        entry_indent = indent;
                    }
                    entries.push_back(make_entry(split->first, split->second, line));
                    return;
                }
                if (entries.empty()) {
                    throw parse_error(
                            "expected `name: description` in {} at line {}"_format(section, line),
                            line,
                            std::string{to_string(section)});
                }
                auto& last = entries.back();
                last.description = text::append_text(std::move(last.description), trimmed);
            }

            void add_statement_line(std::string_view trimmed, size_t line) {
                if (sub == cursor::none) {
                    throw parse_error(
                            "statement outside PRECONDITION/POSTCONDITION/RAISES at line {}"_format(line),
                            line,
                            std::string{to_string(section_id::contracts)});
                }
                if (sub == cursor::unknown) {
                    return;
                }
                auto& statements = tree.contracts->statements(subsection);
                if (trimmed.starts_with('-')) {
                    statements.push_back(text::collapse_spaces(trimmed.substr(1U)));
                    return;
                }
                if (statements.empty()) {
                    statements.push_back(text::collapse_spaces(trimmed));
                    return;
                }
                statements.back() = text::append_text(std::move(statements.back()), trimmed);
            }

            void add_content(std::string_view trimmed, size_t indent, size_t line, bool inline_text) {
                if (trimmed.empty()) {
                    return;
                }
                if (top == cursor::none) {
                    tree.preamble = text::append_text(tree.preamble.value_or(""), trimmed);
                    return;
                }
                if (top == cursor::unknown) {
                    return;
                }
                switch (section) {
                    case section_id::purpose:
                        tree.purpose = text::append_text(std::move(*tree.purpose), trimmed);
                        break;
                    case section_id::description:
                        tree.description = text::append_text(std::move(*tree.description), trimmed);
                        break;
                    case section_id::returns:
                        tree.returns = text::append_text(std::move(*tree.returns), trimmed);
                        break;
                    case section_id::attributes:
                    case section_id::arguments:
                        add_mapping_line(trimmed, indent, line, inline_text);
                        break;
                    case section_id::contracts:
                        add_statement_line(trimmed, line);
                        break;
                    default:
                        break;
                }
            }

            void handle_header(const header_token& header, size_t indent, size_t line) {
                if (!top_indent) {
                    top_indent = indent;
                }

                section_id id{};
                bool known = try_parse_section_id(header.name, id);
                bool in_contracts = top == cursor::known && section == section_id::contracts;

                bool top_level = indent <= *top_indent;
                if (!top_level && in_contracts && (!sub_indent || indent <= *sub_indent)) {
                    if (!sub_indent) {
                        sub_indent = indent;
                    }
                    note_separator(header.name);
                    if (known && is_contract_subsection(id)) {
                        open_sub(id, line);
                    }
                    else {
                        open_unknown(header.name, line, true);
                    }
                    add_content(header.rest, indent, line, true);
                    return;
                }

                if (!top_level && !(known && top == cursor::known && section != section_id::contracts)) {
                    // deeper uppercase words inside a section are ordinary content
                    auto trimmed = header.name + ":" + (header.rest.empty() ? "" : " " + header.rest);
                    pending_blank.reset();
                    add_content(trimmed, indent, line, false);
                    return;
                }

                note_separator(header.name);
                if (known && !is_contract_subsection(id)) {
                    open_top(id, line);
                    seen_subsections.clear();
                    add_content(header.rest, indent, line, true);
                    return;
                }
                // unknown names and contract subsections outside CONTRACTS
                open_unknown(header.name, line, false);
            }
        };

    }  // namespace detail

    section_tree parse_documentation(const std::optional<std::string>& text, element_kind kind) {
        detail::parser_state state{};
        if (!text) {
            return state.tree;
        }

        for (const auto& [number, line] : internal::text::normalize_docstring(*text)) {
            auto trimmed = internal::text::trim_ascii(line);
            if (trimmed.empty()) {
                if (!state.pending_blank) {
                    state.pending_blank = number;
                }
                continue;
            }

            auto indent = internal::text::leading_indent(line);
            if (auto header = detail::parse_header(trimmed)) {
                state.handle_header(*header, indent, number);
                continue;
            }
            state.pending_blank.reset();
            state.add_content(trimmed, indent, number, false);
        }

        debug_log("parsed ", to_string(kind), " doc: ", state.tree.header_order.size(), " sections");
        return std::move(state.tree);
    }

    namespace detail {

        // Whether `name: description` would read back with a type.
        static bool reads_as_typed(std::string_view description) {
            if (text::looks_like_type(description) || description.starts_with("- ") || description.ends_with(" -")) {
                return true;
            }
            auto dash = description.find(" - ");
            return dash != std::string_view::npos && text::looks_like_type(description.substr(0U, dash));
        }

        static void write_entry(std::string& out, const mapping_entry& entry) {
            out += "    ";
            out += entry.name;
            out += ':';
            if (!entry.type.empty()) {
                out += ' ';
                out += entry.type;
                if (!entry.description.empty()) {
                    out += " - ";
                    out += entry.description;
                }
                else if (!text::looks_like_type(entry.type)) {
                    out += " -";
                }
            }
            else if (!entry.description.empty()) {
                out += reads_as_typed(entry.description) ? " - " : " ";
                out += entry.description;
            }
            out += '\n';
        }

        static void write_line_section(std::string& out, section_id id, const std::string& value) {
            out += to_string(id);
            out += ':';
            if (!value.empty()) {
                out += ' ';
                out += value;
            }
            out += '\n';
        }

        static void write_mapping(std::string& out, section_id id, const std::vector<mapping_entry>& entries) {
            out += to_string(id);
            out += ":\n";
            for (const auto& entry : entries) {
                write_entry(out, entry);
            }
        }

    }  // namespace detail

    std::string serialize_sections(const section_tree& tree) {
        std::string out{};
        if (tree.purpose) {
            detail::write_line_section(out, section_id::purpose, *tree.purpose);
        }
        if (tree.description) {
            detail::write_line_section(out, section_id::description, *tree.description);
        }
        if (tree.attributes) {
            detail::write_mapping(out, section_id::attributes, *tree.attributes);
        }
        if (tree.arguments) {
            detail::write_mapping(out, section_id::arguments, *tree.arguments);
        }
        if (tree.returns) {
            detail::write_line_section(out, section_id::returns, *tree.returns);
        }
        if (tree.contracts && !tree.contracts->empty()) {
            out += "CONTRACTS:\n";
            for (auto id : legal_contract_subsections()) {
                const auto& statements = tree.contracts->statements(id);
                if (statements.empty()) {
                    continue;
                }
                out += "    ";
                out += to_string(id);
                out += ":\n";
                for (const auto& statement : statements) {
                    out += "        - ";
                    out += statement;
                    out += '\n';
                }
            }
        }
        if (!out.empty() && out.back() == '\n') {
            out.pop_back();
        }
        return out;
    }

}  // namespace clause
