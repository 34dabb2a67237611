#pragma once

#include "element.hpp"
#include "schema.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    struct mapping_entry {
        std::string name{};
        std::string type{};
        std::string description{};
        size_t line{};
    };

    struct contracts_block {
        std::vector<std::string> preconditions{};
        std::vector<std::string> postconditions{};
        std::vector<std::string> raises{};

        bool empty() const { return preconditions.empty() && postconditions.empty() && raises.empty(); }

        const std::vector<std::string>& statements(section_id id) const;
        std::vector<std::string>& statements(section_id id);
    };

    struct unknown_header {
        std::string name{};
        size_t line{};
        bool nested{false};
    };

    // A blank line found between two sections; `section` names the header that follows it.
    struct blank_separator {
        size_t line{};
        std::string section{};
    };

    struct section_tree {
        std::optional<std::string> purpose{};
        std::optional<std::string> description{};
        std::optional<std::vector<mapping_entry>> attributes{};
        std::optional<std::vector<mapping_entry>> arguments{};
        std::optional<std::string> returns{};
        std::optional<contracts_block> contracts{};

        std::optional<std::string> preamble{};
        std::vector<unknown_header> unknown_sections{};
        std::vector<blank_separator> blank_separators{};
        std::vector<section_id> header_order{};

        bool has(section_id id) const;
        bool empty() const { return header_order.empty() && !preamble && unknown_sections.empty(); }

        const std::optional<std::vector<mapping_entry>>& mapping(element_kind kind) const {
            return kind == element_kind::class_type ? attributes : arguments;
        }
    };

    class parse_error : public std::runtime_error {
      public:
        parse_error(const std::string& message, size_t line, std::string section)
                : std::runtime_error{message}, _line{line}, _section{std::move(section)} {}

        size_t line() const { return _line; }
        const std::string& section() const { return _section; }

      private:
        size_t _line;
        std::string _section;
    };

    // Absent text yields an empty tree. Throws parse_error on a duplicate mapping key,
    // a repeated header, or a mapping line that is not `name: description`.
    section_tree parse_documentation(const std::optional<std::string>& text, element_kind kind);

    // Canonical text form; parse_documentation(serialize_sections(t)) reproduces `t`'s sections.
    std::string serialize_sections(const section_tree& tree);

    const mapping_entry* find_entry(const std::vector<mapping_entry>& entries, std::string_view name);

}  // namespace clause
