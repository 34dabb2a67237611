#pragma once

#include "clause/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace clause::internal::text {

    using namespace std::string_view_literals;

    inline constexpr bool is_blank_char(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    inline constexpr std::string_view trim_ascii(std::string_view value) noexcept {
        while (!value.empty() && is_blank_char(value.front())) {
            value.remove_prefix(1U);
        }
        while (!value.empty() && is_blank_char(value.back())) {
            value.remove_suffix(1U);
        }
        return value;
    }

    inline constexpr bool is_blank(std::string_view value) noexcept {
        return trim_ascii(value).empty();
    }

    inline constexpr bool is_ident_char(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }

    inline constexpr bool is_upper_ident_char(char c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }

    inline constexpr size_t leading_indent(std::string_view line) noexcept {
        size_t n = 0U;
        for (char c : line) {
            if (c == ' ') {
                ++n;
            }
            else if (c == '\t') {
                n += 4U;
            }
            else {
                break;
            }
        }
        return n;
    }

    inline std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines{};
        size_t start = 0U;
        while (start <= text.size()) {
            auto nl = text.find('\n', start);
            if (nl == std::string_view::npos) {
                lines.emplace_back(text.substr(start));
                break;
            }
            lines.emplace_back(text.substr(start, nl - start));
            start = nl + 1U;
        }
        for (auto& line : lines) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
        }
        return lines;
    }

    /*
     * Docstring normalization: the first line loses its leading whitespace, every
     * later line loses the indentation common to the non-blank later lines, and
     * leading/trailing blank lines are dropped. Line numbers of the remaining lines
     * are reported relative to the original text.
     */
    struct numbered_line {
        size_t number{};
        std::string text{};
    };

    inline std::vector<numbered_line> normalize_docstring(std::string_view raw) {
        auto lines = split_lines(raw);
        std::vector<numbered_line> out{};
        if (lines.empty()) {
            return out;
        }

        auto common = std::string::npos;
        for (size_t i = 1U; i < lines.size(); ++i) {
            if (!is_blank(lines[i])) {
                common = std::min(common, leading_indent(lines[i]));
            }
        }

        for (size_t i = 0U; i < lines.size(); ++i) {
            std::string_view line = lines[i];
            if (is_blank(line)) {
                out.push_back({i + 1U, {}});
                continue;
            }
            if (i == 0U) {
                line = trim_ascii(line);
            }
            else {
                // leading tabs count as four columns
                std::string expanded(leading_indent(line), ' ');
                expanded += line.substr(line.find_first_not_of(" \t"));
                auto drop = common == std::string::npos ? 0U : std::min(common, leading_indent(expanded));
                auto trimmed = std::string_view{expanded}.substr(drop);
                while (!trimmed.empty() && is_blank_char(trimmed.back())) {
                    trimmed.remove_suffix(1U);
                }
                out.push_back({i + 1U, std::string{trimmed}});
                continue;
            }
            while (!line.empty() && is_blank_char(line.back())) {
                line.remove_suffix(1U);
            }
            out.push_back({i + 1U, std::string{line}});
        }

        while (!out.empty() && out.front().text.empty()) {
            out.erase(out.begin());
        }
        while (!out.empty() && out.back().text.empty()) {
            out.pop_back();
        }
        return out;
    }

    // Lowercased identifier-like words; dotted paths are split into their parts.
    inline std::vector<std::string> words(std::string_view text) {
        std::vector<std::string> out{};
        std::string current{};
        for (char c : text) {
            if (is_ident_char(c)) {
                current.push_back(utils::char_tolower(c));
                continue;
            }
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) {
            out.push_back(std::move(current));
        }
        return out;
    }

    inline bool contains_word(const std::vector<std::string>& haystack, std::string_view word) {
        return std::ranges::find(haystack, word) != haystack.end();
    }

    inline constexpr bool is_type_joiner(char c) noexcept {
        return c == '|' || c == ',' || c == '[' || c == ']' || c == '(' || c == ')';
    }

    // `int`, `str | None`, `dict[str, int]`: whitespace only next to a joiner.
    inline constexpr bool looks_like_type(std::string_view value) noexcept {
        value = trim_ascii(value);
        if (value.empty()) {
            return false;
        }
        size_t i = 0U;
        while (i < value.size()) {
            if (!is_blank_char(value[i])) {
                ++i;
                continue;
            }
            auto run_end = i;
            while (run_end < value.size() && is_blank_char(value[run_end])) {
                ++run_end;
            }
            if (!is_type_joiner(value[i - 1U]) && !is_type_joiner(value[run_end])) {
                return false;
            }
            i = run_end;
        }
        return true;
    }

    inline std::string collapse_spaces(std::string_view value) {
        std::string out{};
        bool pending_space = false;
        for (char c : trim_ascii(value)) {
            if (is_blank_char(c)) {
                pending_space = true;
                continue;
            }
            if (pending_space && !out.empty()) {
                out.push_back(' ');
            }
            pending_space = false;
            out.push_back(c);
        }
        return out;
    }

    inline std::string append_text(std::string base, std::string_view more) {
        auto addition = collapse_spaces(more);
        if (addition.empty()) {
            return base;
        }
        if (base.empty()) {
            return addition;
        }
        base.push_back(' ');
        base += addition;
        return base;
    }

}  // namespace clause::internal::text
