#include "clause/report.hpp"

#include "clause/format.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace clause::literals;

namespace clause::detail {

    struct diagnostic_output {
        std::string code{};
        std::string severity{};
        std::string section{};
        std::optional<size_t> line{};
        std::string message{};
    };

    struct fact_output {
        std::string kind{};
        std::string description{};
        std::optional<std::string> trigger_condition{};
        std::optional<std::string> subject{};
        std::optional<std::string> exception{};
        std::optional<std::string> shape{};
        bool conditional{false};
        size_t line{};
    };

    struct record_output {
        std::string qualified_path{};
        std::string kind{};
        std::string status{};
        std::vector<diagnostic_output> diagnostics{};
        std::optional<std::string> regenerated_text{};
        std::optional<std::vector<fact_output>> facts{};
    };

    struct report_output {
        int schema_version{1};
        std::vector<record_output> records{};
    };

}  // namespace clause::detail

namespace glz {

    template <>
    struct meta<clause::detail::diagnostic_output> {
        using T = clause::detail::diagnostic_output;
        static constexpr auto value =
                object("code", &T::code, "severity", &T::severity, "section", &T::section, "line", &T::line, "message", &T::message);
    };

    template <>
    struct meta<clause::detail::fact_output> {
        using T = clause::detail::fact_output;
        static constexpr auto value = object(
                "kind",
                &T::kind,
                "description",
                &T::description,
                "trigger_condition",
                &T::trigger_condition,
                "subject",
                &T::subject,
                "exception",
                &T::exception,
                "shape",
                &T::shape,
                "conditional",
                &T::conditional,
                "line",
                &T::line);
    };

    template <>
    struct meta<clause::detail::record_output> {
        using T = clause::detail::record_output;
        static constexpr auto value = object(
                "qualified_path",
                &T::qualified_path,
                "kind",
                &T::kind,
                "status",
                &T::status,
                "diagnostics",
                &T::diagnostics,
                "regenerated_text",
                &T::regenerated_text,
                "facts",
                &T::facts);
    };

    template <>
    struct meta<clause::detail::report_output> {
        using T = clause::detail::report_output;
        static constexpr auto value = object("schema_version", &T::schema_version, "records", &T::records);
    };

}  // namespace glz

namespace clause {

    namespace detail {

        static std::optional<std::string> optional_text(const std::string& value) {
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

        static fact_output to_output(const fact& f) {
            fact_output out{};
            out.kind = std::string{to_string(f.kind)};
            out.description = f.description;
            out.trigger_condition = optional_text(f.trigger_condition);
            out.subject = optional_text(f.subject);
            out.exception = optional_text(f.exception);
            if (f.shape) {
                out.shape = std::string{to_string(*f.shape)};
            }
            out.conditional = f.conditional;
            out.line = f.line;
            return out;
        }

        static record_output to_output(const element_record& record) {
            record_output out{};
            out.qualified_path = record.qualified_path;
            out.kind = std::string{to_string(record.kind)};
            out.status = std::string{to_string(record.status)};
            for (const auto& d : record.diagnostics) {
                out.diagnostics.push_back(
                        {std::string{to_string(d.code)}, std::string{to_string(d.level)}, d.section, d.line, d.message});
            }
            out.regenerated_text = record.regenerated_text;
            if (record.facts) {
                std::vector<fact_output> facts{};
                for (const auto& f : *record.facts) {
                    facts.push_back(to_output(f));
                }
                out.facts = std::move(facts);
            }
            return out;
        }

        static void write_indented(std::string_view text, std::string_view prefix, std::ostream& os) {
            size_t start = 0U;
            while (start <= text.size()) {
                auto nl = text.find('\n', start);
                auto line = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
                os << prefix << line << '\n';
                if (nl == std::string_view::npos) {
                    break;
                }
                start = nl + 1U;
            }
        }

        static void write_map_group(
                std::string& out,
                std::string_view header,
                std::string_view plural,
                const std::vector<element_record>& records,
                element_kind kind,
                bool last) {
            out += header;
            out += ":\n";
            bool any = false;
            for (const auto& record : records) {
                if (record.kind != kind) {
                    continue;
                }
                any = true;
                out += "- ";
                if (record.span && kind == element_kind::class_type) {
                    const auto& span = *record.span;
                    out += "@{}#L{}-{}-{} - "_format(
                            span.file, span.first_line, span.header_last_line.value_or(span.first_line), span.last_line);
                }
                else if (record.span) {
                    out += "@{}#L{}-{} - "_format(record.span->file, record.span->first_line, record.span->last_line);
                }
                out += "{} - {}\n"_format(record.name, record.summary.value_or("No description available"));
            }
            if (!any) {
                out += "- No {} found\n"_format(plural);
            }
            if (!last) {
                out += '\n';
            }
        }

    }  // namespace detail

    report_totals tally(const std::vector<element_record>& records) {
        report_totals totals{};
        for (const auto& record : records) {
            switch (record.status) {
                case record_status::compliant:
                    ++totals.compliant;
                    break;
                case record_status::regenerated:
                    ++totals.regenerated;
                    break;
                case record_status::unresolved:
                    ++totals.unresolved;
                    break;
                case record_status::failed:
                    ++totals.failed;
                    break;
            }
            for (const auto& d : record.diagnostics) {
                if (d.level == severity::error) {
                    ++totals.errors;
                }
                else if (d.level == severity::warning) {
                    ++totals.warnings;
                }
            }
        }
        return totals;
    }

    int exit_status(const std::vector<element_record>& records) {
        auto totals = tally(records);
        return (totals.unresolved > 0U || totals.failed > 0U || totals.errors > 0U) ? 1 : 0;
    }

    std::string render_json(const std::vector<element_record>& records) {
        detail::report_output payload{};
        payload.records.reserve(records.size());
        for (const auto& record : records) {
            payload.records.push_back(detail::to_output(record));
        }

        std::string json{};
        auto ec = glz::write_json(payload, json);
        if (ec) {
            throw std::runtime_error("failed to serialize report");
        }
        return json;
    }

    void render_table(const std::vector<element_record>& records, bool verbose, std::ostream& os) {
        if (records.empty()) {
            os << "no elements\n";
            return;
        }

        for (const auto& record : records) {
            if (!verbose && record.status == record_status::compliant && record.diagnostics.empty()) {
                continue;
            }
            os << "{} [{}] {}\n"_format(record.qualified_path, record.kind, record.status);
            for (const auto& d : record.diagnostics) {
                os << "  {} {}"_format(d.level, d.code);
                if (!d.section.empty()) {
                    os << " (" << d.section;
                    if (d.line) {
                        os << " line " << *d.line;
                    }
                    os << ')';
                }
                else if (d.line) {
                    os << " (line " << *d.line << ')';
                }
                os << ": " << d.message << '\n';
            }
            if (record.regenerated_text) {
                os << "  regenerated:\n";
                detail::write_indented(*record.regenerated_text, "    | "sv, os);
            }
            if (record.facts && !record.facts->empty()) {
                os << "  facts:\n";
                for (const auto& f : *record.facts) {
                    os << "    [{}] {}"_format(f.kind, f.description);
                    if (f.line != 0U) {
                        os << " (line " << f.line << ')';
                    }
                    os << '\n';
                }
            }
        }
    }

    std::string render_summary(const report_totals& totals) {
        auto total = totals.compliant + totals.regenerated + totals.unresolved + totals.failed;
        return "{} elements: {} compliant, {} regenerated, {} unresolved, {} failed ({} errors, {} warnings)"_format(
                total,
                totals.compliant,
                totals.regenerated,
                totals.unresolved,
                totals.failed,
                totals.errors,
                totals.warnings);
    }

    std::string render_module_map(const std::vector<element_record>& records) {
        std::string out{"MODULE_MAP:\n\n"};
        detail::write_map_group(out, "CLASSES"sv, "classes"sv, records, element_kind::class_type, false);
        detail::write_map_group(out, "METHODS"sv, "methods"sv, records, element_kind::method, false);
        detail::write_map_group(out, "FUNCTIONS"sv, "functions"sv, records, element_kind::function, true);
        return out;
    }

}  // namespace clause
