#pragma once

#include "diagnostics.hpp"
#include "element.hpp"
#include "facts.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    using namespace std::string_view_literals;

    enum class record_status : uint8_t { compliant, regenerated, unresolved, failed };

    inline constexpr std::string_view to_string(record_status status) {
        switch (status) {
            case record_status::compliant:
                return "compliant"sv;
            case record_status::regenerated:
                return "regenerated"sv;
            case record_status::unresolved:
                return "unresolved"sv;
            case record_status::failed:
                return "failed"sv;
        }
        return "failed"sv;
    }

    struct element_record {
        std::string qualified_path{};
        std::string name{};
        element_kind kind{element_kind::function};
        record_status status{record_status::compliant};
        std::vector<diagnostic> diagnostics{};
        std::optional<std::string> regenerated_text{};
        std::optional<std::vector<fact>> facts{};

        // module map only
        std::optional<source_span> span{};
        std::optional<std::string> summary{};
    };

    struct report_totals {
        size_t compliant{};
        size_t regenerated{};
        size_t unresolved{};
        size_t failed{};
        size_t errors{};
        size_t warnings{};
    };

    report_totals tally(const std::vector<element_record>& records);

    // 0 when every record is compliant or regenerated without error diagnostics, else 1.
    int exit_status(const std::vector<element_record>& records);

    std::string render_json(const std::vector<element_record>& records);

    void render_table(const std::vector<element_record>& records, bool verbose, std::ostream& os);

    std::string render_summary(const report_totals& totals);

    /*
     * MODULE_MAP listing of classes, methods and functions:
     *
     *     - @file#Lfirst-last - name - description
     *
     * The description is the element's DESCRIPTION, else its PURPOSE.
     */
    std::string render_module_map(const std::vector<element_record>& records);

}  // namespace clause
