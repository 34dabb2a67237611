#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    using namespace std::string_view_literals;

    enum class diagnostic_code : uint8_t {
        parse_error,
        unreadable_body,
        unconditional_raise,
        missing_section,
        unknown_section,
        formatting,
        empty_contract_block,
        redundant_contract,
        unverified_raise,
        missing_contracts,
        argument_mismatch,
        synthesis_unresolved,
        element_failed,
    };

    inline constexpr std::string_view to_string(diagnostic_code code) {
        switch (code) {
            case diagnostic_code::parse_error:
                return "ParseError"sv;
            case diagnostic_code::unreadable_body:
                return "UnreadableBody"sv;
            case diagnostic_code::unconditional_raise:
                return "UnconditionalRaise"sv;
            case diagnostic_code::missing_section:
                return "MissingSectionError"sv;
            case diagnostic_code::unknown_section:
                return "UnknownSectionError"sv;
            case diagnostic_code::formatting:
                return "FormattingError"sv;
            case diagnostic_code::empty_contract_block:
                return "EmptyContractBlockError"sv;
            case diagnostic_code::redundant_contract:
                return "RedundantContractError"sv;
            case diagnostic_code::unverified_raise:
                return "UnverifiedRaiseError"sv;
            case diagnostic_code::missing_contracts:
                return "MissingContractsError"sv;
            case diagnostic_code::argument_mismatch:
                return "ArgumentMismatchError"sv;
            case diagnostic_code::synthesis_unresolved:
                return "SynthesisUnresolvedError"sv;
            case diagnostic_code::element_failed:
                return "ElementFailed"sv;
        }
        return "ElementFailed"sv;
    }

    enum class severity : uint8_t { note, warning, error };

    inline constexpr std::string_view to_string(severity level) {
        switch (level) {
            case severity::note:
                return "note"sv;
            case severity::warning:
                return "warning"sv;
            case severity::error:
                return "error"sv;
        }
        return "warning"sv;
    }

    struct diagnostic {
        diagnostic_code code{diagnostic_code::element_failed};
        severity level{severity::warning};
        std::string section{};
        std::optional<size_t> line{};
        std::string message{};
    };

    inline bool has_code(const std::vector<diagnostic>& diagnostics, diagnostic_code code) {
        for (const auto& d : diagnostics) {
            if (d.code == code) {
                return true;
            }
        }
        return false;
    }

    inline bool has_errors(const std::vector<diagnostic>& diagnostics) {
        for (const auto& d : diagnostics) {
            if (d.level == severity::error) {
                return true;
            }
        }
        return false;
    }

}  // namespace clause
