#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clause {

    using namespace std::string_view_literals;

    enum class element_kind : uint8_t { module, class_type, method, function };

    inline constexpr std::string_view to_string(element_kind kind) {
        switch (kind) {
            case element_kind::module:
                return "module"sv;
            case element_kind::class_type:
                return "class"sv;
            case element_kind::method:
                return "method"sv;
            case element_kind::function:
                return "function"sv;
        }
        return "unknown"sv;
    }

    inline constexpr bool try_parse_element_kind(std::string_view text, element_kind& out) {
        if (text == "module"sv) {
            out = element_kind::module;
            return true;
        }
        if (text == "class"sv) {
            out = element_kind::class_type;
            return true;
        }
        if (text == "method"sv) {
            out = element_kind::method;
            return true;
        }
        if (text == "function"sv) {
            out = element_kind::function;
            return true;
        }
        return false;
    }

    inline constexpr bool is_callable(element_kind kind) {
        return kind == element_kind::method || kind == element_kind::function;
    }

    struct parameter {
        std::string name{};
        std::string type{};
        bool has_default{false};
    };

    struct attribute_decl {
        std::string name{};
        std::string type{};
    };

    struct source_span {
        std::string file{};
        size_t first_line{};
        size_t last_line{};
        // last line of a class header (decorators, bases, signature)
        std::optional<size_t> header_last_line{};
    };

    struct element {
        element_kind kind{element_kind::function};
        std::string name{};
        std::string qualified_path{};
        std::vector<parameter> parameters{};
        std::vector<attribute_decl> attributes{};
        std::optional<std::string> return_type{};
        std::optional<std::string> receiver{};
        bool constructor{false};
        std::optional<std::string> body_reference{};
        std::optional<std::string> existing_doc_text{};
        std::optional<source_span> span{};
        std::vector<element> children{};

        // Name of the instance through which attribute writes are visible.
        std::optional<std::string> instance_name() const {
            if (receiver) {
                return receiver;
            }
            if (kind == element_kind::method) {
                return std::string{"self"};
            }
            return std::nullopt;
        }

        bool has_signature_entries() const {
            return kind == element_kind::class_type ? !attributes.empty() : !parameters.empty();
        }
    };

    /*
     * Body model
     *
     * Language front ends lower an element's implementation into this small
     * statement/expression tree. Only the shapes the fact scans inspect are
     * distinguished; anything else arrives as `other` and is carried as text.
     */

    enum class expr_kind : uint8_t {
        name,
        literal,
        attribute,
        call,
        compare,
        binary,
        unary,
        boolean,
        subscript,
        sequence,
        other,
    };

    // name/literal/other: `text` is the token; attribute: `text` is the member and
    // operands[0] the object; call: operands[0] is the callee, the rest arguments;
    // compare/binary/boolean/unary: `text` is the operator; subscript: object, index.
    struct expression {
        expr_kind kind{expr_kind::other};
        std::string text{};
        std::vector<expression> operands{};
    };

    enum class stmt_kind : uint8_t {
        expression,
        assign,
        augmented_assign,
        remove,
        raise,
        return_value,
        branch,
        loop,
        guarded,
        handler,
        assertion,
        block,
        pass,
    };

    // assign/augmented_assign/remove: `target` (+ `value`, `op` for augmented);
    // raise: optional `value`; return_value: optional `value`;
    // branch: `value` is the test, `body` / `orelse`;
    // loop: `op` is "while" or "for", `value` the test or iterable, `body` / `orelse`;
    // guarded: `body`, `handlers` (handler statements), `orelse`, `finally_body`;
    // handler: `exception` names the caught type, `body`;
    // assertion: `value` is the test; block: `body`.
    struct statement {
        stmt_kind kind{stmt_kind::pass};
        size_t line{};
        std::optional<expression> target{};
        std::optional<expression> value{};
        std::string op{};
        std::string exception{};
        std::vector<statement> body{};
        std::vector<statement> orelse{};
        std::vector<statement> handlers{};
        std::vector<statement> finally_body{};
    };

    struct body {
        bool readable{true};
        std::vector<statement> statements{};
    };

    using body_store = std::map<std::string, body, std::less<>>;

    // Read-only snapshot of one analysis run.
    struct element_tree {
        std::vector<element> elements{};
        body_store bodies{};
    };

    // nullptr when the handle is absent or unknown to the store
    const body* find_body(const body_store& bodies, const std::optional<std::string>& reference);

}  // namespace clause
