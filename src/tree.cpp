#include "clause/tree.hpp"

#include "clause/format.hpp"
#include "clause/schema.hpp"

#include <glaze/glaze.hpp>

#include <array>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace clause::literals;

namespace clause::detail {

    struct expression_input {
        std::string kind{};
        std::string text{};
        std::vector<expression_input> operands{};
    };

    struct statement_input {
        std::string kind{};
        size_t line{};
        std::optional<expression_input> target{};
        std::optional<expression_input> value{};
        std::string op{};
        std::string exception{};
        std::vector<statement_input> body{};
        std::vector<statement_input> orelse{};
        std::vector<statement_input> handlers{};
        std::vector<statement_input> finally_body{};
    };

    struct body_input {
        bool readable{true};
        std::vector<statement_input> statements{};
    };

    struct parameter_input {
        std::string name{};
        std::string type{};
        bool has_default{false};
    };

    struct attribute_input {
        std::string name{};
        std::string type{};
    };

    struct span_input {
        std::string file{};
        size_t first_line{};
        size_t last_line{};
        std::optional<size_t> header_last_line{};
    };

    struct element_input {
        std::string kind{};
        std::string name{};
        std::string qualified_path{};
        std::vector<parameter_input> parameters{};
        std::vector<attribute_input> attributes{};
        std::optional<std::string> return_type{};
        std::optional<std::string> receiver{};
        bool constructor{false};
        std::optional<std::string> body_reference{};
        std::optional<std::string> existing_doc_text{};
        std::optional<span_input> span{};
        std::vector<element_input> children{};
    };

    struct tree_input {
        int schema_version{tree_schema_version};
        std::vector<element_input> elements{};
        std::map<std::string, body_input> bodies{};
    };

}  // namespace clause::detail

namespace glz {

    template <>
    struct meta<clause::detail::expression_input> {
        using T = clause::detail::expression_input;
        static constexpr auto value = object("kind", &T::kind, "text", &T::text, "operands", &T::operands);
    };

    template <>
    struct meta<clause::detail::statement_input> {
        using T = clause::detail::statement_input;
        static constexpr auto value = object(
                "kind",
                &T::kind,
                "line",
                &T::line,
                "target",
                &T::target,
                "value",
                &T::value,
                "op",
                &T::op,
                "exception",
                &T::exception,
                "body",
                &T::body,
                "orelse",
                &T::orelse,
                "handlers",
                &T::handlers,
                "finally",
                &T::finally_body);
    };

    template <>
    struct meta<clause::detail::body_input> {
        using T = clause::detail::body_input;
        static constexpr auto value = object("readable", &T::readable, "statements", &T::statements);
    };

    template <>
    struct meta<clause::detail::parameter_input> {
        using T = clause::detail::parameter_input;
        static constexpr auto value = object("name", &T::name, "type", &T::type, "has_default", &T::has_default);
    };

    template <>
    struct meta<clause::detail::attribute_input> {
        using T = clause::detail::attribute_input;
        static constexpr auto value = object("name", &T::name, "type", &T::type);
    };

    template <>
    struct meta<clause::detail::span_input> {
        using T = clause::detail::span_input;
        static constexpr auto value = object(
                "file",
                &T::file,
                "first_line",
                &T::first_line,
                "last_line",
                &T::last_line,
                "header_last_line",
                &T::header_last_line);
    };

    template <>
    struct meta<clause::detail::element_input> {
        using T = clause::detail::element_input;
        static constexpr auto value = object(
                "kind",
                &T::kind,
                "name",
                &T::name,
                "qualified_path",
                &T::qualified_path,
                "parameters",
                &T::parameters,
                "attributes",
                &T::attributes,
                "return_type",
                &T::return_type,
                "receiver",
                &T::receiver,
                "constructor",
                &T::constructor,
                "body_reference",
                &T::body_reference,
                "existing_doc_text",
                &T::existing_doc_text,
                "span",
                &T::span,
                "children",
                &T::children);
    };

    template <>
    struct meta<clause::detail::tree_input> {
        using T = clause::detail::tree_input;
        static constexpr auto value =
                object("schema_version", &T::schema_version, "elements", &T::elements, "bodies", &T::bodies);
    };

}  // namespace glz

namespace clause {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::array<std::pair<std::string_view, expr_kind>, 11> expression_kinds{{
                {"name"sv, expr_kind::name},
                {"literal"sv, expr_kind::literal},
                {"attribute"sv, expr_kind::attribute},
                {"call"sv, expr_kind::call},
                {"compare"sv, expr_kind::compare},
                {"binary"sv, expr_kind::binary},
                {"unary"sv, expr_kind::unary},
                {"boolean"sv, expr_kind::boolean},
                {"subscript"sv, expr_kind::subscript},
                {"sequence"sv, expr_kind::sequence},
                {"other"sv, expr_kind::other},
        }};

        static constexpr std::array<std::pair<std::string_view, stmt_kind>, 13> statement_kinds{{
                {"expr"sv, stmt_kind::expression},
                {"assign"sv, stmt_kind::assign},
                {"aug_assign"sv, stmt_kind::augmented_assign},
                {"delete"sv, stmt_kind::remove},
                {"raise"sv, stmt_kind::raise},
                {"return"sv, stmt_kind::return_value},
                {"if"sv, stmt_kind::branch},
                {"loop"sv, stmt_kind::loop},
                {"try"sv, stmt_kind::guarded},
                {"except"sv, stmt_kind::handler},
                {"assert"sv, stmt_kind::assertion},
                {"block"sv, stmt_kind::block},
                {"pass"sv, stmt_kind::pass},
        }};

        template <typename K, size_t N>
        static K lookup_kind(
                const std::array<std::pair<std::string_view, K>, N>& table,
                std::string_view name,
                std::string_view what,
                std::string_view where) {
            for (const auto& [key, kind] : table) {
                if (key == name) {
                    return kind;
                }
            }
            throw tree_error("unknown {} kind '{}' in {}"_format(what, name, where));
        }

        static expression convert(const expression_input& in, std::string_view where) {
            expression out{};
            out.kind = lookup_kind(expression_kinds, in.kind, "expression"sv, where);
            out.text = in.text;
            out.operands.reserve(in.operands.size());
            for (const auto& operand : in.operands) {
                out.operands.push_back(convert(operand, where));
            }
            return out;
        }

        static std::vector<statement> convert(const std::vector<statement_input>& in, std::string_view where);

        static statement convert(const statement_input& in, std::string_view where) {
            statement out{};
            out.kind = lookup_kind(statement_kinds, in.kind, "statement"sv, where);
            out.line = in.line;
            if (in.target) {
                out.target = convert(*in.target, where);
            }
            if (in.value) {
                out.value = convert(*in.value, where);
            }
            out.op = in.op;
            out.exception = in.exception;
            out.body = convert(in.body, where);
            out.orelse = convert(in.orelse, where);
            out.handlers = convert(in.handlers, where);
            out.finally_body = convert(in.finally_body, where);
            return out;
        }

        static std::vector<statement> convert(const std::vector<statement_input>& in, std::string_view where) {
            std::vector<statement> out{};
            out.reserve(in.size());
            for (const auto& stmt : in) {
                out.push_back(convert(stmt, where));
            }
            return out;
        }

        static element convert(const element_input& in) {
            element out{};
            out.kind = lookup_schema(in.kind).kind;
            out.name = in.name;
            out.qualified_path = in.qualified_path.empty() ? in.name : in.qualified_path;
            if (out.qualified_path.empty()) {
                throw tree_error("{} element without name or qualified_path"_format(in.kind));
            }
            for (const auto& p : in.parameters) {
                out.parameters.push_back({p.name, p.type, p.has_default});
            }
            for (const auto& a : in.attributes) {
                out.attributes.push_back({a.name, a.type});
            }
            out.return_type = in.return_type;
            out.receiver = in.receiver;
            out.constructor = in.constructor;
            out.body_reference = in.body_reference;
            out.existing_doc_text = in.existing_doc_text;
            if (in.span) {
                out.span = source_span{
                        in.span->file, in.span->first_line, in.span->last_line, in.span->header_last_line};
            }
            out.children.reserve(in.children.size());
            for (const auto& child : in.children) {
                out.children.push_back(convert(child));
            }
            return out;
        }

        static void flatten_into(
                const element& el, std::vector<const element*>& out, std::set<std::string_view, std::less<>>& seen) {
            if (!seen.insert(el.qualified_path).second) {
                throw tree_error("duplicate qualified_path '{}'"_format(el.qualified_path));
            }
            out.push_back(&el);
            for (const auto& child : el.children) {
                flatten_into(child, out, seen);
            }
        }

    }  // namespace detail

    const body* find_body(const body_store& bodies, const std::optional<std::string>& reference) {
        if (!reference) {
            return nullptr;
        }
        if (auto it = bodies.find(*reference); it != bodies.end()) {
            return &it->second;
        }
        return nullptr;
    }

    element_tree load_tree(std::string_view json) {
        detail::tree_input input{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(input, json);
        if (ec) {
            throw tree_error("failed to parse element tree: {}"_format(glz::format_error(ec, json)));
        }
        if (input.schema_version > tree_schema_version) {
            throw tree_error(
                    "unsupported schema_version: {} > {}"_format(input.schema_version, tree_schema_version));
        }

        element_tree tree{};
        tree.elements.reserve(input.elements.size());
        for (const auto& el : input.elements) {
            tree.elements.push_back(detail::convert(el));
        }
        for (const auto& [handle, b] : input.bodies) {
            body converted{};
            converted.readable = b.readable;
            converted.statements = detail::convert(b.statements, handle);
            tree.bodies.emplace(handle, std::move(converted));
        }
        debug_log("loaded ", tree.elements.size(), " top-level elements, ", tree.bodies.size(), " bodies");
        return tree;
    }

    element_tree load_tree_file(const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw tree_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw tree_error("failed to read {}"_format(path.string()));
        }
        return load_tree(ss.str());
    }

    std::vector<const element*> flatten(const element_tree& tree) {
        std::vector<const element*> out{};
        std::set<std::string_view, std::less<>> seen{};
        for (const auto& el : tree.elements) {
            detail::flatten_into(el, out, seen);
        }
        return out;
    }

}  // namespace clause
