#include "clause/facts.hpp"

#include "clause/format.hpp"
#include "clause/schema.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace clause::literals;

namespace clause {

    namespace detail {

        using namespace std::string_literals;
        using namespace std::string_view_literals;

        static constexpr std::array mutating_methods{
                "append"sv,
                "extend"sv,
                "insert"sv,
                "remove"sv,
                "pop"sv,
                "popitem"sv,
                "clear"sv,
                "update"sv,
                "add"sv,
                "discard"sv,
                "setdefault"sv,
                "sort"sv,
                "reverse"sv};

        static constexpr auto abstract_method_error = "NotImplementedError"sv;
        static constexpr auto no_early_return_trigger = "no earlier return was taken"sv;

        static bool is_none_literal(const expression& expr) {
            return expr.kind == expr_kind::literal && (expr.text == "None"sv || expr.text == "null"sv);
        }

        static bool is_parameter(const element& el, std::string_view name) {
            return std::ranges::any_of(el.parameters, [&](const parameter& p) { return p.name == name; });
        }

        static std::string_view last_segment(std::string_view dotted) {
            if (auto dot = dotted.rfind('.'); dot != std::string_view::npos) {
                return dotted.substr(dot + 1U);
            }
            return dotted;
        }

        static bool needs_parens(const expression& child, const expression& parent) {
            if (child.kind == expr_kind::boolean) {
                return parent.kind != expr_kind::boolean || parent.text != child.text;
            }
            if (child.kind == expr_kind::compare) {
                return parent.kind == expr_kind::compare || parent.kind == expr_kind::binary;
            }
            return false;
        }

        static std::string render_operand(const expression& child, const expression& parent) {
            auto text = render_expression(child);
            if (needs_parens(child, parent)) {
                return "(" + text + ")";
            }
            return text;
        }

        // Attribute of the element's own instance written through `target`, if any.
        static std::optional<std::string> instance_attribute(
                const expression& target, const std::optional<std::string>& instance) {
            if (!instance) {
                return std::nullopt;
            }
            switch (target.kind) {
                case expr_kind::attribute:
                    if (target.operands.empty()) {
                        return std::nullopt;
                    }
                    if (target.operands[0].kind == expr_kind::name && target.operands[0].text == *instance) {
                        return target.text;
                    }
                    return instance_attribute(target.operands[0], instance);
                case expr_kind::subscript:
                    if (target.operands.empty()) {
                        return std::nullopt;
                    }
                    return instance_attribute(target.operands[0], instance);
                default:
                    return std::nullopt;
            }
        }

        // First parameter or instance attribute the expression reads.
        static std::optional<std::string> inspected_subject(const expression& expr, const element& el) {
            if (expr.kind == expr_kind::name && is_parameter(el, expr.text)) {
                return expr.text;
            }
            if (auto attr = instance_attribute(expr, el.instance_name())) {
                return attr;
            }
            for (const auto& operand : expr.operands) {
                if (auto found = inspected_subject(operand, el)) {
                    return found;
                }
            }
            return std::nullopt;
        }

        static std::string subject_phrase(const expression& expr, const element& el) {
            if (expr.kind == expr_kind::name && is_parameter(el, expr.text)) {
                return "argument " + expr.text;
            }
            return render_expression(expr);
        }

        static bool is_instance_check(const expression& expr) {
            return expr.kind == expr_kind::call && expr.operands.size() == 3U &&
                   expr.operands[0].kind == expr_kind::name && expr.operands[0].text == "isinstance"sv;
        }

        /*
         * Walk context shared by the scans. `conditions` holds the tests (already negated
         * for else branches) and handler frames enclosing the current statement, innermost
         * last. `guarded_depth` counts enclosing constructs that may skip the statement.
         */
        struct condition_frame {
            std::optional<expression> test{};
            std::string caught{};
        };

        struct walk_context {
            std::vector<condition_frame> conditions{};
            size_t guarded_depth{};
            size_t ordinal{};
            std::vector<std::string> handlers{};

            bool conditional() const { return guarded_depth > 0U; }
        };

        using statement_visitor = std::function<void(const statement&, const walk_context&)>;

        static void walk(const std::vector<statement>& statements, walk_context& ctx, const statement_visitor& visit);

        static void walk_nested(
                const std::vector<statement>& statements,
                walk_context& ctx,
                const statement_visitor& visit,
                std::optional<condition_frame> frame,
                bool guarded) {
            if (frame) {
                ctx.conditions.push_back(std::move(*frame));
            }
            if (guarded) {
                ++ctx.guarded_depth;
            }
            walk(statements, ctx, visit);
            if (guarded) {
                --ctx.guarded_depth;
            }
            if (frame) {
                ctx.conditions.pop_back();
            }
        }

        static void walk(const std::vector<statement>& statements, walk_context& ctx, const statement_visitor& visit) {
            for (const auto& stmt : statements) {
                ++ctx.ordinal;
                visit(stmt, ctx);

                switch (stmt.kind) {
                    case stmt_kind::branch: {
                        std::optional<condition_frame> then_frame{};
                        std::optional<condition_frame> else_frame{};
                        if (stmt.value) {
                            then_frame = condition_frame{*stmt.value, {}};
                            else_frame = condition_frame{negate_condition(*stmt.value), {}};
                        }
                        walk_nested(stmt.body, ctx, visit, std::move(then_frame), true);
                        walk_nested(stmt.orelse, ctx, visit, std::move(else_frame), true);
                        break;
                    }
                    case stmt_kind::loop: {
                        std::optional<condition_frame> frame{};
                        if (stmt.op == "while"sv && stmt.value) {
                            frame = condition_frame{*stmt.value, {}};
                        }
                        walk_nested(stmt.body, ctx, visit, std::move(frame), true);
                        walk_nested(stmt.orelse, ctx, visit, std::nullopt, true);
                        break;
                    }
                    case stmt_kind::guarded:
                        walk_nested(stmt.body, ctx, visit, std::nullopt, false);
                        for (const auto& handler : stmt.handlers) {
                            ++ctx.ordinal;
                            visit(handler, ctx);
                            ctx.handlers.push_back(handler.exception);
                            walk_nested(handler.body, ctx, visit, condition_frame{std::nullopt, handler.exception}, true);
                            ctx.handlers.pop_back();
                        }
                        walk_nested(stmt.orelse, ctx, visit, std::nullopt, true);
                        walk_nested(stmt.finally_body, ctx, visit, std::nullopt, false);
                        break;
                    case stmt_kind::handler:
                        ctx.handlers.push_back(stmt.exception);
                        walk_nested(stmt.body, ctx, visit, condition_frame{std::nullopt, stmt.exception}, true);
                        ctx.handlers.pop_back();
                        break;
                    case stmt_kind::block:
                        walk_nested(stmt.body, ctx, visit, std::nullopt, false);
                        break;
                    default:
                        break;
                }
            }
        }

        static std::string describe_frame(const condition_frame& frame, const element& el) {
            if (frame.test) {
                return describe_condition(*frame.test, el);
            }
            return "{} is caught"_format(frame.caught.empty() ? "an exception"s : frame.caught);
        }

        static std::string innermost_trigger(const walk_context& ctx, const element& el) {
            if (ctx.conditions.empty()) {
                return std::string{unconditional_trigger};
            }
            return describe_frame(ctx.conditions.back(), el);
        }

        static std::string raised_exception(const statement& stmt, const walk_context& ctx) {
            if (!stmt.value) {
                if (!ctx.handlers.empty() && !ctx.handlers.back().empty()) {
                    return ctx.handlers.back();
                }
                return "active exception";
            }
            const auto& value = *stmt.value;
            if (value.kind == expr_kind::call && !value.operands.empty()) {
                return render_expression(value.operands[0]);
            }
            return render_expression(value);
        }

        static std::string raise_description(const std::string& exception, const std::string& trigger) {
            if (trigger == unconditional_trigger) {
                return exception + " - unconditionally";
            }
            return exception + " - when " + trigger;
        }

        /*
         * A return that may have been taken before a later statement runs. `skipped_when`
         * phrases the path that passes it, known only for a return under a single
         * top-level test.
         */
        struct early_exit {
            std::optional<std::string> skipped_when{};
        };

        static early_exit make_early_exit(const walk_context& at, const element& el) {
            if (at.conditions.size() == 1U && at.guarded_depth == 1U && at.conditions[0].test) {
                return {describe_condition(negate_condition(*at.conditions[0].test), el)};
            }
            return {};
        }

        static std::string past_exits_trigger(const std::vector<early_exit>& exits) {
            std::vector<std::string> parts{};
            for (const auto& taken : exits) {
                if (!taken.skipped_when) {
                    return std::string{no_early_return_trigger};
                }
                if (std::ranges::find(parts, *taken.skipped_when) == parts.end()) {
                    parts.push_back(*taken.skipped_when);
                }
            }
            return utils::join_with_separator(parts, " and ");
        }

        static void raise_scan(const std::vector<statement>& statements, const element& el, fact_set& out) {
            walk_context ctx{};
            std::vector<early_exit> exits{};
            walk(statements, ctx, [&](const statement& stmt, const walk_context& at) {
                if (stmt.kind == stmt_kind::return_value && at.conditional()) {
                    exits.push_back(make_early_exit(at, el));
                    return;
                }
                if (stmt.kind != stmt_kind::raise) {
                    return;
                }
                fact f{};
                f.kind = fact_kind::raises;
                f.exception = raised_exception(stmt, at);
                if (at.conditions.empty() && !exits.empty()) {
                    f.trigger_condition = past_exits_trigger(exits);
                    f.conditional = true;
                }
                else {
                    f.trigger_condition = innermost_trigger(at, el);
                    f.conditional = !at.conditions.empty();
                }
                f.description = raise_description(f.exception, f.trigger_condition);
                f.ordinal = at.ordinal;
                f.line = stmt.line;
                if (!at.conditions.empty() && at.conditions.back().test) {
                    f.subject = inspected_subject(*at.conditions.back().test, el).value_or("");
                }

                bool duplicate = std::ranges::any_of(out.facts, [&](const fact& seen) {
                    return seen.kind == fact_kind::raises && seen.exception == f.exception &&
                           seen.trigger_condition == f.trigger_condition;
                });
                if (duplicate) {
                    return;
                }

                if (!f.conditional && last_segment(f.exception) != abstract_method_error) {
                    out.diagnostics.push_back(
                            {diagnostic_code::unconditional_raise,
                             severity::warning,
                             std::string{to_string(section_id::raises)},
                             stmt.line,
                             "{} is raised on every path through {}"_format(f.exception, el.qualified_path)});
                }
                out.facts.push_back(std::move(f));
            });
        }

        static std::string mutation_description(const statement& stmt, const std::string& subject_path) {
            auto value = stmt.value ? render_expression(*stmt.value) : std::string{};
            switch (stmt.kind) {
                case stmt_kind::assign:
                    return "{} is set to {}"_format(subject_path, value);
                case stmt_kind::augmented_assign:
                    if (stmt.op == "+"sv) {
                        return "{} reflects {} added"_format(subject_path, value);
                    }
                    if (stmt.op == "-"sv) {
                        return "{} reflects {} deducted"_format(subject_path, value);
                    }
                    if (stmt.op == "*"sv) {
                        return "{} is multiplied by {}"_format(subject_path, value);
                    }
                    if (stmt.op == "/"sv || stmt.op == "//"sv) {
                        return "{} is divided by {}"_format(subject_path, value);
                    }
                    return "{} is updated with {}= {}"_format(subject_path, stmt.op, value);
                case stmt_kind::remove:
                    return "{} is removed"_format(subject_path);
                default:
                    return "{} is modified"_format(subject_path);
            }
        }

        static std::string method_call_description(const std::string& object, std::string_view method, const expression& call) {
            std::vector<std::string> args{};
            for (size_t i = 1U; i < call.operands.size(); ++i) {
                args.push_back(render_expression(call.operands[i]));
            }
            auto joined = utils::join_with_separator(args, ", ");
            if ((method == "append"sv || method == "add"sv) && !joined.empty()) {
                return "{} contains {}"_format(object, joined);
            }
            if (method == "clear"sv) {
                return "{} is empty"_format(object);
            }
            return "{} is modified by {}"_format(object, method);
        }

        static void push_mutation(fact_set& out, fact f) {
            bool seen = std::ranges::any_of(out.facts, [&](const fact& existing) {
                return existing.kind == fact_kind::mutates && existing.subject == f.subject;
            });
            if (!seen) {
                out.facts.push_back(std::move(f));
            }
        }

        static void mutation_scan(const std::vector<statement>& statements, const element& el, fact_set& out) {
            auto instance = el.instance_name();
            if (!instance) {
                return;
            }

            walk_context ctx{};
            walk(statements, ctx, [&](const statement& stmt, const walk_context& at) {
                auto make_fact = [&](std::string subject, std::string description) {
                    fact f{};
                    f.kind = fact_kind::mutates;
                    f.subject = std::move(subject);
                    f.description = std::move(description);
                    f.conditional = at.conditional();
                    if (!at.conditions.empty()) {
                        f.trigger_condition = describe_frame(at.conditions.back(), el);
                    }
                    f.ordinal = at.ordinal;
                    f.line = stmt.line;
                    return f;
                };

                switch (stmt.kind) {
                    case stmt_kind::assign:
                    case stmt_kind::augmented_assign:
                    case stmt_kind::remove: {
                        if (!stmt.target) {
                            return;
                        }
                        std::vector<const expression*> targets{};
                        if (stmt.target->kind == expr_kind::sequence) {
                            for (const auto& part : stmt.target->operands) {
                                targets.push_back(&part);
                            }
                        }
                        else {
                            targets.push_back(&*stmt.target);
                        }
                        for (const auto* target : targets) {
                            if (auto subject = instance_attribute(*target, instance)) {
                                push_mutation(
                                        out, make_fact(*subject, mutation_description(stmt, render_expression(*target))));
                            }
                        }
                        return;
                    }
                    case stmt_kind::expression: {
                        if (!stmt.value || stmt.value->kind != expr_kind::call || stmt.value->operands.empty()) {
                            return;
                        }
                        const auto& callee = stmt.value->operands[0];
                        if (callee.kind != expr_kind::attribute || callee.operands.empty()) {
                            return;
                        }
                        if (std::ranges::find(mutating_methods, std::string_view{callee.text}) ==
                            mutating_methods.end()) {
                            return;
                        }
                        if (auto subject = instance_attribute(callee.operands[0], instance)) {
                            auto object = render_expression(callee.operands[0]);
                            push_mutation(
                                    out,
                                    make_fact(*subject, method_call_description(object, callee.text, *stmt.value)));
                        }
                        return;
                    }
                    default:
                        return;
                }
            });
        }

        static return_shape classify_return(const std::optional<expression>& value) {
            if (!value) {
                return return_shape::none;
            }
            switch (value->kind) {
                case expr_kind::literal:
                    return return_shape::literal;
                case expr_kind::attribute:
                    return return_shape::attribute_reference;
                case expr_kind::call:
                    return return_shape::call_result;
                default:
                    return return_shape::computed_expression;
            }
        }

        static void return_scan(const std::vector<statement>& statements, const element& el, fact_set& out) {
            walk_context ctx{};
            walk(statements, ctx, [&](const statement& stmt, const walk_context& at) {
                if (stmt.kind != stmt_kind::return_value) {
                    return;
                }
                fact f{};
                f.kind = fact_kind::returns;
                f.shape = classify_return(stmt.value);
                f.description = "{}: {}"_format(*f.shape, stmt.value ? render_expression(*stmt.value) : "None"s);
                f.conditional = at.conditional();
                if (!at.conditions.empty()) {
                    f.trigger_condition = describe_frame(at.conditions.back(), el);
                }
                f.ordinal = at.ordinal;
                f.line = stmt.line;
                out.facts.push_back(std::move(f));
            });
        }

        static void assertion_scan(const std::vector<statement>& statements, const element& el, fact_set& out) {
            walk_context ctx{};
            walk(statements, ctx, [&](const statement& stmt, const walk_context& at) {
                if (stmt.kind != stmt_kind::assertion || !stmt.value) {
                    return;
                }
                auto subject = inspected_subject(*stmt.value, el);
                if (!subject) {
                    return;
                }
                fact f{};
                f.kind = fact_kind::precondition_candidate;
                f.subject = *subject;
                f.description = describe_condition(*stmt.value, el);
                f.conditional = at.conditional();
                f.ordinal = at.ordinal;
                f.line = stmt.line;
                out.facts.push_back(std::move(f));
            });
        }

        static void scan_body(const element& el, const body& b, fact_set& out) {
            raise_scan(b.statements, el, out);
            mutation_scan(b.statements, el, out);
            return_scan(b.statements, el, out);
            assertion_scan(b.statements, el, out);
        }

        static void merge_constructor_facts(const element& cls, const body_store& bodies, fact_set& out) {
            auto offset = out.facts.empty() ? size_t{0} : out.facts.back().ordinal;
            for (const auto& child : cls.children) {
                if (!child.constructor) {
                    continue;
                }
                auto child_facts = extract_facts(child, bodies);
                out.body_available = out.body_available || child_facts.body_available;
                for (auto& f : child_facts.facts) {
                    if (f.kind != fact_kind::raises && f.kind != fact_kind::precondition_candidate) {
                        continue;
                    }
                    bool duplicate = f.kind == fact_kind::raises &&
                                     std::ranges::any_of(out.facts, [&](const fact& seen) {
                                         return seen.kind == fact_kind::raises && seen.exception == f.exception &&
                                                seen.trigger_condition == f.trigger_condition;
                                     });
                    if (duplicate) {
                        continue;
                    }
                    f.ordinal += offset;
                    out.facts.push_back(std::move(f));
                }
            }
        }

    }  // namespace detail

    std::string render_expression(const expression& expr) {
        switch (expr.kind) {
            case expr_kind::name:
            case expr_kind::literal:
            case expr_kind::other:
                return expr.text;
            case expr_kind::attribute:
                if (expr.operands.empty()) {
                    return expr.text;
                }
                return render_expression(expr.operands[0]) + "." + expr.text;
            case expr_kind::call: {
                if (expr.operands.empty()) {
                    return expr.text + "()";
                }
                std::vector<std::string> args{};
                for (size_t i = 1U; i < expr.operands.size(); ++i) {
                    args.push_back(render_expression(expr.operands[i]));
                }
                return render_expression(expr.operands[0]) + "(" + utils::join_with_separator(args, ", ") + ")";
            }
            case expr_kind::compare:
            case expr_kind::binary:
            case expr_kind::boolean: {
                std::vector<std::string> parts{};
                for (const auto& operand : expr.operands) {
                    parts.push_back(detail::render_operand(operand, expr));
                }
                return utils::join_with_separator(parts, " " + expr.text + " ");
            }
            case expr_kind::unary:
                if (expr.operands.empty()) {
                    return expr.text;
                }
                if (expr.text == "not"sv) {
                    auto inner = render_expression(expr.operands[0]);
                    if (expr.operands[0].kind == expr_kind::compare || expr.operands[0].kind == expr_kind::boolean) {
                        return "not (" + inner + ")";
                    }
                    return "not " + inner;
                }
                return expr.text + render_expression(expr.operands[0]);
            case expr_kind::subscript:
                if (expr.operands.size() < 2U) {
                    return expr.text;
                }
                return render_expression(expr.operands[0]) + "[" + render_expression(expr.operands[1]) + "]";
            case expr_kind::sequence: {
                std::vector<std::string> parts{};
                for (const auto& operand : expr.operands) {
                    parts.push_back(render_expression(operand));
                }
                return utils::join_with_separator(parts, ", ");
            }
        }
        return expr.text;
    }

    std::string describe_condition(const expression& test, const element& el) {
        if (test.kind == expr_kind::compare && test.operands.size() == 2U && detail::is_none_literal(test.operands[1])) {
            if (test.text == "is"sv || test.text == "=="sv) {
                return detail::subject_phrase(test.operands[0], el) + " is absent";
            }
            if (test.text == "is not"sv || test.text == "!="sv) {
                return detail::subject_phrase(test.operands[0], el) + " is present";
            }
        }
        if (detail::is_instance_check(test)) {
            return "{} is a {}"_format(
                    detail::subject_phrase(test.operands[1], el), render_expression(test.operands[2]));
        }
        if (test.kind == expr_kind::unary && test.text == "not"sv && test.operands.size() == 1U) {
            const auto& inner = test.operands[0];
            if (detail::is_instance_check(inner)) {
                return "{} is not a {}"_format(
                        detail::subject_phrase(inner.operands[1], el), render_expression(inner.operands[2]));
            }
            if (inner.kind == expr_kind::name || inner.kind == expr_kind::attribute) {
                return detail::subject_phrase(inner, el) + " is empty or absent";
            }
        }
        if (test.kind == expr_kind::name && detail::is_parameter(el, test.text)) {
            return "argument " + test.text + " is set";
        }
        return render_expression(test);
    }

    expression negate_condition(const expression& test) {
        static constexpr std::array<std::pair<std::string_view, std::string_view>, 10> inverse{{
                {"<"sv, ">="sv},
                {"<="sv, ">"sv},
                {">"sv, "<="sv},
                {">="sv, "<"sv},
                {"=="sv, "!="sv},
                {"!="sv, "=="sv},
                {"is"sv, "is not"sv},
                {"is not"sv, "is"sv},
                {"in"sv, "not in"sv},
                {"not in"sv, "in"sv},
        }};

        if (test.kind == expr_kind::compare && test.operands.size() == 2U) {
            for (const auto& [op, inverted] : inverse) {
                if (test.text == op) {
                    auto negated = test;
                    negated.text = std::string{inverted};
                    return negated;
                }
            }
        }
        if (test.kind == expr_kind::unary && test.text == "not"sv && test.operands.size() == 1U) {
            return test.operands[0];
        }
        return expression{expr_kind::unary, "not", {test}};
    }

    fact_set extract_facts(const element& el, const body_store& bodies) {
        fact_set out{};
        if (el.body_reference) {
            const auto* b = find_body(bodies, el.body_reference);
            if (b == nullptr || !b->readable) {
                out.diagnostics.push_back(
                        {diagnostic_code::unreadable_body,
                         severity::warning,
                         {},
                         std::nullopt,
                         "body '{}' of {} could not be read; facts unavailable"_format(
                                 *el.body_reference, el.qualified_path)});
            }
            else {
                out.body_available = true;
                detail::scan_body(el, *b, out);
            }
        }

        if (el.kind == element_kind::class_type) {
            detail::merge_constructor_facts(el, bodies, out);
        }

        debug_log(el.qualified_path, ": ", out.facts.size(), " facts");
        return out;
    }

    bool enforces_invariants(const element& el, const fact_set& facts) {
        return el.kind == element_kind::class_type &&
               (facts.any(fact_kind::raises) || facts.any(fact_kind::precondition_candidate));
    }

}  // namespace clause
