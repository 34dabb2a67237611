#pragma once

#include "clause/clause.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clause::test::detail {

    inline expression name(std::string text) {
        return expression{expr_kind::name, std::move(text), {}};
    }

    inline expression literal(std::string text) {
        return expression{expr_kind::literal, std::move(text), {}};
    }

    inline expression attr(expression object, std::string member) {
        return expression{expr_kind::attribute, std::move(member), {std::move(object)}};
    }

    inline expression self_attr(std::string member) {
        return attr(name("self"), std::move(member));
    }

    inline expression call(expression callee, std::vector<expression> args = {}) {
        expression out{expr_kind::call, {}, {std::move(callee)}};
        for (auto& arg : args) {
            out.operands.push_back(std::move(arg));
        }
        return out;
    }

    inline expression compare(expression lhs, std::string op, expression rhs) {
        return expression{expr_kind::compare, std::move(op), {std::move(lhs), std::move(rhs)}};
    }

    inline expression negated(expression operand) {
        return expression{expr_kind::unary, "not", {std::move(operand)}};
    }

    inline statement raise(expression exception, size_t line = 0U) {
        statement out{};
        out.kind = stmt_kind::raise;
        out.line = line;
        out.value = std::move(exception);
        return out;
    }

    inline statement if_(expression test, std::vector<statement> body, std::vector<statement> orelse = {}) {
        statement out{};
        out.kind = stmt_kind::branch;
        out.value = std::move(test);
        out.body = std::move(body);
        out.orelse = std::move(orelse);
        return out;
    }

    inline statement for_(expression target, expression iterable, std::vector<statement> body) {
        statement out{};
        out.kind = stmt_kind::loop;
        out.op = "for";
        out.target = std::move(target);
        out.value = std::move(iterable);
        out.body = std::move(body);
        return out;
    }

    inline statement assign(expression target, expression value) {
        statement out{};
        out.kind = stmt_kind::assign;
        out.target = std::move(target);
        out.value = std::move(value);
        return out;
    }

    inline statement aug_assign(expression target, std::string op, expression value) {
        statement out{};
        out.kind = stmt_kind::augmented_assign;
        out.target = std::move(target);
        out.op = std::move(op);
        out.value = std::move(value);
        return out;
    }

    inline statement return_(std::optional<expression> value = std::nullopt) {
        statement out{};
        out.kind = stmt_kind::return_value;
        out.value = std::move(value);
        return out;
    }

    inline statement assert_(expression test) {
        statement out{};
        out.kind = stmt_kind::assertion;
        out.value = std::move(test);
        return out;
    }

    inline statement expr_stmt(expression value) {
        statement out{};
        out.kind = stmt_kind::expression;
        out.value = std::move(value);
        return out;
    }

    inline element method(std::string name, std::vector<parameter> params, std::optional<std::string> returns = {}) {
        element el{};
        el.kind = element_kind::method;
        el.qualified_path = "Account." + name;
        el.name = std::move(name);
        el.parameters = std::move(params);
        el.return_type = std::move(returns);
        return el;
    }

    inline element function(std::string name, std::vector<parameter> params, std::optional<std::string> returns = {}) {
        element el{};
        el.kind = element_kind::function;
        el.qualified_path = "mod." + name;
        el.name = std::move(name);
        el.parameters = std::move(params);
        el.return_type = std::move(returns);
        return el;
    }

    /*
     *  def transfer(self, amount: Money) -> None:
     *      if self.balance < amount:
     *          raise InsufficientFundsError(...)
     *      self.balance -= amount
     */
    inline element_tree transfer_tree(std::optional<std::string> doc = std::nullopt) {
        element_tree tree{};
        auto el = method("transfer", {{"amount", "Money", false}}, "None");
        el.body_reference = "transfer";
        el.existing_doc_text = std::move(doc);

        body b{};
        b.statements.push_back(if_(
                compare(self_attr("balance"), "<", name("amount")),
                {raise(call(name("InsufficientFundsError"), {literal("'insufficient funds'")}), 3U)}));
        b.statements.push_back(aug_assign(self_attr("balance"), "-", name("amount")));
        tree.bodies.emplace("transfer", std::move(b));
        tree.elements.push_back(std::move(el));
        return tree;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline std::filesystem::path write_temp_file(std::string_view name, std::string_view contents) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out{path};
        out << contents;
        return path;
    }

    inline bool has_statement(const std::vector<std::string>& statements, std::string_view text) {
        return std::ranges::find(statements, text) != statements.end();
    }

    inline size_t count_code(const std::vector<diagnostic>& diagnostics, diagnostic_code code) {
        return static_cast<size_t>(
                std::ranges::count_if(diagnostics, [code](const diagnostic& d) { return d.code == code; }));
    }

}  // namespace clause::test::detail
