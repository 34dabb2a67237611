#include "utils.hpp"

#include <string>
#include <string_view>

namespace clause::test {
    using namespace std::string_literals;
    using namespace std::string_view_literals;

    namespace {
        constexpr auto account_tree = R"({
  "schema_version": 1,
  "elements": [
    {
      "kind": "module",
      "name": "bank",
      "qualified_path": "bank",
      "existing_doc_text": "PURPOSE: Account bookkeeping.\nDESCRIPTION: Balances and transfers.",
      "span": {"file": "bank.py", "first_line": 1, "last_line": 40},
      "children": [
        {
          "kind": "class",
          "name": "Account",
          "qualified_path": "bank.Account",
          "attributes": [{"name": "balance", "type": "Money"}],
          "existing_doc_text": "PURPOSE: A bank account.\nDESCRIPTION: Holds a balance.\nATTRIBUTES:\n    balance: Money - current funds",
          "span": {"file": "bank.py", "first_line": 3, "last_line": 30, "header_last_line": 4},
          "children": [
            {
              "kind": "method",
              "name": "transfer",
              "qualified_path": "bank.Account.transfer",
              "parameters": [{"name": "amount", "type": "Money"}],
              "return_type": "None",
              "body_reference": "bank.Account.transfer",
              "existing_doc_text": "PURPOSE: Move funds.\nDESCRIPTION: Deducts the amount.",
              "span": {"file": "bank.py", "first_line": 10, "last_line": 14}
            }
          ]
        },
        {
          "kind": "function",
          "name": "audit",
          "qualified_path": "bank.audit",
          "existing_doc_text": "PURPOSE: one\nPURPOSE: two",
          "frontend_note": "ignored"
        }
      ]
    }
  ],
  "bodies": {
    "bank.Account.transfer": {
      "statements": [
        {
          "kind": "if",
          "line": 11,
          "value": {"kind": "compare", "text": "<", "operands": [
            {"kind": "attribute", "text": "balance", "operands": [{"kind": "name", "text": "self"}]},
            {"kind": "name", "text": "amount"}
          ]},
          "body": [
            {"kind": "raise", "line": 12, "value": {"kind": "call", "operands": [
              {"kind": "name", "text": "InsufficientFundsError"},
              {"kind": "literal", "text": "'insufficient funds'"}
            ]}}
          ]
        },
        {
          "kind": "aug_assign",
          "line": 13,
          "op": "-",
          "target": {"kind": "attribute", "text": "balance", "operands": [{"kind": "name", "text": "self"}]},
          "value": {"kind": "name", "text": "amount"}
        }
      ]
    }
  }
})"sv;
    }  // namespace

    TEST_CASE("009: element trees load from json", "[009][tree]") {
        auto tree = load_tree(account_tree);
        REQUIRE(tree.elements.size() == 1U);
        const auto& mod = tree.elements[0];
        CHECK(mod.kind == element_kind::module);
        REQUIRE(mod.children.size() == 2U);

        const auto& cls = mod.children[0];
        CHECK(cls.kind == element_kind::class_type);
        REQUIRE(cls.attributes.size() == 1U);
        CHECK(cls.attributes[0].type == "Money");
        REQUIRE(cls.span);
        REQUIRE(cls.span->header_last_line);
        CHECK(*cls.span->header_last_line == 4U);

        const auto& method = cls.children[0];
        CHECK(method.kind == element_kind::method);
        REQUIRE(method.return_type);
        CHECK(*method.return_type == "None");
        REQUIRE(method.span);
        CHECK(method.span->first_line == 10U);
        CHECK_FALSE(method.span->header_last_line);

        const auto* b = find_body(tree.bodies, method.body_reference);
        REQUIRE(b != nullptr);
        CHECK(b->readable);
        REQUIRE(b->statements.size() == 2U);
        CHECK(b->statements[0].kind == stmt_kind::branch);
        CHECK(b->statements[1].kind == stmt_kind::augmented_assign);
        CHECK(b->statements[1].op == "-");

        auto flat = flatten(tree);
        REQUIRE(flat.size() == 4U);
        CHECK(flat[0]->qualified_path == "bank");
        CHECK(flat[1]->qualified_path == "bank.Account");
        CHECK(flat[2]->qualified_path == "bank.Account.transfer");
        CHECK(flat[3]->qualified_path == "bank.audit");
    }

    TEST_CASE("009: malformed trees are rejected", "[009][tree]") {
        SECTION("unknown element kind") {
            CHECK_THROWS_AS(load_tree(R"({"elements":[{"kind":"property","name":"x"}]})"sv), schema_lookup_error);
        }

        SECTION("unknown statement kind") {
            CHECK_THROWS_AS(
                    load_tree(R"({"elements":[],"bodies":{"f":{"statements":[{"kind":"goto"}]}}})"sv), tree_error);
        }

        SECTION("unknown expression kind") {
            CHECK_THROWS_AS(
                    load_tree(
                            R"({"bodies":{"f":{"statements":[{"kind":"expr","value":{"kind":"lambda"}}]}}})"sv),
                    tree_error);
        }

        SECTION("newer schema version") {
            CHECK_THROWS_AS(load_tree(R"({"schema_version":2,"elements":[]})"sv), tree_error);
        }

        SECTION("invalid json") {
            CHECK_THROWS_AS(load_tree(R"({"elements":[)"sv), tree_error);
        }

        SECTION("nameless element") {
            CHECK_THROWS_AS(load_tree(R"({"elements":[{"kind":"function"}]})"sv), tree_error);
        }

        SECTION("duplicate qualified path") {
            auto tree = load_tree(
                    R"({"elements":[{"kind":"function","name":"f"},{"kind":"function","name":"f"}]})"sv);
            CHECK_THROWS_AS(flatten(tree), tree_error);
            CHECK_THROWS_AS(run_engine(tree, engine_config{}), tree_error);
        }

        SECTION("missing file") {
            CHECK_THROWS_AS(load_tree_file("/nonexistent/tree.json"), tree_error);
        }
    }

    TEST_CASE("009: engine reports every element in pre-order", "[009][engine]") {
        auto tree = load_tree(account_tree);
        auto records = run_engine(tree, engine_config{});
        REQUIRE(records.size() == 4U);

        CHECK(records[0].qualified_path == "bank");
        CHECK(records[0].status == record_status::compliant);
        CHECK(records[0].diagnostics.empty());
        CHECK_FALSE(records[0].regenerated_text);

        CHECK(records[1].qualified_path == "bank.Account");
        CHECK(records[1].status == record_status::compliant);

        const auto& transfer = records[2];
        CHECK(transfer.status == record_status::regenerated);
        CHECK(detail::count_code(transfer.diagnostics, diagnostic_code::missing_section) == 2U);
        CHECK(detail::count_code(transfer.diagnostics, diagnostic_code::missing_contracts) == 1U);
        REQUIRE(transfer.regenerated_text);
        CHECK(transfer.regenerated_text->find("        - InsufficientFundsError - when self.balance < amount") !=
              std::string::npos);
        CHECK_FALSE(transfer.facts);

        const auto& audit = records[3];
        CHECK(audit.status == record_status::unresolved);
        REQUIRE_FALSE(audit.diagnostics.empty());
        CHECK(audit.diagnostics[0].code == diagnostic_code::parse_error);
        CHECK(audit.diagnostics[0].level == severity::warning);
        CHECK(audit.diagnostics[0].section == "PURPOSE");
        REQUIRE(audit.diagnostics[0].line);
        CHECK(*audit.diagnostics[0].line == 2U);
        CHECK(detail::count_code(audit.diagnostics, diagnostic_code::synthesis_unresolved) == 1U);
        CHECK_FALSE(audit.regenerated_text);

        CHECK(exit_status(records) == 1);
    }

    TEST_CASE("009: unresolved elements are recorded and the batch continues", "[009][engine]") {
        element_tree tree{};
        tree.elements.push_back(detail::function("nodoc", {}));
        auto ok = detail::function("ok", {});
        ok.existing_doc_text = "PURPOSE: Fine.\nDESCRIPTION: Nothing to see.\nCONTRACTS:\n    POSTCONDITION:\n        - nothing changes";
        tree.elements.push_back(ok);

        auto records = run_engine(tree, engine_config{});
        REQUIRE(records.size() == 2U);
        CHECK(records[0].status == record_status::unresolved);
        CHECK(detail::count_code(records[0].diagnostics, diagnostic_code::synthesis_unresolved) == 1U);
        CHECK(has_errors(records[0].diagnostics));
        CHECK(records[1].status == record_status::compliant);
        CHECK(exit_status(records) == 1);
    }

    TEST_CASE("009: facts are attached on request", "[009][engine]") {
        auto tree = detail::transfer_tree("PURPOSE: Move funds.\nDESCRIPTION: Deducts the amount."s);
        engine_config cfg{};
        cfg.include_facts = true;

        auto record = process_element(tree.elements[0], tree.bodies, cfg);
        REQUIRE(record.facts);
        CHECK(record.facts->size() == 2U);
        REQUIRE(record.summary);
        CHECK(*record.summary == "Deducts the amount.");
    }

    TEST_CASE("009: parallel runs match sequential runs", "[009][engine]") {
        auto loaded = load_tree(account_tree);
        element_tree tree{};
        tree.bodies = loaded.bodies;
        for (int i = 0; i < 16; ++i) {
            auto copy = loaded.elements[0];
            copy.qualified_path += std::to_string(i);
            for (auto& child : copy.children) {
                child.qualified_path = copy.qualified_path + "." + child.name;
                for (auto& grandchild : child.children) {
                    grandchild.qualified_path = child.qualified_path + "." + grandchild.name;
                }
            }
            tree.elements.push_back(std::move(copy));
        }

        engine_config sequential{};
        engine_config parallel{};
        parallel.jobs = 4U;
        engine_config automatic{};
        automatic.jobs = 0U;

        auto expected = render_json(run_engine(tree, sequential));
        CHECK(render_json(run_engine(tree, parallel)) == expected);
        CHECK(render_json(run_engine(tree, automatic)) == expected);
    }

    TEST_CASE("009: schema lookup failures abort the run", "[009][engine]") {
        element_tree tree{};
        auto el = detail::function("f", {});
        el.kind = static_cast<element_kind>(42);
        tree.elements.push_back(el);
        tree.elements.push_back(detail::function("g", {}));

        engine_config cfg{};
        cfg.jobs = 2U;
        CHECK_THROWS_AS(run_engine(tree, cfg), schema_lookup_error);
    }
}  // namespace clause::test
