#include "docstore/planner/plan_parser.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <variant>

using Catch::Matchers::ContainsSubstring;
using docstore::catalog::Value;
using docstore::executor::OperationKind;

TEST_CASE("sanitize_planner_output strips fences and commentary")
{
    const std::string fenced = "Sure, here is the plan:\n```json\n{\"operations\": []}\n```\nThanks!";
    CHECK(docstore::planner::sanitize_planner_output(fenced) == "{\"operations\": []}");

    CHECK(docstore::planner::sanitize_planner_output("  noise {\"a\": {\"b\": 1}} trailing ") == "{\"a\": {\"b\": 1}}");
    CHECK(docstore::planner::sanitize_planner_output("   ").empty());
}

TEST_CASE("resolve_operation_tag normalises spellings")
{
    using docstore::planner::resolve_operation_tag;

    CHECK(resolve_operation_tag("ddl.create_table") == OperationKind::CreateTable);
    CHECK(resolve_operation_tag("createTable") == OperationKind::CreateTable);
    CHECK(resolve_operation_tag("create-table") == OperationKind::CreateTable);
    CHECK(resolve_operation_tag(" Create Table ") == OperationKind::CreateTable);
    CHECK(resolve_operation_tag("ddl.addColumn") == OperationKind::AlterTableAddColumn);
    CHECK(resolve_operation_tag("drop_column") == OperationKind::AlterTableDropColumn);
    CHECK(resolve_operation_tag("DML.Insert") == OperationKind::Insert);
    CHECK(resolve_operation_tag("select") == OperationKind::Select);
    CHECK(resolve_operation_tag("dcl.revoke") == OperationKind::Revoke);
    CHECK_FALSE(resolve_operation_tag("truncate").has_value());
    CHECK_FALSE(resolve_operation_tag("").has_value());
}

TEST_CASE("parse_operation decodes create table blueprints")
{
    const auto result = docstore::planner::parse_operation(R"({
        "type": "ddl.create_table",
        "table": "users",
        "description": "People",
        "ifExists": "skip",
        "columns": [
            {"name": "id", "dataType": "integer", "isPrimaryKey": true},
            {"name": "nickname"}
        ]
    })");

    REQUIRE(result.success());
    const auto& create = std::get<docstore::executor::CreateTableOperation>(*result.operation);
    CHECK(create.table == "users");
    CHECK(create.description == std::optional<std::string>{"People"});
    CHECK(create.if_exists == docstore::executor::IfExistsPolicy::Skip);
    REQUIRE(create.columns.size() == 2U);
    CHECK(create.columns[0].is_primary_key);
    CHECK(create.columns[1].data_type == "text");
    CHECK(create.columns[1].nullable == std::optional<bool>{true});
}

TEST_CASE("parse_operation decodes select clauses")
{
    const auto result = docstore::planner::parse_operation(R"({
        "type": "select",
        "table": "users",
        "columns": ["name"],
        "criteria": [{"column": "age", "operator": ">=", "value": 30}],
        "orderBy": [{"column": "name", "direction": "DESC"}],
        "limit": 5
    })");

    REQUIRE(result.success());
    const auto& select = std::get<docstore::executor::SelectOperation>(*result.operation);
    CHECK(select.columns == std::vector<std::string>{"name"});
    REQUIRE(select.criteria.size() == 1U);
    CHECK(select.criteria[0].op == docstore::executor::ComparisonOperator::Gte);
    CHECK(select.criteria[0].value == Value{30});
    REQUIRE(select.order_by.size() == 1U);
    CHECK(select.order_by[0].direction == docstore::executor::SortDirection::Desc);
    CHECK(select.limit == std::optional<std::size_t>{5U});
}

TEST_CASE("parse_operation decodes update and delete scopes")
{
    auto result = docstore::planner::parse_operation(
        R"({"type": "dml.update", "table": "users", "changes": {"age": 31}, "allRows": true})");
    REQUIRE(result.success());
    const auto& update = std::get<docstore::executor::UpdateOperation>(*result.operation);
    CHECK(update.all_rows);
    CHECK(update.changes.at("age") == Value{31});

    result = docstore::planner::parse_operation(R"({"type": "dml.update", "table": "users", "changes": {}})");
    REQUIRE_FALSE(result.success());
    CHECK(result.kind == OperationKind::Update);
    CHECK(result.error == "Update operation must specify at least one change.");

    result = docstore::planner::parse_operation(
        R"({"type": "dml.delete", "table": "users", "criteria": [{"column": "id", "operator": "in", "value": [1, 2]}]})");
    REQUIRE(result.success());
    CHECK(std::get<docstore::executor::DeleteOperation>(*result.operation).criteria.size() == 1U);
}

TEST_CASE("parse_operation reports malformed fields")
{
    auto result = docstore::planner::parse_operation(R"({"type": "dml.insert", "table": "users", "rows": []})");
    REQUIRE_FALSE(result.success());
    CHECK(result.kind == OperationKind::Insert);
    CHECK(result.error == "Field \"rows\" must be a non-empty array of objects.");

    result = docstore::planner::parse_operation(R"({"type": "dml.insert", "rows": [{"a": 1}]})");
    CHECK(result.error == "Field \"table\" must be a non-empty string.");

    result = docstore::planner::parse_operation(R"({"type": "dql.select", "table": "t", "limit": -1})");
    CHECK(result.error == "Field \"limit\" must be a non-negative integer.");

    result = docstore::planner::parse_operation(R"({"type": "dql.select", "table": "t", "limit": 1e20})");
    CHECK(result.error == "Field \"limit\" must be a non-negative integer.");

    result = docstore::planner::parse_operation(
        R"({"type": "ddl.alter_table_add_column", "table": "t", "column": {"name": "c"}, "position": 1e20})");
    CHECK(result.error == "Field \"position\" must be a non-negative integer.");

    result = docstore::planner::parse_operation(R"({"type": "dql.select", "table": "t", "limit": 9007199254740992})");
    REQUIRE(result.success());
    CHECK(std::get<docstore::executor::SelectOperation>(*result.operation).limit == std::size_t{9007199254740992U});

    result = docstore::planner::parse_operation(
        R"({"type": "dql.select", "table": "t", "criteria": [{"column": "a", "operator": "between"}]})");
    CHECK(result.error == "Unsupported comparison operator \"between\".");

    result = docstore::planner::parse_operation(R"({"type": "dcl.grant", "table": "t", "role": "r", "privileges": []})");
    CHECK(result.error == "Field \"privileges\" must be a non-empty array of strings.");

    result = docstore::planner::parse_operation(R"({"table": "t"})");
    CHECK_FALSE(result.kind.has_value());
    CHECK(result.error == "Operation is missing its \"type\" tag.");

    result = docstore::planner::parse_operation("{not json");
    CHECK_FALSE(result.success());
    CHECK_THAT(result.error, ContainsSubstring("(line 1, column"));
}

TEST_CASE("parse_plan reads plan metadata and operations")
{
    const auto result = docstore::planner::parse_plan(R"(```json
{
  "thought": "Create then fill",
  "finalResponse": "Done.",
  "warnings": ["Check ages"],
  "expectedRevision": 4,
  "operations": [
    {"type": "createTable", "table": "t", "columns": [{"name": "a"}]},
    {"type": "dml.insert", "table": "t", "rows": "oops"},
    {"type": "dql.select", "table": "t"}
  ]
}
```)");

    REQUIRE(result.success());
    const auto& plan = *result.plan;
    CHECK(plan.thought == std::optional<std::string>{"Create then fill"});
    CHECK(plan.final_response == std::optional<std::string>{"Done."});
    CHECK(plan.warnings == std::vector<std::string>{"Check ages"});
    CHECK(plan.expected_revision == std::optional<std::uint64_t>{4U});
    REQUIRE(plan.operations.size() == 3U);
    CHECK(plan.operations[0].valid());
    CHECK_FALSE(plan.operations[1].valid());
    CHECK(plan.operations[1].kind == OperationKind::Insert);
    CHECK(plan.operations[1].decode_error == "Field \"rows\" must be a non-empty array of objects.");
    CHECK(plan.operations[2].valid());
}

TEST_CASE("parse_plan rejects unknown operation types")
{
    const auto result = docstore::planner::parse_plan(
        R"({"operations": [{"type": "dql.select", "table": "t"}, {"type": "dml.truncate", "table": "t"}]})");

    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics[0].message == "Operation 2: Unknown operation type \"dml.truncate\".");
    CHECK_FALSE(result.diagnostics[0].remediation_hints.empty());
}

TEST_CASE("parse_plan reports invalid JSON with a position")
{
    const auto result = docstore::planner::parse_plan("{\"operations\": [\n  {\"type\": }\n]}");

    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK_THAT(result.diagnostics[0].message, ContainsSubstring("Planner response was not valid JSON: "));
    CHECK(result.diagnostics[0].line == 2U);
    CHECK(result.diagnostics[0].severity == docstore::planner::PlanSeverity::Error);
}

TEST_CASE("parse_plan accepts a plan without operations")
{
    const auto result = docstore::planner::parse_plan(R"({"thought": "Nothing to do"})");
    REQUIRE(result.success());
    CHECK(result.plan->operations.empty());

    const auto invalid = docstore::planner::parse_plan(R"({"operations": {"type": "select"}})");
    REQUIRE_FALSE(invalid.success());
    CHECK(invalid.diagnostics[0].message == "Field \"operations\" must be an array.");
}
