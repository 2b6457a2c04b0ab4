#include "docstore/catalog/document_summary.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using Catch::Matchers::ContainsSubstring;
using docstore::catalog::ColumnDefinition;
using docstore::catalog::Document;
using docstore::catalog::Privilege;
using docstore::catalog::Row;
using docstore::catalog::Value;

namespace {

Document make_inventory_document()
{
    const auto now = docstore::catalog::timestamp_from_epoch_ms(0);
    auto document = docstore::catalog::make_empty_document(now);

    docstore::catalog::Table items{};
    items.name = "items";
    items.description = "Warehouse stock";
    items.primary_key = "sku";
    items.columns.emplace("sku", ColumnDefinition{"sku", "text", false, std::nullopt, true});
    items.columns.emplace("qty", ColumnDefinition{"qty", "integer", true, Value{0}, false});
    items.column_order = {"sku", "qty"};
    items.rows = {Row{{"sku", Value{"A-1"}}, {"qty", Value{3}}},
                  Row{{"sku", Value{"B-2"}}, {"qty", Value{5}}},
                  Row{{"sku", Value{"C-3"}}, {"qty", Value{}}}};

    docstore::catalog::TablePermission permission{};
    permission.role = "clerk";
    permission.privileges = {Privilege::Select, Privilege::Update};
    items.permissions.emplace("clerk", permission);
    document.tables.emplace("items", items);

    docstore::catalog::RoleDefinition clerk{};
    clerk.name = "clerk";
    document.roles.emplace("clerk", clerk);
    return document;
}

}  // namespace

TEST_CASE("summarize_document projects tables in column order")
{
    const auto summary = docstore::catalog::summarize_document(make_inventory_document());

    REQUIRE(summary.tables.size() == 1U);
    const auto* items = summary.find_table("items");
    REQUIRE(items != nullptr);
    CHECK(items->row_count == 3U);
    CHECK(items->column_count == 2U);
    REQUIRE(items->columns.size() == 2U);
    CHECK(items->columns[0].name == "sku");
    CHECK(items->columns[1].name == "qty");
    REQUIRE(items->permissions.size() == 1U);
    CHECK(items->permissions[0].privileges == std::vector<std::string>{"select", "update"});
    CHECK(summary.roles.size() == 2U);
    CHECK(summary.find_table("ghost") == nullptr);
}

TEST_CASE("summary_to_json uses camelCase fields")
{
    const auto json = docstore::catalog::summary_to_json(docstore::catalog::summarize_document(make_inventory_document()));

    CHECK_THAT(json, ContainsSubstring(R"("meta":{"version":1,"revision":0,)"));
    CHECK_THAT(json, ContainsSubstring(R"("primaryKey":"sku")"));
    CHECK_THAT(json, ContainsSubstring(R"("rowCount":3)"));
    CHECK_THAT(json, ContainsSubstring(R"({"name":"qty","dataType":"integer","nullable":true,"defaultValue":0,"isPrimaryKey":false})"));
    CHECK_THAT(json, ContainsSubstring(R"({"role":"clerk","privileges":["select","update"]})"));
}

TEST_CASE("format_prompt_digest lists tables, samples and roles")
{
    const auto digest = docstore::catalog::format_prompt_digest(make_inventory_document(), 2U);

    CHECK_THAT(digest, ContainsSubstring("Table \"items\" (3 row(s), 2 column(s))"));
    CHECK_THAT(digest, ContainsSubstring("  Description: Warehouse stock"));
    CHECK_THAT(digest, ContainsSubstring("    - sku: text PRIMARY KEY NOT NULL"));
    CHECK_THAT(digest, ContainsSubstring("    - qty: integer DEFAULT 0"));
    CHECK_THAT(digest, ContainsSubstring(R"({"qty":5,"sku":"B-2"})"));
    CHECK_FALSE(digest.find("C-3") != std::string::npos);
    CHECK_THAT(digest, ContainsSubstring("    - clerk: select, update"));
    CHECK_THAT(digest, ContainsSubstring("  - admin (Full access to every table and privilege.)"));
}

TEST_CASE("format_prompt_digest handles an empty document")
{
    const auto document = docstore::catalog::make_empty_document(docstore::catalog::timestamp_from_epoch_ms(0));
    const auto digest = docstore::catalog::format_prompt_digest(document, 0U);

    CHECK_THAT(digest, ContainsSubstring("No tables are currently defined."));
    CHECK_THAT(digest, ContainsSubstring("Roles:"));
}
