#include "docstore/catalog/schema_validation.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/document.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

using docstore::catalog::CatalogErrc;
using docstore::catalog::ColumnBlueprint;
using docstore::catalog::ColumnDefinition;
using docstore::catalog::DataTypeFamily;
using docstore::catalog::Privilege;
using docstore::catalog::PrivilegeSet;
using docstore::catalog::Value;
using docstore::catalog::ValueArray;

namespace {

ColumnDefinition make_column(std::string name, std::string data_type, bool nullable = true)
{
    ColumnDefinition column{};
    column.name = std::move(name);
    column.data_type = std::move(data_type);
    column.nullable = nullable;
    return column;
}

docstore::catalog::Timestamp fixed_time()
{
    return docstore::catalog::timestamp_from_epoch_ms(1'700'000'000'000);
}

}  // namespace

TEST_CASE("Data types classify by family")
{
    CHECK(docstore::catalog::classify_data_type("TEXT") == DataTypeFamily::Text);
    CHECK(docstore::catalog::classify_data_type(" varchar(255) ") == DataTypeFamily::Text);
    CHECK(docstore::catalog::classify_data_type("bigint") == DataTypeFamily::Integer);
    CHECK(docstore::catalog::classify_data_type("decimal(10, 2)") == DataTypeFamily::Number);
    CHECK(docstore::catalog::classify_data_type("bool") == DataTypeFamily::Boolean);
    CHECK(docstore::catalog::classify_data_type("timestamp") == DataTypeFamily::DateTime);
    CHECK(docstore::catalog::classify_data_type("jsonb") == DataTypeFamily::Json);
    CHECK(docstore::catalog::classify_data_type("geometry") == DataTypeFamily::Unknown);
    CHECK(docstore::catalog::classify_data_type("varchar(12") == DataTypeFamily::Unknown);
}

TEST_CASE("Column blueprints normalise into definitions")
{
    const std::map<std::string, ColumnDefinition> existing{};

    ColumnBlueprint blueprint{};
    blueprint.name = "  id ";
    blueprint.data_type = "integer";
    blueprint.nullable = true;
    blueprint.is_primary_key = true;

    ColumnDefinition column{};
    const auto status = docstore::catalog::validate_column_blueprint(blueprint, existing, column);
    REQUIRE(status.ok());
    CHECK(column.name == "id");
    CHECK(column.is_primary_key);
    CHECK_FALSE(column.nullable);
}

TEST_CASE("Column blueprints reject bad names and types")
{
    std::map<std::string, ColumnDefinition> existing{};
    existing.emplace("email", make_column("email", "text"));
    ColumnDefinition column{};

    ColumnBlueprint unnamed{};
    unnamed.data_type = "text";
    auto status = docstore::catalog::validate_column_blueprint(unnamed, existing, column);
    CHECK(status.error == CatalogErrc::SchemaError);
    CHECK(status.message == "Column name cannot be empty.");

    ColumnBlueprint duplicate{};
    duplicate.name = "email";
    duplicate.data_type = "text";
    status = docstore::catalog::validate_column_blueprint(duplicate, existing, column);
    CHECK(status.error == CatalogErrc::SchemaError);
    CHECK(status.message == "Duplicate column name \"email\".");

    ColumnBlueprint unknown_type{};
    unknown_type.name = "shape";
    unknown_type.data_type = "geometry";
    status = docstore::catalog::validate_column_blueprint(unknown_type, existing, column);
    CHECK(status.error == CatalogErrc::SchemaError);
    CHECK(status.message == "Column \"shape\" uses unrecognized data type \"geometry\".");
}

TEST_CASE("Column defaults are coerced to the column type")
{
    const std::map<std::string, ColumnDefinition> existing{};
    ColumnDefinition column{};

    ColumnBlueprint counter{};
    counter.name = "counter";
    counter.data_type = "integer";
    counter.default_value = Value{"5"};
    REQUIRE(docstore::catalog::validate_column_blueprint(counter, existing, column).ok());
    REQUIRE(column.default_value.has_value());
    CHECK(*column.default_value == Value{5});

    ColumnBlueprint broken{};
    broken.name = "ratio";
    broken.data_type = "number";
    broken.default_value = Value{"lots"};
    const auto status = docstore::catalog::validate_column_blueprint(broken, existing, column);
    CHECK(status.error == CatalogErrc::SchemaError);
    CHECK(status.message == "Default for column \"ratio\" is invalid: Value for column \"ratio\" must be numeric.");
}

TEST_CASE("A batch of blueprints allows a single primary key")
{
    const std::map<std::string, ColumnDefinition> existing{};

    ColumnBlueprint first{};
    first.name = "id";
    first.data_type = "integer";
    first.is_primary_key = true;

    ColumnBlueprint second{};
    second.name = "code";
    second.data_type = "text";
    second.is_primary_key = true;

    const std::vector<ColumnBlueprint> blueprints{first, second};
    std::vector<ColumnDefinition> columns{};
    const auto status = docstore::catalog::validate_column_blueprints(blueprints, existing, columns);
    CHECK(status.error == CatalogErrc::SchemaError);
    CHECK(columns.empty());

    const std::vector<ColumnBlueprint> repeated{second, ColumnBlueprint{"code", "text", {}, {}, false}};
    const auto duplicate_status = docstore::catalog::validate_column_blueprints(repeated, existing, columns);
    CHECK(duplicate_status.error == CatalogErrc::SchemaError);
    CHECK(duplicate_status.message == "Duplicate column name \"code\".");
}

TEST_CASE("Values coerce to their column family")
{
    Value out{};

    CHECK(docstore::catalog::coerce_value(make_column("age", "integer"), Value{"42"}, out).ok());
    CHECK(out == Value{42});

    auto status = docstore::catalog::coerce_value(make_column("age", "integer"), Value{4.5}, out);
    CHECK(status.error == CatalogErrc::ValidationError);
    CHECK(status.message == "Value for column \"age\" must be an integer.");

    CHECK(docstore::catalog::coerce_value(make_column("name", "text"), Value{42}, out).ok());
    CHECK(out == Value{"42"});

    status = docstore::catalog::coerce_value(make_column("name", "text"), Value{ValueArray{}}, out);
    CHECK(status.message == "Value for column \"name\" must be text.");

    CHECK(docstore::catalog::coerce_value(make_column("active", "boolean"), Value{" TRUE "}, out).ok());
    CHECK(out == Value{true});

    status = docstore::catalog::coerce_value(make_column("active", "boolean"), Value{1}, out);
    CHECK(status.message == "Value for column \"active\" must be boolean.");

    CHECK(docstore::catalog::coerce_value(make_column("price", "number"), Value{"9.5"}, out).ok());
    CHECK(out == Value{9.5});
}

TEST_CASE("Temporal values are stored as ISO-8601 text")
{
    Value out{};

    CHECK(docstore::catalog::coerce_value(make_column("seen", "timestamp"), Value{0}, out).ok());
    CHECK(out == Value{"1970-01-01T00:00:00.000Z"});

    CHECK(docstore::catalog::coerce_value(make_column("born", "date"), Value{"2024-02-29"}, out).ok());
    CHECK(out == Value{"2024-02-29T00:00:00.000Z"});

    const auto status = docstore::catalog::coerce_value(make_column("born", "date"), Value{"yesterday"}, out);
    CHECK(status.error == CatalogErrc::ValidationError);
    CHECK(status.message == "Value for column \"born\" must be a valid date.");
}

TEST_CASE("JSON columns parse string payloads")
{
    Value out{};

    CHECK(docstore::catalog::coerce_value(make_column("meta", "json"), Value{"{\"a\":1}"}, out).ok());
    REQUIRE(out.is_object());
    CHECK(*out.find("a") == Value{1});

    const auto status = docstore::catalog::coerce_value(make_column("meta", "json"), Value{"{oops"}, out);
    CHECK(status.error == CatalogErrc::ValidationError);
}

TEST_CASE("Null is accepted only by nullable columns")
{
    Value out{"placeholder"};

    CHECK(docstore::catalog::coerce_value(make_column("note", "text"), Value{}, out).ok());
    CHECK(out.is_null());

    const auto status = docstore::catalog::coerce_value(make_column("id", "integer", false), Value{}, out);
    CHECK(status.error == CatalogErrc::ValidationError);
    CHECK(status.message == "Column \"id\" does not allow null values.");
}

TEST_CASE("Privilege lists parse case-insensitively")
{
    PrivilegeSet privileges{};

    const std::vector<std::string> names{"SELECT", " insert ", "", "manage_permissions"};
    REQUIRE(docstore::catalog::parse_privileges(names, privileges).ok());
    CHECK(privileges == PrivilegeSet{Privilege::Select, Privilege::Insert, Privilege::ManagePermissions});
    CHECK(docstore::catalog::join_privileges(privileges) == "select, insert, manage_permissions");

    const std::vector<std::string> unknown{"select", "truncate"};
    auto status = docstore::catalog::parse_privileges(unknown, privileges);
    CHECK(status.error == CatalogErrc::ValidationError);
    CHECK(status.message == "Privilege \"truncate\" is not supported.");

    const std::vector<std::string> blank{"", "  "};
    status = docstore::catalog::parse_privileges(blank, privileges);
    CHECK(status.message == "At least one privilege must be listed.");
}

TEST_CASE("Privilege resolution honours the bootstrap role and table grants")
{
    auto document = docstore::catalog::make_empty_document(fixed_time());

    docstore::catalog::Table table{};
    table.name = "users";
    document.tables.emplace("users", table);

    docstore::catalog::RoleDefinition analyst{};
    analyst.name = "analyst";
    document.roles.emplace("analyst", analyst);

    CHECK(docstore::catalog::resolve_privilege(document, "admin", "users", Privilege::Drop));
    CHECK_FALSE(docstore::catalog::resolve_privilege(document, "analyst", "users", Privilege::Select));
    CHECK_FALSE(docstore::catalog::resolve_privilege(document, "ghost", "users", Privilege::Select));

    docstore::catalog::TablePermission permission{};
    permission.role = "analyst";
    permission.privileges = {Privilege::Select};
    document.tables["users"].permissions.emplace("analyst", permission);

    CHECK(docstore::catalog::resolve_privilege(document, "analyst", "users", Privilege::Select));
    CHECK_FALSE(docstore::catalog::resolve_privilege(document, "analyst", "users", Privilege::Insert));
    CHECK_FALSE(docstore::catalog::can_manage_privilege(document, "analyst", "users", Privilege::Select));
}

TEST_CASE("Column order insertion clamps the position")
{
    const std::vector<std::string> order{"id", "name"};

    CHECK(docstore::catalog::next_column_order(order, "email", std::nullopt) ==
          std::vector<std::string>{"id", "name", "email"});
    CHECK(docstore::catalog::next_column_order(order, "email", 1U) == std::vector<std::string>{"id", "email", "name"});
    CHECK(docstore::catalog::next_column_order(order, "email", 99U) ==
          std::vector<std::string>{"id", "name", "email"});
}
