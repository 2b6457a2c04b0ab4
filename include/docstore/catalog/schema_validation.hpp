#pragma once

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/document.hpp"
#include "docstore/catalog/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docstore::catalog {

enum class DataTypeFamily : std::uint8_t {
    Unknown = 0,
    Text,
    Integer,
    Number,
    Boolean,
    Date,
    DateTime,
    Json
};

struct ColumnBlueprint final {
    std::string name{};
    std::string data_type{};
    std::optional<bool> nullable{};
    std::optional<Value> default_value{};
    bool is_primary_key = false;

    friend bool operator==(const ColumnBlueprint&, const ColumnBlueprint&) = default;
};

struct SchemaStatus final {
    std::error_code error{};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

[[nodiscard]] SchemaStatus make_schema_failure(CatalogErrc error, std::string message);

[[nodiscard]] std::string trim_copy(std::string_view text);
[[nodiscard]] std::string lowercase_copy(std::string_view text);

[[nodiscard]] DataTypeFamily classify_data_type(std::string_view data_type);
[[nodiscard]] bool is_recognized_data_type(std::string_view data_type);
[[nodiscard]] const char* to_string(DataTypeFamily family) noexcept;

// Normalises `blueprint` into a column definition. Fails with SchemaError when
// the name is empty or already taken, the data type is unknown, or the default
// does not fit the column.
[[nodiscard]] SchemaStatus validate_column_blueprint(const ColumnBlueprint& blueprint,
                                                     const std::map<std::string, ColumnDefinition>& existing,
                                                     ColumnDefinition& column);

// Validates every blueprint of one create/alter call, including duplicates
// inside the call and the single-primary-key rule. Nothing is written to
// `columns` unless every blueprint passes.
[[nodiscard]] SchemaStatus validate_column_blueprints(std::span<const ColumnBlueprint> blueprints,
                                                      const std::map<std::string, ColumnDefinition>& existing,
                                                      std::vector<ColumnDefinition>& columns);

// Coerces a cell value to the column's type family. Null is accepted only for
// nullable columns.
[[nodiscard]] SchemaStatus coerce_value(const ColumnDefinition& column, const Value& input, Value& output);

[[nodiscard]] bool is_superuser_role(std::string_view role) noexcept;

// True when `role` holds `action` on `table`. Roles without a permission entry
// hold nothing; the bootstrap role holds everything.
[[nodiscard]] bool resolve_privilege(const Document& document,
                                     std::string_view role,
                                     std::string_view table,
                                     Privilege action);

// Grant/revoke authority: manage_permissions covers every privilege,
// manage_permissions included.
[[nodiscard]] bool can_manage_privilege(const Document& document,
                                        std::string_view role,
                                        std::string_view table,
                                        Privilege privilege);

// Column order after inserting `column` at `position` (clamped), or appended
// when no position is given.
[[nodiscard]] std::vector<std::string> next_column_order(const std::vector<std::string>& order,
                                                         const std::string& column,
                                                         std::optional<std::size_t> position);

[[nodiscard]] SchemaStatus parse_privileges(std::span<const std::string> names, PrivilegeSet& privileges);

[[nodiscard]] std::string join_privileges(const PrivilegeSet& privileges, std::string_view separator = ", ");

}  // namespace docstore::catalog
