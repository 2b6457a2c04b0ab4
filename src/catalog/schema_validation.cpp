#include "docstore/catalog/schema_validation.hpp"

#include "docstore/storage/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <utility>

namespace docstore::catalog {

namespace {

struct DataTypeAlias final {
    std::string_view name;
    DataTypeFamily family;
};

constexpr DataTypeAlias kDataTypeAliases[] = {
    {"text", DataTypeFamily::Text},
    {"string", DataTypeFamily::Text},
    {"uuid", DataTypeFamily::Text},
    {"varchar", DataTypeFamily::Text},
    {"char", DataTypeFamily::Text},
    {"integer", DataTypeFamily::Integer},
    {"int", DataTypeFamily::Integer},
    {"bigint", DataTypeFamily::Integer},
    {"smallint", DataTypeFamily::Integer},
    {"serial", DataTypeFamily::Integer},
    {"number", DataTypeFamily::Number},
    {"float", DataTypeFamily::Number},
    {"real", DataTypeFamily::Number},
    {"double", DataTypeFamily::Number},
    {"decimal", DataTypeFamily::Number},
    {"numeric", DataTypeFamily::Number},
    {"boolean", DataTypeFamily::Boolean},
    {"bool", DataTypeFamily::Boolean},
    {"date", DataTypeFamily::Date},
    {"datetime", DataTypeFamily::DateTime},
    {"timestamp", DataTypeFamily::DateTime},
    {"timestamptz", DataTypeFamily::DateTime},
    {"json", DataTypeFamily::Json},
    {"jsonb", DataTypeFamily::Json},
};

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

std::string quoted(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2U);
    out.push_back('"');
    out.append(text);
    out.push_back('"');
    return out;
}

SchemaStatus value_failure(const ColumnDefinition& column, std::string_view expectation)
{
    return make_schema_failure(CatalogErrc::ValidationError,
                               "Value for column " + quoted(column.name) + " must be " + std::string{expectation} + ".");
}

bool is_integral(double value) noexcept
{
    return std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= kMaxExactInteger;
}

SchemaStatus coerce_temporal(const ColumnDefinition& column, const Value& input, Value& output)
{
    std::optional<Timestamp> parsed{};
    if (input.is_string()) {
        parsed = parse_timestamp_iso(trim_copy(input.as_string()));
    } else if (input.is_number() && is_integral(input.as_number())) {
        parsed = timestamp_from_epoch_ms(static_cast<std::int64_t>(input.as_number()));
    }
    if (!parsed) {
        return value_failure(column, "a valid date");
    }
    output = Value{format_timestamp_iso(*parsed)};
    return {};
}

}  // namespace

SchemaStatus make_schema_failure(CatalogErrc error, std::string message)
{
    SchemaStatus status{};
    status.error = make_error_code(error);
    status.message = std::move(message);
    return status;
}

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1U)};
}

std::string lowercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

DataTypeFamily classify_data_type(std::string_view data_type)
{
    auto name = lowercase_copy(trim_copy(data_type));
    const auto paren = name.find('(');
    if (paren != std::string::npos) {
        if (name.back() != ')') {
            return DataTypeFamily::Unknown;
        }
        name = trim_copy(std::string_view{name}.substr(0U, paren));
    }

    for (const auto& alias : kDataTypeAliases) {
        if (alias.name == name) {
            return alias.family;
        }
    }
    return DataTypeFamily::Unknown;
}

bool is_recognized_data_type(std::string_view data_type)
{
    return classify_data_type(data_type) != DataTypeFamily::Unknown;
}

const char* to_string(DataTypeFamily family) noexcept
{
    switch (family) {
    case DataTypeFamily::Text:
        return "text";
    case DataTypeFamily::Integer:
        return "integer";
    case DataTypeFamily::Number:
        return "number";
    case DataTypeFamily::Boolean:
        return "boolean";
    case DataTypeFamily::Date:
        return "date";
    case DataTypeFamily::DateTime:
        return "datetime";
    case DataTypeFamily::Json:
        return "json";
    case DataTypeFamily::Unknown:
    default:
        return "unknown";
    }
}

SchemaStatus validate_column_blueprint(const ColumnBlueprint& blueprint,
                                       const std::map<std::string, ColumnDefinition>& existing,
                                       ColumnDefinition& column)
{
    auto name = trim_copy(blueprint.name);
    if (name.empty()) {
        return make_schema_failure(CatalogErrc::SchemaError, "Column name cannot be empty.");
    }
    if (existing.contains(name)) {
        return make_schema_failure(CatalogErrc::SchemaError, "Duplicate column name " + quoted(name) + ".");
    }

    auto data_type = trim_copy(blueprint.data_type);
    if (data_type.empty()) {
        return make_schema_failure(CatalogErrc::SchemaError, "Column " + quoted(name) + " must declare a data type.");
    }
    if (!is_recognized_data_type(data_type)) {
        return make_schema_failure(CatalogErrc::SchemaError,
                                   "Column " + quoted(name) + " uses unrecognized data type " + quoted(data_type) + ".");
    }

    ColumnDefinition candidate{};
    candidate.name = std::move(name);
    candidate.data_type = std::move(data_type);
    candidate.is_primary_key = blueprint.is_primary_key;
    candidate.nullable = blueprint.is_primary_key ? false : blueprint.nullable.value_or(true);

    if (blueprint.default_value) {
        if (blueprint.default_value->is_null() && !candidate.nullable) {
            return make_schema_failure(CatalogErrc::SchemaError,
                                       "Column " + quoted(candidate.name) + " cannot default to null because it is not nullable.");
        }
        Value coerced{};
        if (auto status = coerce_value(candidate, *blueprint.default_value, coerced); !status.ok()) {
            return make_schema_failure(CatalogErrc::SchemaError,
                                       "Default for column " + quoted(candidate.name) + " is invalid: " + status.message);
        }
        candidate.default_value = std::move(coerced);
    }

    column = std::move(candidate);
    return {};
}

SchemaStatus validate_column_blueprints(std::span<const ColumnBlueprint> blueprints,
                                        const std::map<std::string, ColumnDefinition>& existing,
                                        std::vector<ColumnDefinition>& columns)
{
    auto known = existing;
    std::vector<ColumnDefinition> staged;
    staged.reserve(blueprints.size());
    std::optional<std::string> primary_key{};

    for (const auto& blueprint : blueprints) {
        ColumnDefinition column{};
        if (auto status = validate_column_blueprint(blueprint, known, column); !status.ok()) {
            return status;
        }
        if (column.is_primary_key) {
            if (primary_key) {
                return make_schema_failure(CatalogErrc::SchemaError,
                                           "Multiple primary keys are not supported (" + quoted(*primary_key) + " and " +
                                               quoted(column.name) + ").");
            }
            primary_key = column.name;
        }
        known.emplace(column.name, column);
        staged.push_back(std::move(column));
    }

    columns = std::move(staged);
    return {};
}

SchemaStatus coerce_value(const ColumnDefinition& column, const Value& input, Value& output)
{
    if (input.is_null()) {
        if (!column.nullable) {
            return make_schema_failure(CatalogErrc::ValidationError,
                                       "Column " + quoted(column.name) + " does not allow null values.");
        }
        output = Value{};
        return {};
    }

    switch (classify_data_type(column.data_type)) {
    case DataTypeFamily::Text:
        if (input.is_array() || input.is_object()) {
            return value_failure(column, "text");
        }
        output = Value{to_display_string(input)};
        return {};
    case DataTypeFamily::Integer: {
        std::optional<double> number{};
        if (input.is_number()) {
            number = input.as_number();
        } else if (input.is_string()) {
            number = parse_number(input.as_string());
        }
        if (!number || !is_integral(*number)) {
            return value_failure(column, "an integer");
        }
        output = Value{*number};
        return {};
    }
    case DataTypeFamily::Number: {
        std::optional<double> number{};
        if (input.is_number() && std::isfinite(input.as_number())) {
            number = input.as_number();
        } else if (input.is_string()) {
            number = parse_number(input.as_string());
        }
        if (!number) {
            return value_failure(column, "numeric");
        }
        output = Value{*number};
        return {};
    }
    case DataTypeFamily::Boolean:
        if (input.is_bool()) {
            output = input;
            return {};
        }
        if (input.is_string()) {
            const auto normalized = lowercase_copy(trim_copy(input.as_string()));
            if (normalized == "true") {
                output = Value{true};
                return {};
            }
            if (normalized == "false") {
                output = Value{false};
                return {};
            }
        }
        return value_failure(column, "boolean");
    case DataTypeFamily::Date:
    case DataTypeFamily::DateTime:
        return coerce_temporal(column, input, output);
    case DataTypeFamily::Json:
        if (input.is_string()) {
            auto parsed = storage::parse_json(input.as_string());
            if (!parsed.success()) {
                return make_schema_failure(CatalogErrc::ValidationError,
                                           "Invalid JSON for column " + quoted(column.name) + ": " + parsed.message);
            }
            output = std::move(*parsed.value);
            return {};
        }
        output = input;
        return {};
    case DataTypeFamily::Unknown:
    default:
        output = input;
        return {};
    }
}

bool is_superuser_role(std::string_view role) noexcept
{
    return role == kBootstrapRoleName;
}

bool resolve_privilege(const Document& document, std::string_view role, std::string_view table, Privilege action)
{
    if (document.find_role(role) == nullptr) {
        return false;
    }
    if (is_superuser_role(role)) {
        return true;
    }

    const auto* target = document.find_table(table);
    if (target == nullptr) {
        return false;
    }
    const auto it = target->permissions.find(std::string{role});
    if (it == target->permissions.end()) {
        return false;
    }
    return it->second.privileges.contains(action);
}

bool can_manage_privilege(const Document& document, std::string_view role, std::string_view table, Privilege)
{
    return resolve_privilege(document, role, table, Privilege::ManagePermissions);
}

std::vector<std::string> next_column_order(const std::vector<std::string>& order,
                                           const std::string& column,
                                           std::optional<std::size_t> position)
{
    auto next = order;
    const auto index = std::min(position.value_or(next.size()), next.size());
    next.insert(next.begin() + static_cast<std::ptrdiff_t>(index), column);
    return next;
}

SchemaStatus parse_privileges(std::span<const std::string> names, PrivilegeSet& privileges)
{
    PrivilegeSet parsed{};
    for (const auto& name : names) {
        const auto normalized = lowercase_copy(trim_copy(name));
        if (normalized.empty()) {
            continue;
        }
        const auto privilege = privilege_from_string(normalized);
        if (!privilege) {
            return make_schema_failure(CatalogErrc::ValidationError,
                                       "Privilege " + quoted(normalized) + " is not supported.");
        }
        parsed.insert(*privilege);
    }

    if (parsed.empty()) {
        return make_schema_failure(CatalogErrc::ValidationError, "At least one privilege must be listed.");
    }

    privileges = std::move(parsed);
    return {};
}

std::string join_privileges(const PrivilegeSet& privileges, std::string_view separator)
{
    std::string joined;
    for (const auto privilege : privileges) {
        if (!joined.empty()) {
            joined.append(separator);
        }
        joined.append(to_string(privilege));
    }
    return joined;
}

}  // namespace docstore::catalog
