#include "docstore/executor/operation.hpp"

#include <array>
#include <utility>

namespace docstore::executor {

namespace {

using catalog::CatalogErrc;

constexpr std::array<const char*, static_cast<std::size_t>(OperationKind::Count)> kOperationTags{
    "ddl.create_table",
    "ddl.drop_table",
    "ddl.alter_table_add_column",
    "ddl.alter_table_drop_column",
    "dml.insert",
    "dml.update",
    "dml.delete",
    "dql.select",
    "dcl.grant",
    "dcl.revoke"};

std::string join(const std::vector<std::string>& values, std::string_view separator)
{
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined.append(separator);
        }
        joined.append(value);
    }
    return joined;
}

std::string conditions_suffix(const Criteria& criteria)
{
    return " WHERE " + std::to_string(criteria.size()) + " conditions";
}

struct DescribeVisitor final {
    std::string operator()(const CreateTableOperation& operation) const
    {
        std::string columns;
        for (const auto& column : operation.columns) {
            if (!columns.empty()) {
                columns.append(", ");
            }
            columns.append(column.name);
            columns.push_back(' ');
            columns.append(column.data_type);
        }
        return "CREATE TABLE " + operation.table + " (" + columns + ")";
    }

    std::string operator()(const DropTableOperation& operation) const
    {
        return "DROP TABLE " + operation.table;
    }

    std::string operator()(const AddColumnOperation& operation) const
    {
        return "ALTER TABLE " + operation.table + " ADD COLUMN " + operation.column.name + " " +
               operation.column.data_type;
    }

    std::string operator()(const DropColumnOperation& operation) const
    {
        return "ALTER TABLE " + operation.table + " DROP COLUMN " + operation.column;
    }

    std::string operator()(const InsertOperation& operation) const
    {
        return "INSERT INTO " + operation.table + " VALUES (" + std::to_string(operation.rows.size()) + " rows)";
    }

    std::string operator()(const UpdateOperation& operation) const
    {
        std::vector<std::string> keys;
        keys.reserve(operation.changes.size());
        for (const auto& [key, value] : operation.changes) {
            keys.push_back(key);
        }
        auto text = "UPDATE " + operation.table + " SET " + join(keys, ", ");
        if (operation.all_rows) {
            return text;
        }
        return text + conditions_suffix(operation.criteria);
    }

    std::string operator()(const DeleteOperation& operation) const
    {
        auto text = "DELETE FROM " + operation.table;
        if (operation.all_rows) {
            return text;
        }
        return text + conditions_suffix(operation.criteria);
    }

    std::string operator()(const SelectOperation& operation) const
    {
        const auto projection = operation.columns.empty() ? std::string{"*"} : join(operation.columns, ", ");
        auto text = "SELECT " + projection + " FROM " + operation.table;
        if (!operation.criteria.empty()) {
            text += conditions_suffix(operation.criteria);
        }
        if (operation.limit) {
            text += " LIMIT " + std::to_string(*operation.limit);
        }
        return text;
    }

    std::string operator()(const GrantOperation& operation) const
    {
        return "GRANT " + join(operation.privileges, ", ") + " ON " + operation.table + " TO " + operation.role;
    }

    std::string operator()(const RevokeOperation& operation) const
    {
        return "REVOKE " + join(operation.privileges, ", ") + " ON " + operation.table + " FROM " + operation.role;
    }
};

}  // namespace

const char* to_string(OperationKind kind) noexcept
{
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kOperationTags.size()) {
        return "unknown";
    }
    return kOperationTags[index];
}

std::optional<OperationKind> operation_kind_from_tag(std::string_view tag) noexcept
{
    for (std::size_t index = 0U; index < kOperationTags.size(); ++index) {
        if (tag == kOperationTags[index]) {
            return static_cast<OperationKind>(index);
        }
    }
    return std::nullopt;
}

OperationCategory category_of(OperationKind kind) noexcept
{
    switch (kind) {
    case OperationKind::CreateTable:
    case OperationKind::DropTable:
    case OperationKind::AlterTableAddColumn:
    case OperationKind::AlterTableDropColumn:
        return OperationCategory::Ddl;
    case OperationKind::Insert:
    case OperationKind::Update:
    case OperationKind::Delete:
        return OperationCategory::Dml;
    case OperationKind::Select:
        return OperationCategory::Dql;
    case OperationKind::Grant:
    case OperationKind::Revoke:
    default:
        return OperationCategory::Dcl;
    }
}

const char* to_string(OperationCategory category) noexcept
{
    switch (category) {
    case OperationCategory::Ddl:
        return "DDL";
    case OperationCategory::Dml:
        return "DML";
    case OperationCategory::Dql:
        return "DQL";
    case OperationCategory::Dcl:
    default:
        return "DCL";
    }
}

bool is_mutating(OperationKind kind) noexcept
{
    return kind != OperationKind::Select;
}

const char* to_string(ComparisonOperator op) noexcept
{
    switch (op) {
    case ComparisonOperator::Eq:
        return "eq";
    case ComparisonOperator::Neq:
        return "neq";
    case ComparisonOperator::Gt:
        return "gt";
    case ComparisonOperator::Gte:
        return "gte";
    case ComparisonOperator::Lt:
        return "lt";
    case ComparisonOperator::Lte:
        return "lte";
    case ComparisonOperator::Contains:
        return "contains";
    case ComparisonOperator::In:
    default:
        return "in";
    }
}

std::optional<ComparisonOperator> parse_comparison_operator(std::string_view text)
{
    const auto normalized = catalog::lowercase_copy(catalog::trim_copy(text));
    if (normalized.empty() || normalized == "eq" || normalized == "=" || normalized == "==") {
        return ComparisonOperator::Eq;
    }
    if (normalized == "neq" || normalized == "!=" || normalized == "<>" || normalized == "ne") {
        return ComparisonOperator::Neq;
    }
    if (normalized == "gt" || normalized == ">") {
        return ComparisonOperator::Gt;
    }
    if (normalized == "gte" || normalized == ">=") {
        return ComparisonOperator::Gte;
    }
    if (normalized == "lt" || normalized == "<") {
        return ComparisonOperator::Lt;
    }
    if (normalized == "lte" || normalized == "<=") {
        return ComparisonOperator::Lte;
    }
    if (normalized == "contains" || normalized == "like") {
        return ComparisonOperator::Contains;
    }
    if (normalized == "in") {
        return ComparisonOperator::In;
    }
    return std::nullopt;
}

const char* to_string(IfExistsPolicy policy) noexcept
{
    switch (policy) {
    case IfExistsPolicy::Skip:
        return "skip";
    case IfExistsPolicy::Replace:
        return "replace";
    case IfExistsPolicy::Abort:
    default:
        return "abort";
    }
}

const char* to_string(SortDirection direction) noexcept
{
    return direction == SortDirection::Desc ? "desc" : "asc";
}

const std::string& target_table(const Operation& operation) noexcept
{
    return std::visit([](const auto& op) -> const std::string& { return op.table; }, operation);
}

std::string describe_operation(const Operation& operation)
{
    return std::visit(DescribeVisitor{}, operation);
}

const char* to_string(ExecutionStatus status) noexcept
{
    switch (status) {
    case ExecutionStatus::Success:
        return "success";
    case ExecutionStatus::Skipped:
        return "skipped";
    case ExecutionStatus::Error:
    default:
        return "error";
    }
}

const char* to_string(DiagnosticSeverity severity) noexcept
{
    switch (severity) {
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
    default:
        return "error";
    }
}

DiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept
{
    if (!error) {
        return DiagnosticSeverity::Info;
    }
    if (error.category() != catalog::catalog_error_category()) {
        return DiagnosticSeverity::Error;
    }

    switch (static_cast<CatalogErrc>(error.value())) {
    case CatalogErrc::Success:
        return DiagnosticSeverity::Info;
    case CatalogErrc::SchemaError:
    case CatalogErrc::ConflictError:
    case CatalogErrc::NotFoundError:
    case CatalogErrc::PrivilegeError:
    case CatalogErrc::ValidationError:
        return DiagnosticSeverity::Warning;
    default:
        return DiagnosticSeverity::Error;
    }
}

std::vector<std::string> default_remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != catalog::catalog_error_category()) {
        return {"Inspect the operation log for additional details."};
    }

    switch (static_cast<CatalogErrc>(error.value())) {
    case CatalogErrc::Success:
        return {};
    case CatalogErrc::SchemaError:
        return {"Check column names, data types, defaults and primary key declarations."};
    case CatalogErrc::ConflictError:
        return {"Use ifExists \"skip\" or \"replace\", or reload the summary and retry against the current revision."};
    case CatalogErrc::NotFoundError:
        return {"Confirm the table, column or role name against the current summary."};
    case CatalogErrc::PrivilegeError:
        return {"Grant the required privilege to the acting role or run the operation as admin."};
    case CatalogErrc::ValidationError:
        return {"Review the validation message and adjust the operation fields."};
    case CatalogErrc::PersistenceFailed:
        return {"Check that the data file directory is writable, then retry."};
    case CatalogErrc::ExecutionFailed:
        return {"Inspect the operation log for execution errors, then retry after resolving the underlying issue."};
    default:
        return {"Inspect the operation log for additional details."};
    }
}

ExecutionResult make_success(OperationKind kind, std::string detail)
{
    ExecutionResult result{};
    result.kind = kind;
    result.status = ExecutionStatus::Success;
    result.detail = std::move(detail);
    result.severity = DiagnosticSeverity::Info;
    return result;
}

ExecutionResult make_skipped(OperationKind kind, std::string detail)
{
    ExecutionResult result{};
    result.kind = kind;
    result.status = ExecutionStatus::Skipped;
    result.detail = std::move(detail);
    result.severity = DiagnosticSeverity::Info;
    return result;
}

ExecutionResult make_failure(OperationKind kind, std::error_code error, std::string detail)
{
    ExecutionResult result{};
    result.kind = kind;
    result.status = ExecutionStatus::Error;
    result.error = error;
    result.detail = std::move(detail);
    result.severity = default_diagnostic_severity(result.error);
    result.remediation_hints = default_remediation_hints(result.error);
    return result;
}

ExecutionResult make_failure(OperationKind kind,
                             std::error_code error,
                             std::string detail,
                             DiagnosticSeverity severity,
                             std::vector<std::string> remediation_hints)
{
    ExecutionResult result{};
    result.kind = kind;
    result.status = ExecutionStatus::Error;
    result.error = error;
    result.detail = std::move(detail);
    result.severity = severity;
    result.remediation_hints = std::move(remediation_hints);
    return result;
}

}  // namespace docstore::executor
