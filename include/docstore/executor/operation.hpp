#pragma once

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/schema_validation.hpp"
#include "docstore/catalog/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace docstore::executor {

enum class OperationKind : std::uint8_t {
    CreateTable = 0,
    DropTable,
    AlterTableAddColumn,
    AlterTableDropColumn,
    Insert,
    Update,
    Delete,
    Select,
    Grant,
    Revoke,
    Count
};

enum class OperationCategory : std::uint8_t {
    Ddl = 0,
    Dml,
    Dql,
    Dcl
};

enum class IfExistsPolicy : std::uint8_t {
    Abort = 0,
    Skip,
    Replace
};

enum class ComparisonOperator : std::uint8_t {
    Eq = 0,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte,
    Contains,
    In
};

enum class SortDirection : std::uint8_t {
    Asc = 0,
    Desc
};

struct CriteriaCondition final {
    std::string column{};
    ComparisonOperator op = ComparisonOperator::Eq;
    catalog::Value value{};

    friend bool operator==(const CriteriaCondition&, const CriteriaCondition&) = default;
};

using Criteria = std::vector<CriteriaCondition>;

struct OrderByClause final {
    std::string column{};
    SortDirection direction = SortDirection::Asc;

    friend bool operator==(const OrderByClause&, const OrderByClause&) = default;
};

struct CreateTableOperation final {
    std::string table{};
    std::optional<std::string> description{};
    std::vector<catalog::ColumnBlueprint> columns{};
    IfExistsPolicy if_exists = IfExistsPolicy::Abort;
};

struct DropTableOperation final {
    std::string table{};
    bool if_exists = false;
};

struct AddColumnOperation final {
    std::string table{};
    catalog::ColumnBlueprint column{};
    std::optional<std::size_t> position{};
};

struct DropColumnOperation final {
    std::string table{};
    std::string column{};
};

struct InsertOperation final {
    std::string table{};
    std::vector<catalog::Row> rows{};
};

// `all_rows` must be set to touch every row with an empty criteria list.
struct UpdateOperation final {
    std::string table{};
    catalog::Row changes{};
    Criteria criteria{};
    bool all_rows = false;
};

struct DeleteOperation final {
    std::string table{};
    Criteria criteria{};
    bool all_rows = false;
};

struct SelectOperation final {
    std::string table{};
    std::vector<std::string> columns{};
    Criteria criteria{};
    std::vector<OrderByClause> order_by{};
    std::optional<std::size_t> limit{};
};

struct GrantOperation final {
    std::string table{};
    std::string role{};
    std::vector<std::string> privileges{};
    std::optional<std::string> role_description{};
};

struct RevokeOperation final {
    std::string table{};
    std::string role{};
    std::vector<std::string> privileges{};
};

// Alternative order matches OperationKind.
using Operation = std::variant<CreateTableOperation,
                               DropTableOperation,
                               AddColumnOperation,
                               DropColumnOperation,
                               InsertOperation,
                               UpdateOperation,
                               DeleteOperation,
                               SelectOperation,
                               GrantOperation,
                               RevokeOperation>;

namespace detail {

template <typename Op>
struct OperationTrait;

template <>
struct OperationTrait<CreateTableOperation> {
    static constexpr OperationKind kind = OperationKind::CreateTable;
};

template <>
struct OperationTrait<DropTableOperation> {
    static constexpr OperationKind kind = OperationKind::DropTable;
};

template <>
struct OperationTrait<AddColumnOperation> {
    static constexpr OperationKind kind = OperationKind::AlterTableAddColumn;
};

template <>
struct OperationTrait<DropColumnOperation> {
    static constexpr OperationKind kind = OperationKind::AlterTableDropColumn;
};

template <>
struct OperationTrait<InsertOperation> {
    static constexpr OperationKind kind = OperationKind::Insert;
};

template <>
struct OperationTrait<UpdateOperation> {
    static constexpr OperationKind kind = OperationKind::Update;
};

template <>
struct OperationTrait<DeleteOperation> {
    static constexpr OperationKind kind = OperationKind::Delete;
};

template <>
struct OperationTrait<SelectOperation> {
    static constexpr OperationKind kind = OperationKind::Select;
};

template <>
struct OperationTrait<GrantOperation> {
    static constexpr OperationKind kind = OperationKind::Grant;
};

template <>
struct OperationTrait<RevokeOperation> {
    static constexpr OperationKind kind = OperationKind::Revoke;
};

}  // namespace detail

template <typename Op>
constexpr OperationKind operation_kind() noexcept
{
    return detail::OperationTrait<Op>::kind;
}

inline OperationKind operation_kind(const Operation& operation) noexcept
{
    return static_cast<OperationKind>(operation.index());
}

static_assert(std::variant_size_v<Operation> == static_cast<std::size_t>(OperationKind::Count));

// Wire tag, e.g. "ddl.create_table".
[[nodiscard]] const char* to_string(OperationKind kind) noexcept;
[[nodiscard]] std::optional<OperationKind> operation_kind_from_tag(std::string_view tag) noexcept;

[[nodiscard]] OperationCategory category_of(OperationKind kind) noexcept;
[[nodiscard]] const char* to_string(OperationCategory category) noexcept;
[[nodiscard]] bool is_mutating(OperationKind kind) noexcept;

[[nodiscard]] const char* to_string(ComparisonOperator op) noexcept;
[[nodiscard]] std::optional<ComparisonOperator> parse_comparison_operator(std::string_view text);

[[nodiscard]] const char* to_string(IfExistsPolicy policy) noexcept;
[[nodiscard]] const char* to_string(SortDirection direction) noexcept;

[[nodiscard]] const std::string& target_table(const Operation& operation) noexcept;

// SQL-like rendering used in operation logs, e.g. "GRANT select ON t TO r".
[[nodiscard]] std::string describe_operation(const Operation& operation);

enum class ExecutionStatus : std::uint8_t {
    Success = 0,
    Skipped,
    Error
};

enum class DiagnosticSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

[[nodiscard]] const char* to_string(ExecutionStatus status) noexcept;
[[nodiscard]] const char* to_string(DiagnosticSeverity severity) noexcept;

struct QueryResultSet final {
    std::string title{};
    std::vector<std::string> columns{};
    std::vector<catalog::Row> rows{};
    std::uint64_t row_count = 0U;
    std::uint64_t matched_count = 0U;
    std::optional<std::size_t> limit{};
};

struct ExecutionResult final {
    std::string id{};
    OperationKind kind = OperationKind::CreateTable;
    ExecutionStatus status = ExecutionStatus::Error;
    std::string detail{};
    std::error_code error{};
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::vector<std::string> remediation_hints{};
    std::optional<QueryResultSet> result_set{};
    std::uint64_t rows_affected = 0U;
    std::chrono::nanoseconds duration{0};

    [[nodiscard]] OperationCategory category() const noexcept { return category_of(kind); }
    [[nodiscard]] bool succeeded() const noexcept { return status == ExecutionStatus::Success; }
    [[nodiscard]] bool failed() const noexcept { return status == ExecutionStatus::Error; }
};

[[nodiscard]] DiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept;
[[nodiscard]] std::vector<std::string> default_remediation_hints(std::error_code error);

[[nodiscard]] ExecutionResult make_success(OperationKind kind, std::string detail);
[[nodiscard]] ExecutionResult make_skipped(OperationKind kind, std::string detail);
[[nodiscard]] ExecutionResult make_failure(OperationKind kind, std::error_code error, std::string detail);
[[nodiscard]] ExecutionResult make_failure(OperationKind kind,
                                           std::error_code error,
                                           std::string detail,
                                           DiagnosticSeverity severity,
                                           std::vector<std::string> remediation_hints);

}  // namespace docstore::executor
