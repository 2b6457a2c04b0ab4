#include "docstore/executor/operation_executor.hpp"

#include "docstore/catalog/schema_validation.hpp"
#include "docstore/executor/criteria_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace docstore::executor {

namespace {

using catalog::CatalogErrc;
using catalog::ColumnDefinition;
using catalog::Document;
using catalog::Privilege;
using catalog::Row;
using catalog::SchemaStatus;
using catalog::Table;
using catalog::Timestamp;
using catalog::Value;

struct MutationContext final {
    Document& document;
    const ExecutionOptions& options;
    Timestamp now;
};

std::string quoted(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2U);
    out.push_back('"');
    out.append(text);
    out.push_back('"');
    return out;
}

template <typename Op>
ExecutionResult fail(CatalogErrc error, std::string detail)
{
    return make_failure(operation_kind<Op>(), make_error_code(error), std::move(detail));
}

template <typename Op>
ExecutionResult fail(const SchemaStatus& status, std::string_view prefix = {})
{
    return make_failure(operation_kind<Op>(), status.error, std::string{prefix} + status.message);
}

template <typename Op>
ExecutionResult table_not_found(std::string_view table)
{
    return fail<Op>(CatalogErrc::NotFoundError, "Table " + quoted(table) + " does not exist.");
}

template <typename Op>
ExecutionResult column_not_found(std::string_view table, std::string_view column)
{
    return fail<Op>(CatalogErrc::NotFoundError,
                    "Column " + quoted(column) + " does not exist on table " + quoted(table) + ".");
}

template <typename Op>
std::optional<ExecutionResult> require_columns(const Table& table, const Criteria& criteria)
{
    for (const auto& condition : criteria) {
        if (!table.has_column(condition.column)) {
            return column_not_found<Op>(table.name, condition.column);
        }
    }
    return std::nullopt;
}

// Destructive match-all guard shared by update and delete.
template <typename Op>
std::optional<ExecutionResult> check_row_scope(const Op& operation, std::string_view verb)
{
    if (operation.criteria.empty() && !operation.all_rows) {
        return fail<Op>(CatalogErrc::ValidationError,
                        std::string{verb} + " on " + quoted(operation.table) +
                            " has no criteria; set allRows to affect every row.");
    }
    if (!operation.criteria.empty() && operation.all_rows) {
        return fail<Op>(CatalogErrc::ValidationError, "allRows cannot be combined with criteria.");
    }
    return std::nullopt;
}

std::optional<Privilege> required_privilege(const Document& document, const Operation& operation)
{
    switch (operation_kind(operation)) {
    case OperationKind::CreateTable: {
        const auto& create = std::get<CreateTableOperation>(operation);
        if (create.if_exists == IfExistsPolicy::Replace && document.find_table(create.table) != nullptr) {
            return Privilege::Drop;
        }
        return std::nullopt;
    }
    case OperationKind::DropTable:
        return Privilege::Drop;
    case OperationKind::AlterTableAddColumn:
    case OperationKind::AlterTableDropColumn:
        return Privilege::Alter;
    case OperationKind::Insert:
        return Privilege::Insert;
    case OperationKind::Update:
        return Privilege::Update;
    case OperationKind::Delete:
        return Privilege::Delete;
    case OperationKind::Select:
        return Privilege::Select;
    case OperationKind::Grant:
    case OperationKind::Revoke:
    default:
        return Privilege::ManagePermissions;
    }
}

std::optional<ExecutionResult> check_access(const Document& document,
                                            const Operation& operation,
                                            const ExecutionOptions& options)
{
    if (!options.acting_role) {
        return std::nullopt;
    }

    const auto kind = operation_kind(operation);
    const auto& role = *options.acting_role;
    if (document.find_role(role) == nullptr) {
        return make_failure(kind,
                            make_error_code(CatalogErrc::PrivilegeError),
                            "Role " + quoted(role) + " does not exist.");
    }

    const auto& table = target_table(operation);
    if (document.find_table(table) == nullptr) {
        return std::nullopt;
    }

    if (kind == OperationKind::Grant || kind == OperationKind::Revoke) {
        const auto& names = kind == OperationKind::Grant ? std::get<GrantOperation>(operation).privileges
                                                         : std::get<RevokeOperation>(operation).privileges;
        catalog::PrivilegeSet requested{};
        // Malformed privilege lists are reported by the handler itself.
        if (!catalog::parse_privileges(names, requested).ok()) {
            return std::nullopt;
        }
        for (const auto privilege : requested) {
            if (!catalog::can_manage_privilege(document, role, table, privilege)) {
                return make_failure(kind,
                                    make_error_code(CatalogErrc::PrivilegeError),
                                    "Role " + quoted(role) + " cannot manage " +
                                        std::string{catalog::to_string(privilege)} + " on table " + quoted(table) +
                                        ".");
            }
        }
        return std::nullopt;
    }

    const auto privilege = required_privilege(document, operation);
    if (!privilege || catalog::resolve_privilege(document, role, table, *privilege)) {
        return std::nullopt;
    }
    return make_failure(kind,
                        make_error_code(CatalogErrc::PrivilegeError),
                        "Role " + quoted(role) + " lacks " + std::string{catalog::to_string(*privilege)} +
                            " on table " + quoted(table) + ".");
}

ExecutionResult handle(MutationContext& context, const CreateTableOperation& operation)
{
    using Op = CreateTableOperation;
    auto& document = context.document;

    if (catalog::trim_copy(operation.table).empty()) {
        return fail<Op>(CatalogErrc::ValidationError, "Table name cannot be empty.");
    }

    const auto* existing = document.find_table(operation.table);
    if (existing != nullptr) {
        if (operation.if_exists == IfExistsPolicy::Skip) {
            return make_skipped(OperationKind::CreateTable,
                                "Table " + quoted(operation.table) + " already exists; skipping creation as requested.");
        }
        if (operation.if_exists == IfExistsPolicy::Abort) {
            return fail<Op>(CatalogErrc::ConflictError, "Table " + quoted(operation.table) + " already exists.");
        }
    }

    if (operation.columns.empty()) {
        return fail<Op>(CatalogErrc::SchemaError, "Cannot create a table without columns.");
    }

    std::vector<ColumnDefinition> columns;
    if (auto status = catalog::validate_column_blueprints(operation.columns, {}, columns); !status.ok()) {
        return fail<Op>(status);
    }

    Table table{};
    table.name = operation.table;
    table.description = operation.description;
    table.created_at = context.now;
    table.updated_at = context.now;
    for (auto& column : columns) {
        if (column.is_primary_key) {
            table.primary_key = column.name;
        }
        table.column_order.push_back(column.name);
        table.columns.emplace(column.name, std::move(column));
    }

    if (context.options.acting_role && !catalog::is_superuser_role(*context.options.acting_role)) {
        catalog::TablePermission owner{};
        owner.role = *context.options.acting_role;
        owner.privileges.insert(catalog::kAllPrivileges.begin(), catalog::kAllPrivileges.end());
        owner.granted_at = context.now;
        table.permissions.emplace(owner.role, std::move(owner));
    }

    const auto column_count = table.column_order.size();
    const bool replaced = existing != nullptr;
    document.tables.insert_or_assign(operation.table, std::move(table));

    const auto verb = replaced ? std::string{"Replaced table "} : std::string{"Created table "};
    return make_success(OperationKind::CreateTable,
                        verb + quoted(operation.table) + " with " + std::to_string(column_count) + " column(s).");
}

ExecutionResult handle(MutationContext& context, const DropTableOperation& operation)
{
    using Op = DropTableOperation;
    auto& document = context.document;

    const auto it = document.tables.find(operation.table);
    if (it == document.tables.end()) {
        if (operation.if_exists) {
            return make_skipped(OperationKind::DropTable,
                                "Table " + quoted(operation.table) + " does not exist; skipping drop as requested.");
        }
        return table_not_found<Op>(operation.table);
    }

    const auto removed_rows = it->second.rows.size();
    document.tables.erase(it);

    auto result = make_success(OperationKind::DropTable,
                               "Dropped table " + quoted(operation.table) + " (removed " +
                                   std::to_string(removed_rows) + " row(s)).");
    result.rows_affected = removed_rows;
    return result;
}

ExecutionResult handle(MutationContext& context, const AddColumnOperation& operation)
{
    using Op = AddColumnOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }

    const auto column_name = catalog::trim_copy(operation.column.name);
    if (table->has_column(column_name)) {
        return fail<Op>(CatalogErrc::SchemaError,
                        "Column " + quoted(column_name) + " already exists on table " + quoted(operation.table) + ".");
    }

    ColumnDefinition column{};
    if (auto status = catalog::validate_column_blueprint(operation.column, table->columns, column); !status.ok()) {
        return fail<Op>(status);
    }

    if (column.is_primary_key) {
        if (table->primary_key) {
            return fail<Op>(CatalogErrc::SchemaError,
                            "Table " + quoted(operation.table) + " already has a primary key column.");
        }
        if (!table->rows.empty()) {
            return fail<Op>(CatalogErrc::SchemaError,
                            "Cannot add primary key column " + quoted(column.name) + " to a table containing rows.");
        }
    }

    if (!column.nullable && !column.default_value && !table->rows.empty()) {
        return fail<Op>(CatalogErrc::SchemaError,
                        "Cannot add non-nullable column " + quoted(column.name) +
                            " without default value to a table containing rows.");
    }

    auto staged = *table;
    staged.column_order = catalog::next_column_order(staged.column_order, column.name, operation.position);
    if (column.default_value) {
        for (auto& row : staged.rows) {
            row.insert_or_assign(column.name, *column.default_value);
        }
    }
    if (column.is_primary_key) {
        staged.primary_key = column.name;
    }
    staged.updated_at = context.now;
    const auto name = column.name;
    staged.columns.emplace(name, std::move(column));

    *table = std::move(staged);
    return make_success(OperationKind::AlterTableAddColumn,
                        "Added column " + quoted(name) + " to table " + quoted(operation.table) + ".");
}

ExecutionResult handle(MutationContext& context, const DropColumnOperation& operation)
{
    using Op = DropColumnOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }

    const auto* column = table->find_column(operation.column);
    if (column == nullptr) {
        return column_not_found<Op>(operation.table, operation.column);
    }
    if (column->is_primary_key) {
        return fail<Op>(CatalogErrc::SchemaError, "Dropping the primary key column is not supported.");
    }

    auto staged = *table;
    staged.columns.erase(operation.column);
    std::erase(staged.column_order, operation.column);
    for (auto& row : staged.rows) {
        row.erase(operation.column);
    }
    staged.updated_at = context.now;

    *table = std::move(staged);
    return make_success(OperationKind::AlterTableDropColumn,
                        "Removed column " + quoted(operation.column) + " from table " + quoted(operation.table) + ".");
}

ExecutionResult handle(MutationContext& context, const InsertOperation& operation)
{
    using Op = InsertOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }
    if (operation.rows.empty()) {
        return fail<Op>(CatalogErrc::ValidationError, "Insert operation requires at least one row.");
    }

    std::vector<Row> staged;
    staged.reserve(operation.rows.size());

    for (std::size_t index = 0U; index < operation.rows.size(); ++index) {
        const auto& incoming = operation.rows[index];
        const auto prefix = "Row " + std::to_string(index) + ": ";

        for (const auto& [key, value] : incoming) {
            if (!table->has_column(key)) {
                return fail<Op>(CatalogErrc::NotFoundError,
                                prefix + "column " + quoted(key) + " does not exist on table " +
                                    quoted(operation.table) + ".");
            }
        }

        Row record{};
        for (const auto& column_name : table->column_order) {
            const auto& column = table->columns.at(column_name);
            const auto it = incoming.find(column_name);
            if (it == incoming.end()) {
                if (column.default_value) {
                    record.emplace(column_name, *column.default_value);
                } else if (!column.nullable) {
                    return fail<Op>(CatalogErrc::ValidationError,
                                    prefix + "column " + quoted(column_name) + " requires a value.");
                }
                continue;
            }

            Value coerced{};
            if (auto status = catalog::coerce_value(column, it->second, coerced); !status.ok()) {
                return fail<Op>(status, prefix);
            }
            record.emplace(column_name, std::move(coerced));
        }

        if (table->primary_key) {
            const auto& key = *table->primary_key;
            const auto candidate = record.find(key);
            if (candidate == record.end() || candidate->second.is_null()) {
                return fail<Op>(CatalogErrc::ValidationError,
                                prefix + "primary key column " + quoted(key) + " requires a value.");
            }
            const auto duplicates = [&](const Row& existing) {
                const auto found = existing.find(key);
                return found != existing.end() && found->second == candidate->second;
            };
            if (std::any_of(table->rows.begin(), table->rows.end(), duplicates) ||
                std::any_of(staged.begin(), staged.end(), duplicates)) {
                return fail<Op>(CatalogErrc::ConflictError,
                                prefix + "duplicate primary key value for column " + quoted(key) + ".");
            }
        }

        staged.push_back(std::move(record));
    }

    const auto inserted = staged.size();
    auto& rows = table->rows;
    rows.reserve(rows.size() + inserted);
    std::move(staged.begin(), staged.end(), std::back_inserter(rows));
    table->updated_at = context.now;

    auto result = make_success(OperationKind::Insert,
                               "Inserted " + std::to_string(inserted) + " row(s) into " + quoted(operation.table) + ".");
    result.rows_affected = inserted;
    return result;
}

ExecutionResult handle(MutationContext& context, const UpdateOperation& operation)
{
    using Op = UpdateOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }
    if (operation.changes.empty()) {
        return fail<Op>(CatalogErrc::ValidationError, "Update operation requires at least one field to change.");
    }
    if (auto rejected = check_row_scope(operation, "Update")) {
        return *rejected;
    }
    if (auto missing = require_columns<Op>(*table, operation.criteria)) {
        return *missing;
    }

    Row changes{};
    for (const auto& [key, raw] : operation.changes) {
        const auto* column = table->find_column(key);
        if (column == nullptr) {
            return column_not_found<Op>(operation.table, key);
        }
        Value coerced{};
        if (auto status = catalog::coerce_value(*column, raw, coerced); !status.ok()) {
            return fail<Op>(status);
        }
        changes.emplace(key, std::move(coerced));
    }

    auto staged = table->rows;
    std::uint64_t affected = 0U;
    for (auto& row : staged) {
        if (!matches_criteria(row, operation.criteria)) {
            continue;
        }
        for (const auto& [key, value] : changes) {
            row.insert_or_assign(key, value);
        }
        ++affected;
    }

    if (table->primary_key && changes.contains(*table->primary_key) && affected > 0U) {
        const auto& key = *table->primary_key;
        for (std::size_t i = 0U; i < staged.size(); ++i) {
            const auto lhs = staged[i].find(key);
            if (lhs == staged[i].end()) {
                continue;
            }
            for (std::size_t j = i + 1U; j < staged.size(); ++j) {
                const auto rhs = staged[j].find(key);
                if (rhs != staged[j].end() && lhs->second == rhs->second) {
                    return fail<Op>(CatalogErrc::ConflictError,
                                    "Update would duplicate primary key value for column " + quoted(key) + ".");
                }
            }
        }
    }

    table->rows = std::move(staged);
    table->updated_at = context.now;

    auto result = make_success(OperationKind::Update,
                               "Updated " + std::to_string(affected) + " row(s) on " + quoted(operation.table) + ".");
    result.rows_affected = affected;
    return result;
}

ExecutionResult handle(MutationContext& context, const DeleteOperation& operation)
{
    using Op = DeleteOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }
    if (auto rejected = check_row_scope(operation, "Delete")) {
        return *rejected;
    }
    if (auto missing = require_columns<Op>(*table, operation.criteria)) {
        return *missing;
    }

    const auto before = table->rows.size();
    std::erase_if(table->rows, [&operation](const Row& row) { return matches_criteria(row, operation.criteria); });
    const auto removed = before - table->rows.size();
    table->updated_at = context.now;

    auto result = make_success(OperationKind::Delete,
                               "Deleted " + std::to_string(removed) + " row(s) from " + quoted(operation.table) + ".");
    result.rows_affected = removed;
    return result;
}

ExecutionResult run_select(const Document& document, const SelectOperation& operation)
{
    using Op = SelectOperation;
    const auto* table = document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }
    if (auto missing = require_columns<Op>(*table, operation.criteria)) {
        return *missing;
    }
    for (const auto& column : operation.columns) {
        if (!table->has_column(column)) {
            return column_not_found<Op>(operation.table, column);
        }
    }
    for (const auto& clause : operation.order_by) {
        if (!table->has_column(clause.column)) {
            return column_not_found<Op>(operation.table, clause.column);
        }
    }

    std::vector<const Row*> matched;
    for (const auto& row : table->rows) {
        if (matches_criteria(row, operation.criteria)) {
            matched.push_back(&row);
        }
    }

    if (!operation.order_by.empty()) {
        std::stable_sort(matched.begin(), matched.end(), [&operation](const Row* lhs, const Row* rhs) {
            for (const auto& clause : operation.order_by) {
                const auto left = lhs->find(clause.column);
                const auto right = rhs->find(clause.column);
                const auto order = compare_for_sort(left == lhs->end() ? nullptr : &left->second,
                                                    right == rhs->end() ? nullptr : &right->second);
                if (order != 0) {
                    return clause.direction == SortDirection::Asc ? order < 0 : order > 0;
                }
            }
            return false;
        });
    }

    const auto take = operation.limit ? std::min(*operation.limit, matched.size()) : matched.size();

    QueryResultSet result_set{};
    result_set.title = "Query on " + operation.table;
    result_set.columns = operation.columns.empty() ? table->column_order : operation.columns;
    result_set.matched_count = matched.size();
    result_set.limit = operation.limit;
    result_set.rows.reserve(take);
    for (std::size_t index = 0U; index < take; ++index) {
        const auto& source = *matched[index];
        Row projected{};
        for (const auto& column : result_set.columns) {
            const auto it = source.find(column);
            projected.emplace(column, it == source.end() ? Value{} : it->second);
        }
        result_set.rows.push_back(std::move(projected));
    }
    result_set.row_count = result_set.rows.size();

    auto result = make_success(OperationKind::Select,
                               "Retrieved " + std::to_string(result_set.row_count) + " row(s) (scanned " +
                                   std::to_string(result_set.matched_count) + ").");
    result.result_set = std::move(result_set);
    return result;
}

ExecutionResult handle(MutationContext& context, const SelectOperation& operation)
{
    return run_select(context.document, operation);
}

ExecutionResult handle(MutationContext& context, const GrantOperation& operation)
{
    using Op = GrantOperation;
    auto& document = context.document;
    auto* table = document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }

    const auto role = catalog::trim_copy(operation.role);
    if (role.empty()) {
        return fail<Op>(CatalogErrc::ValidationError, "Role name cannot be empty.");
    }

    catalog::PrivilegeSet privileges{};
    if (auto status = catalog::parse_privileges(operation.privileges, privileges); !status.ok()) {
        return fail<Op>(status);
    }

    auto staged = *table;
    auto& entry = staged.permissions[role];
    entry.role = role;
    entry.privileges.insert(privileges.begin(), privileges.end());
    entry.granted_at = context.now;
    staged.updated_at = context.now;

    if (auto existing = document.roles.find(role); existing == document.roles.end()) {
        catalog::RoleDefinition definition{};
        definition.name = role;
        definition.description = operation.role_description;
        definition.created_at = context.now;
        definition.updated_at = context.now;
        document.roles.emplace(role, std::move(definition));
    } else if (operation.role_description && existing->second.description != operation.role_description) {
        existing->second.description = operation.role_description;
        existing->second.updated_at = context.now;
    }
    *table = std::move(staged);

    return make_success(OperationKind::Grant,
                        "Granted " + catalog::join_privileges(privileges) + " on " + quoted(operation.table) +
                            " to role " + quoted(role) + ".");
}

ExecutionResult handle(MutationContext& context, const RevokeOperation& operation)
{
    using Op = RevokeOperation;
    auto* table = context.document.find_table(operation.table);
    if (table == nullptr) {
        return table_not_found<Op>(operation.table);
    }

    catalog::PrivilegeSet privileges{};
    if (auto status = catalog::parse_privileges(operation.privileges, privileges); !status.ok()) {
        return fail<Op>(status);
    }

    const auto role = catalog::trim_copy(operation.role);
    if (!table->permissions.contains(role)) {
        return fail<Op>(CatalogErrc::NotFoundError,
                        "Role " + quoted(role) + " has no permissions on table " + quoted(operation.table) + ".");
    }

    auto staged = *table;
    auto& entry = staged.permissions.at(role);
    for (const auto privilege : privileges) {
        entry.privileges.erase(privilege);
    }
    if (entry.privileges.empty()) {
        staged.permissions.erase(role);
    }
    staged.updated_at = context.now;
    *table = std::move(staged);

    return make_success(OperationKind::Revoke,
                        "Revoked " + catalog::join_privileges(privileges) + " on " + quoted(operation.table) +
                            " from role " + quoted(role) + ".");
}

}  // namespace

OperationExecutor::OperationExecutor(Config config)
    : config_{std::move(config)}
{
    if (!config_.clock) {
        config_.clock = [] { return catalog::now_timestamp(); };
    }

    if (config_.telemetry_registry && !config_.telemetry_identifier.empty()) {
        registry_ = config_.telemetry_registry;
        registry_identifier_ = config_.telemetry_identifier;
        registry_->register_sampler(registry_identifier_, [this] { return telemetry_.snapshot(); });
    }
}

OperationExecutor::~OperationExecutor()
{
    if (registry_) {
        registry_->unregister_sampler(registry_identifier_);
    }
}

catalog::Timestamp OperationExecutor::now() const
{
    return config_.clock();
}

std::string OperationExecutor::next_execution_id()
{
    const auto id = next_id_.fetch_add(1U, std::memory_order_relaxed);
    return config_.id_prefix + "-" + std::to_string(id);
}

ExecutionResult OperationExecutor::execute(catalog::Document& document,
                                           const Operation& operation,
                                           const ExecutionOptions& options)
{
    return run(operation, options, [&](Timestamp now) {
        if (auto denied = check_access(document, operation, options)) {
            return std::move(*denied);
        }

        MutationContext context{document, options, now};
        auto result = std::visit([&context](const auto& op) { return handle(context, op); }, operation);
        if (result.succeeded() && is_mutating(result.kind)) {
            document.meta.revision += 1U;
            document.meta.updated_at = now;
        }
        return result;
    });
}

ExecutionResult OperationExecutor::execute_read(const catalog::Document& document,
                                                const Operation& operation,
                                                const ExecutionOptions& options)
{
    return run(operation, options, [&](Timestamp) {
        if (is_mutating(operation_kind(operation))) {
            return make_failure(operation_kind(operation),
                                make_error_code(CatalogErrc::ExecutionFailed),
                                std::string{"Operation "} + to_string(operation_kind(operation)) +
                                    " cannot run on a read-only document.");
        }
        if (auto denied = check_access(document, operation, options)) {
            return std::move(*denied);
        }
        return run_select(document, std::get<SelectOperation>(operation));
    });
}

ExecutionResult OperationExecutor::run(const Operation& operation, const ExecutionOptions& options, const Body& body)
{
    const auto kind = operation_kind(operation);
    const bool counted = !options.preview;
    if (counted) {
        telemetry_.record_attempt(kind);
    }

    const auto start = std::chrono::steady_clock::now();
    ExecutionResult result{};
    try {
        result = body(config_.clock());
    } catch (const std::exception& error) {
        result = make_failure(kind,
                              make_error_code(CatalogErrc::ExecutionFailed),
                              std::string{"Operation failed: "} + error.what());
    }
    const auto end = std::chrono::steady_clock::now();

    result.id = next_execution_id();
    result.kind = kind;
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    if (counted) {
        const auto duration_ns = result.duration.count();
        telemetry_.record_duration(kind, static_cast<std::uint64_t>(duration_ns < 0 ? 0 : duration_ns));

        switch (result.status) {
        case ExecutionStatus::Success:
            telemetry_.record_success(kind);
            break;
        case ExecutionStatus::Skipped:
            telemetry_.record_skip(kind);
            break;
        case ExecutionStatus::Error:
        default:
            telemetry_.record_failure(kind, result.error);
            break;
        }
    }

    if (config_.operation_logger) {
        OperationLogRecord record{};
        record.execution_id = result.id;
        record.query = describe_operation(operation);
        record.kind = kind;
        record.status = result.status;
        record.duration = result.duration;
        record.rows_affected = result.result_set ? result.result_set->row_count : result.rows_affected;
        if (result.failed()) {
            record.error_message = result.detail;
        }
        record.tables.push_back(target_table(operation));
        record.acting_role = options.acting_role;
        record.preview = options.preview;
        config_.operation_logger(record);
    }

    return result;
}

}  // namespace docstore::executor
