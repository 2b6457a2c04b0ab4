#include "docstore/planner/plan_parser.hpp"

#include "docstore/catalog/schema_validation.hpp"
#include "docstore/storage/json_value.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <string_view>
#include <utility>

namespace docstore::planner {

namespace {

using catalog::Value;
using executor::OperationKind;

// Largest integer a JSON number holds exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;

struct TagAlias final {
    std::string_view alias;
    OperationKind kind;
};

constexpr std::array<TagAlias, 12> kTagAliases{{
    {"create_table", OperationKind::CreateTable},
    {"drop_table", OperationKind::DropTable},
    {"alter_table_add_column", OperationKind::AlterTableAddColumn},
    {"add_column", OperationKind::AlterTableAddColumn},
    {"alter_table_drop_column", OperationKind::AlterTableDropColumn},
    {"drop_column", OperationKind::AlterTableDropColumn},
    {"insert", OperationKind::Insert},
    {"update", OperationKind::Update},
    {"delete", OperationKind::Delete},
    {"select", OperationKind::Select},
    {"grant", OperationKind::Grant},
    {"revoke", OperationKind::Revoke},
}};

// Field decoding failures are reported as plain strings; the caller turns
// them into a per-operation ValidationError.
class FieldReader final {
public:
    explicit FieldReader(const Value& object) : object_{object} {}

    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] bool ok() const noexcept { return error_.empty(); }

    std::string required_string(std::string_view key)
    {
        const auto* value = object_.find(key);
        if (value == nullptr || !value->is_string() || catalog::trim_copy(value->as_string()).empty()) {
            set_error("Field \"" + std::string{key} + "\" must be a non-empty string.");
            return {};
        }
        return value->as_string();
    }

    std::optional<std::string> optional_string(std::string_view key)
    {
        const auto* value = object_.find(key);
        if (value == nullptr || value->is_null()) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            set_error("Field \"" + std::string{key} + "\" must be a string.");
            return std::nullopt;
        }
        return value->as_string();
    }

    std::optional<bool> optional_bool(std::string_view key)
    {
        const auto* value = object_.find(key);
        if (value == nullptr || value->is_null()) {
            return std::nullopt;
        }
        if (!value->is_bool()) {
            set_error("Field \"" + std::string{key} + "\" must be a boolean.");
            return std::nullopt;
        }
        return value->as_bool();
    }

    std::optional<std::size_t> optional_index(std::string_view key)
    {
        const auto* value = object_.find(key);
        if (value == nullptr || value->is_null()) {
            return std::nullopt;
        }
        if (!value->is_number() || value->as_number() < 0.0 || value->as_number() > kMaxExactInteger ||
            std::floor(value->as_number()) != value->as_number()) {
            set_error("Field \"" + std::string{key} + "\" must be a non-negative integer.");
            return std::nullopt;
        }
        return static_cast<std::size_t>(value->as_number());
    }

    std::vector<std::string> string_list(std::string_view key, bool required)
    {
        std::vector<std::string> out;
        const auto* value = object_.find(key);
        if (value == nullptr || value->is_null()) {
            if (required) {
                set_error("Field \"" + std::string{key} + "\" must be a non-empty array of strings.");
            }
            return out;
        }
        if (!value->is_array()) {
            set_error("Field \"" + std::string{key} + "\" must be an array of strings.");
            return out;
        }
        for (const auto& entry : value->as_array()) {
            if (!entry.is_string()) {
                set_error("Field \"" + std::string{key} + "\" must be an array of strings.");
                return {};
            }
            out.push_back(entry.as_string());
        }
        if (required && out.empty()) {
            set_error("Field \"" + std::string{key} + "\" must be a non-empty array of strings.");
        }
        return out;
    }

    const Value* field(std::string_view key) const { return object_.find(key); }

    void set_error(std::string message)
    {
        if (error_.empty()) {
            error_ = std::move(message);
        }
    }

private:
    const Value& object_;
    std::string error_{};
};

std::optional<catalog::ColumnBlueprint> decode_blueprint(const Value& value, std::string& error)
{
    if (!value.is_object()) {
        error = "Column blueprint must be an object.";
        return std::nullopt;
    }

    FieldReader reader{value};
    catalog::ColumnBlueprint blueprint{};
    blueprint.name = reader.required_string("name");
    const auto data_type = reader.optional_string("dataType");
    blueprint.data_type = data_type ? catalog::trim_copy(*data_type) : std::string{};
    if (blueprint.data_type.empty()) {
        blueprint.data_type = "text";
    }
    blueprint.nullable = reader.optional_bool("nullable").value_or(true);
    blueprint.is_primary_key = reader.optional_bool("isPrimaryKey").value_or(false);
    if (const auto* fallback = reader.field("defaultValue"); fallback != nullptr) {
        blueprint.default_value = *fallback;
    }

    if (!reader.ok()) {
        error = reader.error();
        return std::nullopt;
    }
    return blueprint;
}

bool decode_criteria(const FieldReader& reader, executor::Criteria& criteria, std::string& error)
{
    const auto* value = reader.field("criteria");
    if (value == nullptr || value->is_null()) {
        return true;
    }
    if (!value->is_array()) {
        error = "Field \"criteria\" must be an array.";
        return false;
    }

    for (const auto& entry : value->as_array()) {
        if (!entry.is_object()) {
            error = "Each criteria condition must be an object.";
            return false;
        }
        FieldReader condition_reader{entry};
        executor::CriteriaCondition condition{};
        condition.column = condition_reader.required_string("column");
        const auto op = condition_reader.optional_string("operator");
        if (!condition_reader.ok()) {
            error = condition_reader.error();
            return false;
        }
        const auto parsed = executor::parse_comparison_operator(op.value_or(std::string{}));
        if (!parsed) {
            error = "Unsupported comparison operator \"" + *op + "\".";
            return false;
        }
        condition.op = *parsed;
        if (const auto* operand = entry.find("value"); operand != nullptr) {
            condition.value = *operand;
        }
        criteria.push_back(std::move(condition));
    }
    return true;
}

bool decode_rows(const Value* value, std::vector<catalog::Row>& rows, std::string& error)
{
    if (value == nullptr || !value->is_array() || value->as_array().empty()) {
        error = "Field \"rows\" must be a non-empty array of objects.";
        return false;
    }
    for (const auto& entry : value->as_array()) {
        if (!entry.is_object()) {
            error = "Field \"rows\" must be a non-empty array of objects.";
            return false;
        }
        rows.push_back(entry.as_object());
    }
    return true;
}

executor::Operation decode_fields(OperationKind kind, FieldReader& reader, std::string& error)
{
    switch (kind) {
    case OperationKind::CreateTable: {
        executor::CreateTableOperation op{};
        op.table = reader.required_string("table");
        op.description = reader.optional_string("description");
        const auto policy = catalog::lowercase_copy(reader.optional_string("ifExists").value_or("abort"));
        if (policy == "skip") {
            op.if_exists = executor::IfExistsPolicy::Skip;
        } else if (policy == "replace") {
            op.if_exists = executor::IfExistsPolicy::Replace;
        } else if (policy != "abort") {
            reader.set_error("Field \"ifExists\" must be one of abort, skip, replace.");
        }
        const auto* columns = reader.field("columns");
        if (columns == nullptr || !columns->is_array() || columns->as_array().empty()) {
            reader.set_error("Field \"columns\" must be a non-empty array.");
        } else {
            for (const auto& entry : columns->as_array()) {
                std::string column_error;
                auto blueprint = decode_blueprint(entry, column_error);
                if (!blueprint) {
                    reader.set_error(std::move(column_error));
                    break;
                }
                op.columns.push_back(std::move(*blueprint));
            }
        }
        error = reader.error();
        return op;
    }
    case OperationKind::DropTable: {
        executor::DropTableOperation op{};
        op.table = reader.required_string("table");
        op.if_exists = reader.optional_bool("ifExists").value_or(false);
        error = reader.error();
        return op;
    }
    case OperationKind::AlterTableAddColumn: {
        executor::AddColumnOperation op{};
        op.table = reader.required_string("table");
        op.position = reader.optional_index("position");
        const auto* column = reader.field("column");
        if (column == nullptr) {
            reader.set_error("Field \"column\" must be a column blueprint.");
        } else {
            std::string column_error;
            if (auto blueprint = decode_blueprint(*column, column_error)) {
                op.column = std::move(*blueprint);
            } else {
                reader.set_error(std::move(column_error));
            }
        }
        error = reader.error();
        return op;
    }
    case OperationKind::AlterTableDropColumn: {
        executor::DropColumnOperation op{};
        op.table = reader.required_string("table");
        op.column = reader.required_string("column");
        error = reader.error();
        return op;
    }
    case OperationKind::Insert: {
        executor::InsertOperation op{};
        op.table = reader.required_string("table");
        error = reader.error();
        if (error.empty()) {
            decode_rows(reader.field("rows"), op.rows, error);
        }
        return op;
    }
    case OperationKind::Update: {
        executor::UpdateOperation op{};
        op.table = reader.required_string("table");
        op.all_rows = reader.optional_bool("allRows").value_or(false);
        const auto* changes = reader.field("changes");
        if (changes == nullptr || !changes->is_object() || changes->as_object().empty()) {
            reader.set_error("Update operation must specify at least one change.");
        } else {
            op.changes = changes->as_object();
        }
        error = reader.error();
        if (error.empty()) {
            decode_criteria(reader, op.criteria, error);
        }
        return op;
    }
    case OperationKind::Delete: {
        executor::DeleteOperation op{};
        op.table = reader.required_string("table");
        op.all_rows = reader.optional_bool("allRows").value_or(false);
        error = reader.error();
        if (error.empty()) {
            decode_criteria(reader, op.criteria, error);
        }
        return op;
    }
    case OperationKind::Select: {
        executor::SelectOperation op{};
        op.table = reader.required_string("table");
        op.columns = reader.string_list("columns", false);
        op.limit = reader.optional_index("limit");
        if (const auto* order = reader.field("orderBy"); order != nullptr && !order->is_null()) {
            if (!order->is_array()) {
                reader.set_error("Field \"orderBy\" must be an array.");
            } else {
                for (const auto& entry : order->as_array()) {
                    if (!entry.is_object()) {
                        reader.set_error("Each orderBy clause must be an object.");
                        break;
                    }
                    FieldReader clause_reader{entry};
                    executor::OrderByClause clause{};
                    clause.column = clause_reader.required_string("column");
                    const auto direction = catalog::lowercase_copy(clause_reader.optional_string("direction").value_or("asc"));
                    if (direction == "desc") {
                        clause.direction = executor::SortDirection::Desc;
                    } else if (direction != "asc") {
                        clause_reader.set_error("Field \"direction\" must be asc or desc.");
                    }
                    if (!clause_reader.ok()) {
                        reader.set_error(clause_reader.error());
                        break;
                    }
                    op.order_by.push_back(std::move(clause));
                }
            }
        }
        error = reader.error();
        if (error.empty()) {
            decode_criteria(reader, op.criteria, error);
        }
        return op;
    }
    case OperationKind::Grant: {
        executor::GrantOperation op{};
        op.table = reader.required_string("table");
        op.role = reader.required_string("role");
        op.privileges = reader.string_list("privileges", true);
        op.role_description = reader.optional_string("description");
        error = reader.error();
        return op;
    }
    case OperationKind::Revoke:
    default: {
        executor::RevokeOperation op{};
        op.table = reader.required_string("table");
        op.role = reader.required_string("role");
        op.privileges = reader.string_list("privileges", true);
        error = reader.error();
        return op;
    }
    }
}

PlanDiagnostic make_diagnostic(std::string message, std::vector<std::string> hints, std::size_t line = 0U, std::size_t column = 0U)
{
    PlanDiagnostic diagnostic{};
    diagnostic.severity = PlanSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.line = line;
    diagnostic.column = column;
    diagnostic.remediation_hints = std::move(hints);
    return diagnostic;
}

std::string normalize_tag_text(std::string_view tag)
{
    const auto trimmed = catalog::trim_copy(tag);
    std::string out;
    out.reserve(trimmed.size() + 4U);
    for (std::size_t i = 0U; i < trimmed.size(); ++i) {
        const auto ch = static_cast<unsigned char>(trimmed[i]);
        if (std::isupper(ch) != 0 && i > 0U && std::islower(static_cast<unsigned char>(trimmed[i - 1U])) != 0) {
            out.push_back('_');
        }
        if (ch == '-' || std::isspace(ch) != 0) {
            if (out.empty() || out.back() != '_') {
                out.push_back('_');
            }
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

}  // namespace

std::string sanitize_planner_output(std::string_view raw)
{
    auto candidate = catalog::trim_copy(raw);
    if (candidate.empty()) {
        return candidate;
    }

    if (const auto fence = candidate.find("```"); fence != std::string::npos) {
        auto body_start = fence + 3U;
        if (candidate.compare(body_start, 4U, "json") == 0 || candidate.compare(body_start, 4U, "JSON") == 0) {
            body_start += 4U;
        }
        const auto closing = candidate.find("```", body_start);
        if (closing != std::string::npos) {
            candidate = catalog::trim_copy(std::string_view{candidate}.substr(body_start, closing - body_start));
        }
    }

    const auto first = candidate.find('{');
    const auto last = candidate.rfind('}');
    if (first != std::string::npos && last != std::string::npos && last >= first) {
        candidate = candidate.substr(first, last - first + 1U);
    }
    return candidate;
}

std::optional<OperationKind> resolve_operation_tag(std::string_view tag)
{
    const auto normalized = normalize_tag_text(tag);
    if (normalized.empty()) {
        return std::nullopt;
    }
    if (auto kind = executor::operation_kind_from_tag(normalized)) {
        return kind;
    }

    std::string_view suffix{normalized};
    if (const auto dot = suffix.find('.'); dot != std::string_view::npos) {
        suffix = suffix.substr(dot + 1U);
    }
    for (const auto& entry : kTagAliases) {
        if (entry.alias == suffix) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

OperationDecodeResult decode_operation(const Value& value)
{
    OperationDecodeResult result{};
    if (!value.is_object()) {
        result.error = "Operation must be a JSON object.";
        return result;
    }

    const auto* type = value.find("type");
    if (type == nullptr || !type->is_string()) {
        result.error = "Operation is missing its \"type\" tag.";
        return result;
    }

    result.kind = resolve_operation_tag(type->as_string());
    if (!result.kind) {
        result.error = "Unknown operation type \"" + type->as_string() + "\".";
        return result;
    }

    FieldReader reader{value};
    std::string error;
    auto operation = decode_fields(*result.kind, reader, error);
    if (!error.empty()) {
        result.error = std::move(error);
        return result;
    }
    result.operation = std::move(operation);
    return result;
}

OperationDecodeResult parse_operation(std::string_view text)
{
    auto parsed = storage::parse_json(text);
    if (!parsed.success()) {
        OperationDecodeResult result{};
        result.error = parsed.message + " (line " + std::to_string(parsed.line) + ", column " +
                       std::to_string(parsed.column) + ")";
        return result;
    }
    return decode_operation(*parsed.value);
}

PlanParseResult decode_plan(const Value& value)
{
    PlanParseResult result{};
    if (!value.is_object()) {
        result.diagnostics.push_back(make_diagnostic("Plan must be a JSON object.",
                                                     {"Return a single object with an \"operations\" array."}));
        return result;
    }

    Plan plan{};
    FieldReader reader{value};
    plan.thought = reader.optional_string("thought");
    plan.final_response = reader.optional_string("finalResponse");
    plan.warnings = reader.string_list("warnings", false);
    if (const auto* revision = value.find("expectedRevision"); revision != nullptr && !revision->is_null()) {
        if (const auto parsed = reader.optional_index("expectedRevision")) {
            plan.expected_revision = static_cast<std::uint64_t>(*parsed);
        }
    }
    if (!reader.ok()) {
        result.diagnostics.push_back(make_diagnostic(reader.error(), {"Check the plan field types."}));
        return result;
    }

    const auto* operations = value.find("operations");
    if (operations != nullptr && !operations->is_null() && !operations->is_array()) {
        result.diagnostics.push_back(make_diagnostic("Field \"operations\" must be an array.",
                                                     {"Wrap the operations in a JSON array."}));
        return result;
    }

    if (operations != nullptr && operations->is_array()) {
        const auto& entries = operations->as_array();
        for (std::size_t index = 0U; index < entries.size(); ++index) {
            auto decoded = decode_operation(entries[index]);
            if (!decoded.kind) {
                result.diagnostics.push_back(
                    make_diagnostic("Operation " + std::to_string(index + 1U) + ": " + decoded.error,
                                    {"Use one of the ddl.*, dml.*, dql.select or dcl.* operation types."}));
                return result;
            }

            PlannedOperation planned{};
            planned.kind = *decoded.kind;
            planned.operation = std::move(decoded.operation);
            planned.decode_error = std::move(decoded.error);
            plan.operations.push_back(std::move(planned));
        }
    }

    result.plan = std::move(plan);
    return result;
}

PlanParseResult parse_plan(std::string_view text)
{
    const auto sanitized = sanitize_planner_output(text);
    auto parsed = storage::parse_json(sanitized);
    if (!parsed.success()) {
        PlanParseResult result{};
        result.diagnostics.push_back(make_diagnostic("Planner response was not valid JSON: " + parsed.message,
                                                     {"Return a single JSON object without commentary."},
                                                     parsed.line,
                                                     parsed.column));
        return result;
    }
    return decode_plan(*parsed.value);
}

}  // namespace docstore::planner
