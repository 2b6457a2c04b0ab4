#include "docstore/catalog/document_summary.hpp"

#include "docstore/storage/json_value.hpp"

#include <algorithm>
#include <utility>

namespace docstore::catalog {
namespace {

using storage::append_json_string;

class JsonFieldWriter final {
public:
    explicit JsonFieldWriter(std::string& out) : out_{out}
    {
        out_.push_back('{');
    }

    void name(const char* field)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(field);
        out_.append("\":");
    }

    void string_field(const char* field, std::string_view value)
    {
        name(field);
        append_json_string(out_, value);
    }

    void optional_string_field(const char* field, const std::optional<std::string>& value)
    {
        if (value) {
            string_field(field, *value);
        }
    }

    void uint_field(const char* field, std::uint64_t value)
    {
        name(field);
        out_.append(std::to_string(value));
    }

    void bool_field(const char* field, bool value)
    {
        name(field);
        out_.append(value ? "true" : "false");
    }

    void raw_field(const char* field, std::string_view json)
    {
        name(field);
        out_.append(json);
    }

    void close()
    {
        out_.push_back('}');
    }

private:
    std::string& out_;
    bool first_ = true;
};

template <typename Range, typename Fn>
void append_json_array(std::string& out, const Range& range, Fn&& append_element)
{
    out.push_back('[');
    bool first = true;
    for (const auto& element : range) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_element(out, element);
    }
    out.push_back(']');
}

std::string meta_to_json(const DocumentMeta& meta)
{
    std::string json;
    JsonFieldWriter writer{json};
    writer.uint_field("version", meta.version);
    writer.uint_field("revision", meta.revision);
    writer.string_field("createdAt", format_timestamp_iso(meta.created_at));
    writer.string_field("updatedAt", format_timestamp_iso(meta.updated_at));
    writer.close();
    return json;
}

std::string table_summary_to_json(const TableSummary& table)
{
    std::string json;
    JsonFieldWriter writer{json};
    writer.string_field("name", table.name);
    writer.optional_string_field("description", table.description);
    writer.optional_string_field("primaryKey", table.primary_key);
    writer.uint_field("columnCount", table.column_count);
    writer.uint_field("rowCount", table.row_count);
    writer.string_field("updatedAt", format_timestamp_iso(table.updated_at));

    std::string columns;
    append_json_array(columns, table.columns, [](std::string& out, const ColumnDefinition& column) {
        out.append(column_definition_to_json(column));
    });
    writer.raw_field("columns", columns);

    std::string permissions;
    append_json_array(permissions, table.permissions, [](std::string& out, const PermissionSummary& permission) {
        JsonFieldWriter entry{out};
        entry.string_field("role", permission.role);
        std::string privileges;
        append_json_array(privileges, permission.privileges, [](std::string& list, const std::string& privilege) {
            append_json_string(list, privilege);
        });
        entry.raw_field("privileges", privileges);
        entry.close();
    });
    writer.raw_field("permissions", permissions);
    writer.close();
    return json;
}

}  // namespace

const TableSummary* DocumentSummary::find_table(std::string_view name) const
{
    const auto it = std::find_if(tables.begin(), tables.end(), [name](const TableSummary& table) {
        return table.name == name;
    });
    return it == tables.end() ? nullptr : &*it;
}

TableSummary summarize_table(const Table& table)
{
    TableSummary summary{};
    summary.name = table.name;
    summary.description = table.description;
    summary.primary_key = table.primary_key;
    summary.column_count = static_cast<std::uint32_t>(table.column_order.size());
    summary.row_count = table.rows.size();
    summary.updated_at = table.updated_at;

    summary.columns.reserve(table.column_order.size());
    for (const auto& column_name : table.column_order) {
        if (const auto* column = table.find_column(column_name); column != nullptr) {
            summary.columns.push_back(*column);
        }
    }

    summary.permissions.reserve(table.permissions.size());
    for (const auto& [role, permission] : table.permissions) {
        PermissionSummary entry{};
        entry.role = role;
        for (const auto privilege : permission.privileges) {
            entry.privileges.emplace_back(to_string(privilege));
        }
        summary.permissions.push_back(std::move(entry));
    }
    return summary;
}

DocumentSummary summarize_document(const Document& document)
{
    DocumentSummary summary{};
    summary.meta = document.meta;

    summary.tables.reserve(document.tables.size());
    for (const auto& [name, table] : document.tables) {
        summary.tables.push_back(summarize_table(table));
    }

    summary.roles.reserve(document.roles.size());
    for (const auto& [name, role] : document.roles) {
        summary.roles.push_back(RoleSummary{role.name, role.description});
    }
    return summary;
}

std::string column_definition_to_json(const ColumnDefinition& column)
{
    std::string json;
    JsonFieldWriter writer{json};
    writer.string_field("name", column.name);
    writer.string_field("dataType", column.data_type);
    writer.bool_field("nullable", column.nullable);
    if (column.default_value) {
        writer.raw_field("defaultValue", storage::write_json(*column.default_value));
    }
    writer.bool_field("isPrimaryKey", column.is_primary_key);
    writer.close();
    return json;
}

std::string summary_to_json(const DocumentSummary& summary)
{
    std::string json;
    json.reserve(512U);
    JsonFieldWriter writer{json};
    writer.raw_field("meta", meta_to_json(summary.meta));

    std::string tables;
    append_json_array(tables, summary.tables, [](std::string& out, const TableSummary& table) {
        out.append(table_summary_to_json(table));
    });
    writer.raw_field("tables", tables);

    std::string roles;
    append_json_array(roles, summary.roles, [](std::string& out, const RoleSummary& role) {
        JsonFieldWriter entry{out};
        entry.string_field("name", role.name);
        entry.optional_string_field("description", role.description);
        entry.close();
    });
    writer.raw_field("roles", roles);
    writer.close();
    return json;
}

std::string format_prompt_digest(const Document& document, std::size_t max_rows)
{
    std::vector<std::string> lines;

    if (document.tables.empty()) {
        lines.emplace_back("No tables are currently defined.");
    }

    for (const auto& [name, table] : document.tables) {
        lines.push_back("Table \"" + table.name + "\" (" + std::to_string(table.rows.size()) + " row(s), " +
                        std::to_string(table.column_order.size()) + " column(s))");
        if (table.description && !table.description->empty()) {
            lines.push_back("  Description: " + *table.description);
        }
        lines.emplace_back("  Columns:");
        for (const auto& column_name : table.column_order) {
            const auto* column = table.find_column(column_name);
            if (column == nullptr) {
                continue;
            }
            std::string line = "    - " + column->name + ": " + column->data_type;
            if (column->is_primary_key) {
                line += " PRIMARY KEY";
            }
            if (!column->nullable) {
                line += " NOT NULL";
            }
            if (column->default_value) {
                line += " DEFAULT " + storage::write_json(*column->default_value);
            }
            lines.push_back(std::move(line));
        }

        if (!table.rows.empty() && max_rows > 0U) {
            lines.emplace_back("  Sample rows:");
            const auto sample_count = std::min(max_rows, table.rows.size());
            for (std::size_t index = 0U; index < sample_count; ++index) {
                lines.push_back("    " + storage::write_json(Value{table.rows[index]}));
            }
        }

        if (!table.permissions.empty()) {
            lines.emplace_back("  Permissions:");
            for (const auto& [role, permission] : table.permissions) {
                std::string privileges;
                for (const auto privilege : permission.privileges) {
                    if (!privileges.empty()) {
                        privileges += ", ";
                    }
                    privileges += to_string(privilege);
                }
                lines.push_back("    - " + role + ": " + privileges);
            }
        }
    }

    if (!document.roles.empty()) {
        lines.emplace_back("Roles:");
        for (const auto& [name, role] : document.roles) {
            std::string line = "  - " + role.name;
            if (role.description && !role.description->empty()) {
                line += " (" + *role.description + ")";
            }
            lines.push_back(std::move(line));
        }
    }

    std::string digest;
    for (std::size_t index = 0U; index < lines.size(); ++index) {
        if (index > 0U) {
            digest.push_back('\n');
        }
        digest += lines[index];
    }
    return digest;
}

}  // namespace docstore::catalog
