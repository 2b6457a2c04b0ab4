#include "docstore/storage/document_codec.hpp"

#include "docstore/storage/json_value.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace docstore::storage {

namespace {

using catalog::ColumnDefinition;
using catalog::Document;
using catalog::RoleDefinition;
using catalog::Table;
using catalog::TablePermission;
using catalog::Timestamp;
using catalog::Value;
using catalog::ValueArray;
using catalog::ValueObject;

Value encode_timestamp(Timestamp timestamp)
{
    return Value{catalog::format_timestamp_iso(timestamp)};
}

Value encode_column(const ColumnDefinition& column)
{
    ValueObject object{};
    object.emplace("name", column.name);
    object.emplace("dataType", column.data_type);
    object.emplace("nullable", column.nullable);
    if (column.default_value) {
        object.emplace("defaultValue", *column.default_value);
    }
    object.emplace("isPrimaryKey", column.is_primary_key);
    return Value{std::move(object)};
}

Value encode_permission(const TablePermission& permission)
{
    ValueArray privileges{};
    for (const auto privilege : permission.privileges) {
        privileges.emplace_back(catalog::to_string(privilege));
    }

    ValueObject object{};
    object.emplace("role", permission.role);
    object.emplace("privileges", std::move(privileges));
    object.emplace("grantedAt", encode_timestamp(permission.granted_at));
    return Value{std::move(object)};
}

Value encode_table(const Table& table)
{
    ValueObject columns{};
    for (const auto& [name, column] : table.columns) {
        columns.emplace(name, encode_column(column));
    }

    ValueArray column_order{};
    for (const auto& name : table.column_order) {
        column_order.emplace_back(name);
    }

    ValueObject permissions{};
    for (const auto& [role, permission] : table.permissions) {
        permissions.emplace(role, encode_permission(permission));
    }

    ValueArray rows{};
    rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        rows.emplace_back(row);
    }

    ValueObject object{};
    object.emplace("name", table.name);
    if (table.description) {
        object.emplace("description", *table.description);
    }
    if (table.primary_key) {
        object.emplace("primaryKey", *table.primary_key);
    }
    object.emplace("columns", std::move(columns));
    object.emplace("columnOrder", std::move(column_order));
    object.emplace("permissions", std::move(permissions));
    object.emplace("rows", std::move(rows));
    object.emplace("createdAt", encode_timestamp(table.created_at));
    object.emplace("updatedAt", encode_timestamp(table.updated_at));
    return Value{std::move(object)};
}

Value encode_role(const RoleDefinition& role)
{
    ValueObject object{};
    object.emplace("name", role.name);
    if (role.description) {
        object.emplace("description", *role.description);
    }
    object.emplace("createdAt", encode_timestamp(role.created_at));
    object.emplace("updatedAt", encode_timestamp(role.updated_at));
    return Value{std::move(object)};
}

class Decoder final {
public:
    explicit Decoder(std::string* message) : message_{message} {}

    bool fail(std::string text)
    {
        if (message_ != nullptr) {
            *message_ = std::move(text);
        }
        return false;
    }

    bool require_object(const Value* value, const std::string& path)
    {
        if (value == nullptr || !value->is_object()) {
            return fail(path + " must be an object");
        }
        return true;
    }

    bool read_string(const Value& object, const char* key, const std::string& path, std::string& out)
    {
        const auto* value = object.find(key);
        if (value == nullptr || !value->is_string()) {
            return fail(path + "." + key + " must be a string");
        }
        out = value->as_string();
        return true;
    }

    bool read_optional_string(const Value& object, const char* key, const std::string& path, std::optional<std::string>& out)
    {
        const auto* value = object.find(key);
        if (value == nullptr || value->is_null()) {
            out.reset();
            return true;
        }
        if (!value->is_string()) {
            return fail(path + "." + key + " must be a string");
        }
        out = value->as_string();
        return true;
    }

    bool read_bool(const Value& object, const char* key, bool fallback, const std::string& path, bool& out)
    {
        const auto* value = object.find(key);
        if (value == nullptr || value->is_null()) {
            out = fallback;
            return true;
        }
        if (!value->is_bool()) {
            return fail(path + "." + key + " must be a boolean");
        }
        out = value->as_bool();
        return true;
    }

    bool read_timestamp(const Value& object, const char* key, const std::string& path, Timestamp fallback, Timestamp& out)
    {
        const auto* value = object.find(key);
        if (value == nullptr || value->is_null()) {
            out = fallback;
            return true;
        }
        if (!value->is_string()) {
            return fail(path + "." + key + " must be an ISO-8601 string");
        }
        const auto parsed = catalog::parse_timestamp_iso(value->as_string());
        if (!parsed) {
            return fail(path + "." + key + " is not a valid timestamp");
        }
        out = *parsed;
        return true;
    }

    bool decode_column(const Value& value, const std::string& key, const std::string& path, ColumnDefinition& column)
    {
        if (!require_object(&value, path)) {
            return false;
        }
        column.name = key;
        if (const auto* name = value.find("name"); name != nullptr && name->is_string()) {
            column.name = name->as_string();
        }
        if (!read_string(value, "dataType", path, column.data_type) ||
            !read_bool(value, "nullable", true, path, column.nullable) ||
            !read_bool(value, "isPrimaryKey", false, path, column.is_primary_key)) {
            return false;
        }
        if (const auto* fallback = value.find("defaultValue"); fallback != nullptr) {
            column.default_value = *fallback;
        }
        if (column.is_primary_key) {
            column.nullable = false;
        }
        return true;
    }

    bool decode_permission(const Value& value, const std::string& role, const std::string& path, TablePermission& permission)
    {
        if (!require_object(&value, path)) {
            return false;
        }
        permission.role = role;
        const auto* privileges = value.find("privileges");
        if (privileges == nullptr || !privileges->is_array()) {
            return fail(path + ".privileges must be an array");
        }
        for (const auto& entry : privileges->as_array()) {
            if (!entry.is_string()) {
                return fail(path + ".privileges must contain strings");
            }
            const auto privilege = catalog::privilege_from_string(entry.as_string());
            if (!privilege) {
                return fail(path + ".privileges contains unknown privilege \"" + entry.as_string() + "\"");
            }
            permission.privileges.insert(*privilege);
        }
        return read_timestamp(value, "grantedAt", path, Timestamp{}, permission.granted_at);
    }

    bool decode_table(const Value& value, const std::string& key, const std::string& path, Table& table)
    {
        if (!require_object(&value, path)) {
            return false;
        }
        table.name = key;
        if (const auto* name = value.find("name"); name != nullptr && name->is_string()) {
            table.name = name->as_string();
        }
        if (!read_optional_string(value, "description", path, table.description) ||
            !read_optional_string(value, "primaryKey", path, table.primary_key) ||
            !read_timestamp(value, "createdAt", path, Timestamp{}, table.created_at) ||
            !read_timestamp(value, "updatedAt", path, table.created_at, table.updated_at)) {
            return false;
        }

        const auto* columns = value.find("columns");
        if (!require_object(columns, path + ".columns")) {
            return false;
        }
        for (const auto& [column_name, column_value] : columns->as_object()) {
            ColumnDefinition column{};
            if (!decode_column(column_value, column_name, path + ".columns." + column_name, column)) {
                return false;
            }
            table.columns.emplace(column_name, std::move(column));
        }

        // Reconcile the order with the column map so both always share a key set.
        if (const auto* order = value.find("columnOrder"); order != nullptr && order->is_array()) {
            for (const auto& entry : order->as_array()) {
                if (entry.is_string() && table.columns.contains(entry.as_string()) &&
                    std::find(table.column_order.begin(), table.column_order.end(), entry.as_string()) ==
                        table.column_order.end()) {
                    table.column_order.push_back(entry.as_string());
                }
            }
        }
        for (const auto& [column_name, column] : table.columns) {
            if (std::find(table.column_order.begin(), table.column_order.end(), column_name) == table.column_order.end()) {
                table.column_order.push_back(column_name);
            }
        }

        if (table.primary_key && !table.columns.contains(*table.primary_key)) {
            return fail(path + ".primaryKey names a missing column");
        }

        if (const auto* permissions = value.find("permissions"); permissions != nullptr && !permissions->is_null()) {
            if (!require_object(permissions, path + ".permissions")) {
                return false;
            }
            for (const auto& [role, entry] : permissions->as_object()) {
                TablePermission permission{};
                if (!decode_permission(entry, role, path + ".permissions." + role, permission)) {
                    return false;
                }
                if (!permission.privileges.empty()) {
                    table.permissions.emplace(role, std::move(permission));
                }
            }
        }

        if (const auto* rows = value.find("rows"); rows != nullptr && !rows->is_null()) {
            if (!rows->is_array()) {
                return fail(path + ".rows must be an array");
            }
            table.rows.reserve(rows->as_array().size());
            for (const auto& row : rows->as_array()) {
                if (!row.is_object()) {
                    return fail(path + ".rows must contain objects");
                }
                table.rows.push_back(row.as_object());
            }
        }
        return true;
    }

    bool decode_role(const Value& value, const std::string& key, const std::string& path, RoleDefinition& role)
    {
        if (!require_object(&value, path)) {
            return false;
        }
        role.name = key;
        return read_optional_string(value, "description", path, role.description) &&
               read_timestamp(value, "createdAt", path, Timestamp{}, role.created_at) &&
               read_timestamp(value, "updatedAt", path, role.created_at, role.updated_at);
    }

    bool decode_document(const Value& value, Document& document)
    {
        if (!require_object(&value, "document")) {
            return false;
        }

        const auto* meta = value.find("meta");
        if (!require_object(meta, "meta")) {
            return false;
        }
        const auto* version = meta->find("version");
        if (version != nullptr && version->is_number()) {
            if (version->as_number() > static_cast<double>(catalog::kDocumentFormatVersion) || version->as_number() < 1.0) {
                return fail("meta.version " + catalog::format_number(version->as_number()) + " is not supported");
            }
            document.meta.version = static_cast<std::uint32_t>(version->as_number());
        }
        const auto* revision = meta->find("revision");
        if (revision != nullptr) {
            if (!revision->is_number() || revision->as_number() < 0.0) {
                return fail("meta.revision must be a non-negative number");
            }
            document.meta.revision = static_cast<std::uint64_t>(revision->as_number());
        }
        if (!read_timestamp(*meta, "createdAt", "meta", Timestamp{}, document.meta.created_at) ||
            !read_timestamp(*meta, "updatedAt", "meta", document.meta.created_at, document.meta.updated_at)) {
            return false;
        }

        if (const auto* tables = value.find("tables"); tables != nullptr && !tables->is_null()) {
            if (!require_object(tables, "tables")) {
                return false;
            }
            for (const auto& [name, entry] : tables->as_object()) {
                Table table{};
                if (!decode_table(entry, name, "tables." + name, table)) {
                    return false;
                }
                document.tables.emplace(name, std::move(table));
            }
        }

        if (const auto* roles = value.find("roles"); roles != nullptr && !roles->is_null()) {
            if (!require_object(roles, "roles")) {
                return false;
            }
            for (const auto& [name, entry] : roles->as_object()) {
                RoleDefinition role{};
                if (!decode_role(entry, name, "roles." + name, role)) {
                    return false;
                }
                document.roles.emplace(name, std::move(role));
            }
        }
        return true;
    }

private:
    std::string* message_ = nullptr;
};

}  // namespace

Value DocumentCodec::encode(const Document& document)
{
    ValueObject meta{};
    meta.emplace("version", static_cast<std::uint64_t>(document.meta.version));
    meta.emplace("revision", document.meta.revision);
    meta.emplace("createdAt", encode_timestamp(document.meta.created_at));
    meta.emplace("updatedAt", encode_timestamp(document.meta.updated_at));

    ValueObject tables{};
    for (const auto& [name, table] : document.tables) {
        tables.emplace(name, encode_table(table));
    }

    ValueObject roles{};
    for (const auto& [name, role] : document.roles) {
        roles.emplace(name, encode_role(role));
    }

    ValueObject root{};
    root.emplace("meta", std::move(meta));
    root.emplace("tables", std::move(tables));
    root.emplace("roles", std::move(roles));
    return Value{std::move(root)};
}

std::string DocumentCodec::serialize(const Document& document)
{
    return write_json(encode(document), kIndent);
}

std::error_code DocumentCodec::decode(const Value& value, Document& document, std::string* message)
{
    Document decoded{};
    Decoder decoder{message};
    if (!decoder.decode_document(value, decoded)) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    document = std::move(decoded);
    return {};
}

std::error_code DocumentCodec::deserialize(std::string_view text, Document& document, std::string* message)
{
    auto parsed = parse_json(text);
    if (!parsed.success()) {
        if (message != nullptr) {
            *message = parsed.message + " at line " + std::to_string(parsed.line) + ", column " +
                       std::to_string(parsed.column);
        }
        return std::make_error_code(std::errc::invalid_argument);
    }
    return decode(*parsed.value, document, message);
}

std::error_code DocumentCodec::write_file(const Document& document, const std::filesystem::path& path)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    auto temporary = path;
    temporary += ".tmp";

    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return std::make_error_code(std::errc::io_error);
        }
        const auto payload = serialize(document);
        stream.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        stream.flush();
        if (!stream) {
            stream.close();
            std::filesystem::remove(temporary, ec);
            return std::make_error_code(std::errc::io_error);
        }
    }

    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temporary, cleanup);
        return ec;
    }
    return {};
}

std::error_code DocumentCodec::read_file(const std::filesystem::path& path, Document& document, std::string* message)
{
    std::error_code status_ec;
    const auto status = std::filesystem::status(path, status_ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (status_ec) {
        return status_ec;
    }
    if (std::filesystem::is_directory(status)) {
        return std::make_error_code(std::errc::is_a_directory);
    }

    // The file exists, so a failed open is never reported as a missing file.
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::make_error_code(std::errc::io_error);
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::make_error_code(std::errc::io_error);
    }
    return deserialize(buffer.str(), document, message);
}

}  // namespace docstore::storage
