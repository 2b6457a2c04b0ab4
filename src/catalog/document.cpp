#include "docstore/catalog/document.hpp"

namespace docstore::catalog {

std::string_view to_string(Privilege privilege) noexcept
{
    switch (privilege) {
    case Privilege::Select:
        return "select";
    case Privilege::Insert:
        return "insert";
    case Privilege::Update:
        return "update";
    case Privilege::Delete:
        return "delete";
    case Privilege::Alter:
        return "alter";
    case Privilege::Drop:
        return "drop";
    case Privilege::ManagePermissions:
        return "manage_permissions";
    default:
        return "unknown";
    }
}

std::optional<Privilege> privilege_from_string(std::string_view name) noexcept
{
    for (const auto privilege : kAllPrivileges) {
        if (to_string(privilege) == name) {
            return privilege;
        }
    }
    return std::nullopt;
}

const ColumnDefinition* Table::find_column(std::string_view column) const
{
    const auto it = columns.find(std::string{column});
    if (it == columns.end()) {
        return nullptr;
    }
    return &it->second;
}

Table* Document::find_table(std::string_view name)
{
    const auto it = tables.find(std::string{name});
    if (it == tables.end()) {
        return nullptr;
    }
    return &it->second;
}

const Table* Document::find_table(std::string_view name) const
{
    const auto it = tables.find(std::string{name});
    if (it == tables.end()) {
        return nullptr;
    }
    return &it->second;
}

const RoleDefinition* Document::find_role(std::string_view name) const
{
    const auto it = roles.find(std::string{name});
    if (it == roles.end()) {
        return nullptr;
    }
    return &it->second;
}

Document make_empty_document(Timestamp now)
{
    Document document{};
    document.meta.version = kDocumentFormatVersion;
    document.meta.revision = 0U;
    document.meta.created_at = now;
    document.meta.updated_at = now;

    RoleDefinition admin{};
    admin.name = std::string{kBootstrapRoleName};
    admin.description = std::string{kBootstrapRoleDescription};
    admin.created_at = now;
    admin.updated_at = now;
    document.roles.emplace(admin.name, std::move(admin));
    return document;
}

}  // namespace docstore::catalog
