#pragma once

#include "docstore/catalog/timestamp.hpp"
#include "docstore/catalog/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docstore::catalog {

inline constexpr std::uint32_t kDocumentFormatVersion = 1U;
inline constexpr std::string_view kBootstrapRoleName = "admin";
inline constexpr std::string_view kBootstrapRoleDescription = "Full access to every table and privilege.";

enum class Privilege : std::uint8_t {
    Select = 0,
    Insert,
    Update,
    Delete,
    Alter,
    Drop,
    ManagePermissions,
    Count
};

inline constexpr std::array<Privilege, static_cast<std::size_t>(Privilege::Count)> kAllPrivileges{
    Privilege::Select,
    Privilege::Insert,
    Privilege::Update,
    Privilege::Delete,
    Privilege::Alter,
    Privilege::Drop,
    Privilege::ManagePermissions};

using PrivilegeSet = std::set<Privilege>;

[[nodiscard]] std::string_view to_string(Privilege privilege) noexcept;
[[nodiscard]] std::optional<Privilege> privilege_from_string(std::string_view name) noexcept;

struct ColumnDefinition final {
    std::string name{};
    std::string data_type{};
    bool nullable = true;
    std::optional<Value> default_value{};
    bool is_primary_key = false;

    friend bool operator==(const ColumnDefinition&, const ColumnDefinition&) = default;
};

struct TablePermission final {
    std::string role{};
    PrivilegeSet privileges{};
    Timestamp granted_at{};

    friend bool operator==(const TablePermission&, const TablePermission&) = default;
};

struct Table final {
    std::string name{};
    std::optional<std::string> description{};
    std::optional<std::string> primary_key{};
    std::map<std::string, ColumnDefinition> columns{};
    std::vector<std::string> column_order{};
    std::map<std::string, TablePermission> permissions{};
    std::vector<Row> rows{};
    Timestamp created_at{};
    Timestamp updated_at{};

    [[nodiscard]] const ColumnDefinition* find_column(std::string_view column) const;
    [[nodiscard]] bool has_column(std::string_view column) const { return find_column(column) != nullptr; }

    friend bool operator==(const Table&, const Table&) = default;
};

struct RoleDefinition final {
    std::string name{};
    std::optional<std::string> description{};
    Timestamp created_at{};
    Timestamp updated_at{};

    friend bool operator==(const RoleDefinition&, const RoleDefinition&) = default;
};

struct DocumentMeta final {
    std::uint32_t version = kDocumentFormatVersion;
    std::uint64_t revision = 0U;
    Timestamp created_at{};
    Timestamp updated_at{};

    friend bool operator==(const DocumentMeta&, const DocumentMeta&) = default;
};

struct Document final {
    DocumentMeta meta{};
    std::map<std::string, Table> tables{};
    std::map<std::string, RoleDefinition> roles{};

    [[nodiscard]] Table* find_table(std::string_view name);
    [[nodiscard]] const Table* find_table(std::string_view name) const;
    [[nodiscard]] const RoleDefinition* find_role(std::string_view name) const;

    friend bool operator==(const Document&, const Document&) = default;
};

// Fresh document at revision 0 holding the bootstrap role.
[[nodiscard]] Document make_empty_document(Timestamp now);

}  // namespace docstore::catalog
