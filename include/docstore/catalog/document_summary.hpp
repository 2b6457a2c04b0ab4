#pragma once

#include "docstore/catalog/document.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docstore::catalog {

struct PermissionSummary final {
    std::string role{};
    std::vector<std::string> privileges{};
};

struct TableSummary final {
    std::string name{};
    std::optional<std::string> description{};
    std::optional<std::string> primary_key{};
    std::vector<ColumnDefinition> columns{};
    std::uint32_t column_count = 0U;
    std::uint64_t row_count = 0U;
    Timestamp updated_at{};
    std::vector<PermissionSummary> permissions{};
};

struct RoleSummary final {
    std::string name{};
    std::optional<std::string> description{};
};

// Read-only projection handed to planners and front ends.
struct DocumentSummary final {
    DocumentMeta meta{};
    std::vector<TableSummary> tables{};
    std::vector<RoleSummary> roles{};

    [[nodiscard]] const TableSummary* find_table(std::string_view name) const;
};

[[nodiscard]] TableSummary summarize_table(const Table& table);
[[nodiscard]] DocumentSummary summarize_document(const Document& document);

std::string summary_to_json(const DocumentSummary& summary);
std::string column_definition_to_json(const ColumnDefinition& column);

// Plain-text context for a planner: every table with its columns, up to
// `max_rows` sample rows and its permissions, followed by the role list.
std::string format_prompt_digest(const Document& document, std::size_t max_rows = 2U);

}  // namespace docstore::catalog
