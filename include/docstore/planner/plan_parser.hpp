#pragma once

#include "docstore/catalog/value.hpp"
#include "docstore/planner/plan.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace docstore::planner {

// Drops Markdown code fences and any text outside the outermost braces.
[[nodiscard]] std::string sanitize_planner_output(std::string_view raw);

// "createTable", "create-table", "create_table" and "ddl.create_table" all
// normalise to "ddl.create_table". Returns nullopt for unknown tags.
[[nodiscard]] std::optional<executor::OperationKind> resolve_operation_tag(std::string_view tag);

struct OperationDecodeResult final {
    std::optional<executor::OperationKind> kind{};
    std::optional<executor::Operation> operation{};
    std::string error{};

    [[nodiscard]] bool success() const noexcept { return operation.has_value(); }
};

[[nodiscard]] OperationDecodeResult decode_operation(const catalog::Value& value);
[[nodiscard]] OperationDecodeResult parse_operation(std::string_view text);

[[nodiscard]] PlanParseResult decode_plan(const catalog::Value& value);
[[nodiscard]] PlanParseResult parse_plan(std::string_view text);

}  // namespace docstore::planner
