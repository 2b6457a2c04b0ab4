#pragma once

#include "docstore/catalog/document_summary.hpp"
#include "docstore/executor/operation.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace docstore::planner {

enum class PlanSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct PlanDiagnostic final {
    PlanSeverity severity = PlanSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::vector<std::string> remediation_hints{};
};

// A known operation tag whose fields failed to decode keeps its kind and
// reports `decode_error`; it is surfaced as a ValidationError result.
struct PlannedOperation final {
    executor::OperationKind kind = executor::OperationKind::CreateTable;
    std::optional<executor::Operation> operation{};
    std::string decode_error{};

    [[nodiscard]] bool valid() const noexcept { return operation.has_value(); }
};

struct Plan final {
    std::optional<std::string> thought{};
    std::optional<std::string> final_response{};
    std::vector<std::string> warnings{};
    std::optional<std::uint64_t> expected_revision{};
    std::vector<PlannedOperation> operations{};
};

struct PlanParseResult final {
    std::optional<Plan> plan{};
    std::vector<PlanDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return plan.has_value(); }
};

struct PlanRequest final {
    Plan plan{};
    std::optional<std::string> acting_role{};
    bool dry_run = false;
};

struct PlanResponse final {
    std::string content{};
    std::optional<std::string> thought{};
    std::vector<executor::ExecutionResult> results{};
    std::vector<std::string> warnings{};
    catalog::DocumentSummary summary{};
    // Batch-level rejection (revision conflict) or persistence failure.
    std::error_code error{};
    std::uint64_t revision_before = 0U;
    std::uint64_t revision_after = 0U;
    bool dry_run = false;

    [[nodiscard]] bool ok() const noexcept { return !error; }
    [[nodiscard]] std::size_t failure_count() const noexcept;
};

[[nodiscard]] const char* to_string(PlanSeverity severity) noexcept;

}  // namespace docstore::planner
