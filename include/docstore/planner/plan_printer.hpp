#pragma once

#include "docstore/executor/operation.hpp"
#include "docstore/planner/plan.hpp"

#include <string>
#include <vector>

namespace docstore::planner {

struct PrintOptions final {
    bool include_summary = true;
    bool include_durations = false;
};

[[nodiscard]] std::string result_set_to_json(const executor::QueryResultSet& result_set);
[[nodiscard]] std::string execution_result_to_json(const executor::ExecutionResult& result, PrintOptions options = {});
[[nodiscard]] std::string plan_response_to_json(const PlanResponse& response, PrintOptions options = {});
[[nodiscard]] std::string plan_diagnostics_to_json(const std::vector<PlanDiagnostic>& diagnostics);

// Fixed-width text table for a result set, one line per row.
[[nodiscard]] std::string format_result_set_table(const executor::QueryResultSet& result_set);

}  // namespace docstore::planner
