#include "docstore/planner/plan_runner.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/schema_validation.hpp"

#include <utility>
#include <vector>

namespace docstore::planner {

namespace {

constexpr const char* kEmptyPlanResponse =
    "No changes were required for your request. Let me know how else you would like to shape the dataset.";

executor::ExecutionResult make_invalid_result(const PlannedOperation& planned, std::string id)
{
    auto result = executor::make_failure(planned.kind,
                                         make_error_code(catalog::CatalogErrc::ValidationError),
                                         planned.decode_error);
    result.id = std::move(id);
    return result;
}

}  // namespace

std::size_t PlanResponse::failure_count() const noexcept
{
    std::size_t count = 0U;
    for (const auto& result : results) {
        if (result.failed()) {
            ++count;
        }
    }
    return count;
}

const char* to_string(PlanSeverity severity) noexcept
{
    switch (severity) {
    case PlanSeverity::Info:
        return "info";
    case PlanSeverity::Warning:
        return "warning";
    case PlanSeverity::Error:
    default:
        return "error";
    }
}

PlanRunner::PlanRunner(storage::DocumentStore& store)
    : PlanRunner(store, Config{})
{
}

PlanRunner::PlanRunner(storage::DocumentStore& store, Config config)
    : store_{store}
    , config_{std::move(config)}
{
}

PlanResponse PlanRunner::run(const PlanRequest& request)
{
    const auto& plan = request.plan;

    PlanResponse response{};
    response.dry_run = config_.dry_run || request.dry_run;
    if (plan.thought) {
        const auto thought = catalog::trim_copy(*plan.thought);
        if (!thought.empty()) {
            response.thought = thought;
        }
    }
    response.warnings = plan.warnings;

    std::vector<executor::Operation> runnable;
    runnable.reserve(plan.operations.size());
    for (const auto& planned : plan.operations) {
        if (planned.valid()) {
            runnable.push_back(*planned.operation);
        }
    }

    storage::BatchOptions options{};
    options.execution.acting_role = request.acting_role ? request.acting_role : config_.default_acting_role;
    options.expected_revision = plan.expected_revision;
    options.dry_run = response.dry_run;

    auto outcome = store_.execute_batch(runnable, options);
    response.error = outcome.error;
    response.revision_before = outcome.revision_before;
    response.revision_after = outcome.revision_after;
    response.summary = std::move(outcome.summary);

    if (outcome.error == catalog::CatalogErrc::ConflictError) {
        response.warnings.push_back(outcome.message);
        response.content = outcome.message;
        return response;
    }

    // Undecodable operations never reach the store, so they are slotted back
    // into plan order here.
    std::size_t next_executed = 0U;
    for (std::size_t index = 0U; index < plan.operations.size(); ++index) {
        const auto& planned = plan.operations[index];
        if (planned.valid()) {
            response.results.push_back(std::move(outcome.results[next_executed++]));
        } else {
            response.results.push_back(
                make_invalid_result(planned, config_.invalid_id_prefix + "-" + std::to_string(index + 1U)));
        }
    }

    for (const auto& result : response.results) {
        if (result.failed()) {
            response.warnings.push_back(result.detail);
        }
    }
    if (outcome.error) {
        response.warnings.push_back(outcome.message);
    }

    if (response.dry_run) {
        for (auto& result : response.results) {
            if (result.succeeded()) {
                result.detail += kPendingConfirmationSuffix;
            }
        }
        response.warnings.emplace_back(kDryRunWarning);
    }

    response.content = build_response_content(plan, response);
    return response;
}

std::string build_response_content(const Plan& plan, const PlanResponse& response)
{
    std::string content;
    if (plan.final_response) {
        content = catalog::trim_copy(*plan.final_response);
    }
    if (content.empty()) {
        if (response.results.empty()) {
            content = kEmptyPlanResponse;
        } else {
            content = "Here is what I executed:";
            for (std::size_t index = 0U; index < response.results.size(); ++index) {
                content.append("\n");
                content.append(std::to_string(index + 1U));
                content.append(". ");
                content.append(response.results[index].detail);
            }
        }
    }

    if (response.dry_run) {
        if (content.back() != '.') {
            content.push_back('.');
        }
        content.append(" These changes have not been applied yet.");
    }
    return content;
}

}  // namespace docstore::planner
