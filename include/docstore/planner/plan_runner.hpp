#pragma once

#include "docstore/planner/plan.hpp"
#include "docstore/storage/document_store.hpp"

#include <optional>
#include <string>

namespace docstore::planner {

class PlanRunner final {
public:
    struct Config final {
        // Applied when the request does not name a role.
        std::optional<std::string> default_acting_role{};
        // Forces every plan into preview mode.
        bool dry_run = false;
        std::string invalid_id_prefix = "invalid";
    };

    explicit PlanRunner(storage::DocumentStore& store);
    PlanRunner(storage::DocumentStore& store, Config config);

    PlanRunner(const PlanRunner&) = delete;
    PlanRunner& operator=(const PlanRunner&) = delete;
    PlanRunner(PlanRunner&&) = delete;
    PlanRunner& operator=(PlanRunner&&) = delete;

    // Runs every operation in order; a failing operation does not stop the
    // ones after it.
    [[nodiscard]] PlanResponse run(const PlanRequest& request);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    storage::DocumentStore& store_;
    Config config_{};
};

inline constexpr const char* kPendingConfirmationSuffix = " (pending confirmation)";
inline constexpr const char* kDryRunWarning = "No changes have been applied yet; run the plan without --dry-run to save them.";

// The planner's final response when present, otherwise a numbered list of
// the result details.
[[nodiscard]] std::string build_response_content(const Plan& plan, const PlanResponse& response);

}  // namespace docstore::planner
