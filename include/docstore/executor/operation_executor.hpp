#pragma once

#include "docstore/catalog/document.hpp"
#include "docstore/catalog/timestamp.hpp"
#include "docstore/executor/operation.hpp"
#include "docstore/executor/operation_telemetry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace docstore::executor {

struct ExecutionOptions final {
    // When set, the role must exist and hold the privilege the operation needs.
    std::optional<std::string> acting_role{};
    // Preview runs are logged with `preview` set and left out of telemetry.
    bool preview = false;
};

struct OperationLogRecord final {
    std::string execution_id{};
    std::string query{};
    OperationKind kind = OperationKind::CreateTable;
    ExecutionStatus status = ExecutionStatus::Success;
    std::chrono::nanoseconds duration{0};
    std::uint64_t rows_affected = 0U;
    std::string error_message{};
    std::vector<std::string> tables{};
    std::optional<std::string> acting_role{};
    bool preview = false;
};

using OperationLogger = std::function<void(const OperationLogRecord&)>;

class OperationExecutor final {
public:
    struct Config final {
        catalog::ClockFn clock{};
        std::string id_prefix = "op";
        OperationTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
        OperationLogger operation_logger{};
    };

    explicit OperationExecutor(Config config);
    ~OperationExecutor();

    OperationExecutor(const OperationExecutor&) = delete;
    OperationExecutor& operator=(const OperationExecutor&) = delete;
    OperationExecutor(OperationExecutor&&) = delete;
    OperationExecutor& operator=(OperationExecutor&&) = delete;

    // Applies one operation. Either the whole operation lands (and the
    // document revision advances for mutating kinds) or the document is left
    // untouched.
    [[nodiscard]] ExecutionResult execute(catalog::Document& document,
                                          const Operation& operation,
                                          const ExecutionOptions& options = {});

    // Read-only entry point; mutating kinds are rejected with ExecutionFailed.
    [[nodiscard]] ExecutionResult execute_read(const catalog::Document& document,
                                               const Operation& operation,
                                               const ExecutionOptions& options = {});

    [[nodiscard]] const OperationTelemetry& telemetry() const noexcept { return telemetry_; }
    [[nodiscard]] catalog::Timestamp now() const;

private:
    using Body = std::function<ExecutionResult(catalog::Timestamp)>;

    [[nodiscard]] ExecutionResult run(const Operation& operation, const ExecutionOptions& options, const Body& body);
    [[nodiscard]] std::string next_execution_id();

    Config config_{};
    OperationTelemetry telemetry_{};
    OperationTelemetryRegistry* registry_ = nullptr;
    std::string registry_identifier_{};
    std::atomic<std::uint64_t> next_id_{1U};
};

}  // namespace docstore::executor
