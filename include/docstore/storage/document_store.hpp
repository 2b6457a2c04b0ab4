#pragma once

#include "docstore/catalog/document.hpp"
#include "docstore/catalog/document_summary.hpp"
#include "docstore/catalog/timestamp.hpp"
#include "docstore/executor/operation.hpp"
#include "docstore/executor/operation_executor.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace docstore::storage {

// PerBatch writes once at the end of execute_batch; execute() always writes
// after a successful mutation.
enum class PersistencePolicy : std::uint8_t {
    PerOperation = 0,
    PerBatch
};

struct BatchOptions final {
    executor::ExecutionOptions execution{};
    std::optional<std::uint64_t> expected_revision{};
    bool dry_run = false;
};

struct BatchOutcome final {
    std::vector<executor::ExecutionResult> results{};
    // Set when the batch as a whole was rejected or could not be persisted.
    std::error_code error{};
    std::string message{};
    std::uint64_t revision_before = 0U;
    std::uint64_t revision_after = 0U;
    catalog::DocumentSummary summary{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

class DocumentStore final {
public:
    struct Config final {
        std::filesystem::path path{};
        PersistencePolicy persistence = PersistencePolicy::PerOperation;
        catalog::ClockFn clock{};
        // The operation logger runs after the store lock is released, so it
        // may call back into the store.
        executor::OperationExecutor::Config executor{};
    };

    explicit DocumentStore(Config config);

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;
    DocumentStore(DocumentStore&&) = delete;
    DocumentStore& operator=(DocumentStore&&) = delete;

    // Reads the document file; an absent file yields a fresh document that is
    // written immediately.
    [[nodiscard]] std::error_code load(std::string* message = nullptr);
    [[nodiscard]] std::error_code persist();

    [[nodiscard]] executor::ExecutionResult execute(const executor::Operation& operation,
                                                    const executor::ExecutionOptions& options = {});
    [[nodiscard]] executor::ExecutionResult execute_read(const executor::Operation& operation,
                                                         const executor::ExecutionOptions& options = {});
    [[nodiscard]] BatchOutcome execute_batch(std::span<const executor::Operation> operations,
                                             const BatchOptions& options = {});

    [[nodiscard]] catalog::DocumentSummary summary() const;
    [[nodiscard]] std::string prompt_digest(std::size_t max_rows = 2U) const;
    [[nodiscard]] std::uint64_t revision() const;
    [[nodiscard]] catalog::Document snapshot() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return config_.path; }
    [[nodiscard]] PersistencePolicy persistence_policy() const noexcept { return config_.persistence; }
    [[nodiscard]] const executor::OperationExecutor& executor() const noexcept { return executor_; }

private:
    [[nodiscard]] std::error_code persist_locked() const;
    [[nodiscard]] BatchOutcome preview_batch(std::span<const executor::Operation> operations, const BatchOptions& options);
    [[nodiscard]] BatchOutcome apply_batch(std::span<const executor::Operation> operations, const BatchOptions& options);
    void flush_operation_logs();

    Config config_{};
    executor::OperationExecutor executor_;
    mutable std::shared_mutex mutex_{};
    catalog::Document document_{};
    std::mutex log_mutex_{};
    std::vector<executor::OperationLogRecord> pending_logs_{};
};

[[nodiscard]] const char* to_string(PersistencePolicy policy) noexcept;

}  // namespace docstore::storage
