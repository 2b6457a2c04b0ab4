#include "docstore/storage/document_store.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/storage/document_codec.hpp"

#include <mutex>
#include <utility>

namespace docstore::storage {

namespace {

using catalog::CatalogErrc;
using executor::ExecutionResult;

executor::OperationExecutor::Config make_executor_config(const DocumentStore::Config& config,
                                                         executor::OperationLogger queue_logger)
{
    auto executor_config = config.executor;
    if (!executor_config.clock) {
        executor_config.clock = config.clock;
    }
    if (executor_config.operation_logger) {
        executor_config.operation_logger = std::move(queue_logger);
    }
    return executor_config;
}

// Keeps the id, kind and duration of the original result.
void mark_persistence_failure(ExecutionResult& result, std::error_code ec)
{
    auto failure = executor::make_failure(result.kind,
                                          make_error_code(CatalogErrc::PersistenceFailed),
                                          "Failed to persist document: " + ec.message());
    failure.id = std::move(result.id);
    failure.duration = result.duration;
    result = std::move(failure);
}

bool needs_persist(const ExecutionResult& result)
{
    return result.succeeded() && executor::is_mutating(result.kind);
}

}  // namespace

DocumentStore::DocumentStore(Config config)
    : config_{std::move(config)}
    , executor_{make_executor_config(config_, [this](const executor::OperationLogRecord& record) {
        std::lock_guard guard{log_mutex_};
        pending_logs_.push_back(record);
    })}
{
    if (!config_.clock) {
        config_.clock = [] { return catalog::now_timestamp(); };
    }
}

std::error_code DocumentStore::load(std::string* message)
{
    std::unique_lock lock(mutex_);

    catalog::Document loaded{};
    const auto ec = DocumentCodec::read_file(config_.path, loaded, message);
    if (ec == std::errc::no_such_file_or_directory) {
        document_ = catalog::make_empty_document(config_.clock());
        return persist_locked();
    }
    if (ec) {
        return ec;
    }

    document_ = std::move(loaded);
    return {};
}

std::error_code DocumentStore::persist()
{
    std::shared_lock lock(mutex_);
    return persist_locked();
}

std::error_code DocumentStore::persist_locked() const
{
    if (config_.path.empty()) {
        return {};
    }
    return DocumentCodec::write_file(document_, config_.path);
}

void DocumentStore::flush_operation_logs()
{
    std::vector<executor::OperationLogRecord> records;
    {
        std::lock_guard guard{log_mutex_};
        records.swap(pending_logs_);
    }
    for (const auto& record : records) {
        config_.executor.operation_logger(record);
    }
}

ExecutionResult DocumentStore::execute(const executor::Operation& operation, const executor::ExecutionOptions& options)
{
    if (!executor::is_mutating(executor::operation_kind(operation))) {
        return execute_read(operation, options);
    }

    ExecutionResult result{};
    {
        // A direct call is a batch of one, so it persists under either policy.
        std::unique_lock lock(mutex_);
        auto previous = document_;
        result = executor_.execute(document_, operation, options);
        if (needs_persist(result)) {
            if (const auto ec = persist_locked()) {
                document_ = std::move(previous);
                mark_persistence_failure(result, ec);
            }
        }
    }
    flush_operation_logs();
    return result;
}

ExecutionResult DocumentStore::execute_read(const executor::Operation& operation,
                                            const executor::ExecutionOptions& options)
{
    ExecutionResult result{};
    {
        std::shared_lock lock(mutex_);
        result = executor_.execute_read(document_, operation, options);
    }
    flush_operation_logs();
    return result;
}

BatchOutcome DocumentStore::execute_batch(std::span<const executor::Operation> operations, const BatchOptions& options)
{
    auto outcome = options.dry_run ? preview_batch(operations, options) : apply_batch(operations, options);
    flush_operation_logs();
    return outcome;
}

BatchOutcome DocumentStore::preview_batch(std::span<const executor::Operation> operations, const BatchOptions& options)
{
    BatchOutcome outcome{};
    catalog::Document preview{};
    {
        std::shared_lock lock(mutex_);
        preview = document_;
    }
    outcome.revision_before = preview.meta.revision;
    if (options.expected_revision && *options.expected_revision != preview.meta.revision) {
        outcome.error = make_error_code(CatalogErrc::ConflictError);
        outcome.message = "Expected revision " + std::to_string(*options.expected_revision) +
                          " but the document is at revision " + std::to_string(preview.meta.revision) + ".";
        outcome.revision_after = preview.meta.revision;
        outcome.summary = catalog::summarize_document(preview);
        return outcome;
    }
    auto execution = options.execution;
    execution.preview = true;
    for (const auto& operation : operations) {
        outcome.results.push_back(executor_.execute(preview, operation, execution));
    }
    outcome.revision_after = preview.meta.revision;
    outcome.summary = catalog::summarize_document(preview);
    return outcome;
}

BatchOutcome DocumentStore::apply_batch(std::span<const executor::Operation> operations, const BatchOptions& options)
{
    BatchOutcome outcome{};
    std::unique_lock lock(mutex_);
    outcome.revision_before = document_.meta.revision;
    if (options.expected_revision && *options.expected_revision != document_.meta.revision) {
        outcome.error = make_error_code(CatalogErrc::ConflictError);
        outcome.message = "Expected revision " + std::to_string(*options.expected_revision) +
                          " but the document is at revision " + std::to_string(document_.meta.revision) + ".";
        outcome.revision_after = document_.meta.revision;
        outcome.summary = catalog::summarize_document(document_);
        return outcome;
    }

    const auto per_operation = config_.persistence == PersistencePolicy::PerOperation;
    auto before_batch = per_operation ? catalog::Document{} : document_;

    for (const auto& operation : operations) {
        if (!per_operation) {
            outcome.results.push_back(executor_.execute(document_, operation, options.execution));
            continue;
        }

        auto previous = document_;
        auto result = executor_.execute(document_, operation, options.execution);
        if (needs_persist(result)) {
            if (const auto ec = persist_locked()) {
                document_ = std::move(previous);
                mark_persistence_failure(result, ec);
            }
        }
        outcome.results.push_back(std::move(result));
    }

    if (!per_operation && document_.meta.revision != outcome.revision_before) {
        if (const auto ec = persist_locked()) {
            document_ = std::move(before_batch);
            outcome.error = make_error_code(CatalogErrc::PersistenceFailed);
            outcome.message = "Failed to persist document: " + ec.message();
            for (auto& result : outcome.results) {
                if (needs_persist(result)) {
                    mark_persistence_failure(result, ec);
                }
            }
        }
    }

    outcome.revision_after = document_.meta.revision;
    outcome.summary = catalog::summarize_document(document_);
    return outcome;
}

catalog::DocumentSummary DocumentStore::summary() const
{
    std::shared_lock lock(mutex_);
    return catalog::summarize_document(document_);
}

std::string DocumentStore::prompt_digest(std::size_t max_rows) const
{
    std::shared_lock lock(mutex_);
    return catalog::format_prompt_digest(document_, max_rows);
}

std::uint64_t DocumentStore::revision() const
{
    std::shared_lock lock(mutex_);
    return document_.meta.revision;
}

catalog::Document DocumentStore::snapshot() const
{
    std::shared_lock lock(mutex_);
    return document_;
}

const char* to_string(PersistencePolicy policy) noexcept
{
    switch (policy) {
    case PersistencePolicy::PerOperation:
        return "per-operation";
    case PersistencePolicy::PerBatch:
        return "per-batch";
    default:
        return "unknown";
    }
}

}  // namespace docstore::storage
