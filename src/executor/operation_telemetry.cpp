#include "docstore/executor/operation_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace docstore::executor {

namespace {

using catalog::CatalogErrc;

enum FailureSlot : std::size_t {
    SchemaSlot = 0U,
    ConflictSlot,
    NotFoundSlot,
    PrivilegeSlot,
    ValidationSlot,
    PersistenceSlot,
    ExecutionSlot,
    OtherSlot
};

inline std::size_t to_index(OperationKind kind) noexcept
{
    return static_cast<std::size_t>(kind);
}

std::size_t failure_slot(std::error_code error) noexcept
{
    if (!error || error.category() != catalog::catalog_error_category()) {
        return OtherSlot;
    }

    switch (static_cast<CatalogErrc>(error.value())) {
    case CatalogErrc::SchemaError:
        return SchemaSlot;
    case CatalogErrc::ConflictError:
        return ConflictSlot;
    case CatalogErrc::NotFoundError:
        return NotFoundSlot;
    case CatalogErrc::PrivilegeError:
        return PrivilegeSlot;
    case CatalogErrc::ValidationError:
        return ValidationSlot;
    case CatalogErrc::PersistenceFailed:
        return PersistenceSlot;
    case CatalogErrc::ExecutionFailed:
        return ExecutionSlot;
    default:
        return OtherSlot;
    }
}

void accumulate(OperationKindTelemetrySnapshot& target, const OperationKindTelemetrySnapshot& source) noexcept
{
    target.attempts += source.attempts;
    target.successes += source.successes;
    target.skips += source.skips;
    target.failures += source.failures;
    target.total_duration_ns += source.total_duration_ns;
    target.last_duration_ns = std::max(target.last_duration_ns, source.last_duration_ns);
}

void accumulate(OperationFailureTelemetrySnapshot& target, const OperationFailureTelemetrySnapshot& source) noexcept
{
    target.schema_errors += source.schema_errors;
    target.conflict_errors += source.conflict_errors;
    target.not_found_errors += source.not_found_errors;
    target.privilege_errors += source.privilege_errors;
    target.validation_errors += source.validation_errors;
    target.persistence_failures += source.persistence_failures;
    target.execution_failures += source.execution_failures;
    target.other_failures += source.other_failures;
}

}  // namespace

std::uint64_t OperationTelemetrySnapshot::total_attempts() const noexcept
{
    std::uint64_t total = 0U;
    for (const auto& kind : kinds) {
        total += kind.attempts;
    }
    return total;
}

std::uint64_t OperationTelemetrySnapshot::total_failures() const noexcept
{
    std::uint64_t total = 0U;
    for (const auto& kind : kinds) {
        total += kind.failures;
    }
    return total;
}

void OperationTelemetry::record_attempt(OperationKind kind) noexcept
{
    attempts_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_success(OperationKind kind) noexcept
{
    successes_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_skip(OperationKind kind) noexcept
{
    skips_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_failure(OperationKind kind, std::error_code error) noexcept
{
    failures_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
    failure_kinds_[failure_slot(error)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_duration(OperationKind kind, std::uint64_t duration_ns) noexcept
{
    total_duration_ns_[to_index(kind)].fetch_add(duration_ns, std::memory_order_relaxed);
    last_duration_ns_[to_index(kind)].store(duration_ns, std::memory_order_relaxed);
}

OperationTelemetrySnapshot OperationTelemetry::snapshot() const noexcept
{
    OperationTelemetrySnapshot snapshot{};
    for (std::size_t i = 0; i < kind_count; ++i) {
        snapshot.kinds[i].attempts = attempts_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].successes = successes_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].skips = skips_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].failures = failures_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].total_duration_ns = total_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].last_duration_ns = last_duration_ns_[i].load(std::memory_order_relaxed);
    }

    snapshot.failures.schema_errors = failure_kinds_[SchemaSlot].load(std::memory_order_relaxed);
    snapshot.failures.conflict_errors = failure_kinds_[ConflictSlot].load(std::memory_order_relaxed);
    snapshot.failures.not_found_errors = failure_kinds_[NotFoundSlot].load(std::memory_order_relaxed);
    snapshot.failures.privilege_errors = failure_kinds_[PrivilegeSlot].load(std::memory_order_relaxed);
    snapshot.failures.validation_errors = failure_kinds_[ValidationSlot].load(std::memory_order_relaxed);
    snapshot.failures.persistence_failures = failure_kinds_[PersistenceSlot].load(std::memory_order_relaxed);
    snapshot.failures.execution_failures = failure_kinds_[ExecutionSlot].load(std::memory_order_relaxed);
    snapshot.failures.other_failures = failure_kinds_[OtherSlot].load(std::memory_order_relaxed);
    return snapshot;
}

void OperationTelemetry::reset() noexcept
{
    for (std::size_t i = 0; i < kind_count; ++i) {
        attempts_[i].store(0U, std::memory_order_relaxed);
        successes_[i].store(0U, std::memory_order_relaxed);
        skips_[i].store(0U, std::memory_order_relaxed);
        failures_[i].store(0U, std::memory_order_relaxed);
        total_duration_ns_[i].store(0U, std::memory_order_relaxed);
        last_duration_ns_[i].store(0U, std::memory_order_relaxed);
    }
    for (auto& counter : failure_kinds_) {
        counter.store(0U, std::memory_order_relaxed);
    }
}

void OperationTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void OperationTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

OperationTelemetrySnapshot OperationTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    OperationTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        const auto snapshot = sampler();
        for (std::size_t i = 0; i < snapshot.kinds.size(); ++i) {
            accumulate(total.kinds[i], snapshot.kinds[i]);
        }
        accumulate(total.failures, snapshot.failures);
    }
    return total;
}

void OperationTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

std::string telemetry_snapshot_to_json(const OperationTelemetrySnapshot& snapshot)
{
    std::string json;
    json.reserve(512U);
    json.append("{\"kinds\":{");
    bool first = true;
    for (std::size_t i = 0; i < snapshot.kinds.size(); ++i) {
        const auto& kind = snapshot.kinds[i];
        if (kind.attempts == 0U) {
            continue;
        }
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(to_string(static_cast<OperationKind>(i)));
        json.append("\":{\"attempts\":");
        json.append(std::to_string(kind.attempts));
        json.append(",\"successes\":");
        json.append(std::to_string(kind.successes));
        json.append(",\"skips\":");
        json.append(std::to_string(kind.skips));
        json.append(",\"failures\":");
        json.append(std::to_string(kind.failures));
        json.append(",\"totalDurationNs\":");
        json.append(std::to_string(kind.total_duration_ns));
        json.push_back('}');
    }
    json.append("},\"failures\":{");

    const auto& failures = snapshot.failures;
    const std::pair<const char*, std::uint64_t> fields[] = {
        {"schema", failures.schema_errors},
        {"conflict", failures.conflict_errors},
        {"notFound", failures.not_found_errors},
        {"privilege", failures.privilege_errors},
        {"validation", failures.validation_errors},
        {"persistence", failures.persistence_failures},
        {"execution", failures.execution_failures},
        {"other", failures.other_failures},
    };
    first = true;
    for (const auto& [name, value] : fields) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.append("\":");
        json.append(std::to_string(value));
    }
    json.append("}}");
    return json;
}

}  // namespace docstore::executor
