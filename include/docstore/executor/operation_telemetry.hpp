#pragma once

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/executor/operation.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>

namespace docstore::executor {

struct OperationKindTelemetrySnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t skips = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

struct OperationFailureTelemetrySnapshot final {
    std::uint64_t schema_errors = 0U;
    std::uint64_t conflict_errors = 0U;
    std::uint64_t not_found_errors = 0U;
    std::uint64_t privilege_errors = 0U;
    std::uint64_t validation_errors = 0U;
    std::uint64_t persistence_failures = 0U;
    std::uint64_t execution_failures = 0U;
    std::uint64_t other_failures = 0U;
};

struct OperationTelemetrySnapshot final {
    std::array<OperationKindTelemetrySnapshot, static_cast<std::size_t>(OperationKind::Count)> kinds{};
    OperationFailureTelemetrySnapshot failures{};

    [[nodiscard]] std::uint64_t total_attempts() const noexcept;
    [[nodiscard]] std::uint64_t total_failures() const noexcept;
};

class OperationTelemetry final {
public:
    void record_attempt(OperationKind kind) noexcept;
    void record_success(OperationKind kind) noexcept;
    void record_skip(OperationKind kind) noexcept;
    void record_failure(OperationKind kind, std::error_code error) noexcept;
    void record_duration(OperationKind kind, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] OperationTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static constexpr std::size_t kind_count = static_cast<std::size_t>(OperationKind::Count);

    std::array<std::atomic<std::uint64_t>, kind_count> attempts_{};
    std::array<std::atomic<std::uint64_t>, kind_count> successes_{};
    std::array<std::atomic<std::uint64_t>, kind_count> skips_{};
    std::array<std::atomic<std::uint64_t>, kind_count> failures_{};
    std::array<std::atomic<std::uint64_t>, kind_count> total_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, kind_count> last_duration_ns_{};

    std::array<std::atomic<std::uint64_t>, 8U> failure_kinds_{};
};

class OperationTelemetryRegistry final {
public:
    using Sampler = std::function<OperationTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const OperationTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] OperationTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    using SamplerMap = std::unordered_map<std::string, Sampler>;

    mutable std::mutex mutex_{};
    SamplerMap samplers_{};
};

std::string telemetry_snapshot_to_json(const OperationTelemetrySnapshot& snapshot);

}  // namespace docstore::executor
