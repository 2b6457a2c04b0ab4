#pragma once

#include "docstore/executor/operation.hpp"
#include "docstore/planner/plan.hpp"
#include "docstore/storage/document_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docstore::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::uint64_t revision = 0U;
    std::vector<planner::PlanDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::vector<executor::ExecutionResult> results{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

class ShellEngine final {
public:
    struct Config final {
        storage::DocumentStore* store = nullptr;
        std::optional<std::string> acting_role{};
        bool dry_run = false;
        std::size_t digest_rows = 2U;
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    explicit ShellEngine(Config config);

    // Accepts a JSON operation, a JSON plan ({"operations": [...]}) or a
    // backslash meta command.
    CommandMetrics execute(const std::string& command);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Operation,
        Plan,
        Meta,
        Unknown
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text);
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics dispatch(const std::string& command, CommandKind kind);
    CommandMetrics execute_operation(const std::string& text);
    CommandMetrics execute_plan(const std::string& text);
    CommandMetrics execute_meta(const std::string& command);
    CommandMetrics unsupported_command(const std::string& text);
    CommandMetrics missing_store(const std::string& text);

    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace docstore::shell
