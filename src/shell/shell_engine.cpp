#include "docstore/shell/shell_engine.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/document_summary.hpp"
#include "docstore/catalog/timestamp.hpp"
#include "docstore/executor/operation_telemetry.hpp"
#include "docstore/planner/plan_parser.hpp"
#include "docstore/planner/plan_printer.hpp"
#include "docstore/planner/plan_runner.hpp"
#include "docstore/storage/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <utility>

using docstore::planner::PlanDiagnostic;
using docstore::planner::PlanSeverity;

namespace docstore::shell {

namespace {

[[nodiscard]] double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration_ns.count()) / 1'000'000.0;
}

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

[[nodiscard]] std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0U;
    while (start <= text.size()) {
        const auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            if (start < text.size()) {
                lines.emplace_back(text.substr(start));
            }
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1U;
    }
    return lines;
}

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

[[nodiscard]] PlanDiagnostic make_error_diagnostic(std::string message, std::vector<std::string> hints)
{
    PlanDiagnostic diagnostic{};
    diagnostic.severity = PlanSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.remediation_hints = std::move(hints);
    return diagnostic;
}

[[nodiscard]] PlanDiagnostic diagnostic_from_result(const executor::ExecutionResult& result)
{
    PlanDiagnostic diagnostic{};
    switch (result.severity) {
    case executor::DiagnosticSeverity::Info:
        diagnostic.severity = PlanSeverity::Info;
        break;
    case executor::DiagnosticSeverity::Warning:
        diagnostic.severity = PlanSeverity::Warning;
        break;
    case executor::DiagnosticSeverity::Error:
    default:
        diagnostic.severity = PlanSeverity::Error;
        break;
    }
    diagnostic.message = std::string{catalog::error_kind_name(result.error)} + ": " + result.detail;
    diagnostic.remediation_hints = result.remediation_hints;
    return diagnostic;
}

[[nodiscard]] std::uint64_t rows_touched_by(const executor::ExecutionResult& result)
{
    return result.result_set ? result.result_set->row_count : result.rows_affected;
}

void append_result_lines(const executor::ExecutionResult& result, std::vector<std::string>& lines)
{
    lines.push_back("[" + result.id + "] " + executor::to_string(result.kind) + " " +
                    executor::to_string(result.status) + ": " + result.detail);
    if (result.result_set) {
        for (auto& line : split_lines(planner::format_result_set_table(*result.result_set))) {
            lines.push_back("  " + line);
        }
    }
}

[[nodiscard]] std::string yes_no(bool value)
{
    return value ? "yes" : "no";
}

}  // namespace

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{
}

CommandMetrics ShellEngine::execute(const std::string& command)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto trimmed = trim(command);
    const auto kind = classify(trimmed);

    auto metrics = dispatch(trimmed, kind);
    metrics.command_text = trimmed;
    metrics.command_category = std::string{command_kind_to_string(kind)};
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();
    if (config_.store != nullptr) {
        metrics.revision = config_.store->revision();
    }

    if (config_.command_logger && kind != CommandKind::Empty) {
        config_.command_logger(metrics);
    }
    return metrics;
}

CommandMetrics ShellEngine::dispatch(const std::string& command, CommandKind kind)
{
    switch (kind) {
    case CommandKind::Empty: {
        CommandMetrics metrics{};
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    }
    case CommandKind::Operation:
        return execute_operation(command);
    case CommandKind::Plan:
        return execute_plan(command);
    case CommandKind::Meta:
        return execute_meta(command);
    case CommandKind::Unknown:
    default:
        return unsupported_command(command);
    }
}

std::string ShellEngine::trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    if (text.empty()) {
        return CommandKind::Empty;
    }
    if (text.front() == '\\') {
        return CommandKind::Meta;
    }
    if (text.front() != '{' && text.rfind("```", 0U) != 0U) {
        return CommandKind::Unknown;
    }

    const auto parsed = storage::parse_json(planner::sanitize_planner_output(text));
    if (!parsed.success() || !parsed.value->is_object()) {
        // Malformed JSON is reported by the operation path with its position.
        return CommandKind::Operation;
    }
    if (parsed.value->find("operations") != nullptr) {
        return CommandKind::Plan;
    }
    return CommandKind::Operation;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Empty:
        return "empty";
    case CommandKind::Operation:
        return "operation";
    case CommandKind::Plan:
        return "plan";
    case CommandKind::Meta:
        return "meta";
    case CommandKind::Unknown:
    default:
        return "unknown";
    }
}

CommandMetrics ShellEngine::execute_operation(const std::string& text)
{
    if (config_.store == nullptr) {
        return missing_store(text);
    }

    const auto start = std::chrono::steady_clock::now();
    CommandMetrics metrics{};

    const auto parsed = storage::parse_json(planner::sanitize_planner_output(text));
    if (!parsed.success()) {
        metrics.success = false;
        metrics.summary = "Invalid JSON.";
        auto diagnostic = make_error_diagnostic(parsed.message, {"Check brackets, quotes and commas."});
        diagnostic.line = parsed.line;
        diagnostic.column = parsed.column;
        metrics.diagnostics.push_back(std::move(diagnostic));
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    }

    auto decoded = planner::decode_operation(*parsed.value);
    if (!decoded.success()) {
        metrics.success = false;
        metrics.summary = decoded.kind ? std::string{"Invalid "} + executor::to_string(*decoded.kind) + " operation."
                                       : std::string{"Invalid operation."};
        metrics.diagnostics.push_back(
            make_error_diagnostic(decoded.error, {"Operations need a \"type\" tag such as \"dql.select\" and its fields."}));
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    }

    executor::ExecutionOptions options{};
    options.acting_role = config_.acting_role;

    executor::ExecutionResult result{};
    if (config_.dry_run && executor::is_mutating(decoded.kind.value_or(executor::OperationKind::Select))) {
        storage::BatchOptions batch{};
        batch.execution = options;
        batch.dry_run = true;
        const std::vector<executor::Operation> single{std::move(*decoded.operation)};
        auto outcome = config_.store->execute_batch(single, batch);
        result = std::move(outcome.results.front());
        if (result.succeeded()) {
            result.detail += planner::kPendingConfirmationSuffix;
        }
    } else {
        result = config_.store->execute(*decoded.operation, options);
    }

    metrics.success = !result.failed();
    metrics.summary = result.detail;
    metrics.rows_touched = rows_touched_by(result);
    if (result.result_set) {
        metrics.detail_lines = split_lines(planner::format_result_set_table(*result.result_set));
    }
    if (result.failed()) {
        metrics.diagnostics.push_back(diagnostic_from_result(result));
    }
    metrics.results.push_back(std::move(result));
    metrics.duration_ms = elapsed_ms(start);
    return metrics;
}

CommandMetrics ShellEngine::execute_plan(const std::string& text)
{
    if (config_.store == nullptr) {
        return missing_store(text);
    }

    const auto start = std::chrono::steady_clock::now();
    CommandMetrics metrics{};

    auto parsed = planner::parse_plan(text);
    if (!parsed.success()) {
        metrics.success = false;
        metrics.summary = "Plan rejected.";
        metrics.diagnostics = std::move(parsed.diagnostics);
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    }

    planner::PlanRunner::Config runner_config{};
    runner_config.default_acting_role = config_.acting_role;
    runner_config.dry_run = config_.dry_run;
    planner::PlanRunner runner{*config_.store, std::move(runner_config)};

    planner::PlanRequest request{};
    request.plan = std::move(*parsed.plan);
    auto response = runner.run(request);

    std::ostringstream summary;
    summary << "Executed " << response.results.size() << " operation" << (response.results.size() == 1U ? "" : "s")
            << " (" << response.failure_count() << " failed); revision " << response.revision_before << " -> "
            << response.revision_after;
    if (response.dry_run) {
        summary << " (preview)";
    }
    metrics.summary = summary.str();
    metrics.success = response.ok() && response.failure_count() == 0U;

    for (const auto& result : response.results) {
        append_result_lines(result, metrics.detail_lines);
        metrics.rows_touched += rows_touched_by(result);
        if (result.failed()) {
            metrics.diagnostics.push_back(diagnostic_from_result(result));
        }
    }
    for (const auto& warning : response.warnings) {
        metrics.detail_lines.push_back("warning: " + warning);
    }
    if (response.thought) {
        metrics.detail_lines.push_back("thought: " + *response.thought);
    }
    for (auto& line : split_lines(response.content)) {
        metrics.detail_lines.push_back(std::move(line));
    }
    if (!response.ok()) {
        metrics.diagnostics.push_back(make_error_diagnostic(
            std::string{catalog::error_kind_name(response.error)} + ": " + response.content,
            {"Reload the summary and regenerate the plan against the current revision."}));
    }

    metrics.results = std::move(response.results);
    metrics.duration_ms = elapsed_ms(start);
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    const auto start = std::chrono::steady_clock::now();

    const auto tokens = split_tokens(command);
    if (tokens.empty()) {
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    }

    auto finalize = [&](std::string summary) {
        metrics.success = true;
        metrics.summary = std::move(summary);
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    };

    const auto& verb = tokens.front();
    if (verb == "\\help" || verb == "\\?") {
        metrics.detail_lines = {
            "{...}              Execute one JSON operation, e.g. {\"type\":\"dql.select\",\"table\":\"users\"}",
            "{\"operations\":[]} Execute a plan of operations in order",
            "\\summary           Print the document summary as JSON",
            "\\digest [rows]     Print the planner context digest",
            "\\tables            List tables",
            "\\describe <table>  Show columns and permissions of a table",
            "\\revision          Show the document revision",
            "\\telemetry         Show per-operation counters",
            "\\quit              Exit the shell",
        };
        return finalize("Available commands.");
    }

    if (config_.store == nullptr) {
        return missing_store(command);
    }
    auto& store = *config_.store;

    if (verb == "\\revision") {
        return finalize("Revision " + std::to_string(store.revision()) + ".");
    }

    if (verb == "\\summary") {
        metrics.detail_lines.push_back(catalog::summary_to_json(store.summary()));
        return finalize("Document summary.");
    }

    if (verb == "\\digest") {
        auto rows = config_.digest_rows;
        if (tokens.size() > 1U) {
            char* end = nullptr;
            const auto parsed = std::strtoull(tokens[1].c_str(), &end, 10);
            if (end == tokens[1].c_str() || *end != '\0') {
                metrics.success = false;
                metrics.summary = "Invalid row count.";
                metrics.diagnostics.push_back(
                    make_error_diagnostic("\\digest expects a non-negative row count.", {"Example: \\digest 5"}));
                metrics.duration_ms = elapsed_ms(start);
                return metrics;
            }
            rows = static_cast<std::size_t>(parsed);
        }
        metrics.detail_lines = split_lines(store.prompt_digest(rows));
        return finalize("Planner digest.");
    }

    if (verb == "\\tables") {
        const auto summary = store.summary();
        std::vector<std::vector<std::string>> rows;
        rows.reserve(summary.tables.size());
        for (const auto& table : summary.tables) {
            rows.push_back({table.name,
                            std::to_string(table.column_count),
                            std::to_string(table.row_count),
                            table.primary_key.value_or("-"),
                            catalog::format_timestamp_iso(table.updated_at)});
        }
        metrics.detail_lines = format_table({"name", "columns", "rows", "primary_key", "updated_at"}, rows);
        return finalize("Listed " + std::to_string(rows.size()) + " table" + (rows.size() == 1U ? "" : "s") + ".");
    }

    if (verb == "\\describe") {
        if (tokens.size() < 2U) {
            metrics.success = false;
            metrics.summary = "Table name required.";
            metrics.diagnostics.push_back(make_error_diagnostic("\\describe expects a table name.", {"Example: \\describe users"}));
            metrics.duration_ms = elapsed_ms(start);
            return metrics;
        }

        const auto summary = store.summary();
        const auto* table = summary.find_table(tokens[1]);
        if (table == nullptr) {
            metrics.success = false;
            metrics.summary = "Table \"" + tokens[1] + "\" does not exist.";
            metrics.diagnostics.push_back(make_error_diagnostic(metrics.summary, {"Use \\tables to list tables."}));
            metrics.duration_ms = elapsed_ms(start);
            return metrics;
        }

        std::vector<std::vector<std::string>> rows;
        rows.reserve(table->columns.size());
        for (const auto& column : table->columns) {
            rows.push_back({column.name,
                            column.data_type,
                            yes_no(column.nullable),
                            column.default_value ? storage::write_json(*column.default_value) : std::string{"-"},
                            yes_no(column.is_primary_key)});
        }
        metrics.detail_lines = format_table({"column", "type", "nullable", "default", "primary_key"}, rows);
        if (table->description) {
            metrics.detail_lines.insert(metrics.detail_lines.begin(), "description: " + *table->description);
        }
        for (const auto& permission : table->permissions) {
            std::string line = "grant: " + permission.role + " -> ";
            for (std::size_t i = 0U; i < permission.privileges.size(); ++i) {
                if (i > 0U) {
                    line.append(", ");
                }
                line.append(permission.privileges[i]);
            }
            metrics.detail_lines.push_back(std::move(line));
        }
        return finalize("Table \"" + table->name + "\" (" + std::to_string(table->row_count) + " row(s)).");
    }

    if (verb == "\\telemetry") {
        metrics.detail_lines.push_back(executor::telemetry_snapshot_to_json(store.executor().telemetry().snapshot()));
        return finalize("Operation telemetry.");
    }

    metrics.success = false;
    metrics.summary = "Unsupported meta command.";
    metrics.diagnostics.push_back(
        make_error_diagnostic("Shell command is not recognised.", {"Use \\help to list supported commands."}));
    metrics.duration_ms = elapsed_ms(start);
    return metrics;
}

CommandMetrics ShellEngine::unsupported_command(const std::string& text)
{
    CommandMetrics metrics{};
    metrics.success = false;

    const auto tokens = split_tokens(text);
    std::ostringstream summary;
    summary << "Unsupported command";
    if (!tokens.empty()) {
        summary << ": '" << tokens.front() << "'";
    }
    metrics.summary = summary.str();
    metrics.diagnostics.push_back(make_error_diagnostic(
        "Command type is not supported by the shell.",
        {"Enter a JSON operation or plan, or a backslash command such as \\help."}));
    return metrics;
}

CommandMetrics ShellEngine::missing_store(const std::string& text)
{
    CommandMetrics metrics{};
    metrics.success = false;
    metrics.summary = "No document store is configured.";
    metrics.diagnostics.push_back(make_error_diagnostic("Cannot run '" + text + "' without a document store.",
                                                        {"Construct the shell engine with a DocumentStore."}));
    return metrics;
}

}  // namespace docstore::shell
