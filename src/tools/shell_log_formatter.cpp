#include "docstore/tools/shell_log_formatter.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/storage/json_value.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

using docstore::storage::append_json_string;

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

// Appends `"name":` with a leading comma after the first field.
class FieldAppender final {
public:
    explicit FieldAppender(std::string& json) : json_{json} {}

    void field(const char* name)
    {
        if (!first_) {
            json_.push_back(',');
        }
        first_ = false;
        json_.push_back('"');
        json_.append(name);
        json_.push_back('"');
        json_.push_back(':');
    }

    void string_field(const char* name, std::string_view value)
    {
        field(name);
        append_json_string(json_, value);
    }

    template <typename Number>
    void number_field(const char* name, Number value)
    {
        field(name);
        json_.append(std::to_string(value));
    }

    void bool_field(const char* name, bool value)
    {
        field(name);
        json_.append(value ? "true" : "false");
    }

    void timestamp_field(const char* name, std::chrono::system_clock::time_point tp)
    {
        const auto text = format_timestamp_iso(tp);
        field(name);
        if (text.empty()) {
            json_.append("null");
        } else {
            append_json_string(json_, text);
        }
    }

    void string_array_field(const char* name, const std::vector<std::string>& values)
    {
        field(name);
        json_.push_back('[');
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0U) {
                json_.push_back(',');
            }
            append_json_string(json_, values[i]);
        }
        json_.push_back(']');
    }

private:
    std::string& json_;
    bool first_ = true;
};

}  // namespace

namespace docstore::tools {

std::string format_shell_command_log_json(const docstore::shell::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(512U);
    json.push_back('{');

    FieldAppender out{json};
    out.string_field("correlation_id", metrics.correlation_id);
    out.string_field("category", metrics.command_category);
    out.string_field("command", metrics.command_text);
    out.string_field("summary", metrics.summary);
    out.bool_field("success", metrics.success);
    out.number_field("duration_ms", metrics.duration_ms);
    out.number_field("rows_touched", metrics.rows_touched);
    out.number_field("revision", metrics.revision);
    out.timestamp_field("started_at", metrics.started_at);
    out.timestamp_field("finished_at", metrics.finished_at);

    out.field("operations");
    json.push_back('[');
    for (std::size_t i = 0; i < metrics.results.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& result = metrics.results[i];
        json.push_back('{');
        FieldAppender entry{json};
        entry.string_field("id", result.id);
        entry.string_field("type", docstore::executor::to_string(result.kind));
        entry.string_field("status", docstore::executor::to_string(result.status));
        if (result.failed()) {
            entry.string_field("error", docstore::catalog::error_kind_name(result.error));
        }
        json.push_back('}');
    }
    json.push_back(']');

    out.field("diagnostics");
    json.push_back('[');
    for (std::size_t i = 0; i < metrics.diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = metrics.diagnostics[i];
        json.push_back('{');
        FieldAppender entry{json};
        entry.string_field("severity", docstore::planner::to_string(diagnostic.severity));
        entry.string_field("message", diagnostic.message);
        entry.number_field("line", diagnostic.line);
        entry.number_field("column", diagnostic.column);
        entry.string_array_field("remediation_hints", diagnostic.remediation_hints);
        json.push_back('}');
    }
    json.push_back(']');

    json.push_back('}');
    return json;
}

std::string format_operation_log_json(const docstore::executor::OperationLogRecord& record)
{
    std::string json;
    json.reserve(256U);
    json.push_back('{');

    FieldAppender out{json};
    out.string_field("execution_id", record.execution_id);
    out.string_field("query", record.query);
    out.string_field("type", docstore::executor::to_string(record.kind));
    out.string_field("category", docstore::executor::to_string(docstore::executor::category_of(record.kind)));
    out.string_field("status", docstore::executor::to_string(record.status));
    const auto duration_ns = record.duration.count();
    out.number_field("duration_ns", duration_ns < 0 ? 0 : duration_ns);
    out.number_field("rows_affected", record.rows_affected);
    if (!record.error_message.empty()) {
        out.string_field("error", record.error_message);
    }
    out.string_array_field("tables", record.tables);
    if (record.acting_role) {
        out.string_field("role", *record.acting_role);
    }
    if (record.preview) {
        out.bool_field("preview", true);
    }

    json.push_back('}');
    return json;
}

}  // namespace docstore::tools
