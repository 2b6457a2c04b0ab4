#include "docstore/planner/plan_printer.hpp"

#include "docstore/catalog/catalog_errors.hpp"
#include "docstore/catalog/document_summary.hpp"
#include "docstore/storage/json_value.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace docstore::planner {

namespace {

using storage::append_json_string;

class ObjectBuilder final {
public:
    explicit ObjectBuilder(std::string& out) : out_{out} { out_.push_back('{'); }

    ObjectBuilder& key(std::string_view name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        append_json_string(out_, name);
        out_.push_back(':');
        return *this;
    }

    void text(std::string_view name, std::string_view value)
    {
        key(name);
        append_json_string(out_, value);
    }

    void number(std::string_view name, std::uint64_t value)
    {
        key(name);
        out_.append(std::to_string(value));
    }

    void flag(std::string_view name, bool value)
    {
        key(name);
        out_.append(value ? "true" : "false");
    }

    void raw(std::string_view name, std::string_view json)
    {
        key(name);
        out_.append(json);
    }

    void strings(std::string_view name, const std::vector<std::string>& values)
    {
        key(name);
        out_.push_back('[');
        for (std::size_t i = 0U; i < values.size(); ++i) {
            if (i > 0U) {
                out_.push_back(',');
            }
            append_json_string(out_, values[i]);
        }
        out_.push_back(']');
    }

    void close() { out_.push_back('}'); }

private:
    std::string& out_;
    bool first_ = true;
};

std::string render_cell(const catalog::Value& value)
{
    if (value.is_null()) {
        return "null";
    }
    return catalog::to_display_string(value);
}

}  // namespace

std::string result_set_to_json(const executor::QueryResultSet& result_set)
{
    std::string json;
    ObjectBuilder object{json};
    if (!result_set.title.empty()) {
        object.text("title", result_set.title);
    }
    object.strings("columns", result_set.columns);

    object.key("rows");
    json.push_back('[');
    for (std::size_t i = 0U; i < result_set.rows.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        // Emit cells in projection order rather than map order.
        ObjectBuilder row{json};
        for (const auto& column : result_set.columns) {
            const auto it = result_set.rows[i].find(column);
            row.raw(column, storage::write_json(it == result_set.rows[i].end() ? catalog::Value{} : it->second));
        }
        row.close();
    }
    json.push_back(']');

    object.number("rowCount", result_set.row_count);
    object.number("matchedCount", result_set.matched_count);
    if (result_set.limit) {
        object.number("limit", *result_set.limit);
    }
    object.close();
    return json;
}

std::string execution_result_to_json(const executor::ExecutionResult& result, PrintOptions options)
{
    std::string json;
    ObjectBuilder object{json};
    object.text("id", result.id);
    object.text("type", executor::to_string(result.kind));
    object.text("category", executor::to_string(result.category()));
    object.text("status", executor::to_string(result.status));
    object.text("detail", result.detail);
    if (result.failed()) {
        object.text("error", catalog::error_kind_name(result.error));
        object.text("severity", executor::to_string(result.severity));
        if (!result.remediation_hints.empty()) {
            object.strings("remediationHints", result.remediation_hints);
        }
    }
    if (executor::is_mutating(result.kind) && result.succeeded()) {
        object.number("rowsAffected", result.rows_affected);
    }
    if (result.result_set) {
        object.raw("resultSet", result_set_to_json(*result.result_set));
    }
    if (options.include_durations) {
        const auto duration_ns = result.duration.count();
        object.number("durationNs", static_cast<std::uint64_t>(duration_ns < 0 ? 0 : duration_ns));
    }
    object.close();
    return json;
}

std::string plan_response_to_json(const PlanResponse& response, PrintOptions options)
{
    std::string json;
    ObjectBuilder object{json};
    object.text("content", response.content);
    if (response.thought) {
        object.text("thought", *response.thought);
    }

    object.key("operations");
    json.push_back('[');
    for (std::size_t i = 0U; i < response.results.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        json.append(execution_result_to_json(response.results[i], options));
    }
    json.push_back(']');

    object.strings("warnings", response.warnings);
    if (response.error) {
        object.text("error", catalog::error_kind_name(response.error));
    }
    object.number("revisionBefore", response.revision_before);
    object.number("revisionAfter", response.revision_after);
    if (response.dry_run) {
        object.flag("requiresConfirmation", true);
    }
    if (options.include_summary) {
        object.raw("snapshot", catalog::summary_to_json(response.summary));
    }
    object.close();
    return json;
}

std::string plan_diagnostics_to_json(const std::vector<PlanDiagnostic>& diagnostics)
{
    std::string json;
    json.push_back('[');
    for (std::size_t i = 0U; i < diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = diagnostics[i];
        ObjectBuilder object{json};
        object.text("severity", to_string(diagnostic.severity));
        object.text("message", diagnostic.message);
        if (diagnostic.line != 0U) {
            object.number("line", diagnostic.line);
            object.number("column", diagnostic.column);
        }
        if (!diagnostic.remediation_hints.empty()) {
            object.strings("remediationHints", diagnostic.remediation_hints);
        }
        object.close();
    }
    json.push_back(']');
    return json;
}

std::string format_result_set_table(const executor::QueryResultSet& result_set)
{
    std::vector<std::size_t> widths;
    widths.reserve(result_set.columns.size());
    for (const auto& column : result_set.columns) {
        widths.push_back(column.size());
    }

    std::vector<std::vector<std::string>> cells;
    cells.reserve(result_set.rows.size());
    for (const auto& row : result_set.rows) {
        auto& line = cells.emplace_back();
        for (std::size_t i = 0U; i < result_set.columns.size(); ++i) {
            const auto it = row.find(result_set.columns[i]);
            line.push_back(it == row.end() ? std::string{"null"} : render_cell(it->second));
            widths[i] = std::max(widths[i], line.back().size());
        }
    }

    std::ostringstream stream;
    const auto emit = [&](const std::vector<std::string>& values) {
        for (std::size_t i = 0U; i < values.size(); ++i) {
            if (i > 0U) {
                stream << " | ";
            }
            stream << values[i];
            if (i + 1U < values.size()) {
                stream << std::string(widths[i] - values[i].size(), ' ');
            }
        }
        stream << '\n';
    };

    emit(result_set.columns);
    std::vector<std::string> separators;
    separators.reserve(widths.size());
    for (const auto width : widths) {
        separators.emplace_back(width, '-');
    }
    emit(separators);
    for (const auto& line : cells) {
        emit(line);
    }
    stream << '(' << result_set.row_count << (result_set.row_count == 1U ? " row)" : " rows)");
    return stream.str();
}

}  // namespace docstore::planner
