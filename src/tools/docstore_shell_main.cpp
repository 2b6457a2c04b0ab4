#include "docstore/planner/plan_printer.hpp"
#include "docstore/shell/shell_engine.hpp"
#include "docstore/storage/document_store.hpp"
#include "docstore/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::string trim(std::string_view text)
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

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".docstore_shell_history";
    return path;
}

void render_result(const docstore::shell::CommandMetrics& metrics, bool json_output)
{
    if (json_output) {
        if (metrics.results.size() == 1U && metrics.command_category == "operation") {
            std::cout << docstore::planner::execution_result_to_json(metrics.results.front()) << '\n';
            return;
        }
    }

    const auto status = metrics.success ? "OK" : "ERROR";
    std::cout << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (metrics.rows_touched != 0U) {
        std::cout << " rows=" << metrics.rows_touched;
    }
    std::cout << " rev=" << metrics.revision << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.message;
        if (diagnostic.line != 0U) {
            std::cout << " (line " << diagnostic.line << ", column " << diagnostic.column << ')';
        }
        std::cout << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

// A command is complete once every brace and bracket opened outside a string
// literal has been closed.
bool command_complete(std::string_view text)
{
    std::int32_t depth = 0;
    bool in_string = false;
    bool escaped = false;
    bool saw_content = false;

    for (const char ch : text) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            saw_content = true;
        }
        if (ch == '"') {
            in_string = true;
        } else if (ch == '{' || ch == '[') {
            ++depth;
        } else if ((ch == '}' || ch == ']') && depth > 0) {
            --depth;
        }
    }

    return saw_content && depth == 0 && !in_string;
}

bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();
    std::string buffer;
    std::string line;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const auto trimmed = trim(line);
        if (buffer.empty() && (trimmed.empty() || trimmed.rfind("//", 0U) == 0U)) {
            continue;
        }
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            commands.push_back(trimmed);
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
        if (!command_complete(buffer)) {
            continue;
        }

        const auto statement = trim(buffer);
        if (!statement.empty()) {
            commands.push_back(statement);
        }
        buffer.clear();
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }
    if (input.fail() && !input.eof()) {
        error_message = "Failed to read script to completion";
        return false;
    }

    const auto trailing = trim(buffer);
    if (!trailing.empty()) {
        commands.push_back(trailing);
    }
    return true;
}

int run_repl(bool quiet, bool json_output, const docstore::shell::ShellEngine::Config& config)
{
    replxx::Replxx repl;
    docstore::shell::ShellEngine engine{config};

    const auto history = history_path();
    if (!history.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(history.parent_path(), ec);
        if (!repl.history_load(history.string())) {
            // A missing history file is normal on first start.
            std::ifstream probe{history};
            if (probe.is_open()) {
                std::cerr << "error: failed to load history from '" << history.string() << "'" << '\n';
            }
        }
    }

    if (!quiet) {
        std::cout << "docstore shell: enter JSON operations or plans, or type \\help.\n";
    }

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "docstore> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(std::string_view{line});
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            repl.history_add(trimmed);
            render_result(engine.execute(trimmed), json_output);
            continue;
        }

        if (buffer.empty() && trimmed.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
        if (!command_complete(buffer)) {
            continue;
        }

        const auto statement = trim(buffer);
        repl.history_add(statement);
        render_result(engine.execute(statement), json_output);
        if (!history.empty() && !repl.history_save(history.string())) {
            std::cerr << "error: failed to save history to '" << history.string() << "'" << '\n';
        }
        buffer.clear();
    }

    return 0;
}

int run_batch(const std::vector<std::string>& commands, bool json_output, const docstore::shell::ShellEngine::Config& config)
{
    docstore::shell::ShellEngine engine{config};
    int exit_code = 0;
    for (const auto& command : commands) {
        const auto result = engine.execute(command);
        render_result(result, json_output);
        if (!result.success) {
            exit_code = 1;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive shell for a docstore document."};

    bool quiet = false;
    bool dry_run = false;
    bool persist_per_batch = false;
    bool json_output = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string log_json_path;
    std::string data_file = "docstore.json";
    std::string role;

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_option("-c,--command", execute_commands, "Execute the provided JSON operation, plan or meta command and exit")
        ->type_name("JSON")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--data-file", data_file, "Path of the persisted document")
        ->type_name("PATH")
        ->capture_default_str();
    app.add_option("--role", role, "Acting role checked against table privileges");
    app.add_flag("--dry-run", dry_run, "Preview mutations without saving them");
    app.add_flag("--persist-per-batch", persist_per_batch, "Write the document once per plan instead of once per operation");
    app.add_flag("--json", json_output, "Print single operation results as JSON");
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    docstore::storage::DocumentStore::Config store_config{};
    store_config.path = std::filesystem::path{data_file};
    store_config.persistence = persist_per_batch ? docstore::storage::PersistencePolicy::PerBatch
                                                 : docstore::storage::PersistencePolicy::PerOperation;
    if (log_stream != nullptr) {
        store_config.executor.operation_logger = [log_stream, &log_mutex](const docstore::executor::OperationLogRecord& record) {
            const auto line = docstore::tools::format_operation_log_json(record);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    docstore::storage::DocumentStore store{std::move(store_config)};
    std::string load_message;
    if (const auto ec = store.load(&load_message)) {
        std::cerr << "error: failed to load '" << data_file << "': " << ec.message();
        if (!load_message.empty()) {
            std::cerr << " (" << load_message << ')';
        }
        std::cerr << '\n';
        return 1;
    }

    docstore::shell::ShellEngine::Config config{};
    config.store = &store;
    config.dry_run = dry_run;
    if (!role.empty()) {
        config.acting_role = role;
    }
    if (log_stream != nullptr) {
        config.command_logger = [log_stream, &log_mutex](const docstore::shell::CommandMetrics& metrics) {
            const auto line = docstore::tools::format_shell_command_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    std::vector<std::string> commands_to_run;
    commands_to_run.reserve(execute_commands.size());

    bool stdin_consumed = false;
    for (const auto& script_path : script_files) {
        std::istream* input = nullptr;
        std::ifstream script_stream;
        if (script_path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin script '-' specified more than once" << '\n';
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            script_stream.open(script_path);
            if (!script_stream.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                return 1;
            }
            input = &script_stream;
        }

        std::string error;
        if (!load_script_commands(*input, commands_to_run, error)) {
            std::cerr << "error: " << error << " ('" << (script_path == "-" ? std::string{"<stdin>"} : script_path)
                      << "')" << '\n';
            return 1;
        }
    }

    commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());

    if (!commands_to_run.empty()) {
        return run_batch(commands_to_run, json_output, config);
    }
    if (!script_files.empty()) {
        return 0;
    }
    return run_repl(quiet, json_output, config);
}
