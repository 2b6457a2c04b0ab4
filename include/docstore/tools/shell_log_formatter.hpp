#pragma once

#include "docstore/executor/operation_executor.hpp"
#include "docstore/shell/shell_engine.hpp"

#include <string>

namespace docstore::tools {

// One JSON Lines record per shell command.
[[nodiscard]] std::string format_shell_command_log_json(const docstore::shell::CommandMetrics& metrics);

// One JSON Lines record per executed operation.
[[nodiscard]] std::string format_operation_log_json(const docstore::executor::OperationLogRecord& record);

}  // namespace docstore::tools
