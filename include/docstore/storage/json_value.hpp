#pragma once

#include "docstore/catalog/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace docstore::storage {

struct JsonParseResult final {
    std::optional<catalog::Value> value{};
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;

    [[nodiscard]] bool success() const noexcept { return value.has_value(); }
};

// Strict JSON (RFC 8259) into a catalog value. Failures carry a message and
// the 1-based line/column where parsing stopped.
[[nodiscard]] JsonParseResult parse_json(std::string_view text);

void append_json_string(std::string& out, std::string_view text);

// Compact output when `indent` is zero, otherwise one member per line.
[[nodiscard]] std::string write_json(const catalog::Value& value, std::size_t indent = 0U);

}  // namespace docstore::storage
