#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docstore::catalog {

struct Value;

using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value, std::less<>>;

enum class ValueKind : std::uint8_t {
    Null = 0,
    Boolean,
    Number,
    String,
    Array,
    Object
};

// JSON-shaped cell value. Rows, defaults and criteria operands all use it.
struct Value final {
    using Storage = std::variant<std::monostate, bool, double, std::string, ValueArray, ValueObject>;

    Value() = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool value) : data{value} {}
    Value(int value) : data{static_cast<double>(value)} {}
    Value(std::int64_t value) : data{static_cast<double>(value)} {}
    Value(std::uint64_t value) : data{static_cast<double>(value)} {}
    Value(double value) : data{value} {}
    Value(const char* value) : data{std::string{value}} {}
    Value(std::string value) : data{std::move(value)} {}
    Value(std::string_view value) : data{std::string{value}} {}
    Value(ValueArray value) : data{std::move(value)} {}
    Value(ValueObject value) : data{std::move(value)} {}

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<ValueArray>(data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<ValueObject>(data); }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data); }
    [[nodiscard]] double as_number() const { return std::get<double>(data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data); }
    [[nodiscard]] const ValueArray& as_array() const { return std::get<ValueArray>(data); }
    [[nodiscard]] ValueArray& as_array() { return std::get<ValueArray>(data); }
    [[nodiscard]] const ValueObject& as_object() const { return std::get<ValueObject>(data); }
    [[nodiscard]] ValueObject& as_object() { return std::get<ValueObject>(data); }

    [[nodiscard]] const Value* find(std::string_view key) const;

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.data == rhs.data; }

    Storage data{};
};

using Row = ValueObject;

const char* to_string(ValueKind kind) noexcept;

// String form used by `contains`, ordering fallbacks and text coercion.
// Integral numbers print without a fraction; arrays and objects print as JSON.
std::string to_display_string(const Value& value);

// Numeric coercion for ordered comparisons: numbers, booleans (1/0) and
// strings that parse completely as finite numbers.
std::optional<double> to_number(const Value& value) noexcept;

std::optional<double> parse_number(std::string_view text) noexcept;

std::string format_number(double value);

// Value-level equality with number/string/boolean coercion. A missing
// operand (nullptr) compares equal to null.
bool loose_equals(const Value* lhs, const Value* rhs);
bool loose_equals(const Value& lhs, const Value& rhs);

}  // namespace docstore::catalog
