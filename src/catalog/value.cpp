#include "docstore/catalog/value.hpp"

#include "docstore/storage/json_value.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace docstore::catalog {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

std::string_view trim_view(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1U);
}

bool is_scalar(const Value& value) noexcept
{
    return value.is_bool() || value.is_number() || value.is_string();
}

}  // namespace

const Value* Value::find(std::string_view key) const
{
    if (!is_object()) {
        return nullptr;
    }
    const auto& object = as_object();
    const auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &it->second;
}

const char* to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Number:
        return "number";
    case ValueKind::String:
        return "string";
    case ValueKind::Array:
        return "array";
    case ValueKind::Object:
    default:
        return "object";
    }
}

std::string format_number(double value)
{
    if (!std::isfinite(value)) {
        return "null";
    }
    if (std::trunc(value) == value && std::fabs(value) < kMaxExactInteger) {
        return std::to_string(static_cast<std::int64_t>(value));
    }

    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), end);
}

std::string to_display_string(const Value& value)
{
    switch (value.kind()) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return value.as_bool() ? "true" : "false";
    case ValueKind::Number:
        return format_number(value.as_number());
    case ValueKind::String:
        return value.as_string();
    case ValueKind::Array:
    case ValueKind::Object:
    default:
        return storage::write_json(value);
    }
}

std::optional<double> parse_number(std::string_view text) noexcept
{
    const auto trimmed = trim_view(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    auto begin = trimmed.data();
    const auto end = trimmed.data() + trimmed.size();
    if (*begin == '+') {
        ++begin;
    }

    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> to_number(const Value& value) noexcept
{
    switch (value.kind()) {
    case ValueKind::Number:
        if (!std::isfinite(value.as_number())) {
            return std::nullopt;
        }
        return value.as_number();
    case ValueKind::Boolean:
        return value.as_bool() ? 1.0 : 0.0;
    case ValueKind::String:
        return parse_number(value.as_string());
    default:
        return std::nullopt;
    }
}

bool loose_equals(const Value* lhs, const Value* rhs)
{
    const bool lhs_null = lhs == nullptr || lhs->is_null();
    const bool rhs_null = rhs == nullptr || rhs->is_null();
    if (lhs_null || rhs_null) {
        return lhs_null && rhs_null;
    }
    return loose_equals(*lhs, *rhs);
}

bool loose_equals(const Value& lhs, const Value& rhs)
{
    if (lhs.is_null() || rhs.is_null()) {
        return lhs.is_null() && rhs.is_null();
    }

    if (lhs.kind() == rhs.kind()) {
        if (lhs.is_array()) {
            const auto& left = lhs.as_array();
            const auto& right = rhs.as_array();
            if (left.size() != right.size()) {
                return false;
            }
            for (std::size_t index = 0U; index < left.size(); ++index) {
                if (!loose_equals(left[index], right[index])) {
                    return false;
                }
            }
            return true;
        }
        if (lhs.is_object()) {
            const auto& left = lhs.as_object();
            const auto& right = rhs.as_object();
            if (left.size() != right.size()) {
                return false;
            }
            for (const auto& [key, entry] : left) {
                const auto it = right.find(key);
                if (it == right.end() || !loose_equals(entry, it->second)) {
                    return false;
                }
            }
            return true;
        }
        return lhs.data == rhs.data;
    }

    if (!is_scalar(lhs) || !is_scalar(rhs)) {
        return false;
    }

    const auto left = to_number(lhs);
    const auto right = to_number(rhs);
    if (!left || !right) {
        return false;
    }
    return *left == *right;
}

}  // namespace docstore::catalog
