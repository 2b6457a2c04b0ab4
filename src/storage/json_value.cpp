#include "docstore/storage/json_value.hpp"

#include <tao/pegtl.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

namespace docstore::storage {

namespace pegtl = tao::pegtl;

namespace {

using catalog::Value;
using catalog::ValueArray;
using catalog::ValueKind;
using catalog::ValueObject;

struct JsonBuildState final {
    std::vector<Value> containers{};
    std::vector<std::string> keys{};
    std::string buffer{};
    std::uint32_t pending_high_surrogate = 0U;
    std::optional<Value> result{};

    void push_value(Value value)
    {
        if (containers.empty()) {
            result = std::move(value);
            return;
        }
        auto& top = containers.back();
        if (top.is_array()) {
            top.as_array().push_back(std::move(value));
            return;
        }
        top.as_object().insert_or_assign(std::move(keys.back()), std::move(value));
        keys.pop_back();
    }
};

void append_utf8(std::string& out, std::uint32_t code_point)
{
    if (code_point < 0x80U) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
}

constexpr std::uint32_t kReplacementCharacter = 0xFFFDU;

void flush_pending_surrogate(JsonBuildState& state)
{
    if (state.pending_high_surrogate != 0U) {
        append_utf8(state.buffer, kReplacementCharacter);
        state.pending_high_surrogate = 0U;
    }
}

namespace json {

struct ws : pegtl::one<' ', '\t', '\r', '\n'> {
};

struct skip : pegtl::star<ws> {
};

struct null_literal : TAO_PEGTL_STRING("null") {
};

struct true_literal : TAO_PEGTL_STRING("true") {
};

struct false_literal : TAO_PEGTL_STRING("false") {
};

struct integer_part : pegtl::sor<pegtl::one<'0'>, pegtl::seq<pegtl::range<'1', '9'>, pegtl::star<pegtl::digit>>> {
};

struct fraction_part : pegtl::seq<pegtl::one<'.'>, pegtl::must<pegtl::plus<pegtl::digit>>> {
};

struct exponent_part
    : pegtl::seq<pegtl::one<'e', 'E'>, pegtl::opt<pegtl::one<'+', '-'>>, pegtl::must<pegtl::plus<pegtl::digit>>> {
};

struct number_literal
    : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, integer_part, pegtl::opt<fraction_part>, pegtl::opt<exponent_part>> {
};

struct unicode_escape : pegtl::seq<pegtl::one<'u'>, pegtl::rep<4, pegtl::xdigit>> {
};

struct escape_char : pegtl::one<'"', '\\', '/', 'b', 'f', 'n', 'r', 't'> {
};

struct escape_body : pegtl::sor<unicode_escape, escape_char> {
};

struct escape_sequence : pegtl::seq<pegtl::one<'\\'>, pegtl::must<escape_body>> {
};

struct plain_char : pegtl::seq<pegtl::not_at<pegtl::range<'\x00', '\x1f'>>, pegtl::not_one<'"', '\\'>> {
};

struct quote_open : pegtl::one<'"'> {
};

struct quote_close : pegtl::one<'"'> {
};

struct string_literal
    : pegtl::seq<quote_open, pegtl::star<pegtl::sor<escape_sequence, plain_char>>, pegtl::must<quote_close>> {
};

struct value_string : string_literal {
};

struct member_key : string_literal {
};

struct value;

struct value_separator : pegtl::seq<skip, pegtl::one<','>, skip> {
};

struct array_open : pegtl::one<'['> {
};

struct array_close : pegtl::one<']'> {
};

struct array_element : pegtl::seq<value> {
};

struct array_literal
    : pegtl::seq<array_open,
                 skip,
                 pegtl::opt<pegtl::list_must<array_element, value_separator>>,
                 skip,
                 pegtl::must<array_close>> {
};

struct object_open : pegtl::one<'{'> {
};

struct object_close : pegtl::one<'}'> {
};

struct name_separator : pegtl::one<':'> {
};

struct member_value : pegtl::seq<value> {
};

struct object_member : pegtl::seq<member_key, skip, pegtl::must<name_separator>, skip, pegtl::must<member_value>> {
};

struct object_literal
    : pegtl::seq<object_open,
                 skip,
                 pegtl::opt<pegtl::list_must<object_member, value_separator>>,
                 skip,
                 pegtl::must<object_close>> {
};

struct value
    : pegtl::sor<value_string, number_literal, object_literal, array_literal, true_literal, false_literal, null_literal> {
};

struct document_grammar : pegtl::seq<skip, pegtl::must<value>, skip, pegtl::must<pegtl::eof>> {
};

template <typename Rule>
struct error_text {
    static constexpr const char* message = "malformed JSON";
};

template <>
struct error_text<value> {
    static constexpr const char* message = "expected a JSON value";
};

template <>
struct error_text<member_value> {
    static constexpr const char* message = "expected a value after ':'";
};

template <>
struct error_text<array_element> {
    static constexpr const char* message = "expected an array element after ','";
};

template <>
struct error_text<object_member> {
    static constexpr const char* message = "expected a quoted member name after ','";
};

template <>
struct error_text<name_separator> {
    static constexpr const char* message = "expected ':' after member name";
};

template <>
struct error_text<array_close> {
    static constexpr const char* message = "expected ',' or ']'";
};

template <>
struct error_text<object_close> {
    static constexpr const char* message = "expected ',' or '}'";
};

template <>
struct error_text<quote_close> {
    static constexpr const char* message = "unterminated string";
};

template <>
struct error_text<escape_body> {
    static constexpr const char* message = "invalid escape sequence";
};

template <>
struct error_text<pegtl::plus<pegtl::digit>> {
    static constexpr const char* message = "expected digits in number";
};

template <>
struct error_text<pegtl::eof> {
    static constexpr const char* message = "unexpected content after JSON value";
};

template <typename Rule>
struct control : pegtl::normal<Rule> {
    template <typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...)
    {
        throw pegtl::parse_error(std::string{error_text<Rule>::message}, in);
    }
};

template <typename Rule>
struct action {
    template <typename Input>
    static void apply(const Input&, JsonBuildState&)
    {
    }
};

template <>
struct action<null_literal> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.push_value(Value{});
    }
};

template <>
struct action<true_literal> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.push_value(Value{true});
    }
};

template <>
struct action<false_literal> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.push_value(Value{false});
    }
};

template <>
struct action<number_literal> {
    template <typename Input>
    static void apply(const Input& in, JsonBuildState& state)
    {
        const auto text = in.string_view();
        double parsed = 0.0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(parsed)) {
            throw pegtl::parse_error("number out of range", in);
        }
        state.push_value(Value{parsed});
    }
};

template <>
struct action<quote_open> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.buffer.clear();
        state.pending_high_surrogate = 0U;
    }
};

template <>
struct action<plain_char> {
    template <typename Input>
    static void apply(const Input& in, JsonBuildState& state)
    {
        flush_pending_surrogate(state);
        state.buffer.append(in.string_view());
    }
};

template <>
struct action<escape_char> {
    template <typename Input>
    static void apply(const Input& in, JsonBuildState& state)
    {
        flush_pending_surrogate(state);
        switch (in.peek_char()) {
        case 'b':
            state.buffer.push_back('\b');
            break;
        case 'f':
            state.buffer.push_back('\f');
            break;
        case 'n':
            state.buffer.push_back('\n');
            break;
        case 'r':
            state.buffer.push_back('\r');
            break;
        case 't':
            state.buffer.push_back('\t');
            break;
        default:
            state.buffer.push_back(in.peek_char());
            break;
        }
    }
};

template <>
struct action<unicode_escape> {
    template <typename Input>
    static void apply(const Input& in, JsonBuildState& state)
    {
        const auto digits = in.string_view().substr(1U);
        std::uint32_t unit = 0U;
        if (std::from_chars(digits.data(), digits.data() + digits.size(), unit, 16).ec != std::errc{}) {
            throw pegtl::parse_error("invalid unicode escape", in);
        }

        if (unit >= 0xD800U && unit <= 0xDBFFU) {
            flush_pending_surrogate(state);
            state.pending_high_surrogate = unit;
            return;
        }
        if (unit >= 0xDC00U && unit <= 0xDFFFU) {
            if (state.pending_high_surrogate == 0U) {
                append_utf8(state.buffer, kReplacementCharacter);
                return;
            }
            const auto code_point = 0x10000U + ((state.pending_high_surrogate - 0xD800U) << 10U) + (unit - 0xDC00U);
            state.pending_high_surrogate = 0U;
            append_utf8(state.buffer, code_point);
            return;
        }
        flush_pending_surrogate(state);
        append_utf8(state.buffer, unit);
    }
};

template <>
struct action<quote_close> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        flush_pending_surrogate(state);
    }
};

template <>
struct action<value_string> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.push_value(Value{std::move(state.buffer)});
        state.buffer.clear();
    }
};

template <>
struct action<member_key> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.keys.push_back(std::move(state.buffer));
        state.buffer.clear();
    }
};

template <>
struct action<array_open> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.containers.emplace_back(ValueArray{});
    }
};

template <>
struct action<object_open> {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        state.containers.emplace_back(ValueObject{});
    }
};

struct close_container {
    template <typename Input>
    static void apply(const Input&, JsonBuildState& state)
    {
        auto finished = std::move(state.containers.back());
        state.containers.pop_back();
        state.push_value(std::move(finished));
    }
};

template <>
struct action<array_close> : close_container {
};

template <>
struct action<object_close> : close_container {
};

}  // namespace json

void append_indent(std::string& out, std::size_t indent, std::size_t depth)
{
    out.push_back('\n');
    out.append(indent * depth, ' ');
}

void write_value(std::string& out, const Value& value, std::size_t indent, std::size_t depth)
{
    switch (value.kind()) {
    case ValueKind::Null:
        out.append("null");
        return;
    case ValueKind::Boolean:
        out.append(value.as_bool() ? "true" : "false");
        return;
    case ValueKind::Number:
        out.append(catalog::format_number(value.as_number()));
        return;
    case ValueKind::String:
        append_json_string(out, value.as_string());
        return;
    case ValueKind::Array: {
        const auto& array = value.as_array();
        if (array.empty()) {
            out.append("[]");
            return;
        }
        out.push_back('[');
        bool first = true;
        for (const auto& element : array) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            if (indent > 0U) {
                append_indent(out, indent, depth + 1U);
            }
            write_value(out, element, indent, depth + 1U);
        }
        if (indent > 0U) {
            append_indent(out, indent, depth);
        }
        out.push_back(']');
        return;
    }
    case ValueKind::Object:
    default: {
        const auto& object = value.as_object();
        if (object.empty()) {
            out.append("{}");
            return;
        }
        out.push_back('{');
        bool first = true;
        for (const auto& [key, member] : object) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            if (indent > 0U) {
                append_indent(out, indent, depth + 1U);
            }
            append_json_string(out, key);
            out.append(indent > 0U ? ": " : ":");
            write_value(out, member, indent, depth + 1U);
        }
        if (indent > 0U) {
            append_indent(out, indent, depth);
        }
        out.push_back('}');
        return;
    }
    }
}

}  // namespace

JsonParseResult parse_json(std::string_view text)
{
    JsonParseResult result{};
    pegtl::memory_input in(text.data(), text.size(), "json");
    JsonBuildState state{};

    try {
        const auto parsed = pegtl::parse<json::document_grammar, json::action, json::control>(in, state);
        if (parsed && state.result) {
            result.value = std::move(state.result);
        } else {
            result.message = "input is not a JSON document";
            result.line = 1U;
            result.column = 1U;
        }
    } catch (const pegtl::parse_error& error) {
        result.message = std::string{error.message()};
        if (!error.positions().empty()) {
            const auto& position = error.positions().front();
            result.line = static_cast<std::size_t>(position.line);
            result.column = static_cast<std::size_t>(position.column);
        }
    }

    return result;
}

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (const char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20U) {
                constexpr char kHex[] = "0123456789abcdef";
                const auto code = static_cast<unsigned char>(ch);
                out.append("\\u00");
                out.push_back(kHex[(code >> 4U) & 0x0FU]);
                out.push_back(kHex[code & 0x0FU]);
            } else {
                out.push_back(ch);
            }
            break;
        }
    }
    out.push_back('"');
}

std::string write_json(const catalog::Value& value, std::size_t indent)
{
    std::string out;
    write_value(out, value, indent, 0U);
    return out;
}

}  // namespace docstore::storage
