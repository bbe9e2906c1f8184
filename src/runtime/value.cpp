#include "nvrpc/runtime/value.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <string>

namespace nvrpc::runtime
{
namespace
{

void append_escaped(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            default:
                out.push_back(c);
        }
    }
    out.push_back('"');
}

void append_hex(std::string& out, const Binary& bytes)
{
    for (std::uint8_t byte : bytes) {
        out += fmt::format("{:02x}", byte);
    }
}

void render(std::string& out, const Value& value)
{
    switch (value.kind()) {
        case ValueKind::Nil:
            out += "nil";
            break;
        case ValueKind::Boolean:
            out += *value.as_bool() ? "true" : "false";
            break;
        case ValueKind::Integer:
            out += fmt::format("{}", *value.get_if<std::int64_t>());
            break;
        case ValueKind::Unsigned:
            out += fmt::format("{}", *value.get_if<std::uint64_t>());
            break;
        case ValueKind::Float:
            out += fmt::format("{}", *value.get_if<double>());
            break;
        case ValueKind::String:
            append_escaped(out, *value.get_if<std::string>());
            break;
        case ValueKind::Binary:
            out += "b'";
            append_hex(out, *value.get_if<Binary>());
            out += "'";
            break;
        case ValueKind::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : *value.as_array()) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                render(out, item);
            }
            out.push_back(']');
            break;
        }
        case ValueKind::Map: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : *value.as_map()) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                render(out, key);
                out += ": ";
                render(out, item);
            }
            out.push_back('}');
            break;
        }
        case ValueKind::Ext: {
            const auto& ext = *value.as_ext();
            out += fmt::format("{}(", ext.kind.empty() ? "ext" : ext.kind);
            out += fmt::format("{}, ", static_cast<int>(ext.code));
            append_hex(out, ext.data);
            out.push_back(')');
            break;
        }
    }
}

}  // namespace

std::string_view to_string(ValueKind kind)
{
    switch (kind) {
        case ValueKind::Nil:
            return "nil";
        case ValueKind::Boolean:
            return "boolean";
        case ValueKind::Integer:
            return "integer";
        case ValueKind::Unsigned:
            return "unsigned";
        case ValueKind::Float:
            return "float";
        case ValueKind::String:
            return "string";
        case ValueKind::Binary:
            return "binary";
        case ValueKind::Array:
            return "array";
        case ValueKind::Map:
            return "map";
        case ValueKind::Ext:
            return "ext";
    }
    return "unknown";
}

ValueKind Value::kind() const
{
    return static_cast<ValueKind>(storage_.index());
}

std::optional<bool> Value::as_bool() const
{
    if (const auto* value = get_if<bool>()) {
        return *value;
    }
    return std::nullopt;
}

std::optional<std::int64_t> Value::as_int64() const
{
    if (const auto* value = get_if<std::int64_t>()) {
        return *value;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> Value::as_uint64() const
{
    if (const auto* value = get_if<std::uint64_t>()) {
        return *value;
    }
    if (const auto* value = get_if<std::int64_t>(); value && *value >= 0) {
        return static_cast<std::uint64_t>(*value);
    }
    return std::nullopt;
}

std::optional<std::string_view> Value::as_string() const
{
    if (const auto* value = get_if<std::string>()) {
        return std::string_view(*value);
    }
    return std::nullopt;
}

const Value* Value::find(std::string_view key) const
{
    const auto* map = as_map();
    if (!map) {
        return nullptr;
    }
    for (const auto& [k, v] : *map) {
        if (auto name = k.as_string(); name && *name == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string to_string(const Value& value)
{
    std::string out;
    render(out, value);
    return out;
}

}  // namespace nvrpc::runtime
