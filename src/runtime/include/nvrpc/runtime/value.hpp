#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nvrpc::runtime
{

class Value;

using Binary = std::vector<std::uint8_t>;
using Array = std::vector<Value>;
using Map = std::vector<std::pair<Value, Value>>;

/**
 * @brief Opaque remote object reference carried as a msgpack ext type.
 *
 * The payload is never interpreted here. `kind` is the type name the code was
 * registered under during the handshake (e.g. "Buffer") and takes no part in equality.
 */
struct ExtValue {
    std::int8_t code = 0;
    Binary data;
    std::string kind;

    bool operator==(const ExtValue& other) const
    {
        return code == other.code && data == other.data;
    }
};

enum class ValueKind { Nil, Boolean, Integer, Unsigned, Float, String, Binary, Array, Map, Ext };

std::string_view to_string(ValueKind kind);

class Value
{
public:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string,
                                 Binary,
                                 Array,
                                 Map,
                                 ExtValue>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value)
        : storage_(value)
    {
    }

    // Unsigned values that fit into int64 are stored signed so that a value decoded
    // from a positive fixint compares equal to the one that was encoded.
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value)
    {
        if constexpr (std::is_signed_v<T>) {
            storage_ = static_cast<std::int64_t>(value);
        } else if (static_cast<std::uint64_t>(value) <= static_cast<std::uint64_t>(INT64_MAX)) {
            storage_ = static_cast<std::int64_t>(value);
        } else {
            storage_ = static_cast<std::uint64_t>(value);
        }
    }

    Value(double value)
        : storage_(value)
    {
    }
    Value(const char* value)
        : storage_(std::string(value))
    {
    }
    Value(std::string_view value)
        : storage_(std::string(value))
    {
    }
    Value(std::string value)
        : storage_(std::move(value))
    {
    }
    Value(Binary value)
        : storage_(std::move(value))
    {
    }
    Value(Array value)
        : storage_(std::move(value))
    {
    }
    Value(Map value)
        : storage_(std::move(value))
    {
    }
    Value(ExtValue value)
        : storage_(std::move(value))
    {
    }

    ValueKind kind() const;

    bool is_nil() const { return std::holds_alternative<std::monostate>(storage_); }
    bool is_integer() const
    {
        return std::holds_alternative<std::int64_t>(storage_) || std::holds_alternative<std::uint64_t>(storage_);
    }

    template <typename T>
    const T* get_if() const
    {
        return std::get_if<T>(&storage_);
    }

    template <typename T>
    T* get_if()
    {
        return std::get_if<T>(&storage_);
    }

    std::optional<bool> as_bool() const;
    std::optional<std::int64_t> as_int64() const;
    std::optional<std::uint64_t> as_uint64() const;
    std::optional<std::string_view> as_string() const;

    const Array* as_array() const { return get_if<Array>(); }
    const Map* as_map() const { return get_if<Map>(); }
    const ExtValue* as_ext() const { return get_if<ExtValue>(); }

    /// Looks up a string key in a map value. Returns nullptr for non-maps and missing keys.
    const Value* find(std::string_view key) const;

    const Storage& storage() const { return storage_; }

    bool operator==(const Value& other) const = default;

private:
    Storage storage_;
};

/// Human-readable rendering, used in log lines and error descriptions.
std::string to_string(const Value& value);

}  // namespace nvrpc::runtime
