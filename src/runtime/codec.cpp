#include "nvrpc/runtime/codec.hpp"

#include <fmt/core.h>

#include <cstring>
#include <limits>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace nvrpc::runtime
{
namespace
{

using Packer = msgpack::packer<msgpack::sbuffer>;

constexpr std::size_t MaxLength = std::numeric_limits<std::uint32_t>::max();

Result<void> pack_value(Packer& pk, const Value& value, const ExtTypeRegistry& registry);

Result<void> pack_string(Packer& pk, std::string_view text)
{
    if (text.size() > MaxLength) {
        return encoding_error("string too long");
    }
    pk.pack_str(static_cast<std::uint32_t>(text.size()));
    pk.pack_str_body(text.data(), static_cast<std::uint32_t>(text.size()));
    return {};
}

Result<void> pack_array(Packer& pk, const Array& items, const ExtTypeRegistry& registry)
{
    if (items.size() > MaxLength) {
        return encoding_error("array too long");
    }
    pk.pack_array(static_cast<std::uint32_t>(items.size()));
    for (const auto& item : items) {
        if (auto res = pack_value(pk, item, registry); !res) {
            return res;
        }
    }
    return {};
}

Result<void> pack_value(Packer& pk, const Value& value, const ExtTypeRegistry& registry)
{
    switch (value.kind()) {
        case ValueKind::Nil:
            pk.pack_nil();
            return {};
        case ValueKind::Boolean:
            if (*value.as_bool()) {
                pk.pack_true();
            } else {
                pk.pack_false();
            }
            return {};
        case ValueKind::Integer:
            pk.pack_int64(*value.get_if<std::int64_t>());
            return {};
        case ValueKind::Unsigned:
            pk.pack_uint64(*value.get_if<std::uint64_t>());
            return {};
        case ValueKind::Float:
            pk.pack_double(*value.get_if<double>());
            return {};
        case ValueKind::String:
            return pack_string(pk, *value.get_if<std::string>());
        case ValueKind::Binary: {
            const auto& bytes = *value.get_if<Binary>();
            if (bytes.size() > MaxLength) {
                return encoding_error("binary too long");
            }
            pk.pack_bin(static_cast<std::uint32_t>(bytes.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bytes.data()), static_cast<std::uint32_t>(bytes.size()));
            return {};
        }
        case ValueKind::Array:
            return pack_array(pk, *value.as_array(), registry);
        case ValueKind::Map: {
            const auto& entries = *value.as_map();
            if (entries.size() > MaxLength) {
                return encoding_error("map too long");
            }
            pk.pack_map(static_cast<std::uint32_t>(entries.size()));
            for (const auto& [key, item] : entries) {
                if (auto res = pack_value(pk, key, registry); !res) {
                    return res;
                }
                if (auto res = pack_value(pk, item, registry); !res) {
                    return res;
                }
            }
            return {};
        }
        case ValueKind::Ext: {
            const auto& ext = *value.as_ext();
            if (!registry.contains(ext.code)) {
                return encoding_error(fmt::format("ext type {} is not registered", static_cast<int>(ext.code)));
            }
            if (ext.data.size() > MaxLength) {
                return encoding_error("ext payload too long");
            }
            pk.pack_ext(ext.data.size(), ext.code);
            pk.pack_ext_body(reinterpret_cast<const char*>(ext.data.data()), static_cast<std::uint32_t>(ext.data.size()));
            return {};
        }
    }
    return encoding_error("unknown value kind");
}

Result<Value> to_value(const msgpack::object& obj, const ExtTypeRegistry& registry)
{
    switch (obj.type) {
        case msgpack::type::NIL:
            return Value{};
        case msgpack::type::BOOLEAN:
            return Value{obj.via.boolean};
        case msgpack::type::POSITIVE_INTEGER:
            return Value{obj.via.u64};
        case msgpack::type::NEGATIVE_INTEGER:
            return Value{obj.via.i64};
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return Value{obj.via.f64};
        case msgpack::type::STR:
            return Value{std::string(obj.via.str.ptr, obj.via.str.size)};
        case msgpack::type::BIN: {
            const auto* begin = reinterpret_cast<const std::uint8_t*>(obj.via.bin.ptr);
            return Value{Binary(begin, begin + obj.via.bin.size)};
        }
        case msgpack::type::ARRAY: {
            Array items;
            items.reserve(obj.via.array.size);
            for (std::uint32_t i = 0; i < obj.via.array.size; ++i) {
                auto item = to_value(obj.via.array.ptr[i], registry);
                if (!item) {
                    return item;
                }
                items.push_back(std::move(*item));
            }
            return Value{std::move(items)};
        }
        case msgpack::type::MAP: {
            Map entries;
            entries.reserve(obj.via.map.size);
            for (std::uint32_t i = 0; i < obj.via.map.size; ++i) {
                auto key = to_value(obj.via.map.ptr[i].key, registry);
                if (!key) {
                    return key;
                }
                auto item = to_value(obj.via.map.ptr[i].val, registry);
                if (!item) {
                    return item;
                }
                entries.emplace_back(std::move(*key), std::move(*item));
            }
            return Value{std::move(entries)};
        }
        case msgpack::type::EXT: {
            const std::int8_t code = obj.via.ext.type();
            auto kind = registry.kind_of(code);
            if (!kind) {
                return protocol_error<Value>(fmt::format("unregistered ext type {}", static_cast<int>(code)));
            }
            const auto* begin = reinterpret_cast<const std::uint8_t*>(obj.via.ext.data());
            return Value{ExtValue{code, Binary(begin, begin + obj.via.ext.size), std::move(*kind)}};
        }
    }
    return protocol_error<Value>("unsupported msgpack type");
}

Result<std::string> to_method(const msgpack::object& obj)
{
    if (obj.type == msgpack::type::STR) {
        return std::string(obj.via.str.ptr, obj.via.str.size);
    }
    if (obj.type == msgpack::type::BIN) {
        return std::string(obj.via.bin.ptr, obj.via.bin.size);
    }
    return protocol_error<std::string>("method name is not a string");
}

Result<Array> to_params(const msgpack::object& obj, const ExtTypeRegistry& registry)
{
    if (obj.type != msgpack::type::ARRAY) {
        return protocol_error<Array>("params is not an array");
    }
    auto value = to_value(obj, registry);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::move(*value->get_if<Array>());
}

Result<std::uint64_t> to_msgid(const msgpack::object& obj)
{
    if (obj.type != msgpack::type::POSITIVE_INTEGER) {
        return protocol_error<std::uint64_t>("message id is not an unsigned integer");
    }
    return obj.via.u64;
}

Result<Frame> to_frame(const msgpack::object& obj, const ExtTypeRegistry& registry)
{
    if (obj.type != msgpack::type::ARRAY || obj.via.array.size < 3) {
        return protocol_error<Frame>("frame is not an array of at least 3 elements");
    }
    const auto* items = obj.via.array.ptr;
    const auto size = obj.via.array.size;
    if (items[0].type != msgpack::type::POSITIVE_INTEGER) {
        return protocol_error<Frame>("frame type is not an unsigned integer");
    }

    switch (items[0].via.u64) {
        case static_cast<std::uint64_t>(MessageType::Request): {
            if (size != 4) {
                return protocol_error<Frame>("request frame must have 4 elements");
            }
            auto id = to_msgid(items[1]);
            if (!id) {
                return std::unexpected(id.error());
            }
            auto method = to_method(items[2]);
            if (!method) {
                return std::unexpected(method.error());
            }
            auto params = to_params(items[3], registry);
            if (!params) {
                return std::unexpected(params.error());
            }
            return Request{*id, std::move(*method), std::move(*params)};
        }
        case static_cast<std::uint64_t>(MessageType::Response): {
            if (size != 4) {
                return protocol_error<Frame>("response frame must have 4 elements");
            }
            auto id = to_msgid(items[1]);
            if (!id) {
                return std::unexpected(id.error());
            }
            auto error = to_value(items[2], registry);
            if (!error) {
                return std::unexpected(error.error());
            }
            auto result = to_value(items[3], registry);
            if (!result) {
                return std::unexpected(result.error());
            }
            return Response{*id, std::move(*error), std::move(*result)};
        }
        case static_cast<std::uint64_t>(MessageType::Notification): {
            if (size != 3) {
                return protocol_error<Frame>("notification frame must have 3 elements");
            }
            auto method = to_method(items[1]);
            if (!method) {
                return std::unexpected(method.error());
            }
            auto params = to_params(items[2], registry);
            if (!params) {
                return std::unexpected(params.error());
            }
            return Notification{std::move(*method), std::move(*params)};
        }
        default:
            return protocol_error<Frame>(fmt::format("unknown frame type {}", items[0].via.u64));
    }
}

}  // namespace

Result<void> ExtTypeRegistry::register_type(std::string kind, std::int8_t code)
{
    std::unique_lock lock(mutex_);
    auto it = kinds_.find(code);
    if (it != kinds_.end()) {
        if (it->second == kind) {
            return {};
        }
        return protocol_error(
            fmt::format("ext type {} already registered as {}, cannot rebind to {}", static_cast<int>(code), it->second, kind));
    }
    for (const auto& [existing_code, existing_kind] : kinds_) {
        if (existing_kind == kind) {
            return protocol_error(fmt::format("ext kind {} already bound to code {}", kind, static_cast<int>(existing_code)));
        }
    }
    kinds_.emplace(code, std::move(kind));
    return {};
}

std::optional<std::string> ExtTypeRegistry::kind_of(std::int8_t code) const
{
    std::shared_lock lock(mutex_);
    auto it = kinds_.find(code);
    if (it == kinds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::int8_t> ExtTypeRegistry::code_of(std::string_view kind) const
{
    std::shared_lock lock(mutex_);
    for (const auto& [code, name] : kinds_) {
        if (name == kind) {
            return code;
        }
    }
    return std::nullopt;
}

bool ExtTypeRegistry::contains(std::int8_t code) const
{
    std::shared_lock lock(mutex_);
    return kinds_.contains(code);
}

std::size_t ExtTypeRegistry::size() const
{
    std::shared_lock lock(mutex_);
    return kinds_.size();
}

Result<ExtValue> ExtTypeRegistry::make(std::string_view kind, Binary data) const
{
    auto code = code_of(kind);
    if (!code) {
        return encoding_error<ExtValue>(fmt::format("ext kind {} is not registered", kind));
    }
    return ExtValue{*code, std::move(data), std::string(kind)};
}

Encoder::Encoder(std::shared_ptr<const ExtTypeRegistry> registry)
    : registry_(std::move(registry))
{
}

Result<std::vector<std::uint8_t>> Encoder::encode(const Frame& frame) const
{
    msgpack::sbuffer buffer;
    Packer pk(buffer);

    auto res = std::visit(
        [&](const auto& message) -> Result<void> {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, Request>) {
                pk.pack_array(4);
                pk.pack_uint64(static_cast<std::uint64_t>(MessageType::Request));
                pk.pack_uint64(message.id);
                if (auto r = pack_string(pk, message.method); !r) {
                    return r;
                }
                return pack_array(pk, message.params, *registry_);
            } else if constexpr (std::is_same_v<T, Response>) {
                pk.pack_array(4);
                pk.pack_uint64(static_cast<std::uint64_t>(MessageType::Response));
                pk.pack_uint64(message.id);
                if (auto r = pack_value(pk, message.error, *registry_); !r) {
                    return r;
                }
                return pack_value(pk, message.result, *registry_);
            } else {
                pk.pack_array(3);
                pk.pack_uint64(static_cast<std::uint64_t>(MessageType::Notification));
                if (auto r = pack_string(pk, message.method); !r) {
                    return r;
                }
                return pack_array(pk, message.params, *registry_);
            }
        },
        frame);
    if (!res) {
        return std::unexpected(res.error());
    }

    const auto* begin = reinterpret_cast<const std::uint8_t*>(buffer.data());
    return std::vector<std::uint8_t>(begin, begin + buffer.size());
}

Decoder::Decoder(std::shared_ptr<const ExtTypeRegistry> registry)
    : registry_(std::move(registry))
{
}

void Decoder::feed(std::span<const std::uint8_t> data)
{
    if (data.empty()) {
        return;
    }
    unpacker_.reserve_buffer(data.size());
    std::memcpy(unpacker_.buffer(), data.data(), data.size());
    unpacker_.buffer_consumed(data.size());
}

Result<std::optional<Frame>> Decoder::next()
{
    msgpack::object_handle handle;
    try {
        if (!unpacker_.next(handle)) {
            return std::optional<Frame>{};
        }
    } catch (const msgpack::unpack_error& ex) {
        return protocol_error<std::optional<Frame>>(fmt::format("malformed msgpack stream: {}", ex.what()));
    }

    auto frame = to_frame(handle.get(), *registry_);
    if (!frame) {
        return std::unexpected(frame.error());
    }
    return std::optional<Frame>{std::move(*frame)};
}

std::size_t Decoder::buffered() const
{
    return unpacker_.nonparsed_size();
}

}  // namespace nvrpc::runtime
