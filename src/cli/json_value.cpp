#include "cli/json_value.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <limits>

namespace nvrpc
{
namespace
{

using nlohmann::json;
using runtime::Array;
using runtime::Binary;
using runtime::ExtValue;
using runtime::Map;
using runtime::Result;
using runtime::Value;

json bytes_to_json(const Binary& bytes)
{
    json arr = json::array();
    for (auto byte : bytes) {
        arr.push_back(byte);
    }
    return arr;
}

Result<Binary> bytes_from_json(const json& value)
{
    if (!value.is_array()) {
        return runtime::encoding_error<Binary>("ext data must be an array of bytes");
    }
    Binary bytes;
    bytes.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_number_unsigned() || item.get<std::uint64_t>() > std::numeric_limits<std::uint8_t>::max()) {
            return runtime::encoding_error<Binary>(fmt::format("invalid ext data byte {}", item.dump()));
        }
        bytes.push_back(item.get<std::uint8_t>());
    }
    return bytes;
}

bool is_ext_object(const json& value)
{
    return value.is_object() && value.size() == 3 && value.contains("ext") && value.contains("code") &&
           value.contains("data");
}

}  // namespace

json to_json(const Value& value)
{
    struct Visitor {
        json operator()(std::monostate) const
        {
            return nullptr;
        }

        json operator()(bool v) const
        {
            return v;
        }

        json operator()(std::int64_t v) const
        {
            return v;
        }

        json operator()(std::uint64_t v) const
        {
            return v;
        }

        json operator()(double v) const
        {
            return v;
        }

        json operator()(const std::string& v) const
        {
            return v;
        }

        json operator()(const Binary& v) const
        {
            return bytes_to_json(v);
        }

        json operator()(const Array& v) const
        {
            json arr = json::array();
            for (const auto& item : v) {
                arr.push_back(to_json(item));
            }
            return arr;
        }

        json operator()(const Map& v) const
        {
            const bool string_keys = std::all_of(v.begin(), v.end(), [](const auto& entry) {
                return entry.first.template get_if<std::string>() != nullptr;
            });
            if (string_keys) {
                json obj = json::object();
                for (const auto& [key, item] : v) {
                    obj[*key.template get_if<std::string>()] = to_json(item);
                }
                return obj;
            }
            json pairs = json::array();
            for (const auto& [key, item] : v) {
                pairs.push_back(json::array({to_json(key), to_json(item)}));
            }
            return pairs;
        }

        json operator()(const ExtValue& v) const
        {
            json obj;
            obj["ext"] = v.kind;
            obj["code"] = static_cast<int>(v.code);
            obj["data"] = bytes_to_json(v.data);
            return obj;
        }
    };

    return std::visit(Visitor{}, value.storage());
}

Result<Value> from_json(const json& value)
{
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return Value{};
        case json::value_t::boolean:
            return Value{value.get<bool>()};
        case json::value_t::number_integer:
            return Value{value.get<std::int64_t>()};
        case json::value_t::number_unsigned:
            return Value{value.get<std::uint64_t>()};
        case json::value_t::number_float:
            return Value{value.get<double>()};
        case json::value_t::string:
            return Value{value.get<std::string>()};
        case json::value_t::binary:
            return Value{Binary(value.get_binary().begin(), value.get_binary().end())};
        case json::value_t::array: {
            Array arr;
            arr.reserve(value.size());
            for (const auto& item : value) {
                auto converted = from_json(item);
                if (!converted) {
                    return converted;
                }
                arr.push_back(std::move(*converted));
            }
            return Value{std::move(arr)};
        }
        case json::value_t::object: {
            if (is_ext_object(value)) {
                const auto& code = value.at("code");
                if (!code.is_number_integer() || code.get<std::int64_t>() < std::numeric_limits<std::int8_t>::min() ||
                    code.get<std::int64_t>() > std::numeric_limits<std::int8_t>::max()) {
                    return runtime::encoding_error<Value>(fmt::format("invalid ext code {}", code.dump()));
                }
                auto data = bytes_from_json(value.at("data"));
                if (!data) {
                    return std::unexpected(data.error());
                }
                ExtValue ext;
                ext.code = static_cast<std::int8_t>(code.get<std::int64_t>());
                ext.data = std::move(*data);
                if (value.at("ext").is_string()) {
                    ext.kind = value.at("ext").get<std::string>();
                }
                return Value{std::move(ext)};
            }
            Map map;
            map.reserve(value.size());
            for (const auto& [key, item] : value.items()) {
                auto converted = from_json(item);
                if (!converted) {
                    return converted;
                }
                map.emplace_back(Value{key}, std::move(*converted));
            }
            return Value{std::move(map)};
        }
    }
    return runtime::encoding_error<Value>("unsupported JSON value");
}

}  // namespace nvrpc
