#include "cli/nvrpc.hpp"

#include "cli/json_value.hpp"
#include "cli/options.hpp"
#include "nvrpc/runtime/client.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace nvrpc
{
namespace
{

// stdout carries results only
void setup_logging(bool verbose)
{
    auto logger = spdlog::get("nvrpc");
    if (!logger) {
        logger = spdlog::stderr_color_mt("nvrpc");
    }
    spdlog::set_default_logger(std::move(logger));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

nlohmann::json api_info_to_json(const runtime::ApiInfo& info)
{
    nlohmann::json out;
    out["channel"] = info.channel_id;
    nlohmann::json types = nlohmann::json::object();
    for (const auto& [name, code] : info.ext_types) {
        types[name] = static_cast<int>(code);
    }
    out["types"] = std::move(types);
    out["error_types"] = info.error_types;
    if (info.version) {
        out["version"] = {
            {"major", info.version->major},
            {"minor", info.version->minor},
            {"patch", info.version->patch},
            {"api_level", info.version->api_level},
        };
    }
    return out;
}

runtime::Result<runtime::Array> parse_params(const std::string& text)
{
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return runtime::encoding_error<runtime::Array>(fmt::format("--params is not valid JSON: {}", text));
    }
    if (!parsed.is_array()) {
        return runtime::encoding_error<runtime::Array>("--params must be a JSON array");
    }
    auto value = from_json(parsed);
    if (!value) {
        return std::unexpected(value.error());
    }
    return *value->as_array();
}

int report(const runtime::Error& error)
{
    if (error.payload) {
        spdlog::error("{}", to_json(*error.payload).dump());
    } else {
        spdlog::error("{}", error.message);
    }
    return 1;
}

}  // namespace

int execute(const Options& opts)
{
    auto socket = resolve_socket(opts);
    if (!socket) {
        spdlog::error("no socket given and neither $NVIM nor $NVIM_LISTEN_ADDRESS is set");
        return 1;
    }

    auto params = parse_params(opts.params);
    if (!params) {
        return report(params.error());
    }

    runtime::ClientConfig config;
    config.info.name = opts.client_name;
    config.worker_threads = 1;
    if (opts.timeout_ms) {
        config.handshake_timeout = std::chrono::milliseconds(*opts.timeout_ms);
    }

    runtime::Client client{std::move(config)};
    if (auto res = client.connect(*socket); !res) {
        return report(res.error());
    }

    int status = 0;
    if (opts.api_info) {
        fmt::print("{}\n", api_info_to_json(client.api_info()).dump(2));
    }

    if (opts.has_feature) {
        auto present = client.capabilities().has(*opts.has_feature);
        if (!present) {
            status = report(present.error());
        } else {
            fmt::print("{}\n", *present ? "true" : "false");
        }
    }

    if (opts.request) {
        auto result = opts.timeout_ms
                          ? client.request(*opts.request, *params, std::chrono::milliseconds(*opts.timeout_ms))
                          : client.request(*opts.request, *params);
        if (!result) {
            status = report(result.error());
        } else {
            fmt::print("{}\n", to_json(*result).dump());
        }
    } else if (opts.notify) {
        if (auto res = client.notify(*opts.notify, *params); !res) {
            status = report(res.error());
        }
    }

    if (!opts.api_info && !opts.has_feature && !opts.request && !opts.notify) {
        fmt::print("{}\n", client.channel());
    }

    client.close();
    return status;
}

int run(int argc, char* argv[])
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print("{}", opts->help_message.value());
        return 0;
    }

    setup_logging(opts->verbose);
    spdlog::debug("nvrpc v{}.{}.{}", NVRPC_VERSION_MAJOR, NVRPC_VERSION_MINOR, NVRPC_VERSION_PATCH);

    return execute(*opts);
}

}  // namespace nvrpc
