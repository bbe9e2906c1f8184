#include "cli/options.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <boost/program_options.hpp>

#include <cstdlib>

namespace nvrpc
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    std::string socket_value;
    std::string request_value;
    std::string notify_value;
    std::string has_value;
    unsigned timeout_value = 0;

    // clang-format off
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("socket,s", po::value<std::string>(&socket_value)->value_name("PATH"),
            "Unix socket of the peer. Defaults to $NVIM, then $NVIM_LISTEN_ADDRESS.")
        ("request,r", po::value<std::string>(&request_value)->value_name("METHOD"),
            "Call METHOD and print its result as JSON")
        ("notify,n", po::value<std::string>(&notify_value)->value_name("METHOD"),
            "Send METHOD as a notification")
        ("params,p", po::value<std::string>(&opts.params)->value_name("JSON"),
            "Call arguments as a JSON array")
        ("client-name", po::value<std::string>(&opts.client_name)->value_name("NAME"),
            "Client name announced to the peer")
        ("has", po::value<std::string>(&has_value)->value_name("FEATURE"),
            "Query has(FEATURE) on the peer")
        ("timeout,t", po::value<unsigned>(&timeout_value)->value_name("MS"),
            "Fail a request that gets no response within MS milliseconds")
        ("api-info,a", po::bool_switch(&opts.api_info), "Print the peer's API metadata summary as JSON")
        ("verbose,v", po::bool_switch(&opts.verbose), "Log protocol traffic");
    // clang-format on

    po::positional_options_description positional;
    positional.add("request", 1);

    po::variables_map vm;

    try {
        auto parser = po::command_line_parser(argc, argv).options(desc).positional(positional).run();
        po::store(parser, vm);

        if (vm.count("help")) {
            // if help is specified, return the options object with help set, ignore other options
            std::string prog_name = argc > 0 ? argv[0] : "nvrpc";
            opts.help_message = fmt::format("Usage: {} <Options>:\n{}\n", prog_name, fmt::streamed(desc));
            return opts;
        }

        po::notify(vm);

        if (vm.count("request") && vm.count("notify")) {
            return std::unexpected("options '--request' and '--notify' are mutually exclusive");
        }
        if (vm.count("socket")) {
            opts.socket = std::move(socket_value);
        }
        if (vm.count("request")) {
            opts.request = std::move(request_value);
        }
        if (vm.count("notify")) {
            opts.notify = std::move(notify_value);
        }
        if (vm.count("has")) {
            opts.has_feature = std::move(has_value);
        }
        if (vm.count("timeout")) {
            opts.timeout_ms = timeout_value;
        }
        return opts;
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

std::optional<std::string> resolve_socket(const Options& opts)
{
    if (opts.socket && !opts.socket->empty()) {
        return opts.socket;
    }
    for (const char* name : {"NVIM", "NVIM_LISTEN_ADDRESS"}) {
        if (const char* value = std::getenv(name); value && *value) {
            return std::string(value);
        }
    }
    return std::nullopt;
}

}  // namespace nvrpc
