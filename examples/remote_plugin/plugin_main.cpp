#include "nvrpc/runtime/client.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

// Attaches to a listening editor:
//   nvim --listen /tmp/nvim.sock
//   NVIM=/tmp/nvim.sock nvrpc_remote_plugin
//   :echo Ping_<hex>('hello')     (the exact name is printed on startup)
int main(int argc, char* argv[])
{
    using namespace nvrpc::runtime;

    std::string endpoint;
    if (argc > 1) {
        endpoint = argv[1];
    } else if (const char* env = std::getenv("NVIM"); env) {
        endpoint = env;
    } else {
        std::cerr << "usage: " << argv[0] << " <socket>\n";
        return 1;
    }

    ClientConfig cfg;
    cfg.info.name = "nvrpc-remote-plugin";
    cfg.info.type = "plugin";
    Client client{cfg};

    // the editor may notify us before the handshake finishes; this is queued until then
    auto registered = client.on_notify("nvrpc_quit", [&client](const Array&) { client.close(); });
    if (!registered) {
        std::cerr << "Failed to register handler: " << registered.error().message << '\n';
        return 1;
    }

    if (auto res = client.connect(endpoint); !res) {
        std::cerr << "Failed to connect to " << endpoint << ": " << res.error().message << '\n';
        return 1;
    }

    auto exported = client.expose_request("ping", [](const Array& args) -> Result<Value> {
        // Called from VimL the arguments arrive wrapped in one list
        const Array* list = &args;
        if (args.size() == 1 && args.front().as_array()) {
            list = args.front().as_array();
        }
        if (list->empty()) {
            return Value{"pong"};
        }
        auto text = list->front().as_string();
        if (!text) {
            return unexpected_result<Value>(ErrorCode::HandlerError, "ping expects a string argument");
        }
        return Value{"pong: " + std::string(*text)};
    });
    if (!exported) {
        std::cerr << "Failed to expose ping: " << exported.error().message << '\n';
        return 1;
    }

    std::cout << "Connected on channel " << client.channel() << ", call " << exported->remote_name << "()"
              << std::endl;
    client.wait();
    return 0;
}
