#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "cli/nvrpc.hpp"

int main(int argc, char* argv[])
{
    try {
        return nvrpc::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
