#include <gtest/gtest.h>

#include "cli/options.hpp"

#include <cstdlib>
#include <string>

TEST(CliOptions, ParseHelpOption)
{
    int argc = 2;
    char* argv[] = {const_cast<char*>("nvrpc"), const_cast<char*>("--help")};
    auto opts = nvrpc::parse_command_line(argc, argv);
    ASSERT_TRUE(opts);
    ASSERT_TRUE(opts->help_message.has_value());

    const auto& help = *opts->help_message;
    EXPECT_EQ(help.rfind("Usage: nvrpc <Options>:\nOptions:\n", 0), 0u);
    for (const char* option : {"--socket", "--request", "--notify", "--params", "--client-name", "--has",
                               "--timeout", "--api-info", "--verbose"}) {
        EXPECT_NE(help.find(option), std::string::npos) << option;
    }
}

TEST(CliOptions, DefaultsWithoutArguments)
{
    int argc = 1;
    char* argv[] = {const_cast<char*>("nvrpc")};
    auto opts = nvrpc::parse_command_line(argc, argv);
    ASSERT_TRUE(opts) << opts.error();
    EXPECT_FALSE(opts->socket);
    EXPECT_FALSE(opts->request);
    EXPECT_FALSE(opts->notify);
    EXPECT_EQ(opts->params, "[]");
    EXPECT_EQ(opts->client_name, "nvrpc");
    EXPECT_FALSE(opts->has_feature);
    EXPECT_FALSE(opts->timeout_ms);
    EXPECT_FALSE(opts->api_info);
    EXPECT_FALSE(opts->verbose);
}

TEST(CliOptions, ParseRequest)
{
    {
        // method provided as positional argument
        int argc = 4;
        char* argv[] = {const_cast<char*>("nvrpc"), const_cast<char*>("nvim_eval"), const_cast<char*>("-p"),
                        const_cast<char*>("[\"1+1\"]")};
        auto opts = nvrpc::parse_command_line(argc, argv);
        ASSERT_TRUE(opts) << opts.error();
        EXPECT_EQ(opts->request, "nvim_eval");
        EXPECT_EQ(opts->params, "[\"1+1\"]");
    }

    {
        int argc = 7;
        char* argv[] = {const_cast<char*>("nvrpc"),      const_cast<char*>("--socket=/tmp/nvim.sock"),
                        const_cast<char*>("--request"),  const_cast<char*>("nvim_get_mode"),
                        const_cast<char*>("-t"),         const_cast<char*>("250"),
                        const_cast<char*>("-v")};
        auto opts = nvrpc::parse_command_line(argc, argv);
        ASSERT_TRUE(opts) << opts.error();
        EXPECT_EQ(opts->socket, "/tmp/nvim.sock");
        EXPECT_EQ(opts->request, "nvim_get_mode");
        EXPECT_EQ(opts->timeout_ms, 250u);
        EXPECT_TRUE(opts->verbose);
    }

    {
        // error case - --request option is provided without value
        int argc = 2;
        char* argv[] = {const_cast<char*>("nvrpc"), const_cast<char*>("--request")};
        auto opts = nvrpc::parse_command_line(argc, argv);
        ASSERT_FALSE(opts);
        EXPECT_EQ(opts.error(), "the required argument for option '--request' is missing");
    }
}

TEST(CliOptions, RequestAndNotifyAreExclusive)
{
    int argc = 5;
    char* argv[] = {const_cast<char*>("nvrpc"), const_cast<char*>("-r"), const_cast<char*>("a"),
                    const_cast<char*>("-n"), const_cast<char*>("b")};
    auto opts = nvrpc::parse_command_line(argc, argv);
    ASSERT_FALSE(opts);
    EXPECT_EQ(opts.error(), "options '--request' and '--notify' are mutually exclusive");
}

TEST(CliOptions, ResolveSocketFallsBackToEnvironment)
{
    ::unsetenv("NVIM");
    ::unsetenv("NVIM_LISTEN_ADDRESS");

    nvrpc::Options opts;
    EXPECT_FALSE(nvrpc::resolve_socket(opts));

    ::setenv("NVIM_LISTEN_ADDRESS", "/tmp/legacy.sock", 1);
    EXPECT_EQ(nvrpc::resolve_socket(opts), "/tmp/legacy.sock");

    ::setenv("NVIM", "/tmp/nvim.sock", 1);
    EXPECT_EQ(nvrpc::resolve_socket(opts), "/tmp/nvim.sock");

    opts.socket = "/tmp/explicit.sock";
    EXPECT_EQ(nvrpc::resolve_socket(opts), "/tmp/explicit.sock");

    ::unsetenv("NVIM");
    ::unsetenv("NVIM_LISTEN_ADDRESS");
}
