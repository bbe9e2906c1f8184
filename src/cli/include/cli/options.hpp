#pragma once

#include <expected>
#include <optional>
#include <string>

namespace nvrpc
{
/**
 * @brief Command line options
 */
struct Options {
    std::optional<std::string> socket;          ///< if not specified, use $NVIM, then $NVIM_LISTEN_ADDRESS
    std::optional<std::string> request;         ///< method to call and print the result of
    std::optional<std::string> notify;          ///< method to send as a notification
    std::string params = "[]";                  ///< JSON array of call arguments
    std::string client_name = "nvrpc";          ///< name announced through nvim_set_client_info
    std::optional<std::string> has_feature;     ///< feature to query through has()
    std::optional<std::string> help_message;    ///< if specified, show help message
    std::optional<unsigned> timeout_ms;         ///< per-request deadline
    bool api_info = false;                      ///< if true, print the peer's API metadata summary
    bool verbose = false;                       ///< if true, log at debug level
};

/**
 * @brief Parse command line options
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

/**
 * @brief Socket address to connect to: the explicit option, else $NVIM, else
 * $NVIM_LISTEN_ADDRESS.
 */
std::optional<std::string> resolve_socket(const Options& opts);

}  // namespace nvrpc
