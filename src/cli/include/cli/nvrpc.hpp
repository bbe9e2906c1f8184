#pragma once

#include "options.hpp"

namespace nvrpc {

/**
 * @brief The entry point of the nvrpc command line client.
 *
 * This function is separated from main() for testability.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments.
 * @return int The exit code.
 */
int run(int argc, char* argv[]);

/**
 * @brief Connect, perform the action selected by @p opts and disconnect.
 *
 * Results are printed to stdout as JSON, diagnostics go to the log.
 *
 * @return int The exit code.
 */
int execute(const Options& opts);

}  // namespace nvrpc
