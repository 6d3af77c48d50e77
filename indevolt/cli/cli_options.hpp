#pragma once

#include "indevolt/cli/cli_config.hpp"

namespace indevolt
{

/**
 * Parse the indevolt_cli command line
 *
 * Prints the usage when --help is given and sets show_help.
 * @throws boost::program_options::error on invalid arguments, after printing the usage to stderr
 */
CliConfig parse_command_line(int argc, const char* const argv[]);

} // namespace indevolt
