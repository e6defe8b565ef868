#ifndef DYNEST_CLI_H
#define DYNEST_CLI_H

#include <iostream>
#include <string>

#include <DyNest/DyNest.h>

namespace DYN {

// A "usage" function for the built-in dynest CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file; empty when help was requested
// @var verbose the verbosity level (0 = warnings only, 1 = step banners and reports)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;
    size_t verbose = 0;
};

// parses the args passed to a typical main() function for a dynest program
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Load the configuration file, build the compiled sampler it describes and run
// dynamic nested sampling. -v on the command line raises the configured
// verbosity.
DynResult run(const CLIArgs & args, std::ostream & os = std::cerr);

}

#endif // DYNEST_CLI_H
