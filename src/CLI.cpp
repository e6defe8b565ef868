#include <DyNest/CLI.h>
#include <DyNest/Config.h>

#include <cstring>

using std::cerr;
using std::endl;
using std::string;

namespace DYN {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Runs, in order:" << endl;
    cerr << ident << INITIAL_RUN << " => " << ALLOCATE << " => " << DYNAMIC_RUN << " => " << COMBINE << " => " << PERSIST << endl;
    cerr << ident << "(only " << INITIAL_RUN << " when the configuration has no dynamic_goal)" << endl;
    cerr << endl;
    cerr << "Options:" << endl;
    cerr << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    cerr << ident << "-(-v)erbose  : when working, be effusive; repeat for more." << endl;
    cerr << endl;
    cerr << "Example config.json:" << endl;
    cerr << ident << "{" << endl;
    cerr << ident << "  \"settings\": { \"base_dir\": \"chains\", \"file_root\": \"gaussian\", \"nlive\": 500, \"num_repeats\": 10 }," << endl;
    cerr << ident << "  \"dynamic_goal\": 1," << endl;
    cerr << ident << "  \"options\": { \"ninit\": 50, \"smoothing_sigma\": 2 }," << endl;
    cerr << ident << "  \"sampler\": {" << endl;
    cerr << ident << "    \"executable\": \"./gaussian_polychord\", \"mpi_str\": \"mpirun -np 4\"," << endl;
    cerr << ident << "    \"prior\": [ { \"type\": \"uniform\", \"nparam\": 10, \"params\": [-10, 10] } ]" << endl;
    cerr << ident << "  }" << endl;
    cerr << ident << "}" << endl;
    if (status != 0) { exit(status); }
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    for (size_t i = 1; i < argc; i++) {
        if (argcheck(argv[i], "-h", "--help")) {
            usage(cmd);
            return CLIArgs("");
        }
    }

    if (argc < 2) { usage(cmd, "Error: no configuration file given.", 101); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {
        if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    return args;
};

DynResult run(const CLIArgs & args, std::ostream & os) {
    const JsonConfig config(args.config_file);

    Json::Value options = config.options;
    if (args.verbose > options.get("verbose", 0).asUInt64()) { options["verbose"] = Json::UInt64(args.verbose); }

    const SamplerExec sampler(
        config.sampler.executable,
        config.sampler.prior_str(),
        config.sampler.derived_str,
        config.sampler.mpi_str,
        config.sampler.config_str
    );

    if (args.verbose > 0) {
        os << "Running dynest on " << args.config_file << " as: " << endl;
        os << VALIDATE << " => " << INITIAL_RUN;
        if (config.dynamic_goal) { os << " => " << ALLOCATE << " => " << DYNAMIC_RUN << " => " << COMBINE << " => " << PERSIST; }
        os << endl;
    }

    return run_dynamic_ns(sampler, config.dynamic_goal, config.settings_json(), options, nullptr, os);
}

} // namespace DYN
