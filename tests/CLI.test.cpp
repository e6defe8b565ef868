#include <DyNest/CLI.h>
#include <DyNest/RunIO.h>

#include "testing.h"

#include <filesystem>
#include <fstream>

using namespace DYN;
using namespace std;

void test_parse_args() {
    const char * help[] = { "./CLI.test", "config.json", "-h" };
    cerr << "Should print usage message:" << endl;
    IS_TRUE(parse_args(3, help).config_file.empty());
    cerr << endl;

    const char * plain[] = { "./CLI.test", "config.json" };
    CLIArgs args = parse_args(2, plain);
    IS_TRUE(args.config_file == "config.json");
    IS_TRUE(args.verbose == 0);

    const char * verbose[] = { "./CLI.test", "config.json", "-v", "--verbose" };
    args = parse_args(4, verbose);
    IS_TRUE(args.config_file == "config.json");
    IS_TRUE(args.verbose == 2);
}

// standard nested sampling through a sampler whose command is commented out:
// only the PolyChord .ini is written
void test_run(const string & exe, const string & dir) {
    const string config_file = dir + "/config.json";
    {
        ofstream out(config_file.c_str());
        out << "{" << endl
            << "  \"settings\": { \"base_dir\": \"" << dir << "\", \"nlive\": 20 }," << endl
            << "  \"sampler\": {" << endl
            << "    \"executable\": \"" << exe << "\", \"mpi_str\": \"#\"," << endl
            << "    \"prior\": [ { \"type\": \"uniform\", \"nparam\": 2, \"params\": [-10, 10] } ]" << endl
            << "  }," << endl
            << "  \"naming\": { \"likelihood\": \"gaussian\", \"prior\": \"uniform\", \"ndim\": 2, \"prior_scale\": 10, \"nlive_const\": 20, \"nrepeats\": 5 }" << endl
            << "}" << endl;
    }
    CLIArgs args(config_file);
    args.verbose = 1;
    ostringstream log;
    const DynResult result = run(args, log);
    IS_TRUE(not result.run);
    IS_TRUE(log.str().find("INITIAL_RUN") != string::npos);

    const string ini_file = output_root(dir, "gaussian_uniform_10_dgNone_2d_20nlive_5nrepeats") + ".ini";
    ifstream in(ini_file.c_str());
    IS_TRUE(in.is_open());
    stringstream ini;
    ini << in.rdbuf();
    IS_TRUE(ini.str().find("nlive = 20\n") == 0);
    IS_TRUE(ini.str().find("read_resume = F\n") != string::npos);
    IS_TRUE(ini.str().find("P : p2 | \\theta_{2} | 1 | uniform | 1 |-10 10\n") != string::npos);

    THROWS(run(CLIArgs(dir + "/missing.json"), log), std::runtime_error);
}

int main(int /*argc*/, char * argv[]) {
    const string dir = scratch_dir("cli");
    test_parse_args();
    test_run(std::filesystem::absolute(argv[0]).string(), dir);
    return TEST_RESULT;
}
