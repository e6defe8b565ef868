#include <DyNest/CLI.h>

#include <exception>
#include <iostream>

using namespace std;

int main(int argc, const char* argv[]) {
    const auto args = DYN::parse_args(argc, argv);
    if (args.config_file.empty()) { return 0; } // help requested

    try {
        const auto result = DYN::run(args);
        if (result.run and (args.verbose > 0)) {
            cerr << "Combined run: " << result.run->nsamples() << " samples in " << result.run->nthreads() << " threads" << endl;
        }
    } catch (const std::exception & e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    return 0;
}
