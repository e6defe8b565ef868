#include <DyNest/Sampler.h>
#include <DyNest/RunIO.h>

#include "testing.h"

#include <fstream>

using namespace DYN;
using namespace std;

// a two-process group that never needs to talk
struct PairComm : Communicator {
    int rank() const override { return 0; }
    int size() const override { return 2; }
    void bcast(Json::Value & /*val*/, const int /*root*/ = 0) const override { }
};

size_t fptr_calls = 0;

void count_calls(const Settings & /*settings*/, const Communicator * /*comm*/) { ++fptr_calls; }

void test_function_pointer() {
    const SamplerFPtr sampler(&count_calls);
    const SerialComm comm;
    sampler(Settings(), &comm);
    sampler(Settings(), nullptr);
    IS_TRUE(fptr_calls == 2);
    THROWS(SamplerFPtr(static_cast<SamplerF *>(nullptr)), SamplerError);
    THROWS(loadSO("./no_such_sampler.so"), SamplerError);
}

void test_exec(const string & exe, const string & dir) {
    THROWS(SamplerExec(dir + "/no_such_executable", ""), SamplerError);

    // '#' comments out the command, so only the .ini is written
    const SamplerExec sampler(exe, "P : p1 | \\theta_{1} | 1 | uniform | 1 |0 1\n", "", "#");
    Settings settings;
    settings.base_dir = dir;
    settings.file_root = "exec";
    settings.nlive = 7;
    sampler(settings, nullptr);

    ifstream in((output_root(dir, "exec") + ".ini").c_str());
    IS_TRUE(in.is_open());
    stringstream contents;
    contents << in.rdbuf();
    IS_TRUE(contents.str().find("nlive = 7\n") == 0);
    IS_TRUE(contents.str().find("P : p1 | \\theta_{1} | 1 | uniform | 1 |0 1\n") != string::npos);

    const PairComm pair;
    THROWS(sampler(settings, &pair), SamplerError);

    const SamplerExec failing(exe, "", "", "exit 3 #");
    THROWS(failing(settings, nullptr), SamplerError);
}

void test_serial_comm() {
    const SerialComm comm;
    IS_TRUE(comm.rank() == 0);
    IS_TRUE(comm.size() == 1);
    Json::Value val;
    val["nlive"] = 5;
    comm.bcast(val);
    IS_TRUE(val["nlive"].asInt() == 5);
}

int main(int /*argc*/, char * argv[]) {
    const string dir = scratch_dir("sampler");
    test_function_pointer();
    test_exec(argv[0], dir);
    test_serial_comm();
    return TEST_RESULT;
}
