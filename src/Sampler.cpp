#include <DyNest/Sampler.h>
#include <DyNest/PolyChordIni.h>
#include <DyNest/RunIO.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using std::string;

namespace DYN {

SamplerF * loadSO(const char * target) {
    void * handle = dlopen(target, RTLD_LAZY);
    if (not handle) {
        throw SamplerError(string("Failed to open sampler object: ") + target + " ; " + dlerror());
    }
    auto samplerf = (SamplerF*)dlsym(handle, "sampler");
    if (not samplerf) {
        const string err = string("Failed to find 'sampler' function in ") + target + " ; " + dlerror();
        dlclose(handle);
        throw SamplerError(err);
    }
    return samplerf;
}

SamplerFPtr::SamplerFPtr(SamplerF * _fptr) : fptr(_fptr) {
    if (not fptr) { throw SamplerError("SamplerFPtr needs a sampler function."); }
}

void SamplerFPtr::operator()(const Settings & settings, const Communicator * comm) const {
    fptr(settings, comm);
}

SamplerExec::SamplerExec(
    const string & exe,
    const string & prior,
    const string & derived,
    const string & mpi,
    const string & config
) : executable_path(exe), prior_str(prior), derived_str(derived), mpi_str(mpi), config_str(config) {
    if (not std::filesystem::exists(executable_path)) {
        throw SamplerError("sampler executable " + executable_path + " does not exist.");
    }
}

void SamplerExec::operator()(const Settings & settings, const Communicator * comm) const {
    if ((comm != nullptr) and (comm->size() > 1)) {
        throw SamplerError("SamplerExec runs its own processes; use mpi_str rather than a multi-process communicator.");
    }

    if (not settings.base_dir.empty()) { std::filesystem::create_directories(settings.base_dir); }
    const string ini_path = output_root(settings.base_dir, settings.file_root) + ".ini";
    {
        std::ofstream ini(ini_path.c_str());
        if (not ini.is_open()) { throw SamplerError("could not write " + ini_path); }
        ini << ini_string(settings, config_str, prior_str, derived_str);
    }

    const string command = mpi_str + " " + executable_path + " " + ini_path;
    const int status = std::system(command.c_str());
    if (status != 0) {
        std::stringstream err;
        err << "sampler command `" << command << "` failed with status " << status;
        throw SamplerError(err.str());
    }
}

}
