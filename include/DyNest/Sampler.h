#ifndef DYNEST_SAMPLER_H
#define DYNEST_SAMPLER_H

#include <dlfcn.h> // for dynamic version
#include <stdexcept>
#include <string>

#include <DyNest/Comm.h>
#include <DyNest/Settings.h>

namespace DYN {

struct SamplerError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Defines the core abstraction for a sampler: a functor whose operator() runs
// one nested sampling run to completion with the given settings, writing
// PolyChord-format output under settings.base_dir / settings.file_root
// (at least the dead-birth file, plus stats and resume files when the
// settings ask for them). Every rank of `comm` calls it together.
// Implementations should not be "stateful": the same settings give the same run.
struct SamplerFun {
    virtual ~SamplerFun() = default;
    virtual void operator()(const Settings & settings, const Communicator * comm) const = 0;
};

// function type for a sampler compiled along with this library, or loaded
// from a shared object
typedef void SamplerF(const Settings &, const Communicator *);

// loads the `sampler` symbol from a shared object file
SamplerF * loadSO(const char * target);

// a SamplerFun built around a SamplerF pointer
struct SamplerFPtr : SamplerFun {
    SamplerF * fptr;
    SamplerFPtr(SamplerF * _fptr);
    SamplerFPtr(const char * target) : SamplerFPtr(loadSO(target)) { } // construct from the file name for shared object
    SamplerFPtr(const std::string target) : SamplerFPtr(target.c_str()) { }
    void operator()(const Settings & settings, const Communicator * comm) const override;
};

// A SamplerFun built around a compiled PolyChord executable, which reads its
// settings and prior from an .ini file. The .ini is written to
// <base_dir>/<file_root>.ini and the executable run as
// "<mpi_str> <executable_path> <ini file>"; the executable takes care of any
// parallelism itself, so the orchestrating process group must be serial.
struct SamplerExec : SamplerFun {
    SamplerExec(
        const std::string & executable_path,
        const std::string & prior_str,
        const std::string & derived_str = "",
        const std::string & mpi_str = "",
        const std::string & config_str = ""
    );

    void operator()(const Settings & settings, const Communicator * comm) const override;

    const std::string executable_path;
    const std::string prior_str;
    const std::string derived_str;
    const std::string mpi_str;
    const std::string config_str;
};

}

#endif // DYNEST_SAMPLER_H
