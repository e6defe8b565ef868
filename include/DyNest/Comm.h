#ifndef DYNEST_COMM_H
#define DYNEST_COMM_H

#ifdef USING_MPI
#include <mpi.h>
#endif // USING_MPI

#include <json/json.h>

// process group management for the DYN namespace
namespace DYN {

// The process group a dynamic run is spread over. Rank 0 is the primary: it
// reads sampler output, allocates, combines and writes; every rank calls the
// sampler. Decisions travel from the primary as JSON.
struct Communicator {
    virtual ~Communicator() = default;
    virtual int rank() const = 0;
    virtual int size() const = 0;
    // replace `val` on every rank with the value held by `root`
    virtual void bcast(Json::Value & val, const int root = 0) const = 0;
};

// a single process; broadcasting is a no-op
struct SerialComm : Communicator {
    int rank() const override { return 0; }
    int size() const override { return 1; }
    void bcast(Json::Value & /*val*/, const int /*root*/ = 0) const override { }
};

#ifdef USING_MPI
// wraps an MPI communicator the caller owns; MPI must already be initialised
struct MPIComm : Communicator {
    MPIComm(MPI_Comm comm = MPI_COMM_WORLD);
    int rank() const override { return mpi_rank; }
    int size() const override { return mpi_size; }
    void bcast(Json::Value & val, const int root = 0) const override;

    private:
        MPI_Comm _comm;
        int mpi_size, mpi_rank;
};
#endif // USING_MPI

}

#endif // DYNEST_COMM_H
