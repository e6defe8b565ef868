#include <DyNest/Comm.h>

#ifdef USING_MPI
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace DYN {

MPIComm::MPIComm(MPI_Comm comm) : _comm(comm) {
    MPI_Comm_size(_comm, &mpi_size);
    MPI_Comm_rank(_comm, &mpi_rank);
}

void MPIComm::bcast(Json::Value & val, const int root) const {
    std::string payload;
    if (mpi_rank == root) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        payload = Json::writeString(builder, val);
    }

    unsigned long len = payload.size();
    MPI_Bcast(&len,                 // message buffer
              1,                    // number of elements
              MPI_UNSIGNED_LONG,    // data item is a length
              root,                 // sending rank
              _comm);

    std::vector<char> buffer(payload.begin(), payload.end());
    buffer.resize(len);
    MPI_Bcast(buffer.data(), len, MPI_CHAR, root, _comm);

    if (mpi_rank != root) {
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream in(std::string(buffer.begin(), buffer.end()));
        if (not Json::parseFromStream(builder, in, &val, &errs)) {
            throw std::runtime_error("MPIComm::bcast: could not parse broadcast payload: " + errs);
        }
    }
}

}

#endif // USING_MPI
