#include "insar_rate/parallel/mpi_context.hpp"
#include "insar_rate/core/errors.hpp"

#include <climits>
#include <cstdlib>
#include <string>

namespace insar_rate::parallel {

namespace {

void check_mpi(int rc, const char* call) {
    if (rc == MPI_SUCCESS) {
        return;
    }
    char err[MPI_MAX_ERROR_STRING];
    int len = 0;
    if (MPI_Error_string(rc, err, &len) != MPI_SUCCESS) {
        len = 0;
    }
    throw ParallelError(std::string(call) + " failed: " + std::string(err, static_cast<size_t>(len)));
}

int checked_count(size_t n) {
    if (n > static_cast<size_t>(INT_MAX)) {
        throw ParallelError("Message too large: " + std::to_string(n) + " bytes");
    }
    return static_cast<int>(n);
}

std::vector<Bytes> unpack(const Bytes& flat, const std::vector<int>& counts,
                          const std::vector<int>& displs) {
    std::vector<Bytes> parts(counts.size());
    for (size_t r = 0; r < counts.size(); ++r) {
        parts[r].assign(flat.begin() + displs[r], flat.begin() + displs[r] + counts[r]);
    }
    return parts;
}

int displacements(const std::vector<int>& counts, std::vector<int>& displs) {
    displs.assign(counts.size(), 0);
    long total = 0;
    for (size_t r = 0; r < counts.size(); ++r) {
        displs[r] = static_cast<int>(total);
        total += counts[r];
    }
    if (total > INT_MAX) {
        throw ParallelError("Gathered message too large: " + std::to_string(total) + " bytes");
    }
    return static_cast<int>(total);
}

} // namespace

MpiSession::MpiSession(int& argc, char**& argv) {
    int initialized = 0;
    check_mpi(MPI_Initialized(&initialized), "MPI_Initialized");
    if (!initialized) {
        check_mpi(MPI_Init(&argc, &argv), "MPI_Init");
        owns_ = true;
    }
    check_mpi(MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN),
              "MPI_Comm_set_errhandler");
}

MpiSession::~MpiSession() {
    if (!owns_) {
        return;
    }
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized) {
        MPI_Finalize();
    }
}

void MpiSession::abort(int code) {
    MPI_Abort(MPI_COMM_WORLD, code);
    std::exit(code);
}

MpiContext::MpiContext(MPI_Comm comm) : comm_(comm) {
    check_mpi(MPI_Comm_rank(comm_, &rank_), "MPI_Comm_rank");
    check_mpi(MPI_Comm_size(comm_, &size_), "MPI_Comm_size");
}

void MpiContext::barrier() {
    check_mpi(MPI_Barrier(comm_), "MPI_Barrier");
}

void MpiContext::send(int dest, int tag, const Bytes& payload) {
    check_mpi(MPI_Send(payload.data(), checked_count(payload.size()), MPI_BYTE, dest, tag, comm_),
              "MPI_Send");
}

Bytes MpiContext::recv(int source, int tag) {
    MPI_Status status;
    check_mpi(MPI_Probe(source, tag, comm_, &status), "MPI_Probe");

    int count = 0;
    check_mpi(MPI_Get_count(&status, MPI_BYTE, &count), "MPI_Get_count");

    Bytes payload(static_cast<size_t>(count));
    check_mpi(MPI_Recv(payload.data(), count, MPI_BYTE, status.MPI_SOURCE, status.MPI_TAG, comm_,
                       MPI_STATUS_IGNORE),
              "MPI_Recv");
    return payload;
}

void MpiContext::broadcast(Bytes& payload, int root) {
    int count = rank_ == root ? checked_count(payload.size()) : 0;
    check_mpi(MPI_Bcast(&count, 1, MPI_INT, root, comm_), "MPI_Bcast");

    if (rank_ != root) {
        payload.assign(static_cast<size_t>(count), 0);
    }
    if (count > 0) {
        check_mpi(MPI_Bcast(payload.data(), count, MPI_BYTE, root, comm_), "MPI_Bcast");
    }
}

std::vector<Bytes> MpiContext::gather(const Bytes& payload, int root) {
    int local = checked_count(payload.size());
    std::vector<int> counts(rank_ == root ? static_cast<size_t>(size_) : 0);
    check_mpi(MPI_Gather(&local, 1, MPI_INT, counts.data(), 1, MPI_INT, root, comm_),
              "MPI_Gather");

    std::vector<int> displs;
    Bytes flat;
    if (rank_ == root) {
        flat.resize(static_cast<size_t>(displacements(counts, displs)));
    }

    check_mpi(MPI_Gatherv(payload.data(), local, MPI_BYTE, flat.data(), counts.data(),
                          displs.data(), MPI_BYTE, root, comm_),
              "MPI_Gatherv");

    if (rank_ != root) {
        return {};
    }
    return unpack(flat, counts, displs);
}

std::vector<Bytes> MpiContext::allgather(const Bytes& payload) {
    int local = checked_count(payload.size());
    std::vector<int> counts(static_cast<size_t>(size_));
    check_mpi(MPI_Allgather(&local, 1, MPI_INT, counts.data(), 1, MPI_INT, comm_),
              "MPI_Allgather");

    std::vector<int> displs;
    Bytes flat(static_cast<size_t>(displacements(counts, displs)));

    check_mpi(MPI_Allgatherv(payload.data(), local, MPI_BYTE, flat.data(), counts.data(),
                             displs.data(), MPI_BYTE, comm_),
              "MPI_Allgatherv");

    return unpack(flat, counts, displs);
}

} // namespace insar_rate::parallel
