#pragma once

#include "insar_rate/parallel/context.hpp"

#include <mpi.h>

namespace insar_rate::parallel {

// Owns MPI_Init / MPI_Finalize for the lifetime of the process
class MpiSession {
public:
    MpiSession(int& argc, char**& argv);
    ~MpiSession();

    MpiSession(const MpiSession&) = delete;
    MpiSession& operator=(const MpiSession&) = delete;

    // Terminates every rank of MPI_COMM_WORLD
    [[noreturn]] static void abort(int code);

private:
    bool owns_ = false;
};

// ExecutionContext over an MPI communicator. Failed MPI calls raise
// ParallelError instead of aborting.
class MpiContext : public ExecutionContext {
public:
    explicit MpiContext(MPI_Comm comm = MPI_COMM_WORLD);

    int rank() const override { return rank_; }
    int size() const override { return size_; }

    void barrier() override;

    void send(int dest, int tag, const Bytes& payload) override;
    Bytes recv(int source, int tag) override;

    void broadcast(Bytes& payload, int root) override;
    std::vector<Bytes> gather(const Bytes& payload, int root) override;
    std::vector<Bytes> allgather(const Bytes& payload) override;

private:
    MPI_Comm comm_;
    int rank_ = 0;
    int size_ = 1;
};

} // namespace insar_rate::parallel
