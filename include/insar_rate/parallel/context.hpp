#pragma once

#include <cstdint>
#include <vector>

namespace insar_rate::parallel {

using Bytes = std::vector<uint8_t>;

// Rank that owns shared artifacts and runs leader-only work
constexpr int kLeader = 0;

// Group of cooperating ranks. Every collective (barrier, broadcast, gather,
// allgather) must be entered by all ranks in the same order. Point-to-point
// messages are matched by (source, tag).
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    virtual int rank() const = 0;
    virtual int size() const = 0;
    bool is_leader() const { return rank() == kLeader; }

    virtual void barrier() = 0;

    virtual void send(int dest, int tag, const Bytes& payload) = 0;
    virtual Bytes recv(int source, int tag) = 0;

    // On return every rank holds the root's payload
    virtual void broadcast(Bytes& payload, int root) = 0;

    // Root receives one payload per rank, indexed by rank; others receive {}
    virtual std::vector<Bytes> gather(const Bytes& payload, int root) = 0;

    virtual std::vector<Bytes> allgather(const Bytes& payload) = 0;
};

} // namespace insar_rate::parallel
