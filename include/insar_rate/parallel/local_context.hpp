#pragma once

#include "insar_rate/parallel/context.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <tuple>

namespace insar_rate::parallel {

namespace detail {
struct LocalGroupState;
}

// Single-rank context. Messages a rank sends to itself are queued.
class SerialContext : public ExecutionContext {
public:
    int rank() const override { return 0; }
    int size() const override { return 1; }

    void barrier() override {}

    void send(int dest, int tag, const Bytes& payload) override;
    Bytes recv(int source, int tag) override;

    void broadcast(Bytes& payload, int root) override;
    std::vector<Bytes> gather(const Bytes& payload, int root) override;
    std::vector<Bytes> allgather(const Bytes& payload) override;

private:
    std::map<int, std::deque<Bytes>> self_messages_;
};

// P ranks simulated by P threads of the calling process, exchanging messages
// through in-memory mailboxes. If any rank throws, the ranks blocked in a
// communication call are released with ParallelError and run() rethrows the
// first exception raised.
class LocalGroup {
public:
    using SendDelay = std::function<std::chrono::milliseconds(int source, int dest, int tag)>;

    explicit LocalGroup(int size);
    ~LocalGroup();

    LocalGroup(const LocalGroup&) = delete;
    LocalGroup& operator=(const LocalGroup&) = delete;

    int size() const { return size_; }

    // Delay applied before a point-to-point message becomes visible
    void set_send_delay(SendDelay delay);

    void run(const std::function<void(ExecutionContext&)>& fn);

private:
    int size_;
    SendDelay delay_;
    std::unique_ptr<detail::LocalGroupState> state_;
};

} // namespace insar_rate::parallel
