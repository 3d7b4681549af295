#include "insar_rate/parallel/local_context.hpp"
#include "insar_rate/core/errors.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace insar_rate::parallel {

namespace {

void check_self(int peer, const char* op) {
    if (peer != 0) {
        throw ParallelError(std::string(op) + ": rank " + std::to_string(peer) +
                            " does not exist in a single-rank context");
    }
}

// Mailbox channels, so that collectives never match point-to-point traffic
enum Channel : int { P2P = 0, BCAST = 1, GATHER = 2, ALLGATHER = 3 };

} // namespace

void SerialContext::send(int dest, int tag, const Bytes& payload) {
    check_self(dest, "send");
    self_messages_[tag].push_back(payload);
}

Bytes SerialContext::recv(int source, int tag) {
    check_self(source, "recv");
    auto it = self_messages_.find(tag);
    if (it == self_messages_.end() || it->second.empty()) {
        // Nothing else could ever deliver it
        throw ParallelError("recv would block forever: no message with tag " +
                            std::to_string(tag));
    }
    Bytes payload = std::move(it->second.front());
    it->second.pop_front();
    return payload;
}

void SerialContext::broadcast(Bytes&, int root) {
    check_self(root, "broadcast");
}

std::vector<Bytes> SerialContext::gather(const Bytes& payload, int root) {
    check_self(root, "gather");
    return {payload};
}

std::vector<Bytes> SerialContext::allgather(const Bytes& payload) {
    return {payload};
}

namespace detail {

struct LocalGroupState {
    using Key = std::tuple<int, int, int, int>; // source, dest, tag, channel

    std::mutex mutex;
    std::condition_variable cv;
    std::map<Key, std::deque<Bytes>> mailboxes;
    int barrier_waiting = 0;
    long barrier_generation = 0;
    bool aborted = false;
    std::exception_ptr first_error;

    void post(const Key& key, Bytes payload) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            mailboxes[key].push_back(std::move(payload));
        }
        cv.notify_all();
    }

    Bytes take(const Key& key) {
        std::unique_lock<std::mutex> lock(mutex);
        auto& box = mailboxes[key];
        cv.wait(lock, [&] { return aborted || !box.empty(); });
        if (aborted) {
            throw ParallelError("Rank group aborted while waiting for rank " +
                                std::to_string(std::get<0>(key)));
        }
        Bytes payload = std::move(box.front());
        box.pop_front();
        return payload;
    }

    void barrier(int size) {
        std::unique_lock<std::mutex> lock(mutex);
        if (aborted) {
            throw ParallelError("Rank group aborted before barrier");
        }
        const long generation = barrier_generation;
        if (++barrier_waiting == size) {
            barrier_waiting = 0;
            ++barrier_generation;
            lock.unlock();
            cv.notify_all();
            return;
        }
        cv.wait(lock, [&] { return aborted || barrier_generation != generation; });
        if (barrier_generation == generation) {
            throw ParallelError("Rank group aborted in barrier");
        }
    }

    void abort(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!first_error) {
                first_error = error;
            }
            aborted = true;
        }
        cv.notify_all();
    }
};

} // namespace detail

namespace {

class LocalRank : public ExecutionContext {
public:
    LocalRank(detail::LocalGroupState& state, int rank, int size,
              const LocalGroup::SendDelay& delay)
        : state_(state), rank_(rank), size_(size), delay_(delay) {}

    int rank() const override { return rank_; }
    int size() const override { return size_; }

    void barrier() override { state_.barrier(size_); }

    void send(int dest, int tag, const Bytes& payload) override {
        check_peer(dest);
        if (delay_) {
            std::this_thread::sleep_for(delay_(rank_, dest, tag));
        }
        state_.post({rank_, dest, tag, P2P}, payload);
    }

    Bytes recv(int source, int tag) override {
        check_peer(source);
        return state_.take({source, rank_, tag, P2P});
    }

    void broadcast(Bytes& payload, int root) override {
        check_peer(root);
        if (rank_ == root) {
            for (int r = 0; r < size_; ++r) {
                if (r != root) state_.post({root, r, 0, BCAST}, payload);
            }
        } else {
            payload = state_.take({root, rank_, 0, BCAST});
        }
    }

    std::vector<Bytes> gather(const Bytes& payload, int root) override {
        check_peer(root);
        if (rank_ != root) {
            state_.post({rank_, root, 0, GATHER}, payload);
            return {};
        }
        std::vector<Bytes> parts(static_cast<size_t>(size_));
        for (int r = 0; r < size_; ++r) {
            parts[static_cast<size_t>(r)] =
                r == root ? payload : state_.take({r, root, 0, GATHER});
        }
        return parts;
    }

    std::vector<Bytes> allgather(const Bytes& payload) override {
        for (int r = 0; r < size_; ++r) {
            if (r != rank_) state_.post({rank_, r, 0, ALLGATHER}, payload);
        }
        std::vector<Bytes> parts(static_cast<size_t>(size_));
        for (int r = 0; r < size_; ++r) {
            parts[static_cast<size_t>(r)] =
                r == rank_ ? payload : state_.take({r, rank_, 0, ALLGATHER});
        }
        return parts;
    }

private:
    void check_peer(int peer) const {
        if (peer < 0 || peer >= size_) {
            throw ParallelError("Invalid rank " + std::to_string(peer) + " in group of " +
                                std::to_string(size_));
        }
    }

    detail::LocalGroupState& state_;
    int rank_;
    int size_;
    const LocalGroup::SendDelay& delay_;
};

} // namespace

LocalGroup::LocalGroup(int size) : size_(size) {
    if (size < 1) {
        throw ParallelError("Rank group size must be >= 1");
    }
}

LocalGroup::~LocalGroup() = default;

void LocalGroup::set_send_delay(SendDelay delay) {
    delay_ = std::move(delay);
}

void LocalGroup::run(const std::function<void(ExecutionContext&)>& fn) {
    state_ = std::make_unique<detail::LocalGroupState>();

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(size_));
    for (int r = 0; r < size_; ++r) {
        threads.emplace_back([this, r, &fn] {
            try {
                LocalRank ctx(*state_, r, size_, delay_);
                fn(ctx);
            } catch (...) {
                // Recorded and rethrown by run() after every rank has stopped
                state_->abort(std::current_exception());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    if (state_->first_error) {
        std::rethrow_exception(state_->first_error);
    }
}

} // namespace insar_rate::parallel
