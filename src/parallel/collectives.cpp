#include "insar_rate/parallel/collectives.hpp"
#include "insar_rate/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace insar_rate::parallel {

Range split_range(size_t n, int parts, int index) {
    if (parts < 1 || index < 0 || index >= parts) {
        throw ParallelError("Invalid split: part " + std::to_string(index) + " of " +
                            std::to_string(parts));
    }
    const size_t p = static_cast<size_t>(parts);
    const size_t i = static_cast<size_t>(index);
    const size_t base = n / p;
    const size_t extra = n % p;

    Range r;
    r.begin = i * base + std::min(i, extra);
    r.end = r.begin + base + (i < extra ? 1 : 0);
    return r;
}

namespace detail {

Bytes wrap_status(uint8_t status, const Bytes& body) {
    Bytes out;
    out.reserve(body.size() + 1);
    out.push_back(status);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Bytes unwrap_status(const Bytes& message, int root) {
    if (message.empty()) {
        throw ParallelError("Empty message from rank " + std::to_string(root));
    }
    Bytes body(message.begin() + 1, message.end());
    if (message.front() != kOk) {
        throw ParallelError("Rank " + std::to_string(root) + " failed: " +
                            std::string(body.begin(), body.end()));
    }
    return body;
}

} // namespace detail

std::vector<double> gather_ordered_by_rank(ExecutionContext& ctx,
                                           const std::vector<double>& local, size_t total) {
    const int size = ctx.size();

    if (!ctx.is_leader()) {
        ctx.send(kLeader, ctx.rank(), encode(local));
        return {};
    }

    std::vector<double> out(total, std::numeric_limits<double>::quiet_NaN());

    auto place = [&](int source, const std::vector<double>& shard) {
        const Range r = split_range(total, size, source);
        if (shard.size() != r.size()) {
            throw ParallelError("Rank " + std::to_string(source) + " sent " +
                                std::to_string(shard.size()) + " values, expected " +
                                std::to_string(r.size()));
        }
        std::copy(shard.begin(), shard.end(), out.begin() + static_cast<std::ptrdiff_t>(r.begin));
    };

    place(kLeader, local);
    for (int source = 1; source < size; ++source) {
        place(source, decode<std::vector<double>>(ctx.recv(source, source)));
    }
    return out;
}

std::string publish(ExecutionContext& ctx, const fs::path& path,
                    const std::function<std::string()>& produce) {
    Bytes message;
    if (ctx.is_leader()) {
        try {
            const std::string payload = produce();
            core::write_atomically(path, payload);
            message = encode(core::sha256_bytes(Bytes(payload.begin(), payload.end())));
        } catch (const std::exception&) {
            // An empty digest tells the other ranks not to wait for the file
            Bytes failed;
            ctx.broadcast(failed, kLeader);
            throw;
        }
    }
    ctx.broadcast(message, kLeader);

    const std::string digest = decode<std::string>(message);
    if (digest.empty()) {
        throw SynchronizationError("Leader failed to publish " + path.string());
    }
    return read_published(path, digest);
}

std::string read_published(const fs::path& path, const std::string& digest) {
    Bytes contents;
    try {
        contents = core::read_bytes(path);
    } catch (const IOError& e) {
        throw SynchronizationError(path.string() + " unreadable after publish: " + e.what());
    }

    if (core::sha256_bytes(contents) != digest) {
        throw SynchronizationError("Digest mismatch for " + path.string() +
                                   " (stale or partial file)");
    }
    return std::string(contents.begin(), contents.end());
}

std::string publish(ExecutionContext& ctx, const fs::path& path, const std::string& payload) {
    return publish(ctx, path, [&payload] { return payload; });
}

} // namespace insar_rate::parallel
