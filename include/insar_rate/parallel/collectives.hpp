#pragma once

#include "insar_rate/core/errors.hpp"
#include "insar_rate/parallel/codec.hpp"
#include "insar_rate/parallel/context.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace insar_rate::parallel {

namespace fs = std::filesystem;

// Half-open index range [begin, end)
struct Range {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

// Contiguous split of n items over `parts` ranks: the first n % parts ranks
// receive one extra item. Pure function of its arguments.
Range split_range(size_t n, int parts, int index);

template <typename T>
std::vector<T> split(const std::vector<T>& items, int parts, int index) {
    const Range r = split_range(items.size(), parts, index);
    return std::vector<T>(items.begin() + static_cast<std::ptrdiff_t>(r.begin),
                          items.begin() + static_cast<std::ptrdiff_t>(r.end));
}

// Shard owned by the calling rank
template <typename T>
std::vector<T> split(const std::vector<T>& items, const ExecutionContext& ctx) {
    return split(items, ctx.size(), ctx.rank());
}

namespace detail {

constexpr uint8_t kOk = 1;
constexpr uint8_t kFailed = 0;

Bytes wrap_status(uint8_t status, const Bytes& body);
// Returns the body; raises ParallelError when the root reported a failure
Bytes unwrap_status(const Bytes& message, int root);

} // namespace detail

// Runs fn on the leader only and hands the leader's result to every rank.
// A failure on the leader is reported to the other ranks before rethrowing.
template <typename Fn>
auto run_once(ExecutionContext& ctx, Fn&& fn) -> std::decay_t<decltype(fn())> {
    using T = std::decay_t<decltype(fn())>;

    Bytes message;
    if (ctx.is_leader()) {
        try {
            message = detail::wrap_status(detail::kOk, encode<T>(fn()));
        } catch (const std::exception& e) {
            const std::string what = e.what();
            Bytes failure = detail::wrap_status(detail::kFailed, Bytes(what.begin(), what.end()));
            ctx.broadcast(failure, kLeader);
            throw;
        }
    }
    ctx.broadcast(message, kLeader);
    return decode<T>(detail::unwrap_status(message, kLeader));
}

template <typename T>
T broadcast_value(ExecutionContext& ctx, const T& value, int root = kLeader) {
    Bytes payload;
    if (ctx.rank() == root) {
        payload = encode<T>(value);
    }
    ctx.broadcast(payload, root);
    return decode<T>(payload);
}

template <typename T>
std::vector<T> allgather_values(ExecutionContext& ctx, const T& value) {
    std::vector<Bytes> parts = ctx.allgather(encode<T>(value));
    std::vector<T> out;
    out.reserve(parts.size());
    for (const auto& part : parts) {
        out.push_back(decode<T>(part));
    }
    return out;
}

// Concatenation in rank order of per-rank vectors, on the root only
template <typename T>
std::vector<T> gather_concat(ExecutionContext& ctx, const std::vector<T>& local,
                             int root = kLeader) {
    std::vector<Bytes> parts = ctx.gather(encode<std::vector<T>>(local), root);
    std::vector<T> out;
    for (const auto& part : parts) {
        std::vector<T> values = decode<std::vector<T>>(part);
        out.insert(out.end(), values.begin(), values.end());
    }
    return out;
}

// Point-to-point reassembly of a vector distributed with split_range(total).
// Non-leaders send their shard tagged with their own rank; the leader
// receives from ranks 1..P-1 in ascending order and places every shard at the
// index range the sender owns. Only the leader gets a non-empty result.
std::vector<double> gather_ordered_by_rank(ExecutionContext& ctx,
                                           const std::vector<double>& local, size_t total);

// Write-once shared artifact. The leader writes the produced payload to
// `path` atomically and broadcasts its SHA-256 digest; every rank then
// reloads the file and checks the digest. Returns the reloaded contents.
// `produce` runs on the leader only; if it throws, every rank fails.
std::string publish(ExecutionContext& ctx, const fs::path& path,
                    const std::function<std::string()>& produce);

std::string publish(ExecutionContext& ctx, const fs::path& path, const std::string& payload);

// Contents of a published file; SynchronizationError when it cannot be read
// or its SHA-256 digest differs from `digest`
std::string read_published(const fs::path& path, const std::string& digest);

} // namespace insar_rate::parallel
