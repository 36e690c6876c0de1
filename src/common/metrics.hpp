// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>

namespace pongd::metrics {

struct RuntimeCounters
{
    // Power-of-two buckets for tick durations (base 50us) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 50'000;

    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    // Samples at or above the last bucket bound; exported only under le="+Inf".
    std::atomic<uint64_t> tick_overflow{0};
    std::atomic<uint64_t> tick_max_ns{0};
    // Gauges
    std::atomic<uint64_t> active_rooms{0};
    std::atomic<uint64_t> ticking_rooms{0};
    std::atomic<uint64_t> connected_players{0};
    // Counters
    std::atomic<uint64_t> rooms_created{0};
    std::atomic<uint64_t> rooms_destroyed{0};
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> goals_scored{0};
    std::atomic<uint64_t> paddle_moves{0};
    std::atomic<uint64_t> messages_delivered{0};
    std::atomic<uint64_t> messages_undeliverable{0};
    std::atomic<uint64_t> messages_dropped_backlog{0};
    std::atomic<uint64_t> malformed_frames{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    uint64_t prev_max = rt.tick_max_ns.load(std::memory_order_relaxed);
    while (ns > prev_max && !rt.tick_max_ns.compare_exchange_weak(prev_max, ns, std::memory_order_relaxed)) {
    }
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (RuntimeCounters::TICK_BUCKET_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_overflow.fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the bucket holding the 99th percentile sample. When that
// sample is past the last bucket the largest observed tick is returned.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99) / 100;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return rt.tick_max_ns.load(std::memory_order_relaxed);
}

inline uint64_t avg_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

// Gauges never go below zero even if a decrement races a reset in tests.
inline void gauge_dec(std::atomic<uint64_t> &g)
{
    uint64_t cur = g.load(std::memory_order_relaxed);
    while (cur > 0 && !g.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
    }
}

} // namespace pongd::metrics
