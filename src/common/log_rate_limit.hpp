// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Emits every Nth invocation of the call site. The counter is shared by every
// room that runs through the same line, so N is a process-wide rate.
// Usage: PONGD_LOG_EVERY_N(debug, 600, "[room] tick id={}", id);
#define PONGD_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> pongd_log_every_n_counter{0}; \
        if ((pongd_log_every_n_counter.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            pongd::log::lvl(__VA_ARGS__); \
        } \
    } while (0)
