// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/game/game_state.hpp"
#include "server/net/broadcast_gateway.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace pongd::game {

// One isolated match: the authoritative GameState, its members and the tick
// loop. Every read and write of the state goes through m_mutex, including the
// tick itself, so a broadcast never observes a half-applied move.
//
// Lifecycle: Waiting (one paddle owned) -> Active (both owned, ticking) ->
// Waiting (an owner left) -> empty. The registry drops the room once
// remove_player() reports it empty.
class Room : public std::enable_shared_from_this<Room>
{
public:
    struct JoinOutcome
    {
        std::optional<Side> side; // empty for a spectator
        bool started{false}; // this join moved the room to Active
    };

    struct LeaveOutcome
    {
        bool was_member{false};
        std::optional<Side> vacated;
        bool stopped{false}; // Active -> Waiting
        bool empty{false};
    };

    // scheduler may be null; the room then never spawns a loop and ticks only
    // when tick() is called (tests).
    Room(
        std::string id,
        GameConfig cfg,
        pongd::net::BroadcastGateway &gateway,
        std::shared_ptr<coro::io_scheduler> scheduler,
        uint32_t seed);
    ~Room();

    Room(const Room &) = delete;
    Room &operator=(const Room &) = delete;

    const std::string &id() const { return m_id; }
    const GameConfig &config() const { return m_cfg; }

    JoinOutcome add_player(const std::string &connection_id);
    // Returns false when the connection owns no paddle here.
    bool move_paddle(const std::string &connection_id, Direction dir);
    LeaveOutcome remove_player(const std::string &connection_id);
    // Runs one tick if the room is Active. Returns false otherwise.
    bool tick();
    // Stops the loop without touching membership (process shutdown).
    void shutdown();

    GameState snapshot() const;
    size_t player_count() const;
    bool has_open_slot() const;
    bool ticking() const;

private:
    void start_loop_locked();
    void stop_loop_locked();
    void tick_locked();
    bool tick_if_current(uint64_t generation);

    static coro::task<void> run_loop(
        std::shared_ptr<coro::io_scheduler> scheduler,
        std::weak_ptr<Room> weak,
        uint64_t generation,
        std::chrono::nanoseconds interval);

    const std::string m_id;
    const GameConfig m_cfg;
    pongd::net::BroadcastGateway &m_gateway;
    std::shared_ptr<coro::io_scheduler> m_scheduler;

    mutable std::mutex m_mutex;
    std::mt19937 m_rng;
    GameState m_state;
    bool m_ticking{false};
    // Bumped on every start/stop; a loop only ticks while its generation is current.
    uint64_t m_generation{0};
};

} // namespace pongd::game
