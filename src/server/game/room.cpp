// SPDX-License-Identifier: Apache-2.0
#include "server/game/room.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/messages.hpp"
#include "server/game/physics.hpp"

#include <algorithm>

namespace pongd::game {

Room::Room(
    std::string id,
    GameConfig cfg,
    pongd::net::BroadcastGateway &gateway,
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint32_t seed)
    : m_id(std::move(id)),
      m_cfg(cfg),
      m_gateway(gateway),
      m_scheduler(std::move(scheduler)),
      m_rng(seed),
      m_state(pongd::phys::make_initial_state(m_cfg, m_rng))
{}

Room::~Room()
{
    std::scoped_lock lk{m_mutex};
    stop_loop_locked();
}

Room::JoinOutcome Room::add_player(const std::string &connection_id)
{
    std::scoped_lock lk{m_mutex};
    JoinOutcome out;
    if (std::find(m_state.players.begin(), m_state.players.end(), connection_id) != m_state.players.end()) {
        out.side = m_state.side_of(connection_id);
        return out;
    }
    m_state.players.push_back(connection_id);
    if (!m_state.left.owner)
        out.side = Side::left;
    else if (!m_state.right.owner)
        out.side = Side::right;

    if (out.side) {
        m_state.paddle(*out.side).owner = connection_id;
        m_gateway.send_to(connection_id, make_paddle_assignment(*out.side));
    }
    if (!m_state.active && m_state.both_slots_owned()) {
        m_state.active = true;
        start_loop_locked();
        m_gateway.broadcast(m_state.players, make_game_start());
        pongd::metrics::runtime().matches_started.fetch_add(1, std::memory_order_relaxed);
        out.started = true;
    }
    m_gateway.send_to(connection_id, make_game_state(m_id, m_state));
    pongd::log::info(
        "[room] join id={} conn={} side={} players={} active={}",
        m_id,
        connection_id,
        out.side ? side_name(*out.side) : "spectator",
        m_state.players.size(),
        m_state.active);
    return out;
}

bool Room::move_paddle(const std::string &connection_id, Direction dir)
{
    std::scoped_lock lk{m_mutex};
    auto side = m_state.side_of(connection_id);
    if (!side) {
        pongd::log::debug("[room] move ignored id={} conn={} (no paddle)", m_id, connection_id);
        return false;
    }
    auto &paddle = m_state.paddle(*side);
    paddle.y = pongd::phys::move_paddle(paddle.y, dir, m_cfg);
    m_gateway.broadcast(m_state.players, make_paddle_update(*side, paddle.y));
    pongd::metrics::runtime().paddle_moves.fetch_add(1, std::memory_order_relaxed);
    return true;
}

Room::LeaveOutcome Room::remove_player(const std::string &connection_id)
{
    std::scoped_lock lk{m_mutex};
    LeaveOutcome out;
    auto it = std::find(m_state.players.begin(), m_state.players.end(), connection_id);
    if (it == m_state.players.end())
        return out;
    out.was_member = true;
    m_state.players.erase(it);
    out.vacated = m_state.side_of(connection_id);
    if (out.vacated)
        m_state.paddle(*out.vacated).owner.reset();

    if (m_state.players.empty()) {
        stop_loop_locked();
        m_state.active = false;
        out.empty = true;
    } else if (m_state.active && !m_state.both_slots_owned()) {
        stop_loop_locked();
        m_state.active = false;
        m_gateway.broadcast(m_state.players, make_player_disconnected());
        out.stopped = true;
    }
    pongd::log::info(
        "[room] leave id={} conn={} vacated={} players={} stopped={}",
        m_id,
        connection_id,
        out.vacated ? side_name(*out.vacated) : "none",
        m_state.players.size(),
        out.stopped);
    return out;
}

bool Room::tick()
{
    std::scoped_lock lk{m_mutex};
    if (!m_ticking)
        return false;
    tick_locked();
    return true;
}

void Room::shutdown()
{
    std::scoped_lock lk{m_mutex};
    stop_loop_locked();
}

GameState Room::snapshot() const
{
    std::scoped_lock lk{m_mutex};
    return m_state;
}

size_t Room::player_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_state.players.size();
}

bool Room::has_open_slot() const
{
    std::scoped_lock lk{m_mutex};
    return !m_state.both_slots_owned();
}

bool Room::ticking() const
{
    std::scoped_lock lk{m_mutex};
    return m_ticking;
}

void Room::start_loop_locked()
{
    if (m_ticking)
        return;
    m_ticking = true;
    ++m_generation;
    pongd::metrics::runtime().ticking_rooms.fetch_add(1, std::memory_order_relaxed);
    if (!m_scheduler)
        return;
    uint32_t rate = m_cfg.tick_rate > 0 ? m_cfg.tick_rate : 60;
    // Nanosecond interval avoids millisecond truncation (16.666ms at 60Hz).
    auto interval = std::chrono::nanoseconds((1'000'000'000ull + rate / 2) / rate);
    m_scheduler->spawn(run_loop(m_scheduler, weak_from_this(), m_generation, interval));
    pongd::log::debug("[room] loop start id={} gen={} rate={}Hz", m_id, m_generation, rate);
}

void Room::stop_loop_locked()
{
    if (!m_ticking)
        return;
    m_ticking = false;
    ++m_generation;
    pongd::metrics::gauge_dec(pongd::metrics::runtime().ticking_rooms);
    pongd::log::debug("[room] loop stop id={} tick={}", m_id, m_state.server_tick);
}

void Room::tick_locked()
{
    auto started = std::chrono::steady_clock::now();
    ++m_state.server_tick;
    auto outcome = pongd::phys::advance(m_state, m_cfg, m_rng);
    if (outcome != pongd::phys::StepOutcome::none) {
        pongd::metrics::runtime().goals_scored.fetch_add(1, std::memory_order_relaxed);
        pongd::log::info(
            "[room] goal id={} scorer={} score={}:{}",
            m_id,
            outcome == pongd::phys::StepOutcome::left_scored ? "left" : "right",
            m_state.score_left,
            m_state.score_right);
    }
    m_gateway.broadcast(m_state.players, make_game_state(m_id, m_state));
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started);
    pongd::metrics::add_tick_duration(static_cast<uint64_t>(ns.count()));
    PONGD_LOG_EVERY_N(debug, 600, "[room] tick id={} tick={} tick_ns={}", m_id, m_state.server_tick, ns.count());
}

bool Room::tick_if_current(uint64_t generation)
{
    std::scoped_lock lk{m_mutex};
    if (!m_ticking || generation != m_generation)
        return false;
    tick_locked();
    return true;
}

coro::task<void> Room::run_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::weak_ptr<Room> weak,
    uint64_t generation,
    std::chrono::nanoseconds interval)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    auto next = clock::now() + interval;
    while (true) {
        auto now = clock::now();
        if (now < next) {
            co_await scheduler->yield_for(std::chrono::duration_cast<std::chrono::nanoseconds>(next - now));
            continue;
        }
        next += interval;
        // After a long stall skip the missed ticks instead of bursting them.
        if (now - next > interval * 4)
            next = now + interval;
        auto room = weak.lock();
        if (!room || !room->tick_if_current(generation))
            co_return;
    }
}

} // namespace pongd::game
