// SPDX-License-Identifier: Apache-2.0
// Tick loop on a real scheduler: runs while Active, emits nothing after stop,
// and rooms loop independently.
#include "recording_gateway.hpp"
#include "server/game/room.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;
using PC = pongd::ServerMessage::PayloadCase;

static bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds limit)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

int main()
{
    auto scheduler = coro::default_executor::io_executor();
    pongd::game::GameConfig cfg;
    cfg.tick_rate = 100;
    pongd::test::RecordingGateway gw;

    auto r1 = std::make_shared<pongd::game::Room>("r1", cfg, gw, scheduler, 11u);
    auto r2 = std::make_shared<pongd::game::Room>("r2", cfg, gw, scheduler, 12u);
    r1->add_player("a1");
    r1->add_player("b1");
    r2->add_player("a2");
    r2->add_player("b2");

    // Both rooms advance on their own.
    assert(wait_until([&] { return r1->snapshot().server_tick >= 10 && r2->snapshot().server_tick >= 10; }, 3000ms));
    assert(gw.count("a1", PC::kGameState) >= 10);
    assert(gw.count("b2", PC::kGameState) >= 10);

    // Stop r1 through the Active -> Waiting transition; r2 keeps going.
    auto out = r1->remove_player("a1");
    assert(out.stopped);
    auto stopped_at = r1->snapshot().server_tick;
    auto states_after_stop = gw.count("b1", PC::kGameState);
    auto r2_before = r2->snapshot().server_tick;
    std::this_thread::sleep_for(200ms);
    assert(r1->snapshot().server_tick == stopped_at);
    assert(gw.count("b1", PC::kGameState) == states_after_stop);
    assert(r2->snapshot().server_tick > r2_before);

    // Restart: a new generation of the loop picks up where the state left off.
    auto again = r1->add_player("c1");
    assert(again.started);
    assert(wait_until([&] { return r1->snapshot().server_tick > stopped_at + 5; }, 3000ms));

    // Dropping the last reference ends the loop without a tick on a dead room.
    r2->shutdown();
    assert(!r2->ticking());
    r2.reset();
    r1->shutdown();
    auto final_tick = r1->snapshot().server_tick;
    std::this_thread::sleep_for(100ms);
    assert(r1->snapshot().server_tick == final_tick);

    std::cout << "unit_room_loop OK" << std::endl;
    return 0;
}
