// SPDX-License-Identifier: Apache-2.0
// Headless client: joins a room, wiggles its paddle and logs what the server sends.
#include "client/frame_client.hpp"
#include "common/logger.hpp"
#include "server/config.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdlib>
#include <string>

using namespace std::chrono_literals;

static const char *side_label(pongd::Side s)
{
    return s == pongd::SIDE_LEFT ? "left" : s == pongd::SIDE_RIGHT ? "right" : "none";
}

static uint64_t wall_ms()
{
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
}

static coro::task<int> probe_flow(
    std::shared_ptr<coro::io_scheduler> scheduler, std::string host, uint16_t port, uint32_t active_secs)
{
    co_await scheduler->schedule();
    coro::net::tcp::client sock{scheduler, {.address = coro::net::ip_address::from_string(host), .port = port}};
    auto cstatus = co_await sock.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        pongd::log::error("connect to {}:{} failed", host, port);
        co_return 1;
    }
    pongd::client::FrameClient cli{std::move(sock)};
    pongd::log::info("connected to {}:{}", host, port);
    if (!co_await cli.send(pongd::client::make_join())) {
        pongd::log::error("failed to send join");
        co_return 1;
    }

    auto start = std::chrono::steady_clock::now();
    auto next_move = start;
    auto next_hb = start;
    bool up = true;
    uint32_t moves = 0;
    uint32_t last_left = 0, last_right = 0;
    uint64_t states = 0;
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(active_secs)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_hb) {
            if (!co_await cli.send(pongd::client::make_heartbeat(wall_ms()))) {
                pongd::log::error("heartbeat send failed");
                co_return 1;
            }
            next_hb = now + 2s;
        }
        if (now >= next_move) {
            if (!co_await cli.send(pongd::client::make_move(up ? pongd::DIRECTION_UP : pongd::DIRECTION_DOWN))) {
                pongd::log::error("move send failed");
                co_return 1;
            }
            if (++moves % 20 == 0)
                up = !up;
            next_move = now + 50ms;
        }
        pongd::ServerMessage sm;
        if (!co_await cli.read(sm, 20ms)) {
            if (cli.closed()) {
                pongd::log::warn("server closed the connection");
                co_return 1;
            }
            continue;
        }
        switch (sm.payload_case()) {
            case pongd::ServerMessage::kPaddleAssignment:
                pongd::log::info("assigned paddle={}", side_label(sm.paddle_assignment().side()));
                break;
            case pongd::ServerMessage::kGameStart:
                pongd::log::info("game started");
                break;
            case pongd::ServerMessage::kPlayerDisconnected:
                pongd::log::info("opponent left; waiting");
                break;
            case pongd::ServerMessage::kPaddleUpdate:
                pongd::log::debug(
                    "paddle {} y={}", side_label(sm.paddle_update().side()), sm.paddle_update().y());
                break;
            case pongd::ServerMessage::kHeartbeatResponse:
                pongd::log::debug("heartbeat rtt~{}ms", sm.heartbeat_response().delta_ms());
                break;
            case pongd::ServerMessage::kGameState: {
                const auto &gs = sm.game_state();
                ++states;
                if (gs.score().left() != last_left || gs.score().right() != last_right) {
                    last_left = gs.score().left();
                    last_right = gs.score().right();
                    pongd::log::info("score {}:{} tick={}", last_left, last_right, gs.server_tick());
                }
                break;
            }
            default:
                break;
        }
    }
    pongd::log::info("probe done states={} moves={}", states, moves);
    co_return 0;
}

int main(int argc, char **argv)
{
    std::string host = "127.0.0.1";
    uint16_t port = 40101;
    uint32_t active_secs = 20;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if (a == "--host" && i + 1 < argc)
                host = argv[++i];
            else if (a == "--seconds" && i + 1 < argc)
                active_secs = static_cast<uint32_t>(std::stoul(argv[++i]));
            else if (!a.empty() && a[0] != '-') {
                auto p = pongd::parse_port(a);
                if (!p) {
                    pongd::log::error("invalid port '{}' (expected 1..65535)", a);
                    return 2;
                }
                port = *p;
            }
        } catch (const std::exception &) {
            pongd::log::error("invalid argument '{}'", argv[i]);
            return 2;
        }
    }
    pongd::log::init();
    auto scheduler = coro::default_executor::io_executor();
    int rc = coro::sync_wait(probe_flow(scheduler, host, port, active_secs));
    pongd::log::shutdown();
    return rc;
}
