// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string_view>

namespace pongd::net {

static void emit(std::ostringstream &oss, const char *name, const char *type, uint64_t value)
{
    oss << "# TYPE pongd_" << name << ' ' << type << '\n';
    oss << "pongd_" << name << ' ' << value << '\n';
}

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = pongd::metrics::runtime();
    emit(oss, "active_rooms", "gauge", rt.active_rooms.load());
    emit(oss, "ticking_rooms", "gauge", rt.ticking_rooms.load());
    emit(oss, "connected_players", "gauge", rt.connected_players.load());
    emit(oss, "rooms_created_total", "counter", rt.rooms_created.load());
    emit(oss, "rooms_destroyed_total", "counter", rt.rooms_destroyed.load());
    emit(oss, "matches_started_total", "counter", rt.matches_started.load());
    emit(oss, "goals_scored_total", "counter", rt.goals_scored.load());
    emit(oss, "paddle_moves_total", "counter", rt.paddle_moves.load());
    emit(oss, "messages_delivered_total", "counter", rt.messages_delivered.load());
    emit(oss, "messages_undeliverable_total", "counter", rt.messages_undeliverable.load());
    emit(oss, "messages_dropped_backlog_total", "counter", rt.messages_dropped_backlog.load());
    emit(oss, "malformed_frames_total", "counter", rt.malformed_frames.load());
    emit(oss, "p99_tick_ns", "gauge", pongd::metrics::approx_tick_p99());
    emit(oss, "max_tick_ns", "gauge", rt.tick_max_ns.load());
    // Cumulative histogram over the power-of-two tick buckets.
    oss << "# TYPE pongd_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < pongd::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        oss << "pongd_tick_duration_ns_bucket{le=\"" << (pongd::metrics::RuntimeCounters::TICK_BUCKET_BASE_NS << i)
            << "\"} " << cumulative << '\n';
    }
    cumulative += rt.tick_overflow.load();
    oss << "pongd_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << '\n';
    oss << "pongd_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << '\n';
    oss << "pongd_tick_duration_ns_count " << rt.tick_samples.load() << '\n';
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    bool found = req.rfind("GET /metrics", 0) == 0;
    std::string body = found ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (found ? "200 OK" : "404 Not Found") << "\r\n"
         << "Content-Type: text/plain; version=0.0.4\r\n"
         << "Content-Length: " << body.size() << "\r\n"
         << "Connection: close\r\n\r\n"
         << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            break;
        out = rest;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    pongd::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            pongd::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace pongd::net
