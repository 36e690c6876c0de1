// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "pongd.pb.h"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <span>
#include <string>

namespace pongd::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Connection> conn,
    std::chrono::milliseconds poll_timeout,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    uint32_t tick_rate,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator)
{
    co_await scheduler->schedule();
    auto rate = std::max<uint32_t>(tick_rate, 1);
    auto poll_timeout = std::chrono::milliseconds(std::max<uint32_t>(1, 500 / rate));
    pongd::log::info("[listener] listening port={} poll_timeout={}ms", port, poll_timeout.count());
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto conn = connections.add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, conn, poll_timeout, connections, coordinator));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            pongd::log::error("[listener] poll error/closed, exiting accept loop");
            co_return;
        }
    }
}

// False when the peer is gone or the socket errored.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static std::string encode_batch(const std::vector<pongd::ServerMessage> &pending)
{
    std::string batch;
    batch.reserve(pending.size() * 96);
    std::string payload;
    for (auto &msg : pending) {
        payload.clear();
        if (!msg.SerializeToString(&payload)) {
            pongd::log::warn("[conn] failed to serialize outbound message case={}", static_cast<int>(msg.payload_case()));
            continue;
        }
        pongd::netutil::append_frame(batch, payload);
    }
    return batch;
}

static void answer_heartbeat(ConnectionManager &connections, const std::shared_ptr<Connection> &conn, const pongd::Heartbeat &hb)
{
    auto now_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
    pongd::ServerMessage msg;
    auto *r = msg.mutable_heartbeat_response();
    r->set_connection_id(conn->connection_id);
    r->set_client_time_ms(hb.time_ms());
    r->set_server_time_ms(now_ms);
    r->set_delta_ms(now_ms > hb.time_ms() ? now_ms - hb.time_ms() : 0);
    connections.push_message(conn, msg);
}

void handle_inbound(
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    const std::shared_ptr<Connection> &conn,
    const pongd::ClientMessage &msg)
{
    connections.update_heartbeat(conn);
    if (msg.has_heartbeat())
        answer_heartbeat(connections, conn, msg.heartbeat());
    else
        coordinator.handle(conn->connection_id, msg);
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Connection> conn,
    std::chrono::milliseconds poll_timeout,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator)
{
    co_await scheduler->schedule();
    const std::string cid = conn->connection_id;
    pongd::log::info("[conn] open id={}", cid);
    pongd::netutil::FrameParseState fps;
    std::string chunk(4096, '\0');
    const char *reason = "closed";
    while (true) {
        if (connections.is_closed(conn)) {
            reason = "reaped";
            break;
        }
        auto pending = connections.drain_messages(conn);
        if (!pending.empty()) {
            auto batch = encode_batch(pending);
            if (!batch.empty() && !co_await send_all(*conn->client, std::span<const char>(batch.data(), batch.size()))) {
                reason = "send failed";
                break;
            }
        }
        auto pstat = co_await conn->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            reason = "poll closed";
            break;
        }
        auto [rstatus, span] = conn->client->recv(chunk);
        if (rstatus == coro::net::recv_status::closed) {
            reason = "closed by peer";
            break;
        }
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            reason = "recv error";
            break;
        }
        fps.feed(span.data(), span.size());
        std::string payload;
        bool drop = false;
        for (;;) {
            auto st = pongd::netutil::try_extract(fps, payload);
            if (st == pongd::netutil::extract_status::need_more)
                break;
            if (st == pongd::netutil::extract_status::invalid) {
                reason = "invalid frame length";
                drop = true;
                break;
            }
            pongd::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                reason = "undecodable payload";
                drop = true;
                break;
            }
            handle_inbound(connections, coordinator, conn, cmsg);
        }
        if (drop) {
            pongd::metrics::runtime().malformed_frames.fetch_add(1, std::memory_order_relaxed);
            break;
        }
    }
    // Channel closed: the room sees an explicit disconnect.
    coordinator.disconnect(cid);
    connections.remove(conn);
    pongd::log::info("[conn] close id={} reason={}", cid, reason);
    co_return;
}

} // namespace pongd::net
