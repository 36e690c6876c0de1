// SPDX-License-Identifier: Apache-2.0
// frame_client.hpp - Client side of the framed protobuf channel (probe tool, e2e tests).
#pragma once
#include "common/framing.hpp"
#include "pongd.pb.h"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <deque>
#include <span>
#include <string>

namespace pongd::client {

class FrameClient
{
public:
    explicit FrameClient(coro::net::tcp::client client)
        : m_client(std::move(client))
    {}

    coro::net::tcp::client &socket() { return m_client; }

    coro::task<bool> send(const pongd::ClientMessage &msg)
    {
        std::string payload;
        if (!msg.SerializeToString(&payload))
            co_return false;
        auto frame = pongd::netutil::build_frame(payload);
        std::span<const char> rest(frame.data(), frame.size());
        while (!rest.empty()) {
            co_await m_client.poll(coro::poll_op::write);
            auto [st, remaining] = m_client.send(rest);
            if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
                co_return false;
            rest = remaining;
        }
        co_return true;
    }

    // Waits up to timeout for the next server message. False on timeout,
    // closed channel or a corrupt stream (see closed()).
    coro::task<bool> read(pongd::ServerMessage &out, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (m_ready.empty()) {
            if (m_closed)
                co_return false;
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                co_return false;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            auto pstat = co_await m_client.poll(coro::poll_op::read, left);
            if (pstat == coro::poll_status::timeout)
                co_return false;
            if (pstat != coro::poll_status::event) {
                m_closed = true;
                co_return false;
            }
            std::string chunk(4096, '\0');
            auto [rs, span] = m_client.recv(chunk);
            if (rs == coro::net::recv_status::would_block)
                continue;
            if (rs != coro::net::recv_status::ok) {
                m_closed = true;
                co_return false;
            }
            m_fps.feed(span.data(), span.size());
            std::string payload;
            for (;;) {
                auto st = pongd::netutil::try_extract(m_fps, payload);
                if (st == pongd::netutil::extract_status::need_more)
                    break;
                if (st == pongd::netutil::extract_status::invalid) {
                    m_closed = true;
                    break;
                }
                pongd::ServerMessage sm;
                if (sm.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
                    m_ready.push_back(std::move(sm));
            }
        }
        out = std::move(m_ready.front());
        m_ready.pop_front();
        co_return true;
    }

    bool closed() const { return m_closed; }

private:
    coro::net::tcp::client m_client;
    pongd::netutil::FrameParseState m_fps;
    std::deque<pongd::ServerMessage> m_ready;
    bool m_closed{false};
};

inline pongd::ClientMessage make_join()
{
    pongd::ClientMessage m;
    m.mutable_join();
    return m;
}

inline pongd::ClientMessage make_move(pongd::Direction dir)
{
    pongd::ClientMessage m;
    m.mutable_move_paddle()->set_direction(dir);
    return m;
}

inline pongd::ClientMessage make_heartbeat(uint64_t time_ms)
{
    pongd::ClientMessage m;
    m.mutable_heartbeat()->set_time_ms(time_ms);
    return m;
}

} // namespace pongd::client
