// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/lobby/room_registry.hpp"
#include "server/lobby/session_coordinator.hpp"
#include "server/net/broadcast_gateway.hpp"
#include "server/net/connection_manager.hpp"
#include "server/net/heartbeat.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#ifndef PONGD_VERSION
#    define PONGD_VERSION "dev"
#endif

namespace {

std::atomic_bool g_shutdown{false};

void handle_signal(int)
{
    g_shutdown.store(true);
}

std::string runtime_summary(const char *metric)
{
    auto &rt = pongd::metrics::runtime();
    std::ostringstream j;
    j << "{\"metric\":\"" << metric << "\"";
    j << ",\"avg_tick_ns\":" << pongd::metrics::avg_tick_ns();
    j << ",\"p99_tick_ns\":" << pongd::metrics::approx_tick_p99();
    j << ",\"max_tick_ns\":" << rt.tick_max_ns.load();
    j << ",\"ticks\":" << rt.tick_samples.load();
    j << ",\"active_rooms\":" << rt.active_rooms.load();
    j << ",\"ticking_rooms\":" << rt.ticking_rooms.load();
    j << ",\"connected_players\":" << rt.connected_players.load();
    j << ",\"matches_started\":" << rt.matches_started.load();
    j << ",\"goals_scored\":" << rt.goals_scored.load();
    j << ",\"messages_delivered\":" << rt.messages_delivered.load();
    j << ",\"messages_dropped_backlog\":" << rt.messages_dropped_backlog.load();
    j << "}";
    return j.str();
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            if (auto p = pongd::parse_port(argv[++i])) {
                port_override = *p;
                cli_port_override = true;
            } else {
                pongd::log::warn("Invalid --port value '{}' (expected 1..65535), ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                pongd::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    pongd::ServerConfig cfg;
    try {
        cfg = pongd::load_config(config_path);
    } catch (const YAML::Exception &ex) {
        pongd::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    } catch (const std::invalid_argument &ex) {
        pongd::log::error("Invalid config '{}': {}", config_path, ex.what());
        return 1;
    }
    if (cli_port_override)
        cfg.listen_port = port_override;

    // An explicit PONGD_LOG_LEVEL in the environment wins over the file.
    if (!cfg.log_level.empty() && std::getenv("PONGD_LOG_LEVEL") == nullptr)
        setenv("PONGD_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("PONGD_LOG_JSON", "1", 1);
    pongd::log::init();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    pongd::log::info("pongd starting (version: {})", PONGD_VERSION);
    pongd::log::info(
        "Board {}x{} paddle {}x{} ball {} speed {} step {} tick {}Hz",
        cfg.game.board_width,
        cfg.game.board_height,
        cfg.game.paddle_width,
        cfg.game.paddle_height,
        cfg.game.ball_size,
        cfg.game.ball_speed,
        cfg.game.paddle_step,
        cfg.game.tick_rate);
    pongd::log::info(
        "Room policy: {} (default room '{}')", pongd::lobby::room_policy_name(cfg.room_policy), cfg.default_room);
    if (duration_override_sec > 0)
        pongd::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    auto scheduler = coro::default_executor::io_executor();
    pongd::net::ConnectionManager connections{cfg.max_outbound_queue};
    pongd::net::ConnectionGateway gateway{connections};
    pongd::lobby::RoomRegistry registry{cfg.game, gateway, scheduler, cfg.fixed_seed};
    pongd::lobby::SessionCoordinator coordinator{
        registry, pongd::lobby::CoordinatorConfig{cfg.room_policy, cfg.default_room}};

    scheduler->spawn(
        pongd::net::run_listener(scheduler, cfg.listen_port, cfg.game.tick_rate, connections, coordinator));
    if (cfg.heartbeat_timeout_seconds > 0) {
        scheduler->spawn(pongd::net::run_heartbeat_monitor(
            scheduler, connections, coordinator, std::chrono::seconds(cfg.heartbeat_timeout_seconds), g_shutdown));
    }
    if (cfg.metrics_port != 0)
        scheduler->spawn(pongd::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_summary = run_start;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0 && now - run_start >= std::chrono::seconds(duration_override_sec)) {
            pongd::log::info("Duration reached ({}s); initiating shutdown", duration_override_sec);
            g_shutdown.store(true);
        }
        if (now - last_summary >= std::chrono::seconds(60)) {
            last_summary = now;
            pongd::log::info("{}", runtime_summary("runtime"));
        }
    }
    pongd::log::info("Signal or deadline received, shutting down...");
    registry.shutdown();
    pongd::log::info("{}", runtime_summary("runtime_final"));
    pongd::log::info("Shutdown complete.");
    pongd::log::shutdown();
    // Listener and connection coroutines still reference the registries above;
    // leave without unwinding them.
    std::quick_exit(0);
}
