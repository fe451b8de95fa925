// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/auth/auth_provider.hpp"
#include "server/config.hpp"
#include "server/game/match_store.hpp"
#include "server/game/settlement.hpp"
#include "server/game/timer_service.hpp"
#include "server/matchmaking/matchmaker.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "server/matchmaking/session_registry.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/net/presence.hpp"
#include "server/shutdown.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#ifndef PONG_VERSION
#    define PONG_VERSION "dev"
#endif

static void handle_signal(int)
{
    pong::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // first non-flag = config path
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                pong::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                pong::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    pong::ServerConfig cfg;
    try {
        cfg = pong::load_config(config_path);
    } catch (const YAML::Exception &ex) {
        pong::log::error("Failed to load config {}: {}", config_path, ex.what());
        pong::log::shutdown();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Config file logging settings apply unless the environment already sets them.
    if (!cfg.log_level.empty() && std::getenv("PONG_LOG_LEVEL") == nullptr)
        setenv("PONG_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json && std::getenv("PONG_LOG_JSON") == nullptr)
        setenv("PONG_LOG_JSON", "1", 1);
    pong::log::init();
    pong::log::info("pong server starting (version: {})", PONG_VERSION);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        pong::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        pong::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    pong::log::info("Tick rate: {} Hz, win score {}", cfg.tick_rate, cfg.win_score);
    pong::log::info("Auth mode: {}, settlement mode: {}", cfg.auth_mode, cfg.settlement_mode);

    auto scheduler = coro::default_executor::io_executor();

    pong::mm::SessionManager sessions{std::chrono::milliseconds(cfg.chat_min_interval_ms)};
    pong::mm::SessionRegistry registry;
    pong::net::Presence presence{sessions, registry};
    auto auth_provider = pong::auth::make_provider(cfg.auth_mode, cfg.auth_stub_prefix);

    pong::game::MatchDeps base;
    base.timers = std::make_shared<pong::game::CoroTimerService>(scheduler);
    base.sessions = &sessions;
    base.settlement = pong::game::make_settlement(cfg.settlement_mode, cfg.winner_share_pct, cfg.burn_share_pct);
    base.store = std::make_shared<pong::game::LogMatchStore>();

    pong::mm::MatchmakerConfig mm_cfg;
    mm_cfg.stake_tiers = cfg.stake_tiers;
    mm_cfg.poll_interval_ms = cfg.matchmaker_poll_ms;
    mm_cfg.fixed_seed = cfg.fixed_seed;
    mm_cfg.match = pong::to_match_config(cfg);
    auto matchmaker = std::make_shared<pong::mm::Matchmaker>(sessions, registry, mm_cfg, base);

    pong::net::ListenerDeps deps{&sessions, &presence, auth_provider.get(), matchmaker.get()};
    scheduler->spawn(pong::net::run_listener(scheduler, cfg.listen_port, cfg.tick_rate, deps));
    scheduler->spawn(pong::mm::run_matchmaker(scheduler, matchmaker));
    scheduler->spawn(pong::net::run_heartbeat_monitor(scheduler, cfg.heartbeat_timeout_seconds, deps));
    if (cfg.metrics_port != 0)
        scheduler->spawn(pong::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!pong::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                pong::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                pong::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            auto &rt = pong::metrics::runtime();
            uint64_t samples = rt.tick_samples.load();
            pong::log::info(
                "{\"metric\":\"runtime\",\"avg_tick_ns\":{},\"p99_tick_ns\":{},\"active_matches\":{},"
                "\"connected_players\":{},\"queue_depth\":{}}",
                samples ? rt.tick_duration_ns_accum.load() / samples : 0,
                pong::metrics::approx_tick_p99(),
                rt.active_matches.load(),
                rt.connected_players.load(),
                rt.queue_depth.load());
        }
    }
    pong::log::info("Signal or duration reached, shutting down...");
    // Matches still registered hold timers on the scheduler; stop them before it is torn down.
    for (auto &m : registry.snapshot())
        registry.remove(m->id());
    scheduler->shutdown();
    pong::log::info("Shutdown complete.");
    pong::log::shutdown();
    return 0;
}
