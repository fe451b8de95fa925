// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <chrono>

namespace pong {

void apply_yaml(const YAML::Node &root, ServerConfig &cfg)
{
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["auth_mode"])
        cfg.auth_mode = root["auth_mode"].as<std::string>();
    if (root["auth_stub_prefix"])
        cfg.auth_stub_prefix = root["auth_stub_prefix"].as<std::string>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["snapshot_interval_ticks"])
        cfg.snapshot_interval_ticks = root["snapshot_interval_ticks"].as<uint32_t>();
    if (root["win_score"])
        cfg.win_score = root["win_score"].as<uint32_t>();
    if (root["ready_timeout_seconds"])
        cfg.ready_timeout_seconds = root["ready_timeout_seconds"].as<uint32_t>();
    if (root["countdown_seconds"])
        cfg.countdown_seconds = root["countdown_seconds"].as<uint32_t>();
    if (root["disconnect_grace_seconds"])
        cfg.disconnect_grace_seconds = root["disconnect_grace_seconds"].as<uint32_t>();
    if (root["retention_seconds"])
        cfg.retention_seconds = root["retention_seconds"].as<uint32_t>();
    if (root["input_rate_limit_per_sec"])
        cfg.input_rate_limit_per_sec = root["input_rate_limit_per_sec"].as<uint32_t>();
    if (root["chat_history_limit"])
        cfg.chat_history_limit = root["chat_history_limit"].as<uint32_t>();
    if (root["chat_max_length"])
        cfg.chat_max_length = root["chat_max_length"].as<uint32_t>();
    if (root["chat_min_interval_ms"])
        cfg.chat_min_interval_ms = root["chat_min_interval_ms"].as<uint32_t>();
    if (root["heartbeat_timeout_seconds"])
        cfg.heartbeat_timeout_seconds = root["heartbeat_timeout_seconds"].as<uint32_t>();
    if (root["matchmaker_poll_ms"])
        cfg.matchmaker_poll_ms = root["matchmaker_poll_ms"].as<uint32_t>();
    if (root["fixed_seed"])
        cfg.fixed_seed = root["fixed_seed"].as<uint64_t>();
    if (root["settlement_mode"])
        cfg.settlement_mode = root["settlement_mode"].as<std::string>();
    if (root["stake_tiers"]) {
        const auto &tiers = root["stake_tiers"];
        if (!tiers.IsMap())
            throw YAML::TypedBadConversion<std::map<std::string, uint64_t>>(tiers.Mark());
        cfg.stake_tiers.clear();
        for (const auto &kv : tiers)
            cfg.stake_tiers[kv.first.as<std::string>()] = kv.second.as<uint64_t>();
    }
    if (root["winner_share_pct"])
        cfg.winner_share_pct = root["winner_share_pct"].as<uint32_t>();
    if (root["burn_share_pct"])
        cfg.burn_share_pct = root["burn_share_pct"].as<uint32_t>();
}

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    apply_yaml(root, cfg);
    return cfg;
}

pong::game::MatchConfig to_match_config(const ServerConfig &cfg)
{
    pong::game::MatchConfig mc;
    mc.tick_rate = cfg.tick_rate;
    mc.snapshot_interval_ticks = cfg.snapshot_interval_ticks;
    mc.win_score = static_cast<int>(cfg.win_score);
    mc.ready_timeout = std::chrono::seconds(cfg.ready_timeout_seconds);
    mc.countdown = std::chrono::seconds(cfg.countdown_seconds);
    mc.disconnect_grace = std::chrono::seconds(cfg.disconnect_grace_seconds);
    mc.retention = std::chrono::seconds(cfg.retention_seconds);
    mc.input_rate_limit_per_sec = cfg.input_rate_limit_per_sec;
    mc.chat_history_limit = cfg.chat_history_limit;
    mc.chat_max_length = cfg.chat_max_length;
    return mc;
}

} // namespace pong
