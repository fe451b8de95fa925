// SPDX-License-Identifier: Apache-2.0
// config.hpp - Server configuration (YAML file + CLI overrides).
#pragma once

#include "server/game/match_session.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <map>
#include <string>

namespace pong {

struct ServerConfig
{
    uint16_t listen_port{40100};
    uint16_t metrics_port{0}; // 0 disables
    std::string log_level{"info"};
    bool log_json{false};
    std::string auth_mode{"stub"};
    std::string auth_stub_prefix{};
    uint32_t tick_rate{60};
    uint32_t snapshot_interval_ticks{1};
    uint32_t win_score{5};
    uint32_t ready_timeout_seconds{30};
    uint32_t countdown_seconds{3};
    uint32_t disconnect_grace_seconds{15};
    uint32_t retention_seconds{30};
    uint32_t input_rate_limit_per_sec{20};
    uint32_t chat_history_limit{50};
    uint32_t chat_max_length{100};
    uint32_t chat_min_interval_ms{1000};
    uint32_t heartbeat_timeout_seconds{15};
    uint32_t matchmaker_poll_ms{100};
    uint64_t fixed_seed{0}; // 0 = seed from std::random_device
    std::string settlement_mode{"stub"};
    // Stake per player by tier, in the smallest currency unit.
    std::map<std::string, uint64_t> stake_tiers{
        {"low", 10'000'000'000ull},
        {"medium", 50'000'000'000ull},
        {"high", 200'000'000'000ull}};
    uint32_t winner_share_pct{90};
    uint32_t burn_share_pct{5};
};

// Overlays keys present in `root` onto `cfg`. Throws YAML::Exception on type errors.
void apply_yaml(const YAML::Node &root, ServerConfig &cfg);
// Throws YAML::Exception (BadFile, ParserException, ...) on failure.
ServerConfig load_config(const std::string &path);

pong::game::MatchConfig to_match_config(const ServerConfig &cfg);

} // namespace pong
