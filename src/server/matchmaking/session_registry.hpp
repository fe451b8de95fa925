// SPDX-License-Identifier: Apache-2.0
// session_registry.hpp - Live matches by id, with a player -> match index for reconnect routing.
#pragma once

#include "server/game/match_session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pong::mm {

class SessionRegistry
{
public:
    // False when the id is already taken.
    bool insert(std::shared_ptr<pong::game::MatchSession> session);
    std::shared_ptr<pong::game::MatchSession> find(const std::string &match_id) const;
    std::shared_ptr<pong::game::MatchSession> find_by_player(const std::string &player_id) const;
    bool remove(const std::string &match_id);
    size_t size() const;
    std::vector<std::shared_ptr<pong::game::MatchSession>> snapshot() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<pong::game::MatchSession>> m_by_id;
    std::unordered_map<std::string, std::string> m_match_of_player;
};

} // namespace pong::mm
