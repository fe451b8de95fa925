// SPDX-License-Identifier: Apache-2.0
// match_store.hpp - Write-only match record sink (status transitions, final score, payout reference).
#pragma once
#include <cstdint>
#include <string>

namespace pong::game {

namespace record_status {
inline constexpr const char *in_progress = "in-progress";
inline constexpr const char *completed = "completed";
inline constexpr const char *cancelled = "cancelled";
inline constexpr const char *settled = "settled";
inline constexpr const char *settlement_failed = "settlement-failed";
} // namespace record_status

struct MatchRecord
{
    std::string match_id;
    std::string status;
    std::string tier;
    uint64_t total_stake{0};
    int score_p1{0};
    int score_p2{0};
    std::string winner_id; // empty until decided
    std::string loser_id;
    std::string reason;
    std::string payout_reference;
};

class IMatchStore
{
public:
    virtual ~IMatchStore() = default;
    virtual void record(const MatchRecord &rec) = 0;
};

// Emits each record as one structured log line.
class LogMatchStore : public IMatchStore
{
public:
    void record(const MatchRecord &rec) override;
};

} // namespace pong::game
