// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_store.hpp"

#include "common/logger.hpp"

namespace pong::game {

void LogMatchStore::record(const MatchRecord &rec)
{
    pong::log::info(
        "[store] match={} status={} tier={} stake={} score={}-{} winner={} loser={} reason='{}' payout={}",
        rec.match_id,
        rec.status,
        rec.tier,
        rec.total_stake,
        rec.score_p1,
        rec.score_p2,
        rec.winner_id.empty() ? "-" : rec.winner_id,
        rec.loser_id.empty() ? "-" : rec.loser_id,
        rec.reason,
        rec.payout_reference.empty() ? "-" : rec.payout_reference);
}

} // namespace pong::game
