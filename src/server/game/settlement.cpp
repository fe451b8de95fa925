// SPDX-License-Identifier: Apache-2.0
#include "server/game/settlement.hpp"

#include "common/logger.hpp"

namespace pong::game {

namespace {
class DisabledSettlement : public ISettlement
{
public:
    SettlementResult settle(const std::string &, const std::string &, uint64_t) override
    {
        SettlementResult r;
        r.ok = false;
        r.reason = "settlement disabled";
        return r;
    }
};
} // namespace

PayoutSplit compute_split(uint64_t total_stake, uint32_t winner_share_pct, uint32_t burn_share_pct)
{
    PayoutSplit s;
    s.winner_share = total_stake / 100 * winner_share_pct + (total_stake % 100) * winner_share_pct / 100;
    s.burned_share = total_stake / 100 * burn_share_pct + (total_stake % 100) * burn_share_pct / 100;
    return s;
}

SettlementResult StubSettlement::settle(const std::string &winner_id, const std::string &loser_id, uint64_t total_stake)
{
    auto split = compute_split(total_stake, m_winner_pct, m_burn_pct);
    SettlementResult r;
    r.ok = true;
    r.winner_share = split.winner_share;
    r.burned_share = split.burned_share;
    r.payout_reference = "stub-payout-" + std::to_string(m_counter.fetch_add(1, std::memory_order_relaxed) + 1);
    pong::log::info(
        "[settle] winner={} loser={} total={} winner_share={} burned={} ref={}",
        winner_id,
        loser_id,
        total_stake,
        r.winner_share,
        r.burned_share,
        r.payout_reference);
    return r;
}

std::unique_ptr<ISettlement> make_settlement(const std::string &mode, uint32_t winner_share_pct, uint32_t burn_share_pct)
{
    if (mode == "stub")
        return std::make_unique<StubSettlement>(winner_share_pct, burn_share_pct);
    if (mode != "disabled")
        pong::log::warn("[settle] unknown settlement_mode '{}', settlement disabled", mode);
    return std::make_unique<DisabledSettlement>();
}

} // namespace pong::game
