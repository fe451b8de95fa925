// SPDX-License-Identifier: Apache-2.0
// settlement.hpp
// Stake payout collaborator invoked once per finished match. Implementations may fail; the
// match outcome is final regardless of the result.
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace pong::game {

struct SettlementResult
{
    bool ok{false};
    std::string payout_reference; // filled when ok
    uint64_t winner_share{0};
    uint64_t burned_share{0};
    std::string reason; // error reason when !ok
};

class ISettlement
{
public:
    virtual ~ISettlement() = default;
    virtual SettlementResult settle(const std::string &winner_id, const std::string &loser_id, uint64_t total_stake)
        = 0;
};

struct PayoutSplit
{
    uint64_t winner_share{0};
    uint64_t burned_share{0};
};

// floor(total * pct / 100) for each share.
PayoutSplit compute_split(uint64_t total_stake, uint32_t winner_share_pct, uint32_t burn_share_pct);

// Computes the split and hands out sequential references "stub-payout-<n>".
class StubSettlement : public ISettlement
{
public:
    StubSettlement(uint32_t winner_share_pct, uint32_t burn_share_pct)
        : m_winner_pct(winner_share_pct), m_burn_pct(burn_share_pct)
    {}

    SettlementResult settle(const std::string &winner_id, const std::string &loser_id, uint64_t total_stake) override;

private:
    uint32_t m_winner_pct;
    uint32_t m_burn_pct;
    std::atomic<uint64_t> m_counter{0};
};

// Factory by mode string ("stub", "disabled"). Unknown modes fall back to disabled.
std::unique_ptr<ISettlement> make_settlement(const std::string &mode, uint32_t winner_share_pct, uint32_t burn_share_pct);

} // namespace pong::game
