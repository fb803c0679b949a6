// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <nuvo/core/int.hpp>
#include <nuvo/core/result.hpp>
#include <nuvo/staking/config.hpp>
#include <nuvo/staking/deposit_ledger.hpp>
#include <nuvo/staking/skill_registry.hpp>
#include <nuvo/staking/tier_registry.hpp>

#include <cstdint>
#include <span>

NUVO_STAKING_NAMESPACE_BEGIN

// base * (10000 + boost_bps) / 10000, truncated
Result<uint256_t> apply_boost(uint256_t const &base, uint64_t boost_bps);

// Pure reward arithmetic over a user's deposits and skills. Every
// calculation is a function of its arguments and the registries only.
//
// A deposit accrues from max(deposit.timestamp, last_claim_time) until
// now at the tier rate in force over each part of that interval:
//
//   reward = amount * sum(rate_bps * seconds) / (10000 * SECONDS_PER_YEAR)
//
// truncated once per deposit.
class RewardCalculator
{
    TierRegistry const &tiers_;
    SkillRegistry const &skills_;

public:
    RewardCalculator(TierRegistry const &, SkillRegistry const &);

    Result<uint256_t> deposit_reward(
        Deposit const &, uint64_t last_claim_time, uint64_t now) const;

    Result<uint256_t> calculate_rewards(
        std::span<Deposit const>, uint64_t last_claim_time,
        uint64_t now) const;

    Result<uint256_t> calculate_boosted_rewards(
        std::span<Deposit const>, std::span<ActiveSkill const>,
        uint64_t last_claim_time, uint64_t now) const;

    Result<uint256_t> calculate_boosted_rewards_with_rarity_multiplier(
        std::span<Deposit const>, std::span<ActiveSkill const>,
        uint64_t last_claim_time, uint64_t now) const;

    // Modifier sums, each additive over the matching skills then clamped
    static uint64_t reward_boost_bps(std::span<ActiveSkill const>);
    uint64_t rarity_reward_boost_bps(std::span<ActiveSkill const>) const;
    static uint64_t fee_discount_bps(std::span<ActiveSkill const>);
    static uint64_t lock_reduction_bps(std::span<ActiveSkill const>);

    static uint64_t
    reduced_lock_time(uint64_t lockup_duration, uint64_t reduction_bps);

    Result<uint64_t> boosted_apy(uint16_t lockup_days, uint64_t boost_bps) const;
};

NUVO_STAKING_NAMESPACE_END
