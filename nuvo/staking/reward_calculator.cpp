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

#include <nuvo/core/checked_math.hpp>
#include <nuvo/staking/reward_calculator.hpp>
#include <nuvo/staking/util/constants.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>

NUVO_STAKING_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint256_t ACCRUAL_DENOMINATOR{BPS_DENOMINATOR * SECONDS_PER_YEAR};

template <typename Pred>
uint64_t sum_effects(std::span<ActiveSkill const> const skills, Pred &&pred)
{
    uint64_t total = 0;
    for (auto const &skill : skills) {
        if (pred(skill.skill_type)) {
            total += skill.effect_bps;
        }
    }
    return total;
}

NUVO_STAKING_ANONYMOUS_NAMESPACE_END

NUVO_STAKING_NAMESPACE_BEGIN

Result<uint256_t> apply_boost(uint256_t const &base, uint64_t const boost_bps)
{
    return checked_mul_div(base, BPS_DENOMINATOR + boost_bps, BPS_DENOMINATOR);
}

RewardCalculator::RewardCalculator(
    TierRegistry const &tiers, SkillRegistry const &skills)
    : tiers_{tiers}
    , skills_{skills}
{
}

Result<uint256_t> RewardCalculator::deposit_reward(
    Deposit const &deposit, uint64_t const last_claim_time,
    uint64_t const now) const
{
    uint64_t const from = std::max(deposit.timestamp, last_claim_time);
    if (now <= from) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const integral,
        tiers_.rate_integral(deposit.lockup_days, from, now));
    return checked_mul_div(deposit.amount, integral, ACCRUAL_DENOMINATOR);
}

Result<uint256_t> RewardCalculator::calculate_rewards(
    std::span<Deposit const> const deposits, uint64_t const last_claim_time,
    uint64_t const now) const
{
    uint256_t total{0};
    for (auto const &deposit : deposits) {
        BOOST_OUTCOME_TRY(
            auto const reward, deposit_reward(deposit, last_claim_time, now));
        BOOST_OUTCOME_TRY(auto const sum, checked_add(total, reward));
        total = sum;
    }
    return total;
}

Result<uint256_t> RewardCalculator::calculate_boosted_rewards(
    std::span<Deposit const> const deposits,
    std::span<ActiveSkill const> const skills, uint64_t const last_claim_time,
    uint64_t const now) const
{
    BOOST_OUTCOME_TRY(
        auto const base, calculate_rewards(deposits, last_claim_time, now));
    return apply_boost(base, reward_boost_bps(skills));
}

Result<uint256_t>
RewardCalculator::calculate_boosted_rewards_with_rarity_multiplier(
    std::span<Deposit const> const deposits,
    std::span<ActiveSkill const> const skills, uint64_t const last_claim_time,
    uint64_t const now) const
{
    BOOST_OUTCOME_TRY(
        auto const base, calculate_rewards(deposits, last_claim_time, now));
    return apply_boost(base, rarity_reward_boost_bps(skills));
}

uint64_t
RewardCalculator::reward_boost_bps(std::span<ActiveSkill const> const skills)
{
    return std::min(
        sum_effects(skills, is_reward_boost), MAX_REWARD_BOOST_BPS);
}

uint64_t RewardCalculator::rarity_reward_boost_bps(
    std::span<ActiveSkill const> const skills) const
{
    uint64_t total = 0;
    for (auto const &skill : skills) {
        if (is_reward_boost(skill.skill_type)) {
            total += uint64_t{skill.effect_bps} *
                     rarity_multiplier(skills_.rarity_of(skill.source_id)) /
                     100;
        }
    }
    return std::min(total, MAX_REWARD_BOOST_BPS);
}

uint64_t
RewardCalculator::fee_discount_bps(std::span<ActiveSkill const> const skills)
{
    return std::min(sum_effects(skills, is_fee_reducer), MAX_FEE_DISCOUNT_BPS);
}

uint64_t
RewardCalculator::lock_reduction_bps(std::span<ActiveSkill const> const skills)
{
    return std::min(
        sum_effects(skills, is_lock_reducer), MAX_LOCK_REDUCTION_BPS);
}

uint64_t RewardCalculator::reduced_lock_time(
    uint64_t const lockup_duration, uint64_t const reduction_bps)
{
    uint64_t const keep =
        BPS_DENOMINATOR - std::min(reduction_bps, BPS_DENOMINATOR);
    // split so that no intermediate exceeds lockup_duration
    uint64_t const whole = lockup_duration / BPS_DENOMINATOR;
    uint64_t const rest = lockup_duration % BPS_DENOMINATOR;
    return whole * keep + rest * keep / BPS_DENOMINATOR;
}

Result<uint64_t> RewardCalculator::boosted_apy(
    uint16_t const lockup_days, uint64_t const boost_bps) const
{
    BOOST_OUTCOME_TRY(auto const rate, tiers_.rate_for(lockup_days));
    return rate * (BPS_DENOMINATOR + boost_bps) / BPS_DENOMINATOR;
}

NUVO_STAKING_NAMESPACE_END
