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
#include <nuvo/core/likely.h>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/tier_registry.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>

NUVO_STAKING_NAMESPACE_BEGIN

TierRegistry::TierRegistry(StakingConfig const &config)
{
    for (size_t i = 0; i < LOCKUP_TIER_COUNT; ++i) {
        tiers_[i] = Tier{
            .lockup_days = LOCKUP_TIER_DAYS[i],
            .min_stake = config.min_deposit,
            .max_stake = config.max_deposit,
            .is_active = true,
            .rates = {RateSegment{
                .start_time = 0, .rate_bps = config.tier_apy_bps[i]}}};
    }
}

Tier *TierRegistry::find_mutable(uint16_t const lockup_days)
{
    auto const it = std::find_if(
        tiers_.begin(), tiers_.end(), [lockup_days](Tier const &tier) {
            return tier.lockup_days == lockup_days;
        });
    return it == tiers_.end() ? nullptr : &*it;
}

Result<Tier const *> TierRegistry::find(uint16_t const lockup_days) const
{
    auto const it = std::find_if(
        tiers_.begin(), tiers_.end(), [lockup_days](Tier const &tier) {
            return tier.lockup_days == lockup_days;
        });
    if (NUVO_UNLIKELY(it == tiers_.end())) {
        return StakingError::InvalidLockupDuration;
    }
    return &*it;
}

Result<uint64_t> TierRegistry::rate_for(uint16_t const lockup_days) const
{
    BOOST_OUTCOME_TRY(auto const *const tier, find(lockup_days));
    return tier->current_rate();
}

Result<uint256_t> TierRegistry::rate_integral(
    uint16_t const lockup_days, uint64_t const from, uint64_t const to) const
{
    BOOST_OUTCOME_TRY(auto const *const tier, find(lockup_days));

    uint256_t integral{0};
    auto const &rates = tier->rates;
    for (size_t i = 0; i < rates.size(); ++i) {
        uint64_t const start = std::max(from, rates[i].start_time);
        uint64_t const end =
            i + 1 < rates.size() ? std::min(to, rates[i + 1].start_time) : to;
        if (end <= start) {
            continue;
        }
        BOOST_OUTCOME_TRY(
            auto const sum,
            checked_add(
                integral,
                uint256_t{rates[i].rate_bps} * uint256_t{end - start}));
        integral = sum;
    }
    return integral;
}

Result<void> TierRegistry::set_apy(
    uint16_t const lockup_days, uint64_t const apy_bps, uint64_t const now)
{
    if (NUVO_UNLIKELY(apy_bps > MAX_APY_BPS)) {
        return StakingError::InvalidApy;
    }
    auto *const tier = find_mutable(lockup_days);
    if (NUVO_UNLIKELY(tier == nullptr)) {
        return StakingError::InvalidLockupDuration;
    }
    auto &last = tier->rates.back();
    if (NUVO_UNLIKELY(now < last.start_time)) {
        return StakingError::InvalidInput;
    }
    if (now == last.start_time) {
        last.rate_bps = apy_bps;
    }
    else {
        tier->rates.push_back(RateSegment{.start_time = now, .rate_bps = apy_bps});
    }
    return outcome::success();
}

Result<void> TierRegistry::toggle(uint16_t const lockup_days)
{
    auto *const tier = find_mutable(lockup_days);
    if (NUVO_UNLIKELY(tier == nullptr)) {
        return StakingError::InvalidLockupDuration;
    }
    tier->is_active = !tier->is_active;
    return outcome::success();
}

Result<void> TierRegistry::set_limits(
    uint16_t const lockup_days, uint256_t const &min_stake,
    uint256_t const &max_stake)
{
    if (NUVO_UNLIKELY(min_stake == 0 || min_stake > max_stake)) {
        return StakingError::InvalidInput;
    }
    auto *const tier = find_mutable(lockup_days);
    if (NUVO_UNLIKELY(tier == nullptr)) {
        return StakingError::InvalidLockupDuration;
    }
    tier->min_stake = min_stake;
    tier->max_stake = max_stake;
    return outcome::success();
}

NUVO_STAKING_NAMESPACE_END
