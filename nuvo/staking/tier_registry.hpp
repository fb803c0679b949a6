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
#include <nuvo/staking/util/constants.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

struct StakingConfig;

// The rate in force from start_time until the next segment begins
struct RateSegment
{
    uint64_t start_time;
    uint64_t rate_bps;
};

struct Tier
{
    uint16_t lockup_days;
    uint256_t min_stake;
    uint256_t max_stake;
    bool is_active;
    std::vector<RateSegment> rates; // ordered by start_time, never empty

    uint64_t current_rate() const noexcept
    {
        return rates.back().rate_bps;
    }
};

class TierRegistry
{
    std::array<Tier, LOCKUP_TIER_COUNT> tiers_;

    Tier *find_mutable(uint16_t lockup_days);

public:
    explicit TierRegistry(StakingConfig const &);

    Result<Tier const *> find(uint16_t lockup_days) const;
    Result<uint64_t> rate_for(uint16_t lockup_days) const;

    std::span<Tier const> lockup_config() const noexcept
    {
        return tiers_;
    }

    // Integral of the tier rate over [from, to), in bps * seconds. Rate
    // changes only split the integral, so time already elapsed keeps the
    // rate it accrued under.
    Result<uint256_t>
    rate_integral(uint16_t lockup_days, uint64_t from, uint64_t to) const;

    Result<void> set_apy(uint16_t lockup_days, uint64_t apy_bps, uint64_t now);
    Result<void> toggle(uint16_t lockup_days);
    Result<void> set_limits(
        uint16_t lockup_days, uint256_t const &min_stake,
        uint256_t const &max_stake);
};

NUVO_STAKING_NAMESPACE_END
