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

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

NUVO_STAKING_NAMESPACE_BEGIN

struct StakingConfig
{
    uint256_t min_deposit{MIN_DEPOSIT};
    uint256_t max_deposit{MAX_DEPOSIT};
    size_t max_deposits_per_user{MAX_DEPOSITS_PER_USER};
    uint64_t commission_bps{COMMISSION_BPS};

    uint256_t daily_withdrawal_limit{DAILY_WITHDRAWAL_LIMIT};

    uint64_t auto_compound_interval{AUTO_COMPOUND_INTERVAL};
    uint256_t min_auto_compound_amount{MIN_AUTO_COMPOUND_AMOUNT};

    size_t max_active_skills{MAX_ACTIVE_SKILLS};

    uint32_t max_actions_per_day{MAX_ACTIONS_PER_DAY};
    uint64_t suspicious_threshold{SUSPICIOUS_THRESHOLD};
    uint64_t suspicion_increment{SUSPICION_INCREMENT};
    uint64_t suspicion_decay_period{SUSPICION_DECAY_PERIOD};

    // indexed like LOCKUP_TIER_DAYS
    std::array<uint64_t, LOCKUP_TIER_COUNT> tier_apy_bps{DEFAULT_TIER_APY_BPS};
};

Result<void> validate(StakingConfig const &);

// Overlays the keys present in the json object onto the defaults. Amounts
// are decimal strings in base units.
Result<StakingConfig> load_staking_config(nlohmann::json const &);

NUVO_STAKING_NAMESPACE_END
