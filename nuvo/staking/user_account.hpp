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
#include <nuvo/staking/config.hpp>
#include <nuvo/staking/skill_registry.hpp>

#include <cstdint>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

struct AutoCompoundSettings
{
    bool enabled{false};
    uint256_t min_amount{0};
    uint64_t last_compound_time{0};
};

// Everything the engine tracks per user besides deposits and activity
struct UserAccount
{
    // Rewards have been paid or compounded up to this instant
    uint64_t last_claim_time{0};

    uint256_t total_withdrawn_today{0};
    uint64_t last_withdraw_day{0}; // start of the current 24h window

    std::vector<ActiveSkill> skills;
    AutoCompoundSettings auto_compound;

    uint256_t quest_rewards{0};
    uint256_t achievement_rewards{0};
};

NUVO_STAKING_NAMESPACE_END
