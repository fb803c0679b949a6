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

#include <nuvo/core/result.hpp>
#include <nuvo/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

enum class SkillType : uint8_t
{
    None = 0,
    StakeBoostI,
    StakeBoostII,
    StakeBoostIII,
    AutoCompound,
    LockReducer,
    FeeReducerI,
    FeeReducerII,
    PriorityListing,
    BatchMinter,
    VerifiedCreator,
    Influencer,
    Curator,
    Ambassador,
    VipAccess,
    EarlyAccess,
    PrivateAuctions,
};

inline constexpr uint8_t MAX_SKILL_TYPE{
    static_cast<uint8_t>(SkillType::PrivateAuctions)};

enum class Rarity : uint8_t
{
    Common = 0,
    Uncommon,
    Rare,
    Epic,
    Legendary,
};

inline constexpr uint8_t MAX_RARITY{static_cast<uint8_t>(Rarity::Legendary)};

struct ActiveSkill
{
    uint64_t source_id;
    SkillType skill_type;
    uint16_t effect_bps;
};

constexpr bool is_reward_boost(SkillType const type) noexcept
{
    return type == SkillType::StakeBoostI || type == SkillType::StakeBoostII ||
           type == SkillType::StakeBoostIII;
}

constexpr bool is_fee_reducer(SkillType const type) noexcept
{
    return type == SkillType::FeeReducerI || type == SkillType::FeeReducerII;
}

constexpr bool is_lock_reducer(SkillType const type) noexcept
{
    return type == SkillType::LockReducer;
}

// Percent applied to a skill's effect: Common 100 through Legendary 500
uint64_t rarity_multiplier(Rarity) noexcept;

// Default skill effects and per-source rarities, plus the rules for
// mutating a user's active skill set. Skills are granted by the trusted
// notifier and carry no expiry of their own.
class SkillRegistry
{
    std::array<uint16_t, MAX_SKILL_TYPE + 1> default_effects_;
    ankerl::unordered_dense::map<uint64_t, Rarity> rarities_;
    size_t max_active_skills_;

public:
    explicit SkillRegistry(size_t max_active_skills);

    static Result<SkillType> parse_skill_type(uint8_t);
    static Result<Rarity> parse_rarity(uint8_t);

    uint16_t default_effect(SkillType) const noexcept;
    Result<void> set_default_effect(uint8_t skill_type, uint16_t effect_bps);

    Rarity rarity_of(uint64_t source_id) const;
    Result<void> set_rarity(uint64_t source_id, uint8_t rarity);
    Result<void> batch_set_rarity(
        std::span<uint64_t const> source_ids, std::span<uint8_t const> rarities);

    // An effect of zero selects the default for the skill type
    Result<void> activate(
        std::vector<ActiveSkill> &active, uint64_t source_id,
        uint8_t skill_type, uint16_t effect_bps) const;
    Result<void>
    deactivate(std::vector<ActiveSkill> &active, uint64_t source_id) const;
};

NUVO_STAKING_NAMESPACE_END
