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

#include <nuvo/core/likely.h>
#include <nuvo/staking/skill_registry.hpp>
#include <nuvo/staking/util/constants.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>

NUVO_STAKING_NAMESPACE_BEGIN

uint64_t rarity_multiplier(Rarity const rarity) noexcept
{
    switch (rarity) {
    case Rarity::Common:
        return 100;
    case Rarity::Uncommon:
        return 150;
    case Rarity::Rare:
        return 200;
    case Rarity::Epic:
        return 300;
    case Rarity::Legendary:
        return 500;
    }
    return 100;
}

SkillRegistry::SkillRegistry(size_t const max_active_skills)
    : default_effects_{}
    , max_active_skills_{max_active_skills}
{
    default_effects_[static_cast<size_t>(SkillType::StakeBoostI)] = 500;
    default_effects_[static_cast<size_t>(SkillType::StakeBoostII)] = 1'000;
    default_effects_[static_cast<size_t>(SkillType::StakeBoostIII)] = 2'000;
    default_effects_[static_cast<size_t>(SkillType::LockReducer)] = 2'500;
    default_effects_[static_cast<size_t>(SkillType::FeeReducerI)] = 1'000;
    default_effects_[static_cast<size_t>(SkillType::FeeReducerII)] = 2'500;
}

Result<SkillType> SkillRegistry::parse_skill_type(uint8_t const raw)
{
    if (NUVO_UNLIKELY(raw == 0 || raw > MAX_SKILL_TYPE)) {
        return StakingError::InvalidSkillType;
    }
    return static_cast<SkillType>(raw);
}

Result<Rarity> SkillRegistry::parse_rarity(uint8_t const raw)
{
    if (NUVO_UNLIKELY(raw > MAX_RARITY)) {
        return StakingError::InvalidRarity;
    }
    return static_cast<Rarity>(raw);
}

uint16_t SkillRegistry::default_effect(SkillType const type) const noexcept
{
    return default_effects_[static_cast<size_t>(type)];
}

Result<void> SkillRegistry::set_default_effect(
    uint8_t const skill_type, uint16_t const effect_bps)
{
    BOOST_OUTCOME_TRY(auto const type, parse_skill_type(skill_type));
    if (NUVO_UNLIKELY(effect_bps > BPS_DENOMINATOR)) {
        return StakingError::InvalidInput;
    }
    default_effects_[static_cast<size_t>(type)] = effect_bps;
    return outcome::success();
}

Rarity SkillRegistry::rarity_of(uint64_t const source_id) const
{
    auto const it = rarities_.find(source_id);
    return it == rarities_.end() ? Rarity::Common : it->second;
}

Result<void>
SkillRegistry::set_rarity(uint64_t const source_id, uint8_t const rarity)
{
    BOOST_OUTCOME_TRY(auto const parsed, parse_rarity(rarity));
    rarities_[source_id] = parsed;
    return outcome::success();
}

Result<void> SkillRegistry::batch_set_rarity(
    std::span<uint64_t const> const source_ids,
    std::span<uint8_t const> const rarities)
{
    if (NUVO_UNLIKELY(
            source_ids.empty() || source_ids.size() != rarities.size())) {
        return StakingError::InvalidInput;
    }
    // validate everything before writing anything
    for (auto const rarity : rarities) {
        BOOST_OUTCOME_TRY(parse_rarity(rarity));
    }
    for (size_t i = 0; i < source_ids.size(); ++i) {
        rarities_[source_ids[i]] = static_cast<Rarity>(rarities[i]);
    }
    return outcome::success();
}

Result<void> SkillRegistry::activate(
    std::vector<ActiveSkill> &active, uint64_t const source_id,
    uint8_t const skill_type, uint16_t const effect_bps) const
{
    BOOST_OUTCOME_TRY(auto const type, parse_skill_type(skill_type));
    if (NUVO_UNLIKELY(effect_bps > BPS_DENOMINATOR)) {
        return StakingError::InvalidInput;
    }
    bool const duplicate = std::any_of(
        active.begin(), active.end(), [source_id](ActiveSkill const &skill) {
            return skill.source_id == source_id;
        });
    if (NUVO_UNLIKELY(duplicate)) {
        return StakingError::SkillAlreadyActive;
    }
    if (NUVO_UNLIKELY(active.size() >= max_active_skills_)) {
        return StakingError::MaxSkillsReached;
    }
    active.push_back(ActiveSkill{
        .source_id = source_id,
        .skill_type = type,
        .effect_bps = effect_bps == 0 ? default_effect(type) : effect_bps});
    return outcome::success();
}

Result<void> SkillRegistry::deactivate(
    std::vector<ActiveSkill> &active, uint64_t const source_id) const
{
    auto const it = std::find_if(
        active.begin(), active.end(), [source_id](ActiveSkill const &skill) {
            return skill.source_id == source_id;
        });
    if (NUVO_UNLIKELY(it == active.end())) {
        return StakingError::SkillNotActive;
    }
    active.erase(it);
    return outcome::success();
}

NUVO_STAKING_NAMESPACE_END
