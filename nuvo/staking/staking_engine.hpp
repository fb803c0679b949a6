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

#include <nuvo/core/address.hpp>
#include <nuvo/core/int.hpp>
#include <nuvo/core/result.hpp>
#include <nuvo/staking/config.hpp>
#include <nuvo/staking/deposit_ledger.hpp>
#include <nuvo/staking/rate_limiter.hpp>
#include <nuvo/staking/reward_calculator.hpp>
#include <nuvo/staking/settlement.hpp>
#include <nuvo/staking/skill_registry.hpp>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/tier_registry.hpp>
#include <nuvo/staking/user_account.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

// Identity and clock of the call being executed
struct CallContext
{
    Address sender;
    uint64_t timestamp;
};

struct PoolState
{
    uint256_t total_pool_balance;
    uint64_t unique_users_count;
    uint256_t reward_reserve;
    Address treasury;
    bool paused;
    bool migrated;
};

struct AutoCompoundResult
{
    Address user;
    Result<uint256_t> outcome; // amount compounded, or why not
};

struct AutoCompoundUsersPage
{
    std::vector<Address> users;
    std::vector<AutoCompoundSettings> settings; // parallel to users
    size_t total; // enrolled users across all pages
};

class StakingEngine
{
    class Checkpoint;

    StakingConfig config_;
    SettlementPort &settlement_;

    Address owner_;
    Address skill_notifier_;
    Address treasury_;

    DepositLedger ledger_;
    TierRegistry tiers_;
    SkillRegistry skills_;
    RateLimiter rate_limiter_;
    RewardCalculator calculator_;

    ankerl::unordered_dense::map<Address, UserAccount> accounts_;
    // users with auto-compound enabled, in enrolment order
    ankerl::unordered_dense::set<Address> auto_compound_users_;

    uint256_t reward_reserve_{0};
    bool paused_{false};
    bool migrated_{false};
    bool entered_{false};

    ///////////////////
    // Access checks //
    ///////////////////
    Result<void> require_not_paused() const;
    Result<void> require_not_migrated() const;
    Result<void> require_not_banned(Address const &) const;
    Result<void> require_owner(Address const &) const;
    Result<void> require_notifier(Address const &) const;

    ////////////////
    //  Internals //
    ////////////////
    UserAccount const *find_account(Address const &) const;

    Result<uint256_t>
    pending_rewards(Address const &, UserAccount const &, uint64_t now) const;

    // rolls the withdrawal window and charges amount against the daily cap
    Result<void>
    charge_daily_limit(UserAccount &, uint256_t const &amount, uint64_t now);

    Result<void> draw_reserve(uint256_t const &amount);
    Result<void> pay_fee(uint256_t const &fee);

    Result<uint256_t> compound_for(Address const &, uint64_t now);
    Result<uint256_t> auto_compound_one(Address const &, uint64_t now);

    void check_solvency() const;

public:
    StakingEngine(
        StakingConfig const &, SettlementPort &, Address const &owner,
        Address const &treasury, Address const &skill_notifier);

    StakingEngine(StakingEngine const &) = delete;
    StakingEngine &operator=(StakingEngine const &) = delete;

    ////////////////////
    // User interface //
    ////////////////////
    Result<void> deposit(
        CallContext const &, uint256_t const &value, uint16_t lockup_days);

    // Pays the net boosted reward; returns the amount paid
    Result<uint256_t> withdraw(CallContext const &);

    // Pays principal plus net reward and clears every deposit. After
    // migration only principal is paid.
    Result<uint256_t> withdraw_all(CallContext const &);

    // Reinvests the net reward as a new deposit with no lockup; returns the
    // new principal
    Result<uint256_t> compound(CallContext const &);

    Result<uint256_t> claim_bonus_rewards(CallContext const &);

    // Only while paused: returns all principal, nothing else
    Result<uint256_t> emergency_withdraw(CallContext const &);

    Result<void>
    enable_auto_compound(CallContext const &, uint256_t const &min_amount);
    Result<void> disable_auto_compound(CallContext const &);

    //////////////////////
    // Keeper interface //
    //////////////////////
    bool check_auto_compound(Address const &, uint64_t now) const;

    // Window [offset, offset + limit) of the enrolled users. A disable moves
    // the most recently enrolled user into the freed slot.
    AutoCompoundUsersPage
    auto_compound_users_page(size_t offset, size_t limit) const;

    Result<uint256_t>
    perform_auto_compound(CallContext const &, Address const &user);

    // Fails as a whole only while paused; otherwise one entry per user
    Result<std::vector<AutoCompoundResult>>
    batch_auto_compound(CallContext const &, std::span<Address const> users);

    ////////////////////////
    // Notifier interface //
    ////////////////////////
    Result<void> notify_skill_activation(
        CallContext const &, Address const &user, uint64_t source_id,
        uint8_t skill_type, uint16_t effect_bps);
    Result<void> notify_skill_deactivation(
        CallContext const &, Address const &user, uint64_t source_id);
    Result<void>
    set_skill_rarity(CallContext const &, uint64_t source_id, uint8_t rarity);
    Result<void> batch_set_skill_rarity(
        CallContext const &, std::span<uint64_t const> source_ids,
        std::span<uint8_t const> rarities);
    Result<void> notify_quest_reward(
        CallContext const &, Address const &user, uint256_t const &amount);
    Result<void> notify_achievement_reward(
        CallContext const &, Address const &user, uint256_t const &amount);

    /////////////////////
    // Admin interface //
    /////////////////////
    Result<void> pause(CallContext const &);
    Result<void> unpause(CallContext const &);
    Result<void>
    ban_user(CallContext const &, Address const &user, std::string reason);
    Result<void> unban_user(CallContext const &, Address const &user);
    Result<void> clear_flag(CallContext const &, Address const &user);

    Result<void>
    set_tier_apy(CallContext const &, uint16_t lockup_days, uint64_t apy_bps);
    Result<void> toggle_tier(CallContext const &, uint16_t lockup_days);
    Result<void> set_tier_limits(
        CallContext const &, uint16_t lockup_days, uint256_t const &min_stake,
        uint256_t const &max_stake);
    Result<void> set_skill_default_effect(
        CallContext const &, uint8_t skill_type, uint16_t effect_bps);
    Result<void> set_treasury(CallContext const &, Address const &);
    Result<void> set_skill_notifier(CallContext const &, Address const &);
    Result<void> set_max_actions_per_day(CallContext const &, uint32_t);
    Result<void> set_suspicious_threshold(CallContext const &, uint64_t);

    Result<void> add_reward_funds(CallContext const &, uint256_t const &value);

    // Moves the reward reserve to destination and closes the pool to new
    // principal. Exits stay open.
    Result<void> migrate(CallContext const &, Address const &destination);

    ///////////
    // Reads //
    ///////////
    Result<uint256_t> calculate_rewards(Address const &, uint64_t now) const;
    Result<uint256_t>
    calculate_boosted_rewards(Address const &, uint64_t now) const;
    Result<uint256_t> calculate_boosted_rewards_with_rarity_multiplier(
        Address const &, uint64_t now) const;
    uint64_t
    calculate_reduced_lock_time(Address const &, uint64_t lockup_duration) const;
    uint64_t calculate_fee_discount(Address const &) const;
    Result<uint64_t>
    calculate_boosted_apy(Address const &, uint16_t lockup_days) const;

    std::span<Deposit const> list_deposits(Address const &) const;
    uint256_t total_deposited(Address const &) const;
    UserAccount user_account(Address const &) const;
    UserActivity user_activity(Address const &) const;
    PoolState pool_state() const;

    TierRegistry const &tiers() const noexcept
    {
        return tiers_;
    }

    SkillRegistry const &skills() const noexcept
    {
        return skills_;
    }

    StakingConfig const &config() const noexcept
    {
        return config_;
    }

    // total_pool_balance equals the principal held, and custody covers
    // principal plus the reward reserve
    bool invariants_hold() const;
};

NUVO_STAKING_NAMESPACE_END
