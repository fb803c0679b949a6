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

#include <nuvo/core/address.hpp>
#include <nuvo/core/int.hpp>
#include <nuvo/core/result.hpp>
#include <nuvo/staking/commission.hpp>
#include <nuvo/staking/in_memory_settlement.hpp>
#include <nuvo/staking/settlement.hpp>
#include <nuvo/staking/skill_registry.hpp>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/staking_engine.hpp>
#include <nuvo/staking/util/constants.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

using namespace nuvo;
using namespace nuvo::staking;
using namespace evmc::literals;

namespace
{
    constexpr auto OWNER = 0x0000000000000000000000000000000000000a11_address;
    constexpr auto TREASURY = 0x7ea5_address;
    constexpr auto NOTIFIER = 0x5c111_address;
    constexpr auto KEEPER = 0xbee_address;
    constexpr auto DESTINATION = 0xde57_address;
    constexpr auto ALICE = 0xa11ce_address;
    constexpr auto BOB = 0xb0b_address;
    constexpr auto CAROL = 0xca201_address;

    constexpr uint64_t T0 = 1'700'000'000;
    constexpr uint256_t RESERVE{100'000 * ETHER};
    constexpr uint256_t WALLET{1'000'000 * ETHER};

    constexpr auto STAKE_BOOST_I = static_cast<uint8_t>(SkillType::StakeBoostI);
    constexpr auto STAKE_BOOST_II =
        static_cast<uint8_t>(SkillType::StakeBoostII);
    constexpr auto LOCK_REDUCER = static_cast<uint8_t>(SkillType::LockReducer);
    constexpr auto FEE_REDUCER_II =
        static_cast<uint8_t>(SkillType::FeeReducerII);

    StakingConfig without_commission()
    {
        StakingConfig config{};
        config.commission_bps = 0;
        return config;
    }
}

struct Engine : public ::testing::Test
{
    std::unique_ptr<InMemorySettlement> settlement;
    std::unique_ptr<StakingEngine> engine;
    uint64_t now{T0};

    void SetUp() override
    {
        start(StakingConfig{});
    }

    void TearDown() override
    {
        EXPECT_TRUE(engine->invariants_hold());
        EXPECT_EQ(settlement->depth(), 0);
    }

    void start(StakingConfig const &config, bool const fund_reserve = true)
    {
        engine.reset();
        settlement = std::make_unique<InMemorySettlement>();
        engine = std::make_unique<StakingEngine>(
            config, *settlement, OWNER, TREASURY, NOTIFIER);
        now = T0;
        for (auto const &user : {OWNER, ALICE, BOB, CAROL}) {
            settlement->mint(user, WALLET);
        }
        if (fund_reserve) {
            ASSERT_FALSE(
                engine->add_reward_funds(ctx(OWNER), RESERVE).has_error());
        }
    }

    CallContext ctx(Address const &sender) const
    {
        return CallContext{.sender = sender, .timestamp = now};
    }

    void advance(uint64_t const seconds)
    {
        now += seconds;
    }

    Result<void> deposit(
        Address const &user, uint256_t const &amount,
        uint16_t const lockup_days = 0)
    {
        return engine->deposit(ctx(user), amount, lockup_days);
    }

    Result<void> activate(
        Address const &user, uint64_t const source_id, uint8_t const type,
        uint16_t const effect_bps = 0)
    {
        return engine->notify_skill_activation(
            ctx(NOTIFIER), user, source_id, type, effect_bps);
    }
};

///////////////////
// deposit
///////////////////

TEST_F(Engine, deposit_applies_commission)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 30).has_error());

    auto const deposits = engine->list_deposits(ALICE);
    ASSERT_EQ(deposits.size(), 1);
    EXPECT_EQ(deposits[0].amount, 94 * ETHER);
    EXPECT_EQ(deposits[0].timestamp, T0);
    EXPECT_EQ(deposits[0].lockup_days, 30);

    EXPECT_EQ(settlement->balance_of(ALICE), WALLET - 100 * ETHER);
    EXPECT_EQ(settlement->balance_of(TREASURY), 6 * ETHER);
    EXPECT_EQ(settlement->custody_balance(), RESERVE + 94 * ETHER);

    auto const pool = engine->pool_state();
    EXPECT_EQ(pool.total_pool_balance, 94 * ETHER);
    EXPECT_EQ(pool.unique_users_count, 1);
    EXPECT_EQ(pool.reward_reserve, RESERVE);
    EXPECT_EQ(engine->user_activity(ALICE).actions_today, 1);
}

TEST_F(Engine, deposit_validation_changes_nothing)
{
    EXPECT_EQ(
        deposit(ALICE, 5 * ETHER - 1).assume_error(),
        StakingError::DepositTooLow);
    EXPECT_EQ(
        deposit(ALICE, 10'000 * ETHER + 1).assume_error(),
        StakingError::DepositTooHigh);
    EXPECT_EQ(
        deposit(ALICE, 10 * ETHER, 45).assume_error(),
        StakingError::InvalidLockupDuration);

    ASSERT_FALSE(engine->toggle_tier(ctx(OWNER), 90).has_error());
    EXPECT_EQ(
        deposit(ALICE, 10 * ETHER, 90).assume_error(),
        StakingError::TierInactive);

    ASSERT_FALSE(
        engine->set_tier_limits(ctx(OWNER), 180, 50 * ETHER, 60 * ETHER)
            .has_error());
    EXPECT_EQ(
        deposit(ALICE, 49 * ETHER, 180).assume_error(),
        StakingError::DepositTooLow);
    EXPECT_EQ(
        deposit(ALICE, 61 * ETHER, 180).assume_error(),
        StakingError::DepositTooHigh);

    EXPECT_TRUE(engine->list_deposits(ALICE).empty());
    EXPECT_EQ(settlement->balance_of(ALICE), WALLET);
    EXPECT_EQ(engine->user_activity(ALICE).actions_today, 0);
}

TEST_F(Engine, deposit_cap_per_user)
{
    auto config = without_commission();
    config.max_actions_per_day = 1'000;
    start(config);

    for (size_t i = 0; i < MAX_DEPOSITS_PER_USER; ++i) {
        ASSERT_FALSE(deposit(ALICE, 5 * ETHER).has_error()) << i;
    }
    EXPECT_EQ(
        deposit(ALICE, 5 * ETHER).assume_error(),
        StakingError::MaxDepositsReached);
    EXPECT_EQ(engine->list_deposits(ALICE).size(), MAX_DEPOSITS_PER_USER);
    EXPECT_EQ(
        engine->pool_state().total_pool_balance,
        MAX_DEPOSITS_PER_USER * 5 * ETHER);

    EXPECT_FALSE(deposit(BOB, 5 * ETHER).has_error());
}

TEST_F(Engine, deposit_insufficient_wallet)
{
    start(StakingConfig{}, false);
    settlement->mint(0xdead_address, ETHER);
    auto const res = engine->deposit(
        CallContext{.sender = 0xdead_address, .timestamp = now}, 5 * ETHER, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), SettlementError::InsufficientFunds);
    EXPECT_EQ(engine->pool_state().total_pool_balance, 0);
    EXPECT_EQ(engine->pool_state().unique_users_count, 0);
}

///////////////////
// rewards
///////////////////

TEST_F(Engine, ten_percent_for_a_year)
{
    start(without_commission());
    ASSERT_FALSE(engine->set_tier_apy(ctx(OWNER), 0, 1'000).has_error());
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());

    advance(SECONDS_PER_YEAR);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 10 * ETHER);

    auto const paid = engine->withdraw(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 10 * ETHER);
    EXPECT_EQ(settlement->balance_of(ALICE), WALLET - 90 * ETHER);
    EXPECT_EQ(engine->pool_state().reward_reserve, RESERVE - 10 * ETHER);
}

TEST_F(Engine, ten_percent_for_a_year_with_commission)
{
    ASSERT_FALSE(engine->set_tier_apy(ctx(OWNER), 0, 1'000).has_error());
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());

    advance(SECONDS_PER_YEAR);
    auto const reward = engine->calculate_rewards(ALICE, now);
    ASSERT_FALSE(reward.has_error());
    EXPECT_EQ(reward.value(), 94 * ETHER / 10);

    // 9.4 less 6%
    auto const paid = engine->withdraw(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 8'836 * ETHER / 1'000);
    EXPECT_EQ(
        settlement->balance_of(TREASURY), 6 * ETHER + 564 * ETHER / 1'000);
}

TEST_F(Engine, two_skill_boost)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 90).has_error());
    ASSERT_FALSE(activate(ALICE, 1, STAKE_BOOST_I).has_error());
    ASSERT_FALSE(activate(ALICE, 2, STAKE_BOOST_II).has_error());

    advance(45 * SECONDS_PER_DAY);
    auto const base = engine->calculate_rewards(ALICE, now);
    auto const boosted = engine->calculate_boosted_rewards(ALICE, now);
    ASSERT_FALSE(base.has_error());
    ASSERT_FALSE(boosted.has_error());
    EXPECT_GT(base.value(), 0);
    EXPECT_EQ(boosted.value(), base.value() * 11'500 / BPS_DENOMINATOR);
    EXPECT_EQ(engine->calculate_boosted_apy(ALICE, 90).value(), 1'725);
}

TEST_F(Engine, rarity_applies_to_payout)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    ASSERT_FALSE(activate(ALICE, 7, STAKE_BOOST_I).has_error());
    ASSERT_FALSE(engine
                     ->set_skill_rarity(
                         ctx(NOTIFIER), 7, static_cast<uint8_t>(Rarity::Rare))
                     .has_error());

    advance(30 * SECONDS_PER_DAY);
    auto const base = engine->calculate_rewards(ALICE, now).value();
    auto const with_rarity =
        engine->calculate_boosted_rewards_with_rarity_multiplier(ALICE, now)
            .value();
    EXPECT_EQ(with_rarity, base * 11'000 / BPS_DENOMINATOR);

    auto const split = apply_withdrawal_commission(with_rarity, 600, 0);
    ASSERT_FALSE(split.has_error());
    auto const paid = engine->withdraw(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), split.value().net);
}

TEST_F(Engine, fee_reducer_discounts_withdrawal)
{
    start(StakingConfig{});
    ASSERT_FALSE(deposit(ALICE, 1'000 * ETHER).has_error());
    ASSERT_FALSE(activate(ALICE, 3, FEE_REDUCER_II).has_error());
    EXPECT_EQ(engine->calculate_fee_discount(ALICE), 2'500);

    advance(10 * SECONDS_PER_DAY);
    auto const reward =
        engine->calculate_boosted_rewards_with_rarity_multiplier(ALICE, now)
            .value();
    auto const treasury_before = settlement->balance_of(TREASURY);
    auto const paid = engine->withdraw(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());

    auto const fee = reward * 600 / BPS_DENOMINATOR * 7'500 / BPS_DENOMINATOR;
    EXPECT_EQ(paid.value(), reward - fee);
    EXPECT_EQ(settlement->balance_of(TREASURY) - treasury_before, fee);
}

TEST_F(Engine, rate_change_is_not_retroactive)
{
    start(without_commission());
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());

    advance(SECONDS_PER_YEAR / 2);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 25 * ETHER / 10);
    ASSERT_FALSE(engine->set_tier_apy(ctx(OWNER), 0, 1'500).has_error());
    // the change does not touch time already elapsed
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 25 * ETHER / 10);

    advance(SECONDS_PER_YEAR / 2);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 10 * ETHER);
}

TEST_F(Engine, reads_are_idempotent)
{
    ASSERT_FALSE(deposit(ALICE, 77 * ETHER, 365).has_error());
    advance(1'234'567);
    auto const a = engine->calculate_boosted_rewards(ALICE, now).value();
    auto const b = engine->calculate_boosted_rewards(ALICE, now).value();
    EXPECT_EQ(a, b);
    EXPECT_EQ(engine->calculate_rewards(BOB, now).value(), 0);
}

///////////////////
// withdraw
///////////////////

TEST_F(Engine, withdraw_resets_accrual)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);

    advance(5 * SECONDS_PER_DAY);
    ASSERT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
    EXPECT_EQ(engine->user_account(ALICE).last_claim_time, now);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 0);
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);
    // principal is untouched
    EXPECT_EQ(engine->total_deposited(ALICE), 94 * ETHER);
}

TEST_F(Engine, daily_withdrawal_limit)
{
    auto config = StakingConfig{};
    config.daily_withdrawal_limit = ETHER;
    start(config);

    ASSERT_FALSE(deposit(ALICE, 1'000 * ETHER, 365).has_error());
    advance(30 * SECONDS_PER_DAY);
    auto const reserve = engine->pool_state().reward_reserve;
    auto const res = engine->withdraw(ctx(ALICE));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::DailyLimitExceeded);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
    EXPECT_EQ(engine->user_account(ALICE).last_claim_time, 0);
    EXPECT_EQ(engine->user_account(ALICE).total_withdrawn_today, 0);
}

TEST_F(Engine, daily_limit_rolls_over)
{
    auto config = without_commission();
    // about 0.137 ether a day on 1000 ether at 5%
    config.daily_withdrawal_limit = ETHER / 5;
    start(config);
    ASSERT_FALSE(deposit(ALICE, 1'000 * ETHER).has_error());

    advance(SECONDS_PER_DAY);
    ASSERT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
    advance(SECONDS_PER_DAY / 2);
    // 0.137 + 0.068 breaks the window opened half a day ago
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::DailyLimitExceeded);
    advance(SECONDS_PER_DAY / 2);
    EXPECT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
}

TEST_F(Engine, withdraw_requires_reserve)
{
    start(StakingConfig{}, false);
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::InsufficientRewardReserve);
    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(),
        StakingError::InsufficientRewardReserve);
}

TEST_F(Engine, withdraw_all_daily_limit)
{
    auto config = StakingConfig{};
    config.daily_withdrawal_limit = ETHER;
    start(config);

    ASSERT_FALSE(deposit(ALICE, 1'000 * ETHER).has_error());
    advance(30 * SECONDS_PER_DAY);
    auto const reserve = engine->pool_state().reward_reserve;
    auto const wallet = settlement->balance_of(ALICE);

    auto const res = engine->withdraw_all(ctx(ALICE));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::DailyLimitExceeded);

    EXPECT_EQ(engine->list_deposits(ALICE).size(), 1);
    EXPECT_EQ(engine->total_deposited(ALICE), 940 * ETHER);
    EXPECT_EQ(engine->pool_state().total_pool_balance, 940 * ETHER);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
    EXPECT_EQ(engine->user_account(ALICE).total_withdrawn_today, 0);
    EXPECT_EQ(settlement->balance_of(ALICE), wallet);
}

TEST_F(Engine, withdraw_all_requires_reserve)
{
    start(StakingConfig{}, false);
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);
    auto const wallet = settlement->balance_of(ALICE);

    auto const res = engine->withdraw_all(ctx(ALICE));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InsufficientRewardReserve);

    EXPECT_EQ(engine->list_deposits(ALICE).size(), 1);
    EXPECT_EQ(engine->total_deposited(ALICE), 94 * ETHER);
    EXPECT_EQ(engine->pool_state().total_pool_balance, 94 * ETHER);
    EXPECT_EQ(engine->pool_state().reward_reserve, 0);
    EXPECT_EQ(settlement->balance_of(ALICE), wallet);
}

TEST_F(Engine, withdraw_all_respects_lock)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 30).has_error());
    advance(30 * SECONDS_PER_DAY - 1);
    EXPECT_EQ(
        engine->withdraw_all(ctx(ALICE)).assume_error(),
        StakingError::FundsAreLocked);
    EXPECT_EQ(engine->list_deposits(ALICE).size(), 1);

    advance(1);
    auto const reward =
        engine->calculate_boosted_rewards_with_rarity_multiplier(ALICE, now)
            .value();
    auto const split = apply_withdrawal_commission(reward, 600, 0).value();
    auto const paid = engine->withdraw_all(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 94 * ETHER + split.net);
}

TEST_F(Engine, withdraw_all_no_double_accounting)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    ASSERT_FALSE(deposit(ALICE, 50 * ETHER).has_error());
    ASSERT_FALSE(deposit(BOB, 10 * ETHER).has_error());
    advance(SECONDS_PER_DAY);

    ASSERT_FALSE(engine->withdraw_all(ctx(ALICE)).has_error());
    EXPECT_TRUE(engine->list_deposits(ALICE).empty());
    EXPECT_EQ(engine->total_deposited(ALICE), 0);
    EXPECT_EQ(engine->pool_state().total_pool_balance, 94 * ETHER / 10);

    EXPECT_EQ(
        engine->withdraw_all(ctx(ALICE)).assume_error(),
        StakingError::NoDepositsFound);
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now + 1'000).value(), 0);
}

TEST_F(Engine, lock_reducer_shortens_lock)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 30).has_error());
    ASSERT_FALSE(activate(ALICE, 11, LOCK_REDUCER).has_error());
    uint64_t const lock = 30 * SECONDS_PER_DAY;
    EXPECT_EQ(engine->calculate_reduced_lock_time(ALICE, lock), lock * 3 / 4);

    advance(lock * 3 / 4);
    EXPECT_FALSE(engine->withdraw_all(ctx(ALICE)).has_error());
}

///////////////////
// compound
///////////////////

TEST_F(Engine, compound_reinvests_net_reward)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 30).has_error());
    advance(20 * SECONDS_PER_DAY);

    auto const reward =
        engine->calculate_boosted_rewards_with_rarity_multiplier(ALICE, now)
            .value();
    auto const split = apply_withdrawal_commission(reward, 600, 0).value();
    auto const reserve = engine->pool_state().reward_reserve;

    auto const res = engine->compound(ctx(ALICE));
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), split.net);

    auto const deposits = engine->list_deposits(ALICE);
    ASSERT_EQ(deposits.size(), 2);
    EXPECT_EQ(deposits[1].amount, split.net);
    EXPECT_EQ(deposits[1].lockup_days, 0);
    EXPECT_EQ(deposits[1].timestamp, now);
    EXPECT_EQ(engine->pool_state().total_pool_balance, 94 * ETHER + split.net);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve - reward);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), 0);

    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);
}

TEST_F(Engine, compound_at_deposit_cap)
{
    auto config = StakingConfig{};
    config.max_deposits_per_user = 1;
    start(config);
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);
    auto const reserve = engine->pool_state().reward_reserve;
    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(),
        StakingError::MaxDepositsReached);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
}

///////////////////
// bonus rewards
///////////////////

TEST_F(Engine, claim_bonus_rewards)
{
    EXPECT_EQ(
        engine->claim_bonus_rewards(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);
    EXPECT_EQ(
        engine->notify_quest_reward(ctx(ALICE), ALICE, ETHER).assume_error(),
        StakingError::Unauthorized);

    ASSERT_FALSE(
        engine->notify_quest_reward(ctx(NOTIFIER), ALICE, 10 * ETHER)
            .has_error());
    ASSERT_FALSE(
        engine->notify_achievement_reward(ctx(NOTIFIER), ALICE, 5 * ETHER)
            .has_error());
    EXPECT_EQ(engine->user_account(ALICE).quest_rewards, 10 * ETHER);

    auto const paid = engine->claim_bonus_rewards(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 141 * ETHER / 10);
    EXPECT_EQ(engine->user_account(ALICE).quest_rewards, 0);
    EXPECT_EQ(engine->user_account(ALICE).achievement_rewards, 0);
    EXPECT_EQ(
        engine->claim_bonus_rewards(ctx(ALICE)).assume_error(),
        StakingError::NoRewardsAvailable);
}

TEST_F(Engine, claim_bonus_daily_limit)
{
    auto config = StakingConfig{};
    config.daily_withdrawal_limit = ETHER;
    start(config);
    ASSERT_FALSE(
        engine->notify_quest_reward(ctx(NOTIFIER), ALICE, 10 * ETHER)
            .has_error());
    auto const reserve = engine->pool_state().reward_reserve;
    auto const wallet = settlement->balance_of(ALICE);

    EXPECT_EQ(
        engine->claim_bonus_rewards(ctx(ALICE)).assume_error(),
        StakingError::DailyLimitExceeded);

    EXPECT_EQ(engine->user_account(ALICE).quest_rewards, 10 * ETHER);
    EXPECT_EQ(engine->user_account(ALICE).total_withdrawn_today, 0);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
    EXPECT_EQ(settlement->balance_of(ALICE), wallet);
}

TEST_F(Engine, claim_bonus_requires_reserve)
{
    start(StakingConfig{}, false);
    ASSERT_FALSE(
        engine->notify_achievement_reward(ctx(NOTIFIER), ALICE, ETHER)
            .has_error());

    EXPECT_EQ(
        engine->claim_bonus_rewards(ctx(ALICE)).assume_error(),
        StakingError::InsufficientRewardReserve);
    EXPECT_EQ(engine->user_account(ALICE).achievement_rewards, ETHER);
    EXPECT_EQ(engine->pool_state().reward_reserve, 0);
}

///////////////////
// skills
///////////////////

TEST_F(Engine, skill_notifications)
{
    EXPECT_EQ(
        engine->notify_skill_activation(ctx(ALICE), ALICE, 1, STAKE_BOOST_I, 0)
            .assume_error(),
        StakingError::Unauthorized);
    ASSERT_FALSE(activate(ALICE, 1, STAKE_BOOST_I).has_error());
    EXPECT_EQ(
        activate(ALICE, 1, STAKE_BOOST_II).assume_error(),
        StakingError::SkillAlreadyActive);
    EXPECT_EQ(
        activate(ALICE, 2, 99).assume_error(), StakingError::InvalidSkillType);

    ASSERT_EQ(engine->user_account(ALICE).skills.size(), 1);
    EXPECT_EQ(engine->user_account(ALICE).skills[0].effect_bps, 500);

    ASSERT_FALSE(
        engine->notify_skill_deactivation(ctx(NOTIFIER), ALICE, 1).has_error());
    EXPECT_EQ(
        engine->notify_skill_deactivation(ctx(NOTIFIER), ALICE, 1)
            .assume_error(),
        StakingError::SkillNotActive);
    EXPECT_EQ(
        engine->notify_skill_deactivation(ctx(NOTIFIER), BOB, 1).assume_error(),
        StakingError::SkillNotActive);

    std::vector<uint64_t> const ids{1, 2};
    std::vector<uint8_t> const rarities{4, 5};
    EXPECT_EQ(
        engine->batch_set_skill_rarity(ctx(NOTIFIER), ids, rarities)
            .assume_error(),
        StakingError::InvalidRarity);
    EXPECT_EQ(engine->skills().rarity_of(1), Rarity::Common);
}

TEST_F(Engine, notifier_can_be_replaced)
{
    constexpr auto NEW_NOTIFIER = 0x5c112_address;
    EXPECT_EQ(
        engine->set_skill_notifier(ctx(ALICE), NEW_NOTIFIER).assume_error(),
        StakingError::Unauthorized);
    ASSERT_FALSE(
        engine->set_skill_notifier(ctx(OWNER), NEW_NOTIFIER).has_error());
    EXPECT_EQ(
        activate(ALICE, 1, STAKE_BOOST_I).assume_error(),
        StakingError::Unauthorized);
    EXPECT_FALSE(engine
                     ->notify_skill_activation(
                         ctx(NEW_NOTIFIER), ALICE, 1, STAKE_BOOST_I, 0)
                     .has_error());
}

///////////////////
// auto-compound
///////////////////

TEST_F(Engine, auto_compound_settings)
{
    EXPECT_EQ(
        engine->enable_auto_compound(ctx(ALICE), ETHER / 100 - 1)
            .assume_error(),
        StakingError::MinAmountTooLow);
    EXPECT_EQ(
        engine->disable_auto_compound(ctx(ALICE)).assume_error(),
        StakingError::AutoCompoundNotEnabled);

    ASSERT_FALSE(
        engine->enable_auto_compound(ctx(ALICE), ETHER / 100).has_error());
    auto const settings = engine->user_account(ALICE).auto_compound;
    EXPECT_TRUE(settings.enabled);
    EXPECT_EQ(settings.min_amount, ETHER / 100);
    EXPECT_EQ(settings.last_compound_time, now);

    ASSERT_FALSE(engine->disable_auto_compound(ctx(ALICE)).has_error());
    EXPECT_FALSE(engine->user_account(ALICE).auto_compound.enabled);
}

TEST_F(Engine, auto_compound_users_page)
{
    EXPECT_EQ(engine->auto_compound_users_page(0, 10).total, 0);
    for (auto const &user : {ALICE, BOB, CAROL}) {
        ASSERT_FALSE(
            engine->enable_auto_compound(ctx(user), ETHER / 100).has_error());
    }

    auto const all = engine->auto_compound_users_page(0, 10);
    EXPECT_EQ(all.total, 3);
    EXPECT_EQ(all.users, (std::vector<Address>{ALICE, BOB, CAROL}));
    ASSERT_EQ(all.settings.size(), 3);
    EXPECT_TRUE(all.settings[1].enabled);
    EXPECT_EQ(all.settings[1].min_amount, ETHER / 100);

    auto const middle = engine->auto_compound_users_page(1, 1);
    EXPECT_EQ(middle.total, 3);
    EXPECT_EQ(middle.users, (std::vector<Address>{BOB}));
    EXPECT_EQ(
        engine->auto_compound_users_page(2, 10).users,
        (std::vector<Address>{CAROL}));
    EXPECT_TRUE(engine->auto_compound_users_page(3, 10).users.empty());
    EXPECT_TRUE(engine->auto_compound_users_page(0, 0).users.empty());

    // updating the threshold keeps the slot
    ASSERT_FALSE(engine->enable_auto_compound(ctx(ALICE), ETHER).has_error());
    auto const updated = engine->auto_compound_users_page(0, 10);
    EXPECT_EQ(updated.users, (std::vector<Address>{ALICE, BOB, CAROL}));
    EXPECT_EQ(updated.settings[0].min_amount, ETHER);

    ASSERT_FALSE(engine->disable_auto_compound(ctx(ALICE)).has_error());
    auto const after = engine->auto_compound_users_page(0, 10);
    EXPECT_EQ(after.total, 2);
    EXPECT_EQ(after.users, (std::vector<Address>{CAROL, BOB}));

    // a rejected disable leaves the listing alone
    ASSERT_FALSE(engine->set_max_actions_per_day(ctx(OWNER), 1).has_error());
    EXPECT_EQ(
        engine->disable_auto_compound(ctx(BOB)).assume_error(),
        StakingError::TooManyActionsToday);
    EXPECT_EQ(engine->auto_compound_users_page(0, 10).total, 2);
    EXPECT_TRUE(engine->user_account(BOB).auto_compound.enabled);
}

TEST_F(Engine, auto_compound_waits_for_interval)
{
    ASSERT_FALSE(deposit(ALICE, 1'000 * ETHER).has_error());
    ASSERT_FALSE(
        engine->enable_auto_compound(ctx(ALICE), ETHER / 100).has_error());

    advance(SECONDS_PER_DAY - 1);
    EXPECT_FALSE(engine->check_auto_compound(ALICE, now));
    EXPECT_EQ(
        engine->perform_auto_compound(ctx(KEEPER), ALICE).assume_error(),
        StakingError::NoRewardsAvailable);

    advance(1);
    EXPECT_TRUE(engine->check_auto_compound(ALICE, now));
    auto const res = engine->perform_auto_compound(ctx(KEEPER), ALICE);
    ASSERT_FALSE(res.has_error());
    EXPECT_GT(res.value(), 0);
    EXPECT_EQ(engine->user_account(ALICE).auto_compound.last_compound_time, now);

    // same interval again
    advance(60);
    EXPECT_EQ(
        engine->perform_auto_compound(ctx(KEEPER), ALICE).assume_error(),
        StakingError::NoRewardsAvailable);
    // the keeper is not rate limited on the user's behalf
    EXPECT_EQ(engine->user_activity(ALICE).actions_today, 2);
}

TEST_F(Engine, auto_compound_respects_min_amount)
{
    ASSERT_FALSE(deposit(ALICE, 10 * ETHER).has_error());
    ASSERT_FALSE(engine->enable_auto_compound(ctx(ALICE), ETHER).has_error());
    advance(2 * SECONDS_PER_DAY);
    EXPECT_FALSE(engine->check_auto_compound(ALICE, now));
}

TEST_F(Engine, batch_auto_compound_partial_success)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    ASSERT_FALSE(
        engine->enable_auto_compound(ctx(ALICE), ETHER / 100).has_error());
    ASSERT_FALSE(deposit(BOB, 100 * ETHER).has_error());
    ASSERT_FALSE(
        engine->enable_auto_compound(ctx(BOB), ETHER / 100).has_error());
    ASSERT_FALSE(engine->disable_auto_compound(ctx(BOB)).has_error());
    ASSERT_FALSE(deposit(CAROL, 100 * ETHER).has_error());
    ASSERT_FALSE(
        engine->enable_auto_compound(ctx(CAROL), ETHER / 100).has_error());
    ASSERT_FALSE(engine->ban_user(ctx(OWNER), CAROL, "bot").has_error());

    advance(2 * SECONDS_PER_DAY);
    auto const expected =
        apply_withdrawal_commission(
            engine->calculate_boosted_rewards_with_rarity_multiplier(ALICE, now)
                .value(),
            600,
            0)
            .value()
            .net;

    std::vector<Address> const users{ALICE, BOB, CAROL, 0x404_address};
    auto const results = engine->batch_auto_compound(ctx(KEEPER), users);
    ASSERT_FALSE(results.has_error());
    ASSERT_EQ(results.value().size(), users.size());

    auto const &alice = results.value()[0];
    EXPECT_EQ(alice.user, ALICE);
    ASSERT_FALSE(alice.outcome.has_error());
    EXPECT_EQ(alice.outcome.value(), expected);
    EXPECT_EQ(engine->list_deposits(ALICE).size(), 2);

    EXPECT_EQ(
        results.value()[1].outcome.assume_error(),
        StakingError::NoRewardsAvailable);
    EXPECT_EQ(
        results.value()[2].outcome.assume_error(), StakingError::UserIsBanned);
    EXPECT_EQ(
        results.value()[3].outcome.assume_error(),
        StakingError::NoRewardsAvailable);
    EXPECT_EQ(engine->list_deposits(BOB).size(), 1);
    EXPECT_EQ(engine->list_deposits(CAROL).size(), 1);

    ASSERT_FALSE(engine->pause(ctx(OWNER)).has_error());
    EXPECT_EQ(
        engine->batch_auto_compound(ctx(KEEPER), users).assume_error(),
        StakingError::ContractPaused);
}

///////////////////
// anti-fraud
///////////////////

TEST_F(Engine, rate_limit_and_flagging)
{
    auto const fill_day = [&] {
        for (uint32_t i = 0; i < MAX_ACTIONS_PER_DAY; ++i) {
            ASSERT_FALSE(deposit(ALICE, 5 * ETHER).has_error());
            advance(1);
        }
        auto const res = deposit(ALICE, 5 * ETHER);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), StakingError::TooManyActionsToday);
    };

    uint64_t const day_one = now;
    fill_day();
    EXPECT_EQ(engine->list_deposits(ALICE).size(), MAX_ACTIONS_PER_DAY);
    now = day_one + SECONDS_PER_DAY;
    fill_day();
    EXPECT_FALSE(engine->user_activity(ALICE).flagged);
    now = day_one + 2 * SECONDS_PER_DAY;
    fill_day();

    auto const activity = engine->user_activity(ALICE);
    EXPECT_TRUE(activity.flagged);
    EXPECT_FALSE(activity.banned);
    EXPECT_EQ(activity.suspicious_score, 25);

    ASSERT_FALSE(engine->clear_flag(ctx(OWNER), ALICE).has_error());
    EXPECT_FALSE(engine->user_activity(ALICE).flagged);
}

TEST_F(Engine, admin_rate_limits)
{
    EXPECT_EQ(
        engine->set_max_actions_per_day(ctx(OWNER), 0).assume_error(),
        StakingError::InvalidInput);
    EXPECT_EQ(
        engine->set_suspicious_threshold(ctx(ALICE), 5).assume_error(),
        StakingError::Unauthorized);
    ASSERT_FALSE(engine->set_max_actions_per_day(ctx(OWNER), 1).has_error());
    ASSERT_FALSE(deposit(ALICE, 5 * ETHER).has_error());
    EXPECT_EQ(
        deposit(ALICE, 5 * ETHER).assume_error(),
        StakingError::TooManyActionsToday);
}

TEST_F(Engine, ban_blocks_mutations_not_reads)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    EXPECT_EQ(
        engine->ban_user(ctx(ALICE), BOB, "no").assume_error(),
        StakingError::Unauthorized);
    ASSERT_FALSE(engine->ban_user(ctx(OWNER), ALICE, "wash trading").has_error());
    EXPECT_EQ(engine->user_activity(ALICE).ban_reason, "wash trading");

    advance(SECONDS_PER_YEAR);
    EXPECT_EQ(
        deposit(ALICE, 10 * ETHER).assume_error(), StakingError::UserIsBanned);
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(), StakingError::UserIsBanned);
    EXPECT_EQ(
        engine->withdraw_all(ctx(ALICE)).assume_error(),
        StakingError::UserIsBanned);
    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(), StakingError::UserIsBanned);
    EXPECT_EQ(
        engine->enable_auto_compound(ctx(ALICE), ETHER).assume_error(),
        StakingError::UserIsBanned);
    EXPECT_FALSE(engine->calculate_rewards(ALICE, now).has_error());

    ASSERT_FALSE(engine->pause(ctx(OWNER)).has_error());
    EXPECT_EQ(
        engine->emergency_withdraw(ctx(ALICE)).assume_error(),
        StakingError::UserIsBanned);
    ASSERT_FALSE(engine->unpause(ctx(OWNER)).has_error());

    ASSERT_FALSE(engine->unban_user(ctx(OWNER), ALICE).has_error());
    EXPECT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
}

///////////////////
// emergency control
///////////////////

TEST_F(Engine, pause_and_emergency_withdraw)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 365).has_error());
    ASSERT_FALSE(deposit(ALICE, 20 * ETHER, 30).has_error());
    advance(10 * SECONDS_PER_DAY);

    EXPECT_EQ(
        engine->emergency_withdraw(ctx(ALICE)).assume_error(),
        StakingError::NotPaused);
    EXPECT_EQ(
        engine->pause(ctx(ALICE)).assume_error(), StakingError::Unauthorized);
    ASSERT_FALSE(engine->pause(ctx(OWNER)).has_error());
    EXPECT_EQ(
        engine->pause(ctx(OWNER)).assume_error(), StakingError::AlreadyPaused);
    EXPECT_TRUE(engine->pool_state().paused);

    EXPECT_EQ(
        deposit(ALICE, 10 * ETHER).assume_error(), StakingError::ContractPaused);
    EXPECT_EQ(
        engine->withdraw(ctx(ALICE)).assume_error(),
        StakingError::ContractPaused);
    EXPECT_EQ(
        engine->withdraw_all(ctx(ALICE)).assume_error(),
        StakingError::ContractPaused);
    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(),
        StakingError::ContractPaused);
    EXPECT_EQ(
        engine->claim_bonus_rewards(ctx(ALICE)).assume_error(),
        StakingError::ContractPaused);
    EXPECT_EQ(
        engine->perform_auto_compound(ctx(KEEPER), ALICE).assume_error(),
        StakingError::ContractPaused);

    auto const treasury = settlement->balance_of(TREASURY);
    auto const reserve = engine->pool_state().reward_reserve;
    auto const returned = engine->emergency_withdraw(ctx(ALICE));
    ASSERT_FALSE(returned.has_error());
    // full principal, locks ignored, no commission and no reward
    EXPECT_EQ(returned.value(), 94 * ETHER + 188 * ETHER / 10);
    EXPECT_EQ(settlement->balance_of(TREASURY), treasury);
    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
    EXPECT_TRUE(engine->list_deposits(ALICE).empty());
    EXPECT_EQ(engine->pool_state().total_pool_balance, 0);
    EXPECT_EQ(
        engine->emergency_withdraw(ctx(ALICE)).assume_error(),
        StakingError::NoDepositsFound);

    ASSERT_FALSE(engine->unpause(ctx(OWNER)).has_error());
    EXPECT_EQ(
        engine->unpause(ctx(OWNER)).assume_error(), StakingError::NotPaused);
    EXPECT_FALSE(deposit(ALICE, 10 * ETHER).has_error());
}

TEST_F(Engine, migrate_moves_reserve)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);

    EXPECT_EQ(
        engine->migrate(ctx(ALICE), DESTINATION).assume_error(),
        StakingError::Unauthorized);
    ASSERT_FALSE(engine->migrate(ctx(OWNER), DESTINATION).has_error());
    EXPECT_EQ(settlement->balance_of(DESTINATION), RESERVE);
    EXPECT_TRUE(engine->pool_state().migrated);
    EXPECT_EQ(engine->pool_state().reward_reserve, 0);
    EXPECT_EQ(
        engine->migrate(ctx(OWNER), DESTINATION).assume_error(),
        StakingError::AlreadyMigrated);

    EXPECT_EQ(
        deposit(BOB, 10 * ETHER).assume_error(),
        StakingError::ContractMigrated);
    EXPECT_EQ(
        engine->compound(ctx(ALICE)).assume_error(),
        StakingError::ContractMigrated);
    EXPECT_EQ(
        engine->add_reward_funds(ctx(OWNER), ETHER).assume_error(),
        StakingError::ContractMigrated);

    // exits stay open and return principal
    auto const paid = engine->withdraw_all(ctx(ALICE));
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 94 * ETHER);
}

TEST_F(Engine, reward_funding)
{
    EXPECT_EQ(
        engine->add_reward_funds(ctx(ALICE), ETHER).assume_error(),
        StakingError::Unauthorized);
    EXPECT_EQ(
        engine->add_reward_funds(ctx(OWNER), 0).assume_error(),
        StakingError::InvalidInput);
    EXPECT_EQ(
        engine->add_reward_funds(ctx(OWNER), WALLET).assume_error(),
        SettlementError::InsufficientFunds);
    ASSERT_FALSE(engine->add_reward_funds(ctx(OWNER), ETHER).has_error());
    EXPECT_EQ(engine->pool_state().reward_reserve, RESERVE + ETHER);
}

TEST_F(Engine, admin_configuration)
{
    EXPECT_EQ(
        engine->set_tier_apy(ctx(ALICE), 0, 100).assume_error(),
        StakingError::Unauthorized);
    EXPECT_EQ(
        engine->set_tier_apy(ctx(OWNER), 0, MAX_APY_BPS + 1).assume_error(),
        StakingError::InvalidApy);
    EXPECT_EQ(
        engine->set_tier_apy(ctx(OWNER), 45, 100).assume_error(),
        StakingError::InvalidLockupDuration);
    EXPECT_EQ(
        engine->set_treasury(ctx(OWNER), Address{}).assume_error(),
        StakingError::InvalidInput);

    constexpr auto NEW_TREASURY = 0x7ea6_address;
    ASSERT_FALSE(engine->set_treasury(ctx(OWNER), NEW_TREASURY).has_error());
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    EXPECT_EQ(settlement->balance_of(NEW_TREASURY), 6 * ETHER);
    EXPECT_EQ(engine->pool_state().treasury, NEW_TREASURY);

    ASSERT_FALSE(engine
                     ->set_skill_default_effect(ctx(OWNER), STAKE_BOOST_I, 800)
                     .has_error());
    ASSERT_FALSE(activate(BOB, 1, STAKE_BOOST_I).has_error());
    EXPECT_EQ(engine->user_account(BOB).skills[0].effect_bps, 800);
}

///////////////////
// atomicity and reentrancy
///////////////////

TEST_F(Engine, failed_fee_transfer_rolls_back_deposit)
{
    settlement->reject_transfers_to(TREASURY);
    auto const res = deposit(ALICE, 100 * ETHER);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), SettlementError::TransferRejected);

    EXPECT_EQ(settlement->balance_of(ALICE), WALLET);
    EXPECT_TRUE(engine->list_deposits(ALICE).empty());
    EXPECT_EQ(engine->pool_state().total_pool_balance, 0);
    EXPECT_EQ(engine->pool_state().unique_users_count, 0);
    EXPECT_EQ(engine->user_activity(ALICE).actions_today, 0);
}

TEST_F(Engine, failed_payout_rolls_back_withdraw)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);
    auto const reward = engine->calculate_rewards(ALICE, now).value();
    auto const reserve = engine->pool_state().reward_reserve;

    settlement->set_receive_hook(
        ALICE, [](Address const &, uint256_t const &) -> Result<void> {
            return StakingError::InternalError;
        });
    auto const res = engine->withdraw(ctx(ALICE));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), SettlementError::TransferRejected);

    EXPECT_EQ(engine->pool_state().reward_reserve, reserve);
    EXPECT_EQ(engine->user_account(ALICE).last_claim_time, 0);
    EXPECT_EQ(engine->user_account(ALICE).total_withdrawn_today, 0);
    EXPECT_EQ(engine->calculate_rewards(ALICE, now).value(), reward);
    EXPECT_EQ(engine->user_activity(ALICE).actions_today, 1);

    settlement->clear_receive_hook(ALICE);
    EXPECT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
}

TEST_F(Engine, reentrant_call_is_rejected)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);

    std::optional<Result<uint256_t>> inner;
    settlement->set_receive_hook(
        ALICE, [&](Address const &, uint256_t const &) -> Result<void> {
            inner.emplace(engine->withdraw_all(ctx(ALICE)));
            return outcome::success();
        });

    auto const outer = engine->withdraw(ctx(ALICE));
    ASSERT_FALSE(outer.has_error());
    ASSERT_TRUE(inner.has_value());
    ASSERT_TRUE(inner->has_error());
    EXPECT_EQ(inner->assume_error(), StakingError::ReentrancyDetected);
    // the nested call changed nothing
    EXPECT_EQ(engine->total_deposited(ALICE), 94 * ETHER);

    // the guard is released afterwards
    settlement->clear_receive_hook(ALICE);
    EXPECT_FALSE(deposit(ALICE, 10 * ETHER).has_error());
}

TEST_F(Engine, reentrant_bonus_credit_is_rejected)
{
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER).has_error());
    advance(SECONDS_PER_DAY);

    std::optional<Result<void>> quest;
    std::optional<Result<void>> achievement;
    settlement->set_receive_hook(
        ALICE, [&](Address const &, uint256_t const &) -> Result<void> {
            quest.emplace(
                engine->notify_quest_reward(ctx(NOTIFIER), ALICE, 10 * ETHER));
            achievement.emplace(engine->notify_achievement_reward(
                ctx(NOTIFIER), ALICE, 5 * ETHER));
            return outcome::success();
        });

    ASSERT_FALSE(engine->withdraw(ctx(ALICE)).has_error());
    ASSERT_TRUE(quest.has_value());
    ASSERT_TRUE(achievement.has_value());
    EXPECT_EQ(quest->assume_error(), StakingError::ReentrancyDetected);
    EXPECT_EQ(achievement->assume_error(), StakingError::ReentrancyDetected);
    EXPECT_EQ(engine->user_account(ALICE).quest_rewards, 0);
    EXPECT_EQ(engine->user_account(ALICE).achievement_rewards, 0);

    settlement->clear_receive_hook(ALICE);
    EXPECT_FALSE(
        engine->notify_quest_reward(ctx(NOTIFIER), ALICE, 10 * ETHER)
            .has_error());
    EXPECT_EQ(engine->user_account(ALICE).quest_rewards, 10 * ETHER);
}

TEST_F(Engine, invariants_hold_across_a_session)
{
    start(StakingConfig{});
    ASSERT_FALSE(deposit(ALICE, 100 * ETHER, 30).has_error());
    ASSERT_FALSE(deposit(BOB, 250 * ETHER, 90).has_error());
    EXPECT_TRUE(engine->invariants_hold());

    advance(31 * SECONDS_PER_DAY);
    ASSERT_FALSE(engine->withdraw(ctx(BOB)).has_error());
    EXPECT_TRUE(engine->invariants_hold());
    ASSERT_FALSE(engine->compound(ctx(ALICE)).has_error());
    EXPECT_TRUE(engine->invariants_hold());
    advance(SECONDS_PER_DAY);
    ASSERT_FALSE(engine->withdraw_all(ctx(ALICE)).has_error());
    EXPECT_TRUE(engine->invariants_hold());

    EXPECT_EQ(
        settlement->custody_balance(),
        engine->pool_state().total_pool_balance +
            engine->pool_state().reward_reserve);
    EXPECT_EQ(engine->pool_state().unique_users_count, 2);
}
