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

#include <nuvo/core/assert.h>
#include <nuvo/core/checked_math.hpp>
#include <nuvo/core/fmt/address_fmt.hpp>
#include <nuvo/core/fmt/amount_fmt.hpp>
#include <nuvo/core/likely.h>
#include <nuvo/staking/commission.hpp>
#include <nuvo/staking/reentrancy_guard.hpp>
#include <nuvo/staking/staking_engine.hpp>
#include <nuvo/staking/util/constants.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <utility>

NUVO_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<void>
check_entry(ReentrancyGuard const &guard, Address const &caller)
{
    if (NUVO_UNLIKELY(!guard.owns_lock())) {
        LOG_WARNING("StakingEngine: reentrant call from {} rejected", caller);
        return StakingError::ReentrancyDetected;
    }
    return outcome::success();
}

std::span<ActiveSkill const> skills_of(UserAccount const *const account)
{
    if (account == nullptr) {
        return {};
    }
    return account->skills;
}

NUVO_STAKING_ANONYMOUS_NAMESPACE_END

NUVO_STAKING_NAMESPACE_BEGIN

// Captures every piece of state a single-user operation may touch and opens
// a settlement frame. Unless commit() is called the destructor puts it all
// back and rejects the frame.
class StakingEngine::Checkpoint
{
    StakingEngine &engine_;
    Address user_;
    DepositLedger::Snapshot ledger_;
    std::optional<UserAccount> account_;
    std::optional<UserActivity> activity_;
    uint256_t reward_reserve_;
    bool auto_compound_listed_;
    bool committed_{false};

public:
    Checkpoint(StakingEngine &engine, Address const &user)
        : engine_{engine}
        , user_{user}
        , ledger_{engine.ledger_.snapshot(user)}
        , activity_{engine.rate_limiter_.snapshot(user)}
        , reward_reserve_{engine.reward_reserve_}
        , auto_compound_listed_{engine.auto_compound_users_.contains(user)}
    {
        if (auto const *const account = engine.find_account(user)) {
            account_ = *account;
        }
        engine_.settlement_.push();
    }

    Checkpoint(Checkpoint const &) = delete;
    Checkpoint &operator=(Checkpoint const &) = delete;

    ~Checkpoint()
    {
        if (committed_) {
            return;
        }
        engine_.ledger_.restore(std::move(ledger_));
        if (account_.has_value()) {
            engine_.accounts_[user_] = std::move(*account_);
        }
        else {
            engine_.accounts_.erase(user_);
        }
        engine_.rate_limiter_.restore(user_, std::move(activity_));
        engine_.reward_reserve_ = reward_reserve_;
        if (auto_compound_listed_) {
            engine_.auto_compound_users_.insert(user_);
        }
        else {
            engine_.auto_compound_users_.erase(user_);
        }
        engine_.settlement_.pop_reject();
        LOG_DEBUG("StakingEngine: rolled back operation for {}", user_);
    }

    void commit()
    {
        NUVO_ASSERT(!committed_);
        committed_ = true;
        engine_.settlement_.pop_accept();
        engine_.check_solvency();
    }
};

StakingEngine::StakingEngine(
    StakingConfig const &config, SettlementPort &settlement,
    Address const &owner, Address const &treasury,
    Address const &skill_notifier)
    : config_{config}
    , settlement_{settlement}
    , owner_{owner}
    , skill_notifier_{skill_notifier}
    , treasury_{treasury}
    , ledger_{config.max_deposits_per_user}
    , tiers_{config}
    , skills_{config.max_active_skills}
    , rate_limiter_{config}
    , calculator_{tiers_, skills_}
{
    NUVO_ASSERT(!validate(config_).has_error());
}

///////////////////
// Access checks //
///////////////////

Result<void> StakingEngine::require_not_paused() const
{
    if (NUVO_UNLIKELY(paused_)) {
        return StakingError::ContractPaused;
    }
    return outcome::success();
}

Result<void> StakingEngine::require_not_migrated() const
{
    if (NUVO_UNLIKELY(migrated_)) {
        return StakingError::ContractMigrated;
    }
    return outcome::success();
}

Result<void> StakingEngine::require_not_banned(Address const &user) const
{
    if (NUVO_UNLIKELY(rate_limiter_.is_banned(user))) {
        return StakingError::UserIsBanned;
    }
    return outcome::success();
}

Result<void> StakingEngine::require_owner(Address const &sender) const
{
    if (NUVO_UNLIKELY(sender != owner_)) {
        return StakingError::Unauthorized;
    }
    return outcome::success();
}

Result<void> StakingEngine::require_notifier(Address const &sender) const
{
    if (NUVO_UNLIKELY(sender != skill_notifier_)) {
        return StakingError::Unauthorized;
    }
    return outcome::success();
}

///////////////
// Internals //
///////////////

UserAccount const *StakingEngine::find_account(Address const &user) const
{
    auto const it = accounts_.find(user);
    return it == accounts_.end() ? nullptr : &it->second;
}

Result<uint256_t> StakingEngine::pending_rewards(
    Address const &user, UserAccount const &account, uint64_t const now) const
{
    return calculator_.calculate_boosted_rewards_with_rarity_multiplier(
        ledger_.list_deposits(user),
        account.skills,
        account.last_claim_time,
        now);
}

Result<void> StakingEngine::charge_daily_limit(
    UserAccount &account, uint256_t const &amount, uint64_t const now)
{
    uint256_t withdrawn = account.total_withdrawn_today;
    uint64_t window = account.last_withdraw_day;
    if (withdrawn == 0 || now >= window + SECONDS_PER_DAY) {
        withdrawn = 0;
        window = now;
    }
    BOOST_OUTCOME_TRY(auto const total, checked_add(withdrawn, amount));
    if (NUVO_UNLIKELY(total > config_.daily_withdrawal_limit)) {
        return StakingError::DailyLimitExceeded;
    }
    account.total_withdrawn_today = total;
    account.last_withdraw_day = window;
    return outcome::success();
}

Result<void> StakingEngine::draw_reserve(uint256_t const &amount)
{
    if (NUVO_UNLIKELY(reward_reserve_ < amount)) {
        return StakingError::InsufficientRewardReserve;
    }
    reward_reserve_ -= amount;
    return outcome::success();
}

Result<void> StakingEngine::pay_fee(uint256_t const &fee)
{
    if (fee == 0) {
        return outcome::success();
    }
    return settlement_.transfer(treasury_, fee);
}

Result<uint256_t>
StakingEngine::compound_for(Address const &user, uint64_t const now)
{
    BOOST_OUTCOME_TRY(require_not_migrated());

    auto &account = accounts_[user];
    BOOST_OUTCOME_TRY(auto const reward, pending_rewards(user, account, now));
    if (reward == 0) {
        return StakingError::NoRewardsAvailable;
    }
    BOOST_OUTCOME_TRY(
        auto const split,
        apply_withdrawal_commission(
            reward,
            config_.commission_bps,
            RewardCalculator::fee_discount_bps(account.skills)));

    BOOST_OUTCOME_TRY(draw_reserve(reward));
    BOOST_OUTCOME_TRY(ledger_.add_deposit(
        user, Deposit{.amount = split.net, .timestamp = now, .lockup_days = 0}));
    account.last_claim_time = now;
    account.auto_compound.last_compound_time = now;
    BOOST_OUTCOME_TRY(pay_fee(split.fee));

    LOG_INFO(
        "StakingEngine: {} compounded {} (fee {})", user, split.net, split.fee);
    return split.net;
}

Result<uint256_t>
StakingEngine::auto_compound_one(Address const &user, uint64_t const now)
{
    BOOST_OUTCOME_TRY(require_not_banned(user));
    if (!check_auto_compound(user, now)) {
        return StakingError::NoRewardsAvailable;
    }
    return compound_for(user, now);
}

void StakingEngine::check_solvency() const
{
    NUVO_ASSERT(ledger_.sum_of_principal() == ledger_.total_pool_balance());
    auto const owed = checked_add(ledger_.total_pool_balance(), reward_reserve_);
    NUVO_ASSERT(!owed.has_error());
    NUVO_ASSERT(settlement_.custody_balance() >= owed.value());
}

////////////////////
// User interface //
////////////////////

Result<void> StakingEngine::deposit(
    CallContext const &ctx, uint256_t const &value, uint16_t const lockup_days)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_migrated());
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    BOOST_OUTCOME_TRY(auto const tier, tiers_.find(lockup_days));
    if (NUVO_UNLIKELY(!tier->is_active)) {
        return StakingError::TierInactive;
    }
    if (NUVO_UNLIKELY(value < config_.min_deposit || value < tier->min_stake)) {
        return StakingError::DepositTooLow;
    }
    if (NUVO_UNLIKELY(value > config_.max_deposit || value > tier->max_stake)) {
        return StakingError::DepositTooHigh;
    }
    if (NUVO_UNLIKELY(
            ledger_.deposit_count(ctx.sender) >=
            config_.max_deposits_per_user)) {
        return StakingError::MaxDepositsReached;
    }

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));

    BOOST_OUTCOME_TRY(
        auto const split,
        apply_deposit_commission(value, config_.commission_bps));
    BOOST_OUTCOME_TRY(ledger_.add_deposit(
        ctx.sender,
        Deposit{
            .amount = split.net,
            .timestamp = ctx.timestamp,
            .lockup_days = lockup_days}));
    BOOST_OUTCOME_TRY(settlement_.pull(ctx.sender, value));
    BOOST_OUTCOME_TRY(pay_fee(split.fee));
    checkpoint.commit();

    LOG_INFO(
        "StakingEngine: {} deposited {} for {} days, principal {} fee {}",
        ctx.sender,
        value,
        lockup_days,
        split.net,
        split.fee);
    return outcome::success();
}

Result<uint256_t> StakingEngine::withdraw(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));

    auto &account = accounts_[ctx.sender];
    BOOST_OUTCOME_TRY(
        auto const reward, pending_rewards(ctx.sender, account, ctx.timestamp));
    if (reward == 0) {
        return StakingError::NoRewardsAvailable;
    }
    BOOST_OUTCOME_TRY(
        auto const split,
        apply_withdrawal_commission(
            reward,
            config_.commission_bps,
            RewardCalculator::fee_discount_bps(account.skills)));
    BOOST_OUTCOME_TRY(charge_daily_limit(account, split.net, ctx.timestamp));
    BOOST_OUTCOME_TRY(draw_reserve(reward));
    account.last_claim_time = ctx.timestamp;

    BOOST_OUTCOME_TRY(settlement_.transfer(ctx.sender, split.net));
    BOOST_OUTCOME_TRY(pay_fee(split.fee));
    checkpoint.commit();

    LOG_INFO(
        "StakingEngine: {} withdrew reward {} (fee {})",
        ctx.sender,
        split.net,
        split.fee);
    return split.net;
}

Result<uint256_t> StakingEngine::withdraw_all(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    auto const deposits = ledger_.list_deposits(ctx.sender);
    if (deposits.empty()) {
        return StakingError::NoDepositsFound;
    }
    uint64_t const reduction = RewardCalculator::lock_reduction_bps(
        skills_of(find_account(ctx.sender)));
    for (auto const &deposit : deposits) {
        uint64_t const lock = RewardCalculator::reduced_lock_time(
            deposit.lockup_duration(), reduction);
        if (ctx.timestamp < deposit.timestamp + lock) {
            return StakingError::FundsAreLocked;
        }
    }

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));

    auto &account = accounts_[ctx.sender];
    BOOST_OUTCOME_TRY(
        auto const reward, pending_rewards(ctx.sender, account, ctx.timestamp));
    CommissionSplit split{.net = 0, .fee = 0};
    // the reserve left with the migration, so only principal is returned
    if (reward > 0 && !migrated_) {
        BOOST_OUTCOME_TRY(
            auto const reward_split,
            apply_withdrawal_commission(
                reward,
                config_.commission_bps,
                RewardCalculator::fee_discount_bps(account.skills)));
        split = reward_split;
        BOOST_OUTCOME_TRY(
            charge_daily_limit(account, split.net, ctx.timestamp));
        BOOST_OUTCOME_TRY(draw_reserve(reward));
    }
    BOOST_OUTCOME_TRY(auto const principal, ledger_.clear_deposits(ctx.sender));
    account.last_claim_time = ctx.timestamp;

    BOOST_OUTCOME_TRY(auto const payout, checked_add(principal, split.net));
    BOOST_OUTCOME_TRY(settlement_.transfer(ctx.sender, payout));
    BOOST_OUTCOME_TRY(pay_fee(split.fee));
    checkpoint.commit();

    LOG_INFO(
        "StakingEngine: {} withdrew all, principal {} reward {} (fee {})",
        ctx.sender,
        principal,
        split.net,
        split.fee);
    return payout;
}

Result<uint256_t> StakingEngine::compound(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_migrated());
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));
    BOOST_OUTCOME_TRY(auto const amount, compound_for(ctx.sender, ctx.timestamp));
    checkpoint.commit();
    return amount;
}

Result<uint256_t> StakingEngine::claim_bonus_rewards(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));

    auto &account = accounts_[ctx.sender];
    BOOST_OUTCOME_TRY(
        auto const bonus,
        checked_add(account.quest_rewards, account.achievement_rewards));
    if (bonus == 0) {
        return StakingError::NoRewardsAvailable;
    }
    BOOST_OUTCOME_TRY(
        auto const split,
        apply_withdrawal_commission(
            bonus,
            config_.commission_bps,
            RewardCalculator::fee_discount_bps(account.skills)));
    BOOST_OUTCOME_TRY(charge_daily_limit(account, split.net, ctx.timestamp));
    BOOST_OUTCOME_TRY(draw_reserve(bonus));
    account.quest_rewards = 0;
    account.achievement_rewards = 0;

    BOOST_OUTCOME_TRY(settlement_.transfer(ctx.sender, split.net));
    BOOST_OUTCOME_TRY(pay_fee(split.fee));
    checkpoint.commit();

    LOG_INFO(
        "StakingEngine: {} claimed bonus {} (fee {})",
        ctx.sender,
        split.net,
        split.fee);
    return split.net;
}

Result<uint256_t> StakingEngine::emergency_withdraw(CallContext const &ctx)
{
    if (NUVO_UNLIKELY(!paused_)) {
        return StakingError::NotPaused;
    }
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    if (ledger_.deposit_count(ctx.sender) == 0) {
        return StakingError::NoDepositsFound;
    }

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(auto const principal, ledger_.clear_deposits(ctx.sender));
    BOOST_OUTCOME_TRY(settlement_.transfer(ctx.sender, principal));
    checkpoint.commit();

    LOG_WARNING(
        "StakingEngine: emergency withdrawal of {} by {}",
        principal,
        ctx.sender);
    return principal;
}

Result<void> StakingEngine::enable_auto_compound(
    CallContext const &ctx, uint256_t const &min_amount)
{
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));
    if (NUVO_UNLIKELY(min_amount < config_.min_auto_compound_amount)) {
        return StakingError::MinAmountTooLow;
    }

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));
    auto &settings = accounts_[ctx.sender].auto_compound;
    settings.enabled = true;
    settings.min_amount = min_amount;
    settings.last_compound_time = ctx.timestamp;
    auto_compound_users_.insert(ctx.sender);
    checkpoint.commit();
    return outcome::success();
}

Result<void> StakingEngine::disable_auto_compound(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_not_banned(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));
    auto const *const account = find_account(ctx.sender);
    if (account == nullptr || !account->auto_compound.enabled) {
        return StakingError::AutoCompoundNotEnabled;
    }

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(rate_limiter_.record_action(ctx.sender, ctx.timestamp));
    accounts_[ctx.sender].auto_compound.enabled = false;
    auto_compound_users_.erase(ctx.sender);
    checkpoint.commit();
    return outcome::success();
}

//////////////////////
// Keeper interface //
//////////////////////

bool StakingEngine::check_auto_compound(
    Address const &user, uint64_t const now) const
{
    auto const *const account = find_account(user);
    if (account == nullptr || !account->auto_compound.enabled) {
        return false;
    }
    auto const &settings = account->auto_compound;
    if (now < settings.last_compound_time + config_.auto_compound_interval) {
        return false;
    }
    auto const reward = pending_rewards(user, *account, now);
    if (reward.has_error()) {
        return false;
    }
    return reward.value() > 0 && reward.value() >= settings.min_amount;
}

AutoCompoundUsersPage StakingEngine::auto_compound_users_page(
    size_t const offset, size_t const limit) const
{
    auto const &enrolled = auto_compound_users_.values();
    AutoCompoundUsersPage page{
        .users = {}, .settings = {}, .total = enrolled.size()};
    if (offset >= enrolled.size()) {
        return page;
    }
    size_t const end = offset + std::min(limit, enrolled.size() - offset);
    page.users.assign(enrolled.begin() + static_cast<std::ptrdiff_t>(offset),
                      enrolled.begin() + static_cast<std::ptrdiff_t>(end));
    page.settings.reserve(page.users.size());
    for (auto const &user : page.users) {
        auto const *const account = find_account(user);
        NUVO_ASSERT(account != nullptr && account->auto_compound.enabled);
        page.settings.push_back(account->auto_compound);
    }
    return page;
}

Result<uint256_t> StakingEngine::perform_auto_compound(
    CallContext const &ctx, Address const &user)
{
    BOOST_OUTCOME_TRY(require_not_paused());
    BOOST_OUTCOME_TRY(require_not_migrated());
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, user};
    BOOST_OUTCOME_TRY(
        auto const amount, auto_compound_one(user, ctx.timestamp));
    checkpoint.commit();
    return amount;
}

Result<std::vector<AutoCompoundResult>> StakingEngine::batch_auto_compound(
    CallContext const &ctx, std::span<Address const> const users)
{
    BOOST_OUTCOME_TRY(require_not_paused());

    std::vector<AutoCompoundResult> results;
    results.reserve(users.size());
    size_t compounded = 0;
    for (auto const &user : users) {
        ReentrancyGuard const guard{entered_};
        if (NUVO_UNLIKELY(!guard.owns_lock())) {
            results.push_back(
                {.user = user, .outcome = StakingError::ReentrancyDetected});
            continue;
        }
        Checkpoint checkpoint{*this, user};
        auto res = auto_compound_one(user, ctx.timestamp);
        if (!res.has_error()) {
            checkpoint.commit();
            ++compounded;
        }
        else {
            LOG_DEBUG(
                "StakingEngine: auto-compound skipped for {}: {}",
                user,
                res.error().message().c_str());
        }
        results.push_back({.user = user, .outcome = std::move(res)});
    }

    LOG_INFO(
        "StakingEngine: auto-compound sweep by {}, {} of {} compounded",
        ctx.sender,
        compounded,
        users.size());
    return results;
}

////////////////////////
// Notifier interface //
////////////////////////

Result<void> StakingEngine::notify_skill_activation(
    CallContext const &ctx, Address const &user, uint64_t const source_id,
    uint8_t const skill_type, uint16_t const effect_bps)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    auto const *const account = find_account(user);
    std::vector<ActiveSkill> skills =
        account == nullptr ? std::vector<ActiveSkill>{} : account->skills;
    BOOST_OUTCOME_TRY(
        skills_.activate(skills, source_id, skill_type, effect_bps));
    accounts_[user].skills = std::move(skills);

    LOG_DEBUG(
        "StakingEngine: skill {} (type {}) activated for {}",
        source_id,
        skill_type,
        user);
    return outcome::success();
}

Result<void> StakingEngine::notify_skill_deactivation(
    CallContext const &ctx, Address const &user, uint64_t const source_id)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    auto const it = accounts_.find(user);
    if (it == accounts_.end()) {
        return StakingError::SkillNotActive;
    }
    BOOST_OUTCOME_TRY(skills_.deactivate(it->second.skills, source_id));
    LOG_DEBUG(
        "StakingEngine: skill {} deactivated for {}", source_id, user);
    return outcome::success();
}

Result<void> StakingEngine::set_skill_rarity(
    CallContext const &ctx, uint64_t const source_id, uint8_t const rarity)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    return skills_.set_rarity(source_id, rarity);
}

Result<void> StakingEngine::batch_set_skill_rarity(
    CallContext const &ctx, std::span<uint64_t const> const source_ids,
    std::span<uint8_t const> const rarities)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    return skills_.batch_set_rarity(source_ids, rarities);
}

Result<void> StakingEngine::notify_quest_reward(
    CallContext const &ctx, Address const &user, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));
    if (NUVO_UNLIKELY(amount == 0)) {
        return StakingError::InvalidInput;
    }
    auto const *const account = find_account(user);
    BOOST_OUTCOME_TRY(
        auto const total,
        checked_add(
            account == nullptr ? uint256_t{0} : account->quest_rewards,
            amount));
    accounts_[user].quest_rewards = total;
    return outcome::success();
}

Result<void> StakingEngine::notify_achievement_reward(
    CallContext const &ctx, Address const &user, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_notifier(ctx.sender));
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));
    if (NUVO_UNLIKELY(amount == 0)) {
        return StakingError::InvalidInput;
    }
    auto const *const account = find_account(user);
    BOOST_OUTCOME_TRY(
        auto const total,
        checked_add(
            account == nullptr ? uint256_t{0} : account->achievement_rewards,
            amount));
    accounts_[user].achievement_rewards = total;
    return outcome::success();
}

/////////////////////
// Admin interface //
/////////////////////

Result<void> StakingEngine::pause(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    if (NUVO_UNLIKELY(paused_)) {
        return StakingError::AlreadyPaused;
    }
    paused_ = true;
    LOG_WARNING("StakingEngine: paused by {}", ctx.sender);
    return outcome::success();
}

Result<void> StakingEngine::unpause(CallContext const &ctx)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    if (NUVO_UNLIKELY(!paused_)) {
        return StakingError::NotPaused;
    }
    paused_ = false;
    LOG_INFO("StakingEngine: unpaused by {}", ctx.sender);
    return outcome::success();
}

Result<void> StakingEngine::ban_user(
    CallContext const &ctx, Address const &user, std::string reason)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    LOG_WARNING("StakingEngine: banning {}: {}", user, reason);
    rate_limiter_.ban(user, std::move(reason));
    return outcome::success();
}

Result<void>
StakingEngine::unban_user(CallContext const &ctx, Address const &user)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    rate_limiter_.unban(user);
    LOG_INFO("StakingEngine: unbanned {}", user);
    return outcome::success();
}

Result<void>
StakingEngine::clear_flag(CallContext const &ctx, Address const &user)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    rate_limiter_.clear_flag(user);
    return outcome::success();
}

Result<void> StakingEngine::set_tier_apy(
    CallContext const &ctx, uint16_t const lockup_days, uint64_t const apy_bps)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    BOOST_OUTCOME_TRY(tiers_.set_apy(lockup_days, apy_bps, ctx.timestamp));
    LOG_INFO(
        "StakingEngine: {} day tier now pays {} bps from {}",
        lockup_days,
        apy_bps,
        ctx.timestamp);
    return outcome::success();
}

Result<void>
StakingEngine::toggle_tier(CallContext const &ctx, uint16_t const lockup_days)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    return tiers_.toggle(lockup_days);
}

Result<void> StakingEngine::set_tier_limits(
    CallContext const &ctx, uint16_t const lockup_days,
    uint256_t const &min_stake, uint256_t const &max_stake)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    return tiers_.set_limits(lockup_days, min_stake, max_stake);
}

Result<void> StakingEngine::set_skill_default_effect(
    CallContext const &ctx, uint8_t const skill_type, uint16_t const effect_bps)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    return skills_.set_default_effect(skill_type, effect_bps);
}

Result<void>
StakingEngine::set_treasury(CallContext const &ctx, Address const &treasury)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    if (NUVO_UNLIKELY(treasury == Address{})) {
        return StakingError::InvalidInput;
    }
    treasury_ = treasury;
    return outcome::success();
}

Result<void>
StakingEngine::set_skill_notifier(CallContext const &ctx, Address const &notifier)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    if (NUVO_UNLIKELY(notifier == Address{})) {
        return StakingError::InvalidInput;
    }
    skill_notifier_ = notifier;
    return outcome::success();
}

Result<void> StakingEngine::set_max_actions_per_day(
    CallContext const &ctx, uint32_t const value)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    return rate_limiter_.set_max_actions_per_day(value);
}

Result<void> StakingEngine::set_suspicious_threshold(
    CallContext const &ctx, uint64_t const value)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    return rate_limiter_.set_suspicious_threshold(value);
}

Result<void>
StakingEngine::add_reward_funds(CallContext const &ctx, uint256_t const &value)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    BOOST_OUTCOME_TRY(require_not_migrated());
    if (NUVO_UNLIKELY(value == 0)) {
        return StakingError::InvalidInput;
    }
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, ctx.sender};
    BOOST_OUTCOME_TRY(auto const reserve, checked_add(reward_reserve_, value));
    BOOST_OUTCOME_TRY(settlement_.pull(ctx.sender, value));
    reward_reserve_ = reserve;
    checkpoint.commit();

    LOG_INFO(
        "StakingEngine: reward reserve funded with {}, now {}",
        value,
        reward_reserve_);
    return outcome::success();
}

Result<void>
StakingEngine::migrate(CallContext const &ctx, Address const &destination)
{
    BOOST_OUTCOME_TRY(require_owner(ctx.sender));
    if (NUVO_UNLIKELY(migrated_)) {
        return StakingError::AlreadyMigrated;
    }
    if (NUVO_UNLIKELY(destination == Address{})) {
        return StakingError::InvalidInput;
    }
    ReentrancyGuard const guard{entered_};
    BOOST_OUTCOME_TRY(check_entry(guard, ctx.sender));

    Checkpoint checkpoint{*this, ctx.sender};
    uint256_t const moved = reward_reserve_;
    if (moved > 0) {
        BOOST_OUTCOME_TRY(settlement_.transfer(destination, moved));
    }
    reward_reserve_ = 0;
    migrated_ = true;
    checkpoint.commit();

    LOG_WARNING(
        "StakingEngine: migrated to {}, moved reward reserve {}",
        destination,
        moved);
    return outcome::success();
}

///////////
// Reads //
///////////

Result<uint256_t>
StakingEngine::calculate_rewards(Address const &user, uint64_t const now) const
{
    auto const *const account = find_account(user);
    return calculator_.calculate_rewards(
        ledger_.list_deposits(user),
        account == nullptr ? 0 : account->last_claim_time,
        now);
}

Result<uint256_t> StakingEngine::calculate_boosted_rewards(
    Address const &user, uint64_t const now) const
{
    auto const *const account = find_account(user);
    return calculator_.calculate_boosted_rewards(
        ledger_.list_deposits(user),
        skills_of(account),
        account == nullptr ? 0 : account->last_claim_time,
        now);
}

Result<uint256_t>
StakingEngine::calculate_boosted_rewards_with_rarity_multiplier(
    Address const &user, uint64_t const now) const
{
    auto const *const account = find_account(user);
    return calculator_.calculate_boosted_rewards_with_rarity_multiplier(
        ledger_.list_deposits(user),
        skills_of(account),
        account == nullptr ? 0 : account->last_claim_time,
        now);
}

uint64_t StakingEngine::calculate_reduced_lock_time(
    Address const &user, uint64_t const lockup_duration) const
{
    return RewardCalculator::reduced_lock_time(
        lockup_duration,
        RewardCalculator::lock_reduction_bps(skills_of(find_account(user))));
}

uint64_t StakingEngine::calculate_fee_discount(Address const &user) const
{
    return RewardCalculator::fee_discount_bps(skills_of(find_account(user)));
}

Result<uint64_t> StakingEngine::calculate_boosted_apy(
    Address const &user, uint16_t const lockup_days) const
{
    return calculator_.boosted_apy(
        lockup_days,
        calculator_.rarity_reward_boost_bps(skills_of(find_account(user))));
}

std::span<Deposit const>
StakingEngine::list_deposits(Address const &user) const
{
    return ledger_.list_deposits(user);
}

uint256_t StakingEngine::total_deposited(Address const &user) const
{
    return ledger_.total_deposited(user);
}

UserAccount StakingEngine::user_account(Address const &user) const
{
    auto const *const account = find_account(user);
    return account == nullptr ? UserAccount{} : *account;
}

UserActivity StakingEngine::user_activity(Address const &user) const
{
    return rate_limiter_.activity(user);
}

PoolState StakingEngine::pool_state() const
{
    return PoolState{
        .total_pool_balance = ledger_.total_pool_balance(),
        .unique_users_count = ledger_.unique_users_count(),
        .reward_reserve = reward_reserve_,
        .treasury = treasury_,
        .paused = paused_,
        .migrated = migrated_};
}

bool StakingEngine::invariants_hold() const
{
    auto const &pool = ledger_.total_pool_balance();
    if (ledger_.sum_of_principal() != pool) {
        return false;
    }
    auto const sum = checked_add(pool, reward_reserve_);
    return !sum.has_error() && settlement_.custody_balance() == sum.value();
}

NUVO_STAKING_NAMESPACE_END
