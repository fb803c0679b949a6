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

#include <nuvo/core/fmt/address_fmt.hpp>
#include <nuvo/core/likely.h>
#include <nuvo/staking/rate_limiter.hpp>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/util/constants.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <utility>

NUVO_STAKING_NAMESPACE_BEGIN

RateLimiter::RateLimiter(StakingConfig const &config)
    : limits_{
          .max_actions_per_day = config.max_actions_per_day,
          .suspicious_threshold = config.suspicious_threshold,
          .suspicion_increment = config.suspicion_increment,
          .suspicion_decay_period = config.suspicion_decay_period}
{
}

Result<void> RateLimiter::record_action(Address const &user, uint64_t const now)
{
    auto &activity = activity_[user];

    if (activity.last_cap_day.has_value() &&
        now >= *activity.last_cap_day + limits_.suspicion_decay_period) {
        activity.suspicious_score = 0;
        activity.consecutive_cap_days = 0;
    }

    if (activity.actions_today == 0 ||
        now >= activity.last_action_day + SECONDS_PER_DAY) {
        activity.actions_today = 0;
        activity.last_action_day = now;
    }

    if (NUVO_UNLIKELY(activity.actions_today >= limits_.max_actions_per_day)) {
        return StakingError::TooManyActionsToday;
    }
    ++activity.actions_today;
    // the limit can move mid-window; a window counts as capped once
    if (activity.actions_today >= limits_.max_actions_per_day &&
        activity.last_cap_day != activity.last_action_day) {
        on_cap_reached(user, activity);
    }
    return outcome::success();
}

void RateLimiter::on_cap_reached(Address const &user, UserActivity &activity)
{
    uint64_t const window = activity.last_action_day;
    if (activity.last_cap_day.has_value() &&
        window - *activity.last_cap_day < 2 * SECONDS_PER_DAY) {
        ++activity.consecutive_cap_days;
    }
    else {
        activity.consecutive_cap_days = 1;
    }
    activity.last_cap_day = window;

    if (activity.consecutive_cap_days < 2) {
        return;
    }
    activity.suspicious_score +=
        limits_.suspicion_increment * activity.consecutive_cap_days;
    if (!activity.flagged &&
        activity.suspicious_score >= limits_.suspicious_threshold) {
        activity.flagged = true;
        LOG_WARNING(
            "RateLimiter: flagged {} after {} consecutive capped days, "
            "score {}",
            user,
            activity.consecutive_cap_days,
            activity.suspicious_score);
    }
}

UserActivity RateLimiter::activity(Address const &user) const
{
    auto const it = activity_.find(user);
    return it == activity_.end() ? UserActivity{} : it->second;
}

bool RateLimiter::is_banned(Address const &user) const
{
    auto const it = activity_.find(user);
    return it != activity_.end() && it->second.banned;
}

bool RateLimiter::is_flagged(Address const &user) const
{
    auto const it = activity_.find(user);
    return it != activity_.end() && it->second.flagged;
}

void RateLimiter::ban(Address const &user, std::string reason)
{
    auto &activity = activity_[user];
    activity.banned = true;
    activity.ban_reason = std::move(reason);
}

void RateLimiter::unban(Address const &user)
{
    auto &activity = activity_[user];
    activity.banned = false;
    activity.ban_reason.clear();
}

void RateLimiter::clear_flag(Address const &user)
{
    auto &activity = activity_[user];
    activity.flagged = false;
    activity.suspicious_score = 0;
    activity.consecutive_cap_days = 0;
}

Result<void> RateLimiter::set_max_actions_per_day(uint32_t const value)
{
    if (NUVO_UNLIKELY(value == 0)) {
        return StakingError::InvalidInput;
    }
    limits_.max_actions_per_day = value;
    return outcome::success();
}

Result<void> RateLimiter::set_suspicious_threshold(uint64_t const value)
{
    if (NUVO_UNLIKELY(value == 0)) {
        return StakingError::InvalidInput;
    }
    limits_.suspicious_threshold = value;
    return outcome::success();
}

std::optional<UserActivity> RateLimiter::snapshot(Address const &user) const
{
    auto const it = activity_.find(user);
    if (it == activity_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RateLimiter::restore(
    Address const &user, std::optional<UserActivity> &&snap)
{
    if (snap.has_value()) {
        activity_[user] = std::move(*snap);
    }
    else {
        activity_.erase(user);
    }
}

NUVO_STAKING_NAMESPACE_END
