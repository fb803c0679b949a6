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
#include <nuvo/core/result.hpp>
#include <nuvo/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <optional>
#include <string>

NUVO_STAKING_NAMESPACE_BEGIN

struct StakingConfig;

struct UserActivity
{
    uint32_t actions_today{0};
    uint64_t last_action_day{0}; // start of the current 24h window
    uint64_t suspicious_score{0};
    uint32_t consecutive_cap_days{0};
    std::optional<uint64_t> last_cap_day; // window in which the cap was hit
    bool flagged{false};
    bool banned{false};
    std::string ban_reason;
};

struct RateLimits
{
    uint32_t max_actions_per_day;
    uint64_t suspicious_threshold;
    uint64_t suspicion_increment;
    uint64_t suspicion_decay_period;
};

// Per-user action counting over rolling 24h windows. A user who fills the
// window on consecutive days accumulates a suspicion score; crossing the
// threshold flags the user for review. Bans are only ever set explicitly.
class RateLimiter
{
    RateLimits limits_;
    ankerl::unordered_dense::map<Address, UserActivity> activity_;

    void on_cap_reached(Address const &, UserActivity &);

public:
    explicit RateLimiter(StakingConfig const &);

    // Fails with TooManyActionsToday once the window is full
    Result<void> record_action(Address const &, uint64_t now);

    UserActivity activity(Address const &) const;
    bool is_banned(Address const &) const;
    bool is_flagged(Address const &) const;

    void ban(Address const &, std::string reason);
    void unban(Address const &);
    void clear_flag(Address const &);

    RateLimits const &limits() const noexcept
    {
        return limits_;
    }

    Result<void> set_max_actions_per_day(uint32_t);
    Result<void> set_suspicious_threshold(uint64_t);

    std::optional<UserActivity> snapshot(Address const &) const;
    void restore(Address const &, std::optional<UserActivity> &&);
};

NUVO_STAKING_NAMESPACE_END
