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

#include <array>
#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

NUVO_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr uint256_t ETHER{1000000000000000000_u256};

inline constexpr uint64_t BPS_DENOMINATOR{10'000};
inline constexpr uint64_t SECONDS_PER_DAY{86'400};
inline constexpr uint64_t SECONDS_PER_YEAR{365 * SECONDS_PER_DAY};

// Deposits
inline constexpr uint256_t MIN_DEPOSIT{5 * ETHER};
inline constexpr uint256_t MAX_DEPOSIT{10'000 * ETHER};
inline constexpr size_t MAX_DEPOSITS_PER_USER{300};
inline constexpr uint64_t COMMISSION_BPS{600};

// Withdrawals
inline constexpr uint256_t DAILY_WITHDRAWAL_LIMIT{1'000 * ETHER};

// Auto-compound
inline constexpr uint64_t AUTO_COMPOUND_INTERVAL{SECONDS_PER_DAY};
inline constexpr uint256_t MIN_AUTO_COMPOUND_AMOUNT{ETHER / 100};

// Tiers and modifiers
inline constexpr uint64_t MAX_APY_BPS{10'000};
inline constexpr uint64_t MAX_REWARD_BOOST_BPS{10'000};
inline constexpr uint64_t MAX_FEE_DISCOUNT_BPS{5'000};
inline constexpr uint64_t MAX_LOCK_REDUCTION_BPS{5'000};
inline constexpr size_t MAX_ACTIVE_SKILLS{10};

inline constexpr size_t LOCKUP_TIER_COUNT{5};
inline constexpr std::array<uint16_t, LOCKUP_TIER_COUNT> LOCKUP_TIER_DAYS{
    0, 30, 90, 180, 365};
inline constexpr std::array<uint64_t, LOCKUP_TIER_COUNT> DEFAULT_TIER_APY_BPS{
    500, 1'000, 1'500, 2'000, 2'500};

// Anti-fraud
inline constexpr uint32_t MAX_ACTIONS_PER_DAY{10};
inline constexpr uint64_t SUSPICIOUS_THRESHOLD{20};
inline constexpr uint64_t SUSPICION_INCREMENT{5};
inline constexpr uint64_t SUSPICION_DECAY_PERIOD{7 * SECONDS_PER_DAY};

static_assert(COMMISSION_BPS <= BPS_DENOMINATOR);
static_assert(MIN_DEPOSIT <= MAX_DEPOSIT);
static_assert(MAX_FEE_DISCOUNT_BPS <= BPS_DENOMINATOR);
static_assert(MAX_LOCK_REDUCTION_BPS <= BPS_DENOMINATOR);

NUVO_STAKING_NAMESPACE_END
