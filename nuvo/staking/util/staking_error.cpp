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

#include <nuvo/staking/util/staking_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<nuvo::staking::StakingError>::mapping> const &
quick_status_code_from_enum<nuvo::staking::StakingError>::value_mappings()
{
    using nuvo::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::InternalError, "internal error", {}},
        {StakingError::InvalidInput, "invalid input", {}},
        {StakingError::Unauthorized, "unauthorized", {}},
        {StakingError::DepositTooLow, "deposit too low", {}},
        {StakingError::DepositTooHigh, "deposit too high", {}},
        {StakingError::InvalidLockupDuration, "invalid lockup duration", {}},
        {StakingError::TierInactive, "tier is not active", {}},
        {StakingError::MaxDepositsReached, "max deposits reached", {}},
        {StakingError::NoRewardsAvailable, "no rewards available", {}},
        {StakingError::NoDepositsFound, "no deposits found", {}},
        {StakingError::FundsAreLocked, "funds are locked", {}},
        {StakingError::DailyLimitExceeded, "daily limit exceeded", {}},
        {StakingError::InsufficientRewardReserve,
         "insufficient reward reserve",
         {}},
        {StakingError::ContractPaused, "contract is paused", {}},
        {StakingError::NotPaused, "contract is not paused", {}},
        {StakingError::AlreadyPaused, "contract is already paused", {}},
        {StakingError::ContractMigrated, "contract is migrated", {}},
        {StakingError::AlreadyMigrated, "contract is already migrated", {}},
        {StakingError::UserIsBanned, "user is banned", {}},
        {StakingError::TooManyActionsToday, "too many actions today", {}},
        {StakingError::ReentrancyDetected, "reentrancy detected", {}},
        {StakingError::SkillAlreadyActive, "skill already active", {}},
        {StakingError::SkillNotActive, "skill not active", {}},
        {StakingError::MaxSkillsReached, "max skills reached", {}},
        {StakingError::InvalidSkillType, "invalid skill type", {}},
        {StakingError::InvalidRarity, "invalid rarity", {}},
        {StakingError::InvalidApy, "invalid apy", {}},
        {StakingError::MinAmountTooLow, "min amount too low", {}},
        {StakingError::AutoCompoundNotEnabled,
         "auto-compound not enabled",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
