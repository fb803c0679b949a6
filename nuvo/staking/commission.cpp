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

#include <nuvo/core/checked_math.hpp>
#include <nuvo/core/likely.h>
#include <nuvo/staking/commission.hpp>
#include <nuvo/staking/util/constants.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/try.hpp>

NUVO_STAKING_NAMESPACE_BEGIN

Result<CommissionSplit> apply_deposit_commission(
    uint256_t const &amount, uint64_t const commission_bps)
{
    return apply_withdrawal_commission(amount, commission_bps, 0);
}

Result<CommissionSplit> apply_withdrawal_commission(
    uint256_t const &amount, uint64_t const commission_bps,
    uint64_t const discount_bps)
{
    if (NUVO_UNLIKELY(
            commission_bps > BPS_DENOMINATOR ||
            discount_bps > BPS_DENOMINATOR)) {
        return StakingError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const gross_fee,
        checked_mul_div(amount, commission_bps, BPS_DENOMINATOR));
    BOOST_OUTCOME_TRY(
        auto const fee,
        checked_mul_div(
            gross_fee, BPS_DENOMINATOR - discount_bps, BPS_DENOMINATOR));
    BOOST_OUTCOME_TRY(auto const net, checked_sub(amount, fee));
    return CommissionSplit{.net = net, .fee = fee};
}

NUVO_STAKING_NAMESPACE_END
