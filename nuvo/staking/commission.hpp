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
#include <nuvo/core/result.hpp>
#include <nuvo/staking/config.hpp>

#include <cstdint>

NUVO_STAKING_NAMESPACE_BEGIN

struct CommissionSplit
{
    uint256_t net;
    uint256_t fee;
};

// fee = amount * commission_bps / 10000, truncated
Result<CommissionSplit>
apply_deposit_commission(uint256_t const &amount, uint64_t commission_bps);

// As above, then the fee is reduced by discount_bps
Result<CommissionSplit> apply_withdrawal_commission(
    uint256_t const &amount, uint64_t commission_bps, uint64_t discount_bps);

NUVO_STAKING_NAMESPACE_END
