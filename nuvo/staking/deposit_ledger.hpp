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
#include <nuvo/staking/util/constants.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

struct Deposit
{
    uint256_t amount; // principal, net of commission
    uint64_t timestamp;
    uint16_t lockup_days;

    uint64_t lockup_duration() const noexcept
    {
        return uint64_t{lockup_days} * SECONDS_PER_DAY;
    }

    friend bool operator==(Deposit const &, Deposit const &) = default;
};

class DepositLedger
{
    ankerl::unordered_dense::map<Address, std::vector<Deposit>> deposits_;
    ankerl::unordered_dense::set<Address> depositors_;
    uint256_t total_pool_balance_{0};
    uint64_t unique_users_count_{0};
    size_t max_deposits_per_user_;

public:
    // Per-user state needed to roll back a failed operation
    struct Snapshot
    {
        Address user;
        std::optional<std::vector<Deposit>> deposits;
        bool was_depositor;
        uint256_t total_pool_balance;
        uint64_t unique_users_count;
    };

    explicit DepositLedger(size_t max_deposits_per_user);

    Result<void> add_deposit(Address const &, Deposit const &);
    Result<Deposit> remove_deposit(Address const &, size_t index);

    // removes every deposit of the user and returns the principal released
    Result<uint256_t> clear_deposits(Address const &);

    std::span<Deposit const> list_deposits(Address const &) const;
    size_t deposit_count(Address const &) const;
    uint256_t total_deposited(Address const &) const;

    uint256_t const &total_pool_balance() const noexcept
    {
        return total_pool_balance_;
    }

    uint64_t unique_users_count() const noexcept
    {
        return unique_users_count_;
    }

    // Sum of principal over every deposit held; must equal
    // total_pool_balance()
    uint256_t sum_of_principal() const;

    Snapshot snapshot(Address const &) const;
    void restore(Snapshot &&);
};

NUVO_STAKING_NAMESPACE_END
