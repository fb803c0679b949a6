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
#include <nuvo/staking/deposit_ledger.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <utility>

NUVO_STAKING_NAMESPACE_BEGIN

DepositLedger::DepositLedger(size_t const max_deposits_per_user)
    : max_deposits_per_user_{max_deposits_per_user}
{
}

Result<void>
DepositLedger::add_deposit(Address const &user, Deposit const &deposit)
{
    auto &deposits = deposits_[user];
    if (NUVO_UNLIKELY(deposits.size() >= max_deposits_per_user_)) {
        return StakingError::MaxDepositsReached;
    }
    BOOST_OUTCOME_TRY(
        auto const total, checked_add(total_pool_balance_, deposit.amount));

    deposits.push_back(deposit);
    total_pool_balance_ = total;
    if (depositors_.insert(user).second) {
        ++unique_users_count_;
    }
    return outcome::success();
}

Result<Deposit>
DepositLedger::remove_deposit(Address const &user, size_t const index)
{
    auto const it = deposits_.find(user);
    if (it == deposits_.end() || it->second.empty()) {
        return StakingError::NoDepositsFound;
    }
    auto &deposits = it->second;
    if (NUVO_UNLIKELY(index >= deposits.size())) {
        return StakingError::InvalidInput;
    }
    Deposit const removed = deposits[index];
    BOOST_OUTCOME_TRY(
        auto const total, checked_sub(total_pool_balance_, removed.amount));

    deposits.erase(deposits.begin() + static_cast<std::ptrdiff_t>(index));
    total_pool_balance_ = total;
    return removed;
}

Result<uint256_t> DepositLedger::clear_deposits(Address const &user)
{
    auto const it = deposits_.find(user);
    if (it == deposits_.end() || it->second.empty()) {
        return StakingError::NoDepositsFound;
    }
    uint256_t principal{0};
    for (auto const &deposit : it->second) {
        BOOST_OUTCOME_TRY(
            auto const sum, checked_add(principal, deposit.amount));
        principal = sum;
    }
    BOOST_OUTCOME_TRY(
        auto const total, checked_sub(total_pool_balance_, principal));

    it->second.clear();
    total_pool_balance_ = total;
    return principal;
}

std::span<Deposit const> DepositLedger::list_deposits(Address const &user) const
{
    auto const it = deposits_.find(user);
    if (it == deposits_.end()) {
        return {};
    }
    return it->second;
}

size_t DepositLedger::deposit_count(Address const &user) const
{
    return list_deposits(user).size();
}

uint256_t DepositLedger::total_deposited(Address const &user) const
{
    uint256_t total{0};
    for (auto const &deposit : list_deposits(user)) {
        total += deposit.amount;
    }
    return total;
}

uint256_t DepositLedger::sum_of_principal() const
{
    uint256_t total{0};
    for (auto const &[user, deposits] : deposits_) {
        for (auto const &deposit : deposits) {
            total += deposit.amount;
        }
    }
    return total;
}

DepositLedger::Snapshot DepositLedger::snapshot(Address const &user) const
{
    Snapshot snap{
        .user = user,
        .deposits = std::nullopt,
        .was_depositor = depositors_.contains(user),
        .total_pool_balance = total_pool_balance_,
        .unique_users_count = unique_users_count_};
    if (auto const it = deposits_.find(user); it != deposits_.end()) {
        snap.deposits = it->second;
    }
    return snap;
}

void DepositLedger::restore(Snapshot &&snap)
{
    if (snap.deposits.has_value()) {
        deposits_[snap.user] = std::move(*snap.deposits);
    }
    else {
        deposits_.erase(snap.user);
    }
    if (!snap.was_depositor) {
        depositors_.erase(snap.user);
    }
    total_pool_balance_ = snap.total_pool_balance;
    unique_users_count_ = snap.unique_users_count;
}

NUVO_STAKING_NAMESPACE_END
