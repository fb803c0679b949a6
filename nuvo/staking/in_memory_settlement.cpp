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
#include <nuvo/core/likely.h>
#include <nuvo/staking/in_memory_settlement.hpp>

#include <boost/outcome/success_failure.hpp>

#include <utility>

NUVO_STAKING_NAMESPACE_BEGIN

void InMemorySettlement::set_balance(
    Address const &account, uint256_t const &value)
{
    auto &balance = balances_[account];
    if (!frames_.empty()) {
        frames_.back().push_back(UndoRecord{account, balance});
    }
    balance = value;
}

void InMemorySettlement::set_custody(uint256_t const &value)
{
    if (!frames_.empty()) {
        frames_.back().push_back(UndoRecord{std::nullopt, custody_});
    }
    custody_ = value;
}

Result<void>
InMemorySettlement::transfer(Address const &to, uint256_t const &amount)
{
    if (NUVO_UNLIKELY(rejecting_.contains(to))) {
        return SettlementError::TransferRejected;
    }
    if (NUVO_UNLIKELY(custody_ < amount)) {
        return SettlementError::InsufficientFunds;
    }

    push();
    set_custody(custody_ - amount);
    set_balance(to, balance_of(to) + amount);

    if (auto const it = hooks_.find(to); it != hooks_.end()) {
        // the hook may replace itself
        auto const hook = it->second;
        if (hook(to, amount).has_error()) {
            pop_reject();
            return SettlementError::TransferRejected;
        }
    }
    pop_accept();
    return outcome::success();
}

Result<void>
InMemorySettlement::pull(Address const &from, uint256_t const &amount)
{
    auto const balance = balance_of(from);
    if (NUVO_UNLIKELY(balance < amount)) {
        return SettlementError::InsufficientFunds;
    }
    set_balance(from, balance - amount);
    set_custody(custody_ + amount);
    return outcome::success();
}

uint256_t InMemorySettlement::custody_balance() const
{
    return custody_;
}

void InMemorySettlement::push()
{
    frames_.emplace_back();
}

void InMemorySettlement::pop_accept()
{
    NUVO_ASSERT(!frames_.empty());

    auto frame = std::move(frames_.back());
    frames_.pop_back();
    if (!frames_.empty()) {
        auto &parent = frames_.back();
        parent.insert(
            parent.end(),
            std::make_move_iterator(frame.begin()),
            std::make_move_iterator(frame.end()));
    }
}

void InMemorySettlement::pop_reject()
{
    NUVO_ASSERT(!frames_.empty());

    auto &frame = frames_.back();
    for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
        if (it->account.has_value()) {
            balances_[*it->account] = it->previous;
        }
        else {
            custody_ = it->previous;
        }
    }
    frames_.pop_back();
}

uint256_t InMemorySettlement::balance_of(Address const &account) const
{
    auto const it = balances_.find(account);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

void InMemorySettlement::mint(Address const &account, uint256_t const &amount)
{
    set_balance(account, balance_of(account) + amount);
}

void InMemorySettlement::set_receive_hook(
    Address const &account, ReceiveHook hook)
{
    hooks_[account] = std::move(hook);
}

void InMemorySettlement::clear_receive_hook(Address const &account)
{
    hooks_.erase(account);
}

void InMemorySettlement::reject_transfers_to(
    Address const &account, bool const reject)
{
    if (reject) {
        rejecting_.insert(account);
    }
    else {
        rejecting_.erase(account);
    }
}

NUVO_STAKING_NAMESPACE_END
