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
#include <nuvo/staking/settlement.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

NUVO_STAKING_NAMESPACE_BEGIN

// Journaled balance map. Every balance write made while a frame is open is
// recorded so that pop_reject() can restore it; pop_accept() folds the
// frame's records into its parent.
class InMemorySettlement final : public SettlementPort
{
public:
    // Invoked after the payee has been credited. An error reverts the
    // transfer and fails it with SettlementError::TransferRejected.
    using ReceiveHook =
        std::function<Result<void>(Address const &, uint256_t const &)>;

private:
    struct UndoRecord
    {
        std::optional<Address> account; // nullopt is the custody account
        uint256_t previous;
    };

    ankerl::unordered_dense::map<Address, uint256_t> balances_;
    uint256_t custody_{0};
    std::vector<std::vector<UndoRecord>> frames_;
    ankerl::unordered_dense::map<Address, ReceiveHook> hooks_;
    ankerl::unordered_dense::set<Address> rejecting_;

    void set_balance(Address const &, uint256_t const &);
    void set_custody(uint256_t const &);

public:
    Result<void> transfer(Address const &to, uint256_t const &amount) override;
    Result<void> pull(Address const &from, uint256_t const &amount) override;
    uint256_t custody_balance() const override;

    void push() override;
    void pop_accept() override;
    void pop_reject() override;

    size_t depth() const noexcept
    {
        return frames_.size();
    }

    uint256_t balance_of(Address const &) const;

    // credits an external account out of thin air
    void mint(Address const &, uint256_t const &amount);

    void set_receive_hook(Address const &, ReceiveHook);
    void clear_receive_hook(Address const &);
    void reject_transfers_to(Address const &, bool reject = true);
};

NUVO_STAKING_NAMESPACE_END
