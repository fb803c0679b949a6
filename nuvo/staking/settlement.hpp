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

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

NUVO_STAKING_NAMESPACE_BEGIN

enum class SettlementError
{
    Success = 0,
    InsufficientFunds,
    TransferRejected,
};

// Moves value in and out of the custody account held on behalf of the
// staking engine. Transfers are all-or-nothing. Frames opened with push()
// are closed by exactly one of pop_accept() or pop_reject(); rejecting a
// frame undoes every transfer made since the matching push().
class SettlementPort
{
public:
    virtual ~SettlementPort() = default;

    // custody -> to
    virtual Result<void> transfer(Address const &to, uint256_t const &amount) = 0;

    // from -> custody
    virtual Result<void> pull(Address const &from, uint256_t const &amount) = 0;

    virtual uint256_t custody_balance() const = 0;

    virtual void push() = 0;
    virtual void pop_accept() = 0;
    virtual void pop_reject() = 0;
};

NUVO_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<nuvo::staking::SettlementError>
    : quick_status_code_from_enum_defaults<nuvo::staking::SettlementError>
{
    static constexpr auto const domain_name = "Settlement Error";
    static constexpr auto const domain_uuid =
        "e7d2a580-3c19-4f6b-b2d4-6a81f09c35e2";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
