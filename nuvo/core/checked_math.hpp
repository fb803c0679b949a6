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

#include <nuvo/core/config.hpp>
#include <nuvo/core/int.hpp>
#include <nuvo/core/result.hpp>

#include <initializer_list>

// status-code headers moved between boost releases
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

NUVO_NAMESPACE_BEGIN

// Token amount arithmetic. Every balance, fee and reward goes through these.
enum class AmountError
{
    Success = 0,
    Overflow,
    Underflow,
    ZeroDivisor,
};

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y);

// x * y / z, truncating. The product is held in 512 bits, so only a quotient
// above UINT256_MAX overflows.
Result<uint256_t>
checked_mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z);

NUVO_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<nuvo::AmountError>
    : quick_status_code_from_enum_defaults<nuvo::AmountError>
{
    static constexpr auto const domain_name = "Amount Error";
    static constexpr auto const domain_uuid =
        "c4e71a90-2b6d-4f38-a1c5-8d9e03f7b256";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
