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

#include <boost/outcome/config.hpp>
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

NUVO_NAMESPACE_BEGIN

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y)
{
    auto const sum = intx::addc(x, y);
    if (NUVO_UNLIKELY(sum.carry)) {
        return AmountError::Overflow;
    }
    return sum.value;
}

Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y)
{
    if (NUVO_UNLIKELY(y > x)) {
        return AmountError::Underflow;
    }
    return x - y;
}

Result<uint256_t>
checked_mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z)
{
    if (NUVO_UNLIKELY(z == 0)) {
        return AmountError::ZeroDivisor;
    }
    uint512_t const quotient = intx::umul(x, y) / uint512_t{z};
    if (NUVO_UNLIKELY(quotient > uint512_t{UINT256_MAX})) {
        return AmountError::Overflow;
    }
    return static_cast<uint256_t>(quotient);
}

NUVO_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<nuvo::AmountError>::mapping> const &
quick_status_code_from_enum<nuvo::AmountError>::value_mappings()
{
    using nuvo::AmountError;

    static std::initializer_list<mapping> const v = {
        {AmountError::Success, "success", {errc::success}},
        {AmountError::Overflow,
         "amount exceeds 256 bits",
         {errc::value_too_large}},
        {AmountError::Underflow,
         "amount would go negative",
         {errc::result_out_of_range}},
        {AmountError::ZeroDivisor,
         "amount divided by zero",
         {errc::invalid_argument}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
