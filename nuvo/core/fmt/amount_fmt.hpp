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

#include <nuvo/core/basic_formatter.hpp>
#include <nuvo/core/config.hpp>
#include <nuvo/core/int.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <string>

NUVO_NAMESPACE_BEGIN

inline constexpr size_t AMOUNT_DECIMALS = 18;

// Base units as a decimal token amount: 1500000000000000000 -> "1.5"
inline std::string format_amount(uint256_t const &value)
{
    constexpr uint256_t unit{1'000'000'000'000'000'000ULL};

    std::string out = intx::to_string(value / unit, 10);
    uint256_t const frac = value % unit;
    if (frac == 0) {
        return out;
    }
    std::string digits = intx::to_string(frac, 10);
    digits.insert(0, AMOUNT_DECIMALS - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    out += '.';
    out += digits;
    return out;
}

NUVO_NAMESPACE_END

template <>
struct quill::copy_loggable<nuvo::uint256_t> : std::true_type
{
};

template <>
struct fmt::formatter<nuvo::uint256_t> : public nuvo::BasicFormatter
{
    template <typename FormatContext>
    auto format(nuvo::uint256_t const &value, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", nuvo::format_amount(value));
    }
};
