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

#include <nuvo/staking/config.hpp>

NUVO_STAKING_NAMESPACE_BEGIN

// Sets the flag for its lifetime unless it was already set, in which case
// the guard does not own it and the caller must back out.
class ReentrancyGuard
{
    bool &entered_;
    bool const owns_;

public:
    explicit ReentrancyGuard(bool &entered) noexcept
        : entered_{entered}
        , owns_{!entered}
    {
        entered_ = true;
    }

    ReentrancyGuard(ReentrancyGuard const &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard const &) = delete;

    ~ReentrancyGuard()
    {
        if (owns_) {
            entered_ = false;
        }
    }

    bool owns_lock() const noexcept
    {
        return owns_;
    }
};

NUVO_STAKING_NAMESPACE_END
