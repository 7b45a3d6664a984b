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

#include <restake/core/assert.h>
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

// Unordered list in account storage. The length is kept in the head slot and
// element i starts at slot head + 1 + i * StorageVariable<T>::N.
template <typename T>
class StorageArray
{
    using Element = StorageVariable<T>;

    State &state_;
    Address const account_;
    uint256_t const head_;

    StorageVariable<u64_be> length_var() const noexcept
    {
        return {state_, account_, intx::be::store<bytes32_t>(head_)};
    }

public:
    StorageArray(State &state, Address const &account, bytes32_t const &head)
        : state_{state}
        , account_{account}
        , head_{intx::be::load<uint256_t>(head)}
    {
    }

    uint64_t length() const noexcept
    {
        return length_var().load().native();
    }

    Element get(uint64_t const index) const noexcept
    {
        uint256_t const first_slot = head_ + 1 + index * Element::N;
        return {state_, account_, intx::be::store<bytes32_t>(first_slot)};
    }

    void push(T const &value)
    {
        uint64_t const n = length();
        get(n).store(value);
        length_var().store(n + 1);
    }

    // Overwrites `index` with the last element and shrinks the list by one.
    void swap_remove(uint64_t const index)
    {
        uint64_t const n = length();
        RESTAKE_ASSERT(index < n);
        auto last = get(n - 1);
        if (index + 1 != n) {
            get(index).store(last.load());
        }
        last.clear();
        length_var().store(n - 1);
    }
};

RESTAKE_NAMESPACE_END
