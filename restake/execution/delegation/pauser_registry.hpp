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

#include <restake/core/bytes.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/delegation/config.hpp>

#include <bit>
#include <cstdint>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// Names the accounts allowed to pause and the single account allowed to
// unpause the contracts that point at this registry.
class PauserRegistry
{
    State &state_;
    Address const address_;

    static constexpr auto AddressUnpauser{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    enum Namespace : uint8_t
    {
        NSIsPauser = 0x01,
    };

    StorageVariable<Address> unpauser_var() const noexcept
    {
        return {state_, address_, AddressUnpauser};
    }

    // mapping(address => bool) isPauser
    StorageVariable<bool> is_pauser_var(Address const &pauser) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSIsPauser, .address = pauser, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    void set_is_pauser_(Address const &pauser, bool can_pause);
    void set_unpauser_(Address const &new_unpauser);

public:
    PauserRegistry(State &, Address const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    // One time setup of the pauser set and the unpauser.
    Result<void>
    initialize(std::vector<Address> const &pausers, Address const &unpauser);

    bool is_pauser(Address const &) const noexcept;

    Address unpauser() const noexcept;

    Result<void> set_is_pauser(
        Address const &pauser, bool can_pause, Address const &msg_sender);

    Result<void>
    set_unpauser(Address const &new_unpauser, Address const &msg_sender);
};

RESTAKE_DELEGATION_NAMESPACE_END
