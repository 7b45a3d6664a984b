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
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/delegation/config.hpp>

#include <bit>
#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// Balances of a fungible token, kept in the storage of the token's account.
class TokenLedger
{
    State &state_;
    Address const token_;

    enum Namespace : uint8_t
    {
        NSBalance = 0x01,
    };

    static constexpr auto AddressTotalSupply{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    // mapping(address => uint256) balanceOf
    StorageVariable<u256_be> balance_var(Address const &holder) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSBalance, .address = holder, .slots = {}};

        return {state_, token_, std::bit_cast<bytes32_t>(key)};
    }

    StorageVariable<u256_be> total_supply_var() const noexcept
    {
        return {state_, token_, AddressTotalSupply};
    }

    void emit_transfer_event(
        Address const &from, Address const &to, uint256_t const &amount);

public:
    TokenLedger(State &, Address const &token);

    uint256_t balance_of(Address const &) const noexcept;

    uint256_t total_supply() const noexcept;

    Result<void> mint(Address const &to, uint256_t const &amount);

    Result<void> transfer(
        Address const &from, Address const &to, uint256_t const &amount);
};

RESTAKE_DELEGATION_NAMESPACE_END
