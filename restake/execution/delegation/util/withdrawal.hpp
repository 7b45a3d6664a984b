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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/config.hpp>

#include <cstdint>
#include <vector>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

struct Withdrawal
{
    Address staker;
    Address delegated_to;
    Address withdrawer;
    uint256_t nonce;
    // block the withdrawal was queued in; queueing asserts it fits in 32 bits
    uint32_t start_block;
    std::vector<Address> strategies;
    std::vector<uint256_t> shares;

    friend bool operator==(Withdrawal const &, Withdrawal const &) = default;
};

struct QueuedWithdrawalParams
{
    std::vector<Address> strategies;
    std::vector<uint256_t> shares;
    Address withdrawer;
};

// The solidity tuple encoding of
// (address,address,address,uint256,uint32,address[],uint256[])
byte_string abi_encode_withdrawal(Withdrawal const &);

// keccak256(abi.encode(withdrawal))
bytes32_t calculate_withdrawal_root(Withdrawal const &);

RESTAKE_DELEGATION_NAMESPACE_END
