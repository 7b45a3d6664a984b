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
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/delegation/config.hpp>

#include <cstdint>
#include <string_view>

#include <intx/intx.hpp>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr Address DELEGATION_MANAGER_CA{0x1100};
inline constexpr Address STRATEGY_MANAGER_CA{0x1101};
inline constexpr Address PAUSER_REGISTRY_CA{0x1102};

inline constexpr uint64_t SECONDS_PER_BLOCK = 12;
inline constexpr uint64_t SECONDS_PER_DAY = 86'400;

// 180 days of blocks
inline constexpr uint32_t MAX_STAKER_OPT_OUT_WINDOW_BLOCKS =
    static_cast<uint32_t>(180 * SECONDS_PER_DAY / SECONDS_PER_BLOCK);
static_assert(MAX_STAKER_OPT_OUT_WINDOW_BLOCKS == 1'296'000);

// 30 days of blocks
inline constexpr uint256_t MAX_WITHDRAWAL_DELAY_BLOCKS{
    30 * SECONDS_PER_DAY / SECONDS_PER_BLOCK};
static_assert(MAX_WITHDRAWAL_DELAY_BLOCKS == 216'000);

// Bit indices of the paused status bitmap
enum PauseFlag : uint8_t
{
    PAUSED_NEW_DELEGATION = 0,
    PAUSED_ENTER_WITHDRAWAL_QUEUE = 1,
    PAUSED_EXIT_WITHDRAWAL_QUEUE = 2,
};

inline constexpr uint256_t UNPAUSE_ALL{0};
inline constexpr uint256_t PAUSE_ALL = UINT256_MAX;

// Returned by a contract wallet that accepts a signature
inline constexpr uint32_t ERC1271_MAGIC_VALUE =
    abi_encode_selector("isValidSignature(bytes32,bytes)");
static_assert(ERC1271_MAGIC_VALUE == 0x1626ba7e);

////////////
// EIP712 //
////////////

inline constexpr std::string_view EIP712_DOMAIN_NAME = "EigenLayer";

inline constexpr bytes32_t DOMAIN_TYPEHASH = abi_encode_type_hash(
    "EIP712Domain(string name,uint256 chainId,address verifyingContract)");
static_assert(
    DOMAIN_TYPEHASH ==
    0x8cad95687ba82c2ce50e74f7b754645e5117c3a5bec8151c0726d5857980a866_bytes32);

inline constexpr bytes32_t STAKER_DELEGATION_TYPEHASH = abi_encode_type_hash(
    "StakerDelegation(address staker,address operator,uint256 expiry)");
static_assert(
    STAKER_DELEGATION_TYPEHASH ==
    0xffa39094ea623a5ed6de3e7cb69cc0be7af97633bbb7073f8f1d789bad76fab3_bytes32);

inline constexpr bytes32_t DELEGATION_APPROVAL_TYPEHASH = abi_encode_type_hash(
    "DelegationApproval(address delegationApprover,address staker,address "
    "operator,bytes32 salt,uint256 expiry)");
static_assert(
    DELEGATION_APPROVAL_TYPEHASH ==
    0x14bde674c9f64b2ad00eaaee4a8bed1fabef35c7507e3c5b9cfc9436909a2dad_bytes32);

RESTAKE_DELEGATION_NAMESPACE_END
