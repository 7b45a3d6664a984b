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
#include <restake/execution/delegation/config.hpp>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// keccak256(abi.encode(DOMAIN_TYPEHASH, keccak256("EigenLayer"), chainId,
//                      verifyingContract))
bytes32_t compute_domain_separator(
    uint256_t const &chain_id, Address const &verifying_contract);

// keccak256("\x19\x01" || domainSeparator || structHash)
bytes32_t typed_data_digest(
    bytes32_t const &domain_separator, bytes32_t const &struct_hash);

bytes32_t staker_delegation_struct_hash(
    Address const &staker, Address const &op, uint256_t const &expiry);

bytes32_t delegation_approval_struct_hash(
    Address const &delegation_approver, Address const &staker,
    Address const &op, bytes32_t const &salt, uint256_t const &expiry);

RESTAKE_DELEGATION_NAMESPACE_END
