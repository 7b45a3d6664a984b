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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/keccak.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/delegation/util/eip712.hpp>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

bytes32_t compute_domain_separator(
    uint256_t const &chain_id, Address const &verifying_contract)
{
    AbiEncoder encoder;
    encoder.add_bytes32(DOMAIN_TYPEHASH);
    encoder.add_bytes32(
        to_bytes(keccak256(to_byte_string_view(EIP712_DOMAIN_NAME))));
    encoder.add_uint(u256_be{chain_id});
    encoder.add_address(verifying_contract);
    return to_bytes(keccak256(encoder.encode_final()));
}

bytes32_t typed_data_digest(
    bytes32_t const &domain_separator, bytes32_t const &struct_hash)
{
    byte_string preimage{0x19, 0x01};
    preimage += domain_separator;
    preimage += struct_hash;
    return to_bytes(keccak256(preimage));
}

bytes32_t staker_delegation_struct_hash(
    Address const &staker, Address const &op, uint256_t const &expiry)
{
    AbiEncoder encoder;
    encoder.add_bytes32(STAKER_DELEGATION_TYPEHASH);
    encoder.add_address(staker);
    encoder.add_address(op);
    encoder.add_uint(u256_be{expiry});
    return to_bytes(keccak256(encoder.encode_final()));
}

bytes32_t delegation_approval_struct_hash(
    Address const &delegation_approver, Address const &staker,
    Address const &op, bytes32_t const &salt, uint256_t const &expiry)
{
    AbiEncoder encoder;
    encoder.add_bytes32(DELEGATION_APPROVAL_TYPEHASH);
    encoder.add_address(delegation_approver);
    encoder.add_address(staker);
    encoder.add_address(op);
    encoder.add_bytes32(salt);
    encoder.add_uint(u256_be{expiry});
    return to_bytes(keccak256(encoder.encode_final()));
}

RESTAKE_DELEGATION_NAMESPACE_END
