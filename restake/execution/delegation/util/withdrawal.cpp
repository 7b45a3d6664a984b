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
#include <restake/core/keccak.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/delegation/util/withdrawal.hpp>

#include <vector>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

byte_string abi_encode_withdrawal(Withdrawal const &withdrawal)
{
    std::vector<u256_be> shares;
    shares.reserve(withdrawal.shares.size());
    for (auto const &s : withdrawal.shares) {
        shares.emplace_back(s);
    }

    AbiEncoder encoder;
    encoder.add_address(withdrawal.staker);
    encoder.add_address(withdrawal.delegated_to);
    encoder.add_address(withdrawal.withdrawer);
    encoder.add_uint(u256_be{withdrawal.nonce});
    encoder.add_uint(u32_be{withdrawal.start_block});
    encoder.add_address_array(withdrawal.strategies);
    encoder.add_uint_array(shares);
    return encoder.encode_final();
}

bytes32_t calculate_withdrawal_root(Withdrawal const &withdrawal)
{
    // a struct with dynamic members is encoded as a single dynamic argument
    AbiEncoder encoder;
    encoder.add_tuple(abi_encode_withdrawal(withdrawal));
    return to_bytes(keccak256(encoder.encode_final()));
}

RESTAKE_DELEGATION_NAMESPACE_END
