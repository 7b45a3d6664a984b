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
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/delegation/util/eip712.hpp>
#include <restake/execution/delegation/util/withdrawal.hpp>

#include <evmc/hex.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::delegation;
using namespace intx::literals;

namespace
{
    constexpr auto STAKER{0x00000000000000000000000000000000000a11ce_address};
    constexpr auto OPERATOR{0x0000000000000000000000000000000000000e55_address};
    constexpr auto APPROVER{0x0000000000000000000000000000000000000fee_address};
    constexpr auto WITHDRAWER{
        0x0000000000000000000000000000000000000b0b_address};
    constexpr auto STRATEGY_A{
        0x000000000000000000000000000000000000005a_address};
    constexpr auto STRATEGY_B{
        0x000000000000000000000000000000000000005b_address};
    constexpr uint256_t EXPIRY{1'700'000'100};
    constexpr auto SALT{
        0x0000000000000000000000000000000000000000000000000000000000005a17_bytes32};
}

TEST(Eip712, domain_separator)
{
    EXPECT_EQ(
        compute_domain_separator(1, DELEGATION_MANAGER_CA),
        0x3df5917b1b8195e54c4b67bbc01c83d9518b4e3daf931b2c375f3b4d196433a5_bytes32);
    EXPECT_EQ(
        compute_domain_separator(5, DELEGATION_MANAGER_CA),
        0xb8d7dd3d95e9df114595fa897a6b283e2aae0832eb6a65706407f60eec419487_bytes32);
}

TEST(Eip712, staker_delegation_digest)
{
    auto const struct_hash =
        staker_delegation_struct_hash(STAKER, OPERATOR, EXPIRY);
    EXPECT_EQ(
        struct_hash,
        0x392fdf5c7985f68d7c14c1c681b03ef03678f6f143c33f7b993ebbea9b369c01_bytes32);
    EXPECT_EQ(
        typed_data_digest(
            compute_domain_separator(1, DELEGATION_MANAGER_CA), struct_hash),
        0xa10f85a06f033764d8a150c9defc41fb3b526d728ab769e3b1ba7c69ebc01e10_bytes32);
}

TEST(Eip712, delegation_approval_digest)
{
    auto const struct_hash = delegation_approval_struct_hash(
        APPROVER, STAKER, OPERATOR, SALT, EXPIRY);
    EXPECT_EQ(
        struct_hash,
        0xca6b2629b8ef9d532032890ec9c98e3ba7f10cb2739bdc0d861c13c1379b28af_bytes32);
    EXPECT_EQ(
        typed_data_digest(
            compute_domain_separator(1, DELEGATION_MANAGER_CA), struct_hash),
        0xd414ca826fad351e05ffbfd0c4a8c76e4f93a18eb2df7ab9c0244ed0f142d3a4_bytes32);

    // every field is bound
    EXPECT_NE(
        delegation_approval_struct_hash(
            APPROVER, STAKER, OPERATOR, bytes32_t{}, EXPIRY),
        struct_hash);
    EXPECT_NE(
        delegation_approval_struct_hash(
            APPROVER, OPERATOR, STAKER, SALT, EXPIRY),
        struct_hash);
}

TEST(Withdrawal, abi_encoding)
{
    Withdrawal const withdrawal{
        .staker = STAKER,
        .delegated_to = OPERATOR,
        .withdrawer = STAKER,
        .nonce = 0,
        .start_block = 1000,
        .strategies = {STRATEGY_A},
        .shares = {1000000000000000000_u256}};

    auto const encoded = abi_encode_withdrawal(withdrawal);
    ASSERT_EQ(encoded.size(), 11 * 32);
    EXPECT_EQ(
        evmc::hex(encoded),
        "00000000000000000000000000000000000000000000000000000000000a11ce"
        "0000000000000000000000000000000000000000000000000000000000000e55"
        "00000000000000000000000000000000000000000000000000000000000a11ce"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "00000000000000000000000000000000000000000000000000000000000003e8"
        "00000000000000000000000000000000000000000000000000000000000000e0"
        "0000000000000000000000000000000000000000000000000000000000000120"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "000000000000000000000000000000000000000000000000000000000000005a"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000de0b6b3a7640000");
    EXPECT_EQ(
        calculate_withdrawal_root(withdrawal),
        0x22591b2f3160f8c2441875ef34bec92d2399a74a16a475896f8fd55b2ab58842_bytes32);
}

TEST(Withdrawal, root_of_undelegated_multi_strategy_withdrawal)
{
    Withdrawal const withdrawal{
        .staker = STAKER,
        .delegated_to = Address{},
        .withdrawer = WITHDRAWER,
        .nonce = 3,
        .start_block = 1050,
        .strategies = {STRATEGY_A, STRATEGY_B},
        .shares = {100000000000000000_u256, 5}};
    EXPECT_EQ(
        calculate_withdrawal_root(withdrawal),
        0x05490cb04e07e722c32d9faf4fbe0141d65d6655e49f12d1cf50737f1bf140e8_bytes32);

    Withdrawal next = withdrawal;
    next.nonce = 4;
    EXPECT_NE(
        calculate_withdrawal_root(next), calculate_withdrawal_root(withdrawal));
}
