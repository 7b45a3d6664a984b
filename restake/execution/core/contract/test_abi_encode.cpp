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
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <vector>

using namespace restake;
using namespace intx::literals;

TEST(AbiEncode, boolean)
{
    constexpr auto expected_true =
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32;
    EXPECT_EQ(abi_encode_bool(true), expected_true);
    EXPECT_EQ(abi_encode_bool(false), bytes32_t{});
}

TEST(AbiEncode, u32)
{
    constexpr u32_be input{216000};
    constexpr auto expected =
        0x0000000000000000000000000000000000000000000000000000000000034bc0_bytes32;
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, u256)
{
    constexpr u256_be input{15355346523654236542356453_u256};
    constexpr auto expected =
        0x0000000000000000000000000000000000000000000cb39f00c54ee156444be5_bytes32;
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    constexpr auto expected =
        0x000000000000000000000000deadbeef000000000000000000f00d0000000100_bytes32;
    constexpr auto actual = abi_encode_address(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, string)
{
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000020"
            "0000000000000000000000000000000000000000000000000000000000000005"
            "68656c6c6f000000000000000000000000000000000000000000000000000000")
            .value();
    AbiEncoder encoder;
    encoder.add_string("hello");
    EXPECT_EQ(encoder.encode_final(), expected);
}

TEST(AbiEncode, static_tuple_is_inlined)
{
    // (address delegationApprover, uint32 stakerOptOutWindowBlocks)
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000001111111111111111111111111111111111111111"
            "000000000000000000000000000000000000000000000000000000000000c4e0")
            .value();
    AbiEncoder encoder;
    encoder.add_address(0x1111111111111111111111111111111111111111_address);
    encoder.add_uint(u32_be{50400});
    EXPECT_EQ(encoder.encode_final(), expected);
}

TEST(AbiEncode, nested_dynamic_tuple)
{
    AbiEncoder inner;
    inner.add_address(0x1111111111111111111111111111111111111111_address);
    inner.add_uint(u32_be{7});
    inner.add_address_array(
        {0x2222222222222222222222222222222222222222_address});
    inner.add_uint_array(std::vector<u256_be>{u256_be{10}});

    AbiEncoder outer;
    outer.add_bytes32(
        0xabababababababababababababababababababababababababababababababab_bytes32);
    outer.add_tuple(inner.encode_final());

    byte_string const expected =
        evmc::from_hex(
            "abababababababababababababababababababababababababababababababab"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000001111111111111111111111111111111111111111"
            "0000000000000000000000000000000000000000000000000000000000000007"
            "0000000000000000000000000000000000000000000000000000000000000080"
            "00000000000000000000000000000000000000000000000000000000000000c0"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000002222222222222222222222222222222222222222"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "000000000000000000000000000000000000000000000000000000000000000a")
            .value();
    EXPECT_EQ(outer.encode_final(), expected);
}

TEST(AbiEncode, empty_array)
{
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000020"
            "0000000000000000000000000000000000000000000000000000000000000000")
            .value();
    std::vector<u256_be> arr{};
    AbiEncoder encoder;
    encoder.add_uint_array(arr);
    EXPECT_EQ(encoder.encode_final(), expected);
}
