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

#include <restake/core/int.hpp>
#include <restake/execution/core/contract/big_endian.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <array>
#include <bit>
#include <cstring>

using namespace restake;
using namespace intx::literals;

template <typename T>
class BigEndianTest : public ::testing::Test
{
};

using StoredTypes = ::testing::Types<uint8_t, uint32_t, uint64_t, uint256_t>;
TYPED_TEST_SUITE(BigEndianTest, StoredTypes);

TYPED_TEST(BigEndianTest, most_significant_byte_first)
{
    using Native = TypeParam;

    constexpr Native native = [] {
        Native v{};
        for (uint8_t i = 1; i <= sizeof(Native); ++i) {
            v = static_cast<Native>((v << 8) | i);
        }
        return v;
    }();
    constexpr BigEndian<Native> be = native;

    for (uint8_t i = 0; i < sizeof(Native); ++i) {
        EXPECT_EQ(be.bytes[i], i + 1);
    }
    EXPECT_EQ(be.native(), native);
}

TEST(BigEndian, assignment)
{
    u32_be start_block = 7;
    EXPECT_EQ(start_block.native(), 7);
    start_block = 216000;
    EXPECT_EQ(start_block.native(), 216000);
    EXPECT_EQ(start_block, u32_be{216000});

    u256_be const shares{1'000'000_u256};
    std::array<uint8_t, 32> expected{};
    expected[29] = 0x0f;
    expected[30] = 0x42;
    expected[31] = 0x40;
    EXPECT_EQ(0, std::memcmp(shares.bytes, expected.data(), expected.size()));
}

TEST(BigEndian, default_zero_initialized)
{
    u256_be const zero{};
    EXPECT_EQ(zero.native(), 0);
    EXPECT_EQ(zero, u256_be{0});
}
