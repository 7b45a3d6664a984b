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

#include <restake/core/bytes.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_array.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state{};
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, multi_slot_struct)
{
    struct S
    {
        Address staker;
        u32_be start_block;
        u256_be shares;
    };

    static_assert(StorageVariable<S>::N == 2);

    StorageVariable<S> var(state, ADDRESS, bytes32_t{6000});

    ASSERT_FALSE(var.load_checked().has_value());
    var.store(S{.staker = Address{0xbeef}, .start_block = 5, .shares = 6_u256});
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 2);

    S s = var.load();
    EXPECT_EQ(s.staker, Address{0xbeef});
    EXPECT_EQ(s.start_block.native(), 5);
    EXPECT_EQ(s.shares.native(), 6);

    s.shares = s.shares.native() * 2;
    var.store(s);
    EXPECT_EQ(var.load().shares.native(), 12);

    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, distinct_accounts)
{
    constexpr auto OTHER{0x00000000000000000000000000000000000000aa_address};
    StorageVariable<u64_be> a(state, ADDRESS, bytes32_t{1});
    StorageVariable<u64_be> b(state, OTHER, bytes32_t{1});
    a.store(1);
    b.store(2);
    EXPECT_EQ(a.load().native(), 1);
    EXPECT_EQ(b.load().native(), 2);
}

TEST_F(Storage, array)
{
    struct Entry
    {
        Address strategy;
        u256_be shares;
    };

    static_assert(StorageVariable<Entry>::N == 2);

    StorageArray<Entry> arr(state, ADDRESS, bytes32_t{100});
    EXPECT_EQ(arr.length(), 0);

    for (uint32_t i = 0; i < 100; ++i) {
        arr.push(Entry{.strategy = Address{i + 1}, .shares = uint256_t{i}});
        EXPECT_EQ(arr.length(), i + 1);
    }

    for (uint32_t i = 0; i < 100; ++i) {
        auto const res = arr.get(i);
        ASSERT_TRUE(res.load_checked().has_value())
            << "Could not load at index: " << i << std::endl;
        EXPECT_EQ(res.load().strategy, Address{i + 1});
        EXPECT_EQ(res.load().shares.native(), i);
    }

    for (uint32_t i = 100; i > 0; --i) {
        arr.swap_remove(i - 1);
        EXPECT_EQ(arr.length(), i - 1);
    }
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, array_swap_remove)
{
    StorageArray<Address> arr(state, ADDRESS, bytes32_t{100});
    arr.push(Address{1});
    arr.push(Address{2});
    arr.push(Address{3});

    arr.swap_remove(0);
    ASSERT_EQ(arr.length(), 2);
    EXPECT_EQ(arr.get(0).load(), Address{3});
    EXPECT_EQ(arr.get(1).load(), Address{2});

    arr.swap_remove(1);
    ASSERT_EQ(arr.length(), 1);
    EXPECT_EQ(arr.get(0).load(), Address{3});
}

TEST_F(Storage, array_swap_remove_frees_last_slot)
{
    StorageArray<Address> arr(state, ADDRESS, bytes32_t{100});
    arr.push(Address{1});
    arr.push(Address{2});
    // length slot plus one slot per element
    EXPECT_EQ(state.storage_size(ADDRESS), 3);

    arr.swap_remove(0);
    EXPECT_EQ(arr.length(), 1);
    EXPECT_EQ(arr.get(0).load(), Address{2});
    EXPECT_FALSE(arr.get(1).load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 2);
}

TEST_F(Storage, value_present_when_only_a_later_slot_is_set)
{
    struct Record
    {
        u256_be first;
        u64_be second;
    };

    static_assert(StorageVariable<Record>::N == 2);

    StorageVariable<Record> var(state, ADDRESS, bytes32_t{7});
    var.store(Record{.first = uint256_t{0}, .second = 9});
    EXPECT_EQ(state.storage_size(ADDRESS), 1);

    auto const loaded = var.load_checked();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->first.native(), 0);
    EXPECT_EQ(loaded->second.native(), 9);
}

TEST_F(Storage, rejected_checkpoint_restores_array)
{
    StorageArray<Address> arr(state, ADDRESS, bytes32_t{100});
    arr.push(Address{1});

    state.push();
    arr.push(Address{2});
    arr.swap_remove(0);
    EXPECT_EQ(arr.get(0).load(), Address{2});
    state.pop_reject();

    ASSERT_EQ(arr.length(), 1);
    EXPECT_EQ(arr.get(0).load(), Address{1});
}
