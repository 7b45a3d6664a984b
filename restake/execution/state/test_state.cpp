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
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/state/version_stack.hpp>

#include <gtest/gtest.h>

using namespace restake;

namespace
{
    constexpr auto A{0x00000000000000000000000000000000000000aa_address};
    constexpr auto B{0x00000000000000000000000000000000000000bb_address};
    constexpr auto KEY{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
    constexpr auto VALUE{
        0x00000000000000000000000000000000000000000000000000000000000000ff_bytes32};

    Receipt::Log make_log(Address const &address)
    {
        return Receipt::Log{.data = {}, .topics = {VALUE}, .address = address};
    }
}

TEST(State, unknown_account_reads_zero)
{
    State state;
    EXPECT_EQ(state.get_storage(A, KEY), bytes32_t{});
    EXPECT_EQ(state.storage_size(A), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST(State, pop_accept_keeps_writes)
{
    State state;
    state.push();
    state.set_storage(A, KEY, VALUE);
    state.store_log(make_log(A));
    state.pop_accept();

    EXPECT_EQ(state.version(), 0);
    EXPECT_EQ(state.get_storage(A, KEY), VALUE);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST(State, pop_reject_discards_writes)
{
    State state;
    state.set_storage(A, KEY, VALUE);

    state.push();
    state.set_storage(A, KEY, bytes32_t{});
    state.set_storage(B, KEY, VALUE);
    state.store_log(make_log(B));
    EXPECT_EQ(state.get_storage(A, KEY), bytes32_t{});
    EXPECT_EQ(state.get_storage(B, KEY), VALUE);
    state.pop_reject();

    EXPECT_EQ(state.get_storage(A, KEY), VALUE);
    EXPECT_EQ(state.get_storage(B, KEY), bytes32_t{});
    EXPECT_TRUE(state.logs().empty());
}

TEST(State, nested_checkpoints)
{
    State state;
    state.push();
    state.set_storage(A, KEY, VALUE);

    state.push();
    state.set_storage(B, KEY, VALUE);
    state.pop_reject();

    state.push();
    state.store_log(make_log(A));
    state.pop_accept();

    EXPECT_EQ(state.get_storage(A, KEY), VALUE);
    EXPECT_EQ(state.get_storage(B, KEY), bytes32_t{});
    EXPECT_EQ(state.logs().size(), 1);

    state.pop_reject();
    EXPECT_EQ(state.get_storage(A, KEY), bytes32_t{});
    EXPECT_TRUE(state.logs().empty());
}

TEST(State, zero_write_frees_slot)
{
    State state;
    state.set_storage(A, KEY, VALUE);
    EXPECT_EQ(state.storage_size(A), 1);
    state.set_storage(A, KEY, bytes32_t{});
    EXPECT_EQ(state.storage_size(A), 0);
}

TEST(VersionStack, accept_folds_into_parent_depth)
{
    VersionStack<int> v{1};
    v.current(1) = 2;
    v.current(2) = 3;
    EXPECT_EQ(v.recent(), 3);

    v.pop_accept(2);
    EXPECT_EQ(v.recent(), 3);

    EXPECT_FALSE(v.pop_reject(1));
    EXPECT_EQ(v.recent(), 1);
}

TEST(VersionStack, accept_across_untouched_depths)
{
    VersionStack<int> v{1};
    v.current(3) = 7;
    v.pop_accept(3);
    v.pop_accept(2);
    EXPECT_EQ(v.recent(), 7);

    // the frame now belongs to depth 1
    EXPECT_FALSE(v.pop_reject(1));
    EXPECT_EQ(v.recent(), 1);
}

TEST(VersionStack, untouched_depth_is_noop)
{
    VersionStack<int> v{4};
    v.pop_accept(1);
    EXPECT_FALSE(v.pop_reject(1));
    EXPECT_EQ(v.recent(), 4);
}

TEST(VersionStack, reject_drops_value_created_inside)
{
    VersionStack<int> v{5, 2};
    EXPECT_TRUE(v.pop_reject(2));
}

TEST(State, account_created_in_rejected_checkpoint_is_dropped)
{
    State state;
    state.push();
    state.push();
    state.set_storage(B, KEY, VALUE);
    state.pop_accept();
    EXPECT_EQ(state.get_storage(B, KEY), VALUE);
    state.pop_reject();

    EXPECT_EQ(state.get_storage(B, KEY), bytes32_t{});
    EXPECT_EQ(state.storage_size(B), 0);
}
