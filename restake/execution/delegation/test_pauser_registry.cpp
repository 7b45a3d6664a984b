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

#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/pauser_registry.hpp>
#include <restake/execution/delegation/test_fixtures_gtest.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/state/state.hpp>

#include <gtest/gtest.h>

using namespace restake;
using namespace restake::delegation;
using namespace restake::delegation::test;

TEST(PauserRegistry, initialize)
{
    State state;
    PauserRegistry registry{state, PAUSER_REGISTRY_CA};

    EXPECT_EQ(
        registry.initialize({PAUSER}, Address{}).assume_error(),
        DelegationError::ZeroAddress);

    state.push();
    auto const res = registry.initialize({PAUSER, Address{}}, UNPAUSER);
    EXPECT_EQ(res.assume_error(), DelegationError::ZeroAddress);
    state.pop_reject();
    EXPECT_FALSE(registry.is_pauser(PAUSER));

    EXPECT_FALSE(registry.initialize({PAUSER, OWNER}, UNPAUSER).has_error());
    EXPECT_TRUE(registry.is_pauser(PAUSER));
    EXPECT_TRUE(registry.is_pauser(OWNER));
    EXPECT_FALSE(registry.is_pauser(UNPAUSER));
    EXPECT_EQ(registry.unpauser(), UNPAUSER);
    EXPECT_EQ(state.logs().size(), 3);

    EXPECT_EQ(
        registry.initialize({STAKER}, STAKER).assume_error(),
        DelegationError::AlreadyInitialized);
}

TEST(PauserRegistry, unpauser_manages_roles)
{
    State state;
    PauserRegistry registry{state, PAUSER_REGISTRY_CA};
    ASSERT_FALSE(registry.initialize({PAUSER}, UNPAUSER).has_error());

    EXPECT_EQ(
        registry.set_is_pauser(STAKER, true, PAUSER).assume_error(),
        DelegationError::Unauthorized);
    EXPECT_EQ(
        registry.set_is_pauser(Address{}, true, UNPAUSER).assume_error(),
        DelegationError::ZeroAddress);
    EXPECT_FALSE(registry.set_is_pauser(STAKER, true, UNPAUSER).has_error());
    EXPECT_TRUE(registry.is_pauser(STAKER));
    EXPECT_FALSE(registry.set_is_pauser(PAUSER, false, UNPAUSER).has_error());
    EXPECT_FALSE(registry.is_pauser(PAUSER));

    EXPECT_EQ(
        registry.set_unpauser(STAKER, STAKER).assume_error(),
        DelegationError::Unauthorized);
    EXPECT_EQ(
        registry.set_unpauser(Address{}, UNPAUSER).assume_error(),
        DelegationError::ZeroAddress);
    EXPECT_FALSE(registry.set_unpauser(OWNER, UNPAUSER).has_error());
    EXPECT_EQ(registry.unpauser(), OWNER);
    EXPECT_EQ(
        registry.set_is_pauser(PAUSER, true, UNPAUSER).assume_error(),
        DelegationError::Unauthorized);
}

TEST_F(DelegationTest, unpauser_change_moves_unpause_right)
{
    ASSERT_FALSE(contract.pause_all(PAUSER).has_error());
    ASSERT_FALSE(
        pauser_registry.set_unpauser(OWNER, UNPAUSER).has_error());

    EXPECT_EQ(
        unpause(UNPAUSE_ALL, UNPAUSER).assume_error(),
        DelegationError::Unauthorized);
    EXPECT_FALSE(unpause(UNPAUSE_ALL, OWNER).has_error());
    EXPECT_EQ(contract.paused(), UNPAUSE_ALL);
}
