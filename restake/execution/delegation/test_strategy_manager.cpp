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
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/delegation/in_memory_strategy_manager.hpp>
#include <restake/execution/delegation/test_fixtures_gtest.hpp>
#include <restake/execution/delegation/token_ledger.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/delegation/util/strategy_error.hpp>
#include <restake/execution/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::delegation;
using namespace restake::delegation::test;
using namespace intx::literals;

namespace
{
    constexpr auto TOKEN_C = 0x7c_address;
    constexpr auto STRATEGY_C = 0x5c_address;
}

//////////////////
// Token Ledger //
//////////////////

TEST(TokenLedger, mint_and_transfer)
{
    State state;
    TokenLedger token{state, TOKEN_C};

    EXPECT_FALSE(token.mint(STAKER, ONE_ETHER).has_error());
    EXPECT_EQ(token.balance_of(STAKER), ONE_ETHER);
    EXPECT_EQ(token.total_supply(), ONE_ETHER);

    EXPECT_FALSE(token.transfer(STAKER, OTHER_STAKER, 400).has_error());
    EXPECT_EQ(token.balance_of(STAKER), ONE_ETHER - 400);
    EXPECT_EQ(token.balance_of(OTHER_STAKER), 400);
    EXPECT_EQ(token.total_supply(), ONE_ETHER);

    EXPECT_EQ(
        token.transfer(OTHER_STAKER, STAKER, 401).assume_error(),
        StrategyError::InsufficientBalance);
    EXPECT_EQ(token.balance_of(OTHER_STAKER), 400);

    // the mint and the successful transfer
    EXPECT_EQ(state.logs().size(), 2);
    EXPECT_EQ(
        state.logs()[1].topics[0],
        abi_encode_event_signature("Transfer(address,address,uint256)"));

    // balances of different tokens are separate accounts
    EXPECT_EQ(TokenLedger(state, TOKEN_A).balance_of(STAKER), 0);
}

//////////////////////
// Strategy Manager //
//////////////////////

TEST_F(DelegationTest, strategy_whitelist)
{
    EXPECT_TRUE(strategy_manager.strategy_is_whitelisted(STRATEGY_A));
    EXPECT_EQ(strategy_manager.underlying_token(STRATEGY_B), TOKEN_B);
    EXPECT_FALSE(strategy_manager.strategy_is_whitelisted(STRATEGY_C));
    EXPECT_EQ(strategy_manager.whitelister(), WHITELISTER);

    EXPECT_EQ(
        strategy_manager
            .add_strategies_to_deposit_whitelist(
                {STRATEGY_C}, {TOKEN_C}, STAKER)
            .assume_error(),
        DelegationError::Unauthorized);
    EXPECT_EQ(
        strategy_manager
            .add_strategies_to_deposit_whitelist(
                {STRATEGY_C}, {}, WHITELISTER)
            .assume_error(),
        DelegationError::InputLengthMismatch);
    EXPECT_EQ(
        strategy_manager
            .add_strategies_to_deposit_whitelist(
                {STRATEGY_A}, {TOKEN_C}, WHITELISTER)
            .assume_error(),
        StrategyError::TokenMismatch);
    EXPECT_EQ(
        strategy_manager.initialize(STAKER).assume_error(),
        DelegationError::AlreadyInitialized);

    EXPECT_FALSE(strategy_manager
                     .remove_strategies_from_deposit_whitelist(
                         {STRATEGY_B}, WHITELISTER)
                     .has_error());
    EXPECT_FALSE(strategy_manager.strategy_is_whitelisted(STRATEGY_B));
    EXPECT_EQ(strategy_manager.underlying_token(STRATEGY_B), TOKEN_B);
    EXPECT_EQ(
        deposit(STAKER, STRATEGY_B, ONE_ETHER).assume_error(),
        StrategyError::StrategyNotWhitelisted);
}

TEST_F(DelegationTest, deposit_into_strategy)
{
    auto const shares = deposit(STAKER, STRATEGY_A, ONE_ETHER);
    ASSERT_FALSE(shares.has_error());
    EXPECT_EQ(shares.value(), ONE_ETHER);

    EXPECT_EQ(balance(TOKEN_A, STAKER), 0);
    EXPECT_EQ(balance(TOKEN_A, STRATEGY_A), ONE_ETHER);
    EXPECT_EQ(
        strategy_manager.staker_strategy_shares(STAKER, STRATEGY_A),
        ONE_ETHER);
    EXPECT_EQ(strategy_manager.total_shares(STRATEGY_A), ONE_ETHER);
    EXPECT_EQ(strategy_manager.staker_strategy_list_length(STAKER), 1);
    EXPECT_EQ(
        count_events(
            state,
            abi_encode_event_signature(
                "Deposit(address,address,address,uint256)")),
        1);

    ASSERT_FALSE(deposit(STAKER, STRATEGY_A, ONE_ETHER).has_error());
    ASSERT_FALSE(deposit(STAKER, STRATEGY_B, ONE_ETHER).has_error());
    EXPECT_EQ(strategy_manager.staker_strategy_list_length(STAKER), 2);

    auto const deposits = strategy_manager.get_deposits(STAKER);
    EXPECT_EQ(
        deposits.strategies, (std::vector<Address>{STRATEGY_A, STRATEGY_B}));
    EXPECT_EQ(
        deposits.shares, (std::vector<uint256_t>{2 * ONE_ETHER, ONE_ETHER}));
}

TEST_F(DelegationTest, deposit_into_strategy_revert)
{
    state.push();
    auto const wrong_token = strategy_manager.deposit_into_strategy(
        STRATEGY_A, TOKEN_B, ONE_ETHER, STAKER);
    post_call(wrong_token.has_error());
    EXPECT_EQ(wrong_token.assume_error(), StrategyError::TokenMismatch);

    state.push();
    auto const unfunded = strategy_manager.deposit_into_strategy(
        STRATEGY_A, TOKEN_A, ONE_ETHER, STAKER);
    post_call(unfunded.has_error());
    EXPECT_EQ(unfunded.assume_error(), StrategyError::InsufficientBalance);

    EXPECT_EQ(
        deposit(STAKER, STRATEGY_A, 0).assume_error(),
        StrategyError::ZeroShares);
    EXPECT_EQ(strategy_manager.staker_strategy_list_length(STAKER), 0);
    EXPECT_EQ(strategy_manager.total_shares(STRATEGY_A), 0);
}

TEST_F(DelegationTest, remove_shares_drops_empty_strategy)
{
    ASSERT_FALSE(deposit(STAKER, STRATEGY_A, ONE_ETHER).has_error());
    ASSERT_FALSE(deposit(STAKER, STRATEGY_B, ONE_ETHER).has_error());

    EXPECT_EQ(
        strategy_manager.remove_shares(STAKER, STRATEGY_A, 2 * ONE_ETHER)
            .assume_error(),
        StrategyError::InsufficientShares);
    EXPECT_EQ(
        strategy_manager.remove_shares(STAKER, STRATEGY_A, 0).assume_error(),
        StrategyError::ZeroShares);

    EXPECT_FALSE(strategy_manager.remove_shares(STAKER, STRATEGY_A, 1)
                     .has_error());
    EXPECT_EQ(strategy_manager.staker_strategy_list_length(STAKER), 2);

    EXPECT_FALSE(
        strategy_manager.remove_shares(STAKER, STRATEGY_A, ONE_ETHER - 1)
            .has_error());
    EXPECT_EQ(strategy_manager.staker_strategy_list_length(STAKER), 1);
    EXPECT_EQ(
        strategy_manager.get_deposits(STAKER).strategies,
        (std::vector<Address>{STRATEGY_B}));
    EXPECT_EQ(strategy_manager.total_shares(STRATEGY_A), 0);
}

TEST_F(DelegationTest, withdraw_shares_as_tokens)
{
    ASSERT_FALSE(deposit(STAKER, STRATEGY_A, ONE_ETHER).has_error());

    EXPECT_EQ(
        strategy_manager
            .withdraw_shares_as_tokens(OTHER_STAKER, STRATEGY_A, 10, TOKEN_B)
            .assume_error(),
        StrategyError::TokenMismatch);
    EXPECT_FALSE(
        strategy_manager
            .withdraw_shares_as_tokens(OTHER_STAKER, STRATEGY_A, 10, TOKEN_A)
            .has_error());
    EXPECT_EQ(balance(TOKEN_A, OTHER_STAKER), 10);
    EXPECT_EQ(balance(TOKEN_A, STRATEGY_A), ONE_ETHER - 10);
}

TEST_F(DelegationTest, add_shares_checks_named_token)
{
    EXPECT_EQ(
        strategy_manager.add_shares(STAKER, TOKEN_B, STRATEGY_A, ONE_ETHER)
            .assume_error(),
        StrategyError::TokenMismatch);
    EXPECT_FALSE(
        strategy_manager.add_shares(STAKER, Address{}, STRATEGY_A, ONE_ETHER)
            .has_error());
    EXPECT_EQ(
        strategy_manager.staker_strategy_shares(STAKER, STRATEGY_A),
        ONE_ETHER);
}
