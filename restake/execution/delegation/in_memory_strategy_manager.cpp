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

#include <restake/core/assert.h>
#include <restake/core/likely.h>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/checked_math.hpp>
#include <restake/execution/core/contract/events.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/in_memory_strategy_manager.hpp>
#include <restake/execution/delegation/token_ledger.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/delegation/util/strategy_error.hpp>
#include <restake/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

InMemoryStrategyManager::InMemoryStrategyManager(
    State &state, Address const &address)
    : state_{state}
    , address_{address}
{
}

void InMemoryStrategyManager::set_delegation_manager(DelegationManager &dm)
{
    delegation_ = &dm;
}

/////////////
// Events //
/////////////

void InMemoryStrategyManager::emit_deposit_event(
    Address const &staker, Address const &token, Address const &strategy,
    uint256_t const &shares)
{
    // event Deposit(address staker, address token, address strategy,
    //               uint256 shares)
    constexpr bytes32_t signature =
        abi_encode_event_signature("Deposit(address,address,address,uint256)");
    static_assert(
        signature ==
        0x7cfff908a4b583f36430b25d75964c458d8ede8a99bd61be750e97ee1b2f3a96_bytes32);

    state_.store_log(EventBuilder(address_, signature)
                         .add_data(abi_encode_address(staker))
                         .add_data(abi_encode_address(token))
                         .add_data(abi_encode_address(strategy))
                         .add_data(abi_encode_uint(u256_be{shares}))
                         .build());
}

void InMemoryStrategyManager::emit_whitelist_event(
    Address const &strategy, bool const added)
{
    constexpr bytes32_t added_signature =
        abi_encode_event_signature("StrategyAddedToDepositWhitelist(address)");
    static_assert(
        added_signature ==
        0x0c35b17d91c96eb2751cd456e1252f42a386e524ef9ff26ecc9950859fdc04fe_bytes32);
    constexpr bytes32_t removed_signature = abi_encode_event_signature(
        "StrategyRemovedFromDepositWhitelist(address)");
    static_assert(
        removed_signature ==
        0x4074413b4b443e4e58019f2855a8765113358c7c72e39509c6af45fc0f5ba030_bytes32);

    state_.store_log(
        EventBuilder(address_, added ? added_signature : removed_signature)
            .add_data(abi_encode_address(strategy))
            .build());
}

///////////
// Admin //
///////////

Result<void> InMemoryStrategyManager::initialize(Address const &whitelister)
{
    if (RESTAKE_UNLIKELY(whitelister_var().load_checked().has_value())) {
        return DelegationError::AlreadyInitialized;
    }
    if (RESTAKE_UNLIKELY(whitelister == Address{})) {
        return DelegationError::ZeroAddress;
    }
    whitelister_var().store(whitelister);
    return outcome::success();
}

Address InMemoryStrategyManager::whitelister() const noexcept
{
    return whitelister_var().load();
}

Result<void> InMemoryStrategyManager::add_strategies_to_deposit_whitelist(
    std::vector<Address> const &strategies, std::vector<Address> const &tokens,
    Address const &msg_sender)
{
    if (RESTAKE_UNLIKELY(msg_sender != whitelister())) {
        return DelegationError::Unauthorized;
    }
    if (RESTAKE_UNLIKELY(strategies.size() != tokens.size())) {
        return DelegationError::InputLengthMismatch;
    }
    for (size_t i = 0; i < strategies.size(); ++i) {
        if (RESTAKE_UNLIKELY(
                strategies[i] == Address{} || tokens[i] == Address{})) {
            return DelegationError::ZeroAddress;
        }
        auto info = strategy_var(strategies[i]);
        auto const existing = info.load_checked();
        if (existing.has_value() && existing->token != tokens[i]) {
            return StrategyError::TokenMismatch;
        }
        if (existing.has_value() && existing->whitelisted) {
            continue;
        }
        info.store(StrategyInfo{.token = tokens[i], .whitelisted = true});
        emit_whitelist_event(strategies[i], true);
    }
    return outcome::success();
}

Result<void> InMemoryStrategyManager::remove_strategies_from_deposit_whitelist(
    std::vector<Address> const &strategies, Address const &msg_sender)
{
    if (RESTAKE_UNLIKELY(msg_sender != whitelister())) {
        return DelegationError::Unauthorized;
    }
    for (auto const &strategy : strategies) {
        auto info = strategy_var(strategy);
        auto existing = info.load();
        if (!existing.whitelisted) {
            continue;
        }
        // the token stays recorded so queued withdrawals can still exit
        existing.whitelisted = false;
        info.store(existing);
        emit_whitelist_event(strategy, false);
    }
    return outcome::success();
}

bool InMemoryStrategyManager::strategy_is_whitelisted(
    Address const &strategy) const noexcept
{
    return strategy_var(strategy).load().whitelisted;
}

Address InMemoryStrategyManager::underlying_token(
    Address const &strategy) const noexcept
{
    return strategy_var(strategy).load().token;
}

/////////////
// Deposit //
/////////////

Result<uint256_t> InMemoryStrategyManager::deposit_into_strategy(
    Address const &strategy, Address const &token, uint256_t const &amount,
    Address const &msg_sender)
{
    RESTAKE_ASSERT(delegation_ != nullptr, "delegation manager not set");

    auto const info = strategy_var(strategy).load();
    if (RESTAKE_UNLIKELY(!info.whitelisted)) {
        return StrategyError::StrategyNotWhitelisted;
    }
    if (RESTAKE_UNLIKELY(info.token != token)) {
        return StrategyError::TokenMismatch;
    }
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return StrategyError::ZeroShares;
    }

    BOOST_OUTCOME_TRY(
        TokenLedger(state_, token).transfer(msg_sender, strategy, amount));
    BOOST_OUTCOME_TRY(add_shares_(msg_sender, strategy, amount));
    emit_deposit_event(msg_sender, token, strategy, amount);
    LOG_INFO(
        "StrategyManager: {} deposited {} into strategy {}",
        msg_sender,
        amount,
        strategy);

    BOOST_OUTCOME_TRY(delegation_->increase_delegated_shares(
        msg_sender, strategy, amount, address_));
    return amount;
}

///////////
// Views //
///////////

uint256_t InMemoryStrategyManager::staker_strategy_shares(
    Address const &staker, Address const &strategy) const noexcept
{
    return staker_shares_var(staker, strategy).load().native();
}

uint64_t InMemoryStrategyManager::staker_strategy_list_length(
    Address const &staker) const noexcept
{
    return staker_strategy_list(staker).length();
}

uint256_t
InMemoryStrategyManager::total_shares(Address const &strategy) const noexcept
{
    return total_shares_var(strategy).load().native();
}

/////////////////////
// StrategyManager //
/////////////////////

Deposits InMemoryStrategyManager::get_deposits(Address const &staker)
{
    auto const list = staker_strategy_list(staker);
    uint64_t const length = list.length();

    Deposits deposits;
    deposits.strategies.reserve(length);
    deposits.shares.reserve(length);
    for (uint64_t i = 0; i < length; ++i) {
        Address const strategy = list.get(i).load();
        deposits.strategies.push_back(strategy);
        deposits.shares.push_back(staker_strategy_shares(staker, strategy));
    }
    return deposits;
}

Result<void> InMemoryStrategyManager::add_shares_(
    Address const &staker, Address const &strategy, uint256_t const &shares)
{
    if (RESTAKE_UNLIKELY(shares == 0)) {
        return StrategyError::ZeroShares;
    }
    auto staker_shares = staker_shares_var(staker, strategy);
    uint256_t const current = staker_shares.load().native();
    if (current == 0) {
        staker_strategy_list(staker).push(strategy);
    }
    BOOST_OUTCOME_TRY(auto const updated, checked_add(current, shares));
    staker_shares.store(updated);

    auto total = total_shares_var(strategy);
    BOOST_OUTCOME_TRY(
        auto const new_total, checked_add(total.load().native(), shares));
    total.store(new_total);
    return outcome::success();
}

Result<void> InMemoryStrategyManager::add_shares(
    Address const &staker, Address const &token, Address const &strategy,
    uint256_t const &shares)
{
    if (RESTAKE_UNLIKELY(
            token != Address{} && token != underlying_token(strategy))) {
        return StrategyError::TokenMismatch;
    }
    return add_shares_(staker, strategy, shares);
}

Result<void> InMemoryStrategyManager::remove_shares(
    Address const &staker, Address const &strategy, uint256_t const &shares)
{
    if (RESTAKE_UNLIKELY(shares == 0)) {
        return StrategyError::ZeroShares;
    }
    auto staker_shares = staker_shares_var(staker, strategy);
    uint256_t const current = staker_shares.load().native();
    if (RESTAKE_UNLIKELY(current < shares)) {
        return StrategyError::InsufficientShares;
    }
    uint256_t const remaining = current - shares;
    staker_shares.store(remaining);

    if (remaining == 0) {
        auto list = staker_strategy_list(staker);
        uint64_t const length = list.length();
        for (uint64_t i = 0; i < length; ++i) {
            if (list.get(i).load() == strategy) {
                list.swap_remove(i);
                break;
            }
        }
    }

    auto total = total_shares_var(strategy);
    BOOST_OUTCOME_TRY(
        auto const new_total, checked_sub(total.load().native(), shares));
    total.store(new_total);
    return outcome::success();
}

Result<void> InMemoryStrategyManager::withdraw_shares_as_tokens(
    Address const &recipient, Address const &strategy, uint256_t const &shares,
    Address const &token)
{
    if (RESTAKE_UNLIKELY(token != underlying_token(strategy))) {
        return StrategyError::TokenMismatch;
    }
    if (RESTAKE_UNLIKELY(shares == 0)) {
        return StrategyError::ZeroShares;
    }
    LOG_INFO(
        "StrategyManager: releasing {} of token {} to {}",
        shares,
        token,
        recipient);
    return TokenLedger(state_, token).transfer(strategy, recipient, shares);
}

RESTAKE_DELEGATION_NAMESPACE_END
