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

#include <restake/core/likely.h>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/checked_math.hpp>
#include <restake/execution/core/contract/events.hpp>
#include <restake/execution/delegation/token_ledger.hpp>
#include <restake/execution/delegation/util/strategy_error.hpp>
#include <restake/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

TokenLedger::TokenLedger(State &state, Address const &token)
    : state_{state}
    , token_{token}
{
}

void TokenLedger::emit_transfer_event(
    Address const &from, Address const &to, uint256_t const &amount)
{
    // event Transfer(address indexed from, address indexed to, uint256 value)
    constexpr bytes32_t signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");
    static_assert(
        signature ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);

    state_.store_log(EventBuilder(token_, signature)
                         .add_topic(abi_encode_address(from))
                         .add_topic(abi_encode_address(to))
                         .add_data(abi_encode_uint(u256_be{amount}))
                         .build());
}

uint256_t TokenLedger::balance_of(Address const &holder) const noexcept
{
    return balance_var(holder).load().native();
}

uint256_t TokenLedger::total_supply() const noexcept
{
    return total_supply_var().load().native();
}

Result<void> TokenLedger::mint(Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        auto const supply, checked_add(total_supply(), amount));
    BOOST_OUTCOME_TRY(auto const balance, checked_add(balance_of(to), amount));
    total_supply_var().store(supply);
    balance_var(to).store(balance);
    emit_transfer_event(Address{}, to, amount);
    return outcome::success();
}

Result<void> TokenLedger::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    uint256_t const from_balance = balance_of(from);
    if (RESTAKE_UNLIKELY(from_balance < amount)) {
        return StrategyError::InsufficientBalance;
    }
    balance_var(from).store(from_balance - amount);
    BOOST_OUTCOME_TRY(auto const to_balance, checked_add(balance_of(to), amount));
    balance_var(to).store(to_balance);
    emit_transfer_event(from, to, amount);
    return outcome::success();
}

RESTAKE_DELEGATION_NAMESPACE_END
