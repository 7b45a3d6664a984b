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

#pragma once

#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_array.hpp>
#include <restake/execution/core/contract/storage_key.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/delegation/config.hpp>
#include <restake/execution/delegation/strategy_manager.hpp>
#include <restake/execution/delegation/util/constants.hpp>

#include <bit>
#include <cstdint>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

class DelegationManager;

// Storage backed strategy registry. Each strategy holds a single underlying
// token and issues one share per token deposited.
class InMemoryStrategyManager final : public StrategyManager
{
public:
    struct StrategyInfo
    {
        Address token;
        bool whitelisted;
    };

    static_assert(StorageVariable<StrategyInfo>::N == 1);

private:
    State &state_;
    Address const address_;
    DelegationManager *delegation_{nullptr};

    static constexpr auto AddressWhitelister{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    enum Namespace : uint8_t
    {
        NSStrategy = 0x01,
        NSStakerShares = 0x02,
        NSStakerStrategyList = 0x03,
        NSTotalShares = 0x04,
    };

    StorageVariable<Address> whitelister_var() const noexcept
    {
        return {state_, address_, AddressWhitelister};
    }

    // mapping(address => StrategyInfo) strategies
    StorageVariable<StrategyInfo>
    strategy_var(Address const &strategy) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSStrategy, .address = strategy, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(address => mapping(address => uint256)) stakerStrategyShares
    StorageVariable<u256_be> staker_shares_var(
        Address const &staker, Address const &strategy) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address staker;
            Address strategy;
        } key{.ns = NSStakerShares, .staker = staker, .strategy = strategy};

        return {state_, address_, hashed_storage_key(key)};
    }

    // mapping(address => address[]) stakerStrategyList
    StorageArray<Address>
    staker_strategy_list(Address const &staker) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSStakerStrategyList, .address = staker, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(address => uint256) totalShares
    StorageVariable<u256_be>
    total_shares_var(Address const &strategy) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address address;
            uint8_t slots[11];
        } key{.ns = NSTotalShares, .address = strategy, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    Result<void> add_shares_(
        Address const &staker, Address const &strategy,
        uint256_t const &shares);

    void emit_deposit_event(
        Address const &staker, Address const &token, Address const &strategy,
        uint256_t const &shares);
    void emit_whitelist_event(Address const &strategy, bool added);

public:
    explicit InMemoryStrategyManager(
        State &, Address const &address = STRATEGY_MANAGER_CA);

    // Deposits notify this delegation manager of new shares.
    void set_delegation_manager(DelegationManager &);

    Result<void> initialize(Address const &whitelister);

    Address whitelister() const noexcept;

    Result<void> add_strategies_to_deposit_whitelist(
        std::vector<Address> const &strategies,
        std::vector<Address> const &tokens, Address const &msg_sender);

    Result<void> remove_strategies_from_deposit_whitelist(
        std::vector<Address> const &strategies, Address const &msg_sender);

    bool strategy_is_whitelisted(Address const &strategy) const noexcept;

    Address underlying_token(Address const &strategy) const noexcept;

    // Moves `amount` of `token` from the caller into the strategy and credits
    // the same number of shares. Returns the shares issued.
    Result<uint256_t> deposit_into_strategy(
        Address const &strategy, Address const &token, uint256_t const &amount,
        Address const &msg_sender);

    uint256_t staker_strategy_shares(
        Address const &staker, Address const &strategy) const noexcept;

    uint64_t
    staker_strategy_list_length(Address const &staker) const noexcept;

    uint256_t total_shares(Address const &strategy) const noexcept;

    /////////////////////
    // StrategyManager //
    /////////////////////

    Address const &address() const noexcept override
    {
        return address_;
    }

    Deposits get_deposits(Address const &staker) override;

    Result<void> add_shares(
        Address const &staker, Address const &token, Address const &strategy,
        uint256_t const &shares) override;

    Result<void> remove_shares(
        Address const &staker, Address const &strategy,
        uint256_t const &shares) override;

    Result<void> withdraw_shares_as_tokens(
        Address const &recipient, Address const &strategy,
        uint256_t const &shares, Address const &token) override;
};

RESTAKE_DELEGATION_NAMESPACE_END
