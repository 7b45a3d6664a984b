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

#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/in_memory_strategy_manager.hpp>
#include <restake/execution/delegation/pauser_registry.hpp>
#include <restake/execution/delegation/signature_checker.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

struct GenesisStrategy
{
    Address strategy;
    Address token;
    uint256_t withdrawal_delay_blocks;
};

struct GenesisBalance
{
    Address token;
    Address holder;
    uint256_t amount;
};

struct GenesisOperator
{
    Address address;
    Address delegation_approver;
    uint32_t staker_opt_out_window_blocks;
    std::string metadata_uri;
};

struct GenesisDeposit
{
    Address staker;
    Address strategy;
    uint256_t amount;
};

struct GenesisDelegation
{
    Address staker;
    Address op;
};

struct Genesis
{
    uint64_t chain_id{1};
    int64_t block_number{0};
    int64_t timestamp{0};
    Address owner{};
    std::vector<Address> pausers{};
    Address unpauser{};
    Address whitelister{};
    uint256_t initial_paused_status{};
    uint256_t min_withdrawal_delay_blocks{};
    std::vector<GenesisStrategy> strategies{};
    std::vector<GenesisBalance> balances{};
    std::vector<GenesisOperator> operators{};
    std::vector<GenesisDeposit> deposits{};
    std::vector<GenesisDelegation> delegations{};
};

// The delegation manager and its collaborators over one state.
struct Deployment
{
    State state;
    evmc_tx_context tx_context{};
    delegation::SignatureChecker signature_checker;
    delegation::InMemoryStrategyManager strategy_manager{state};
    delegation::PauserRegistry pauser_registry{
        state, delegation::PAUSER_REGISTRY_CA};
    delegation::DelegationManager delegation_manager{
        state, tx_context, strategy_manager, signature_checker};

    Deployment()
    {
        strategy_manager.set_delegation_manager(delegation_manager);
    }

    Deployment(Deployment const &) = delete;
    Deployment &operator=(Deployment const &) = delete;
};

Address parse_address(nlohmann::json const &);

// Accepts a json number or a decimal or 0x prefixed string.
uint256_t parse_uint256(nlohmann::json const &);

std::vector<Address> parse_addresses(nlohmann::json const &);

// Throws on malformed input: nlohmann::json exceptions for missing or
// mistyped fields, RestakeException for bad addresses.
Genesis parse_genesis(nlohmann::json const &);

Genesis read_genesis(std::filesystem::path const &);

// Sets the block context, initializes every contract and applies balances,
// operators, deposits and delegations in that order. Deposits are paid from
// the genesis balances. Nothing is written when any step fails.
Result<void> load_genesis(Genesis const &, Deployment &);

RESTAKE_NAMESPACE_END
