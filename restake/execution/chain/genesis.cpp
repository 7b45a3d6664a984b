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
#include <restake/core/restake_exception.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/chain/genesis.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/token_ledger.hpp>
#include <restake/execution/delegation/util/constants.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

Address parse_address(nlohmann::json const &j)
{
    auto const address = evmc::from_hex<Address>(j.get<std::string>());
    RESTAKE_THROW(address.has_value(), "invalid address");
    return address.value();
}

uint256_t parse_uint256(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    return intx::from_string<uint256_t>(j.get<std::string>());
}

std::vector<Address> parse_addresses(nlohmann::json const &j)
{
    std::vector<Address> addresses;
    for (auto const &item : j) {
        addresses.push_back(parse_address(item));
    }
    return addresses;
}

Genesis parse_genesis(nlohmann::json const &j)
{
    Genesis genesis;
    genesis.chain_id = j.value("chain_id", uint64_t{1});
    genesis.block_number = j.value("block_number", int64_t{0});
    genesis.timestamp = j.value("timestamp", int64_t{0});
    genesis.owner = parse_address(j.at("owner"));
    genesis.pausers = parse_addresses(j.at("pausers"));
    genesis.unpauser = parse_address(j.at("unpauser"));
    genesis.whitelister = j.contains("whitelister")
                              ? parse_address(j.at("whitelister"))
                              : genesis.owner;
    if (j.contains("initial_paused_status")) {
        genesis.initial_paused_status =
            parse_uint256(j.at("initial_paused_status"));
    }
    genesis.min_withdrawal_delay_blocks =
        parse_uint256(j.at("min_withdrawal_delay_blocks"));

    for (auto const &item : j.value("strategies", nlohmann::json::array())) {
        genesis.strategies.push_back(GenesisStrategy{
            .strategy = parse_address(item.at("address")),
            .token = parse_address(item.at("token")),
            .withdrawal_delay_blocks =
                item.contains("withdrawal_delay_blocks")
                    ? parse_uint256(item.at("withdrawal_delay_blocks"))
                    : uint256_t{0}});
    }
    for (auto const &item : j.value("balances", nlohmann::json::array())) {
        genesis.balances.push_back(GenesisBalance{
            .token = parse_address(item.at("token")),
            .holder = parse_address(item.at("holder")),
            .amount = parse_uint256(item.at("amount"))});
    }
    for (auto const &item : j.value("operators", nlohmann::json::array())) {
        genesis.operators.push_back(GenesisOperator{
            .address = parse_address(item.at("address")),
            .delegation_approver =
                item.contains("delegation_approver")
                    ? parse_address(item.at("delegation_approver"))
                    : Address{},
            .staker_opt_out_window_blocks =
                item.value("staker_opt_out_window_blocks", uint32_t{0}),
            .metadata_uri = item.value("metadata_uri", std::string{})});
    }
    for (auto const &item : j.value("deposits", nlohmann::json::array())) {
        genesis.deposits.push_back(GenesisDeposit{
            .staker = parse_address(item.at("staker")),
            .strategy = parse_address(item.at("strategy")),
            .amount = parse_uint256(item.at("amount"))});
    }
    for (auto const &item : j.value("delegations", nlohmann::json::array())) {
        genesis.delegations.push_back(GenesisDelegation{
            .staker = parse_address(item.at("staker")),
            .op = parse_address(item.at("operator"))});
    }
    return genesis;
}

Genesis read_genesis(std::filesystem::path const &path)
{
    std::ifstream input{path};
    RESTAKE_THROW(input.is_open(), "cannot open genesis file");
    return parse_genesis(nlohmann::json::parse(input));
}

Result<void> load_genesis(Genesis const &genesis, Deployment &deployment)
{
    using namespace delegation;

    auto &tx_context = deployment.tx_context;
    tx_context.block_number = genesis.block_number;
    tx_context.block_timestamp = genesis.timestamp;
    tx_context.chain_id =
        intx::be::store<evmc_uint256be>(uint256_t{genesis.chain_id});

    auto &state = deployment.state;
    auto &strategy_manager = deployment.strategy_manager;
    auto &delegation_manager = deployment.delegation_manager;

    auto const apply = [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(deployment.pauser_registry.initialize(
            genesis.pausers, genesis.unpauser));
        BOOST_OUTCOME_TRY(strategy_manager.initialize(genesis.whitelister));

        std::vector<Address> strategies;
        std::vector<Address> tokens;
        std::vector<uint256_t> delays;
        for (auto const &strategy : genesis.strategies) {
            strategies.push_back(strategy.strategy);
            tokens.push_back(strategy.token);
            delays.push_back(strategy.withdrawal_delay_blocks);
        }
        BOOST_OUTCOME_TRY(strategy_manager.add_strategies_to_deposit_whitelist(
            strategies, tokens, genesis.whitelister));

        BOOST_OUTCOME_TRY(delegation_manager.initialize(
            genesis.owner,
            deployment.pauser_registry.address(),
            genesis.initial_paused_status,
            genesis.min_withdrawal_delay_blocks,
            strategies,
            delays,
            genesis.owner));

        for (auto const &balance : genesis.balances) {
            BOOST_OUTCOME_TRY(TokenLedger(state, balance.token)
                                  .mint(balance.holder, balance.amount));
        }
        for (auto const &op : genesis.operators) {
            OperatorDetails const details{
                .delegation_approver = op.delegation_approver,
                .staker_opt_out_window_blocks =
                    op.staker_opt_out_window_blocks};
            BOOST_OUTCOME_TRY(delegation_manager.register_as_operator(
                details, op.metadata_uri, op.address));
        }
        for (auto const &deposit : genesis.deposits) {
            BOOST_OUTCOME_TRY(strategy_manager.deposit_into_strategy(
                deposit.strategy,
                strategy_manager.underlying_token(deposit.strategy),
                deposit.amount,
                deposit.staker));
        }
        for (auto const &delegation : genesis.delegations) {
            BOOST_OUTCOME_TRY(delegation_manager.delegate_to(
                delegation.op, {}, {}, delegation.staker));
        }
        return outcome::success();
    };

    state.push();
    auto res = apply();
    if (res.has_error()) {
        state.pop_reject();
        LOG_ERROR(
            "Genesis: load failed: {}", res.assume_error().message().c_str());
        return res;
    }
    state.pop_accept();

    LOG_INFO(
        "Genesis: chain id {} at block {}, {} strategies, {} operators, {} "
        "deposits",
        genesis.chain_id,
        genesis.block_number,
        genesis.strategies.size(),
        genesis.operators.size(),
        genesis.deposits.size());
    return outcome::success();
}

RESTAKE_NAMESPACE_END
