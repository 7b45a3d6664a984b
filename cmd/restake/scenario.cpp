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

#include "scenario.hpp"

#include <restake/core/assert.h>
#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/restake_exception.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/chain/genesis.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/execution/core/fmt/bytes_fmt.hpp> // NOLINT
#include <restake/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/execution/core/fmt/receipt_fmt.hpp> // NOLINT
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/token_ledger.hpp>
#include <restake/execution/delegation/util/withdrawal.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

RESTAKE_ANONYMOUS_NAMESPACE_BEGIN

using namespace delegation;

constexpr int64_t SECONDS_PER_BLOCK = 12;

bytes32_t parse_bytes32(nlohmann::json const &j)
{
    auto const value = evmc::from_hex<bytes32_t>(j.get<std::string>());
    RESTAKE_THROW(value.has_value(), "invalid bytes32");
    return value.value();
}

std::vector<uint256_t> parse_uint256s(nlohmann::json const &j)
{
    std::vector<uint256_t> values;
    for (auto const &item : j) {
        values.push_back(parse_uint256(item));
    }
    return values;
}

SignatureWithExpiry parse_signature(nlohmann::json const &step, char const *key)
{
    if (!step.contains(key)) {
        return {};
    }
    auto const &j = step.at(key);
    auto signature = evmc::from_hex(j.at("signature").get<std::string>());
    RESTAKE_THROW(signature.has_value(), "invalid signature hex");
    return SignatureWithExpiry{
        .signature = std::move(signature.value()),
        .expiry = parse_uint256(j.at("expiry"))};
}

OperatorDetails parse_operator_details(nlohmann::json const &step)
{
    return OperatorDetails{
        .delegation_approver = step.contains("delegation_approver")
                                   ? parse_address(step.at("delegation_approver"))
                                   : Address{},
        .staker_opt_out_window_blocks =
            step.value("staker_opt_out_window_blocks", uint32_t{0})};
}

RESTAKE_ANONYMOUS_NAMESPACE_END

RESTAKE_NAMESPACE_BEGIN

using namespace delegation;

ScenarioRunner::ScenarioRunner(Deployment &deployment)
    : deployment_{deployment}
{
}

Result<void> ScenarioRunner::queue_withdrawals(nlohmann::json const &step)
{
    auto &dm = deployment_.delegation_manager;
    Address const sender = parse_address(step.at("sender"));

    std::vector<QueuedWithdrawalParams> params;
    for (auto const &item : step.at("withdrawals")) {
        params.push_back(QueuedWithdrawalParams{
            .strategies = parse_addresses(item.at("strategies")),
            .shares = parse_uint256s(item.at("shares")),
            .withdrawer = item.contains("withdrawer")
                              ? parse_address(item.at("withdrawer"))
                              : sender});
    }

    Address const op = dm.delegated_to(sender);
    uint256_t const nonce = dm.cumulative_withdrawals_queued(sender);
    auto const start_block =
        static_cast<uint32_t>(deployment_.tx_context.block_number);

    BOOST_OUTCOME_TRY(auto const roots, dm.queue_withdrawals(params, sender));
    RESTAKE_ASSERT(roots.size() == params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        Withdrawal withdrawal{
            .staker = sender,
            .delegated_to = op,
            .withdrawer = params[i].withdrawer,
            .nonce = nonce + i,
            .start_block = start_block,
            .strategies = params[i].strategies,
            .shares = params[i].shares};
        RESTAKE_ASSERT(dm.calculate_withdrawal_root(withdrawal) == roots[i]);
        LOG_INFO("  withdrawal #{} root {}", withdrawals_.size(), roots[i]);
        withdrawals_.push_back(std::move(withdrawal));
    }
    return outcome::success();
}

Result<void> ScenarioRunner::undelegate(nlohmann::json const &step)
{
    auto &dm = deployment_.delegation_manager;
    Address const sender = parse_address(step.at("sender"));
    Address const staker =
        step.contains("staker") ? parse_address(step.at("staker")) : sender;

    Address const op = dm.delegated_to(staker);
    uint256_t const nonce = dm.cumulative_withdrawals_queued(staker);
    auto const start_block =
        static_cast<uint32_t>(deployment_.tx_context.block_number);
    Deposits const deposits = dm.get_delegatable_shares(staker);

    BOOST_OUTCOME_TRY(auto const roots, dm.undelegate(staker, sender));
    size_t root = 0;
    for (size_t i = 0; i < deposits.strategies.size(); ++i) {
        if (deposits.shares[i] == 0) {
            continue;
        }
        Withdrawal withdrawal{
            .staker = staker,
            .delegated_to = op,
            .withdrawer = staker,
            .nonce = nonce + root,
            .start_block = start_block,
            .strategies = {deposits.strategies[i]},
            .shares = {deposits.shares[i]}};
        RESTAKE_ASSERT(root < roots.size());
        RESTAKE_ASSERT(dm.calculate_withdrawal_root(withdrawal) == roots[root]);
        LOG_INFO("  withdrawal #{} root {}", withdrawals_.size(), roots[root]);
        withdrawals_.push_back(std::move(withdrawal));
        ++root;
    }
    RESTAKE_ASSERT(root == roots.size());
    return outcome::success();
}

Result<void>
ScenarioRunner::complete_queued_withdrawal(nlohmann::json const &step)
{
    auto const index = step.at("withdrawal").get<size_t>();
    RESTAKE_THROW(index < withdrawals_.size(), "unknown withdrawal index");
    Withdrawal const &withdrawal = withdrawals_[index];

    std::vector<Address> tokens;
    for (auto const &strategy : withdrawal.strategies) {
        tokens.push_back(
            deployment_.strategy_manager.underlying_token(strategy));
    }
    Address const sender = step.contains("sender")
                               ? parse_address(step.at("sender"))
                               : withdrawal.withdrawer;
    return deployment_.delegation_manager.complete_queued_withdrawal(
        withdrawal,
        tokens,
        0,
        step.value("receive_as_tokens", true),
        sender);
}

Result<void> ScenarioRunner::call(nlohmann::json const &step)
{
    auto &dm = deployment_.delegation_manager;
    auto &sm = deployment_.strategy_manager;
    auto const op = step.at("op").get<std::string>();

    if (op == "advance_blocks") {
        auto const blocks = step.at("blocks").get<int64_t>();
        deployment_.tx_context.block_number += blocks;
        deployment_.tx_context.block_timestamp += blocks * SECONDS_PER_BLOCK;
        return outcome::success();
    }
    if (op == "queue_withdrawals") {
        return queue_withdrawals(step);
    }
    if (op == "undelegate") {
        return undelegate(step);
    }
    if (op == "complete_queued_withdrawal") {
        return complete_queued_withdrawal(step);
    }

    Address const sender = parse_address(step.at("sender"));
    if (op == "mint") {
        return TokenLedger(deployment_.state, parse_address(step.at("token")))
            .mint(sender, parse_uint256(step.at("amount")));
    }
    if (op == "deposit") {
        Address const strategy = parse_address(step.at("strategy"));
        BOOST_OUTCOME_TRY(sm.deposit_into_strategy(
            strategy,
            sm.underlying_token(strategy),
            parse_uint256(step.at("amount")),
            sender));
        return outcome::success();
    }
    if (op == "register_as_operator") {
        return dm.register_as_operator(
            parse_operator_details(step),
            step.value("metadata_uri", std::string{}),
            sender);
    }
    if (op == "modify_operator_details") {
        return dm.modify_operator_details(parse_operator_details(step), sender);
    }
    if (op == "update_operator_metadata_uri") {
        return dm.update_operator_metadata_uri(
            step.at("metadata_uri").get<std::string>(), sender);
    }
    if (op == "delegate_to") {
        return dm.delegate_to(
            parse_address(step.at("operator")),
            parse_signature(step, "approver_signature"),
            step.contains("approver_salt")
                ? parse_bytes32(step.at("approver_salt"))
                : bytes32_t{},
            sender);
    }
    if (op == "delegate_to_by_signature") {
        return dm.delegate_to_by_signature(
            parse_address(step.at("staker")),
            parse_address(step.at("operator")),
            parse_signature(step, "staker_signature"),
            parse_signature(step, "approver_signature"),
            step.contains("approver_salt")
                ? parse_bytes32(step.at("approver_salt"))
                : bytes32_t{},
            sender);
    }
    if (op == "set_min_withdrawal_delay_blocks") {
        return dm.set_min_withdrawal_delay_blocks(
            parse_uint256(step.at("blocks")), sender);
    }
    if (op == "set_strategy_withdrawal_delay_blocks") {
        return dm.set_strategy_withdrawal_delay_blocks(
            parse_addresses(step.at("strategies")),
            parse_uint256s(step.at("blocks")),
            sender);
    }
    if (op == "pause") {
        return dm.pause(parse_uint256(step.at("status")), sender);
    }
    if (op == "pause_all") {
        return dm.pause_all(sender);
    }
    if (op == "unpause") {
        return dm.unpause(parse_uint256(step.at("status")), sender);
    }
    if (op == "transfer_ownership") {
        return dm.transfer_ownership(
            parse_address(step.at("new_owner")), sender);
    }
    RESTAKE_THROW(false, "unknown scenario op");
    return outcome::success();
}

bool ScenarioRunner::check(nlohmann::json const &step) const
{
    auto const &dm = deployment_.delegation_manager;
    auto const op = step.at("op").get<std::string>();

    if (op == "expect_operator_shares") {
        uint256_t const actual = dm.operator_shares(
            parse_address(step.at("operator")),
            parse_address(step.at("strategy")));
        uint256_t const expected = parse_uint256(step.at("shares"));
        if (actual != expected) {
            LOG_ERROR("  operator shares {} expected {}", actual, expected);
        }
        return actual == expected;
    }
    if (op == "expect_delegated_to") {
        Address const actual =
            dm.delegated_to(parse_address(step.at("staker")));
        Address const expected = step.at("operator").is_null()
                                     ? Address{}
                                     : parse_address(step.at("operator"));
        if (actual != expected) {
            LOG_ERROR("  delegated to {} expected {}", actual, expected);
        }
        return actual == expected;
    }
    if (op == "expect_balance") {
        uint256_t const actual =
            TokenLedger(deployment_.state, parse_address(step.at("token")))
                .balance_of(parse_address(step.at("holder")));
        uint256_t const expected = parse_uint256(step.at("amount"));
        if (actual != expected) {
            LOG_ERROR("  balance {} expected {}", actual, expected);
        }
        return actual == expected;
    }
    if (op == "expect_pending") {
        auto const index = step.at("withdrawal").get<size_t>();
        RESTAKE_THROW(index < withdrawals_.size(), "unknown withdrawal index");
        bool const actual = dm.pending_withdrawals(
            dm.calculate_withdrawal_root(withdrawals_[index]));
        return actual == step.value("pending", true);
    }
    RESTAKE_THROW(false, "unknown scenario check");
    return false;
}

size_t ScenarioRunner::run(nlohmann::json const &scenario)
{
    auto &state = deployment_.state;
    size_t mismatches = 0;
    size_t index = 0;

    for (auto const &step : scenario.at("steps")) {
        auto const op = step.at("op").get<std::string>();

        if (op.starts_with("expect_")) {
            bool const ok = check(step);
            LOG_INFO("step {} {}: {}", index, op, ok ? "ok" : "MISMATCH");
            mismatches += ok ? 0 : 1;
            ++index;
            continue;
        }

        size_t const logs_before = state.logs().size();
        state.push();
        auto const res = call(step);
        if (res.has_error()) {
            state.pop_reject();
        }
        else {
            state.pop_accept();
        }

        std::string const outcome =
            res.has_error() ? std::string{res.assume_error().message().c_str()}
                            : std::string{"success"};
        std::string const expected = step.value("expect", std::string{"success"});
        bool const ok = outcome == expected;
        mismatches += ok ? 0 : 1;

        if (ok) {
            LOG_INFO(
                "step {} {} at block {}: {}",
                index,
                op,
                deployment_.tx_context.block_number,
                outcome);
        }
        else {
            LOG_ERROR(
                "step {} {} at block {}: {}, expected {}",
                index,
                op,
                deployment_.tx_context.block_number,
                outcome,
                expected);
        }
        auto const &logs = state.logs();
        for (size_t i = logs_before; i < logs.size(); ++i) {
            LOG_DEBUG("  {}", logs[i]);
        }
        ++index;
    }
    return mismatches;
}

RESTAKE_NAMESPACE_END
