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
#include <restake/execution/core/fmt/bytes_fmt.hpp> // NOLINT
#include <restake/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/pauser_registry.hpp>
#include <restake/execution/delegation/signature_checker.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/delegation/util/eip712.hpp>
#include <restake/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <limits>

RESTAKE_DELEGATION_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint8_t INITIALIZED_VERSION = 1;

RESTAKE_DELEGATION_ANONYMOUS_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

DelegationManager::DelegationManager(
    State &state, evmc_tx_context const &tx_context,
    StrategyManager &strategy_manager,
    SignatureChecker const &signature_checker)
    : state_{state}
    , tx_context_{tx_context}
    , strategy_manager_{strategy_manager}
    , signature_checker_{signature_checker}
    , vars{state}
{
}

////////////
// Events //
////////////

void DelegationManager::emit_operator_registered_event(
    Address const &op, OperatorDetails const &details)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "OperatorRegistered(address,(address,uint32))");
    static_assert(
        signature ==
        0xfc64399f88afa882a6960f089803d4c363341aa85ade7826360afc812106ae46_bytes32);

    state_.store_log(
        EventBuilder(DELEGATION_MANAGER_CA, signature)
            .add_topic(abi_encode_address(op))
            .add_data(abi_encode_address(details.delegation_approver))
            .add_data(abi_encode_uint(details.staker_opt_out_window_blocks))
            .build());
}

void DelegationManager::emit_operator_details_modified_event(
    Address const &op, OperatorDetails const &details)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "OperatorDetailsModified(address,(address,uint32))");
    static_assert(
        signature ==
        0x9370d03062ed1495767fd7109ad3958578bab7d729f5f7d9e204d61bd2afd3fc_bytes32);

    state_.store_log(
        EventBuilder(DELEGATION_MANAGER_CA, signature)
            .add_topic(abi_encode_address(op))
            .add_data(abi_encode_address(details.delegation_approver))
            .add_data(abi_encode_uint(details.staker_opt_out_window_blocks))
            .build());
}

void DelegationManager::emit_operator_metadata_uri_updated_event(
    Address const &op, std::string_view const metadata_uri)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "OperatorMetadataURIUpdated(address,string)");
    static_assert(
        signature ==
        0x02a919ed0e2acad1dd90f17ef2fa4ae5462ee1339170034a8531cca4b6708090_bytes32);

    AbiEncoder encoder;
    encoder.add_string(metadata_uri);
    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_topic(abi_encode_address(op))
                         .add_data(encoder.encode_final())
                         .build());
}

void DelegationManager::emit_operator_shares_event(
    bool const increased, Address const &op, Address const &staker,
    Address const &strategy, uint256_t const &shares)
{
    constexpr bytes32_t increased_signature = abi_encode_event_signature(
        "OperatorSharesIncreased(address,address,address,uint256)");
    static_assert(
        increased_signature ==
        0x1ec042c965e2edd7107b51188ee0f383e22e76179041ab3a9d18ff151405166c_bytes32);
    constexpr bytes32_t decreased_signature = abi_encode_event_signature(
        "OperatorSharesDecreased(address,address,address,uint256)");
    static_assert(
        decreased_signature ==
        0x6909600037b75d7b4733aedd815442b5ec018a827751c832aaff64eba5d6d2dd_bytes32);

    state_.store_log(
        EventBuilder(
            DELEGATION_MANAGER_CA,
            increased ? increased_signature : decreased_signature)
            .add_topic(abi_encode_address(op))
            .add_data(abi_encode_address(staker))
            .add_data(abi_encode_address(strategy))
            .add_data(abi_encode_uint(u256_be{shares}))
            .build());
}

void DelegationManager::emit_staker_delegated_event(
    Address const &staker, Address const &op)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("StakerDelegated(address,address)");
    static_assert(
        signature ==
        0xc3ee9f2e5fda98e8066a1f745b2df9285f416fe98cf2559cd21484b3d8743304_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_topic(abi_encode_address(staker))
                         .add_topic(abi_encode_address(op))
                         .build());
}

void DelegationManager::emit_staker_undelegated_event(
    bool const forced, Address const &staker, Address const &op)
{
    constexpr bytes32_t undelegated_signature =
        abi_encode_event_signature("StakerUndelegated(address,address)");
    static_assert(
        undelegated_signature ==
        0xfee30966a256b71e14bc0ebfc94315e28ef4a97a7131a9e2b7a310a73af44676_bytes32);
    constexpr bytes32_t forced_signature =
        abi_encode_event_signature("StakerForceUndelegated(address,address)");
    static_assert(
        forced_signature ==
        0xf0eddf07e6ea14f388b47e1e94a0f464ecbd9eed4171130e0fc0e99fb4030a8a_bytes32);

    state_.store_log(
        EventBuilder(
            DELEGATION_MANAGER_CA,
            forced ? forced_signature : undelegated_signature)
            .add_topic(abi_encode_address(staker))
            .add_topic(abi_encode_address(op))
            .build());
}

void DelegationManager::emit_withdrawal_queued_event(
    bytes32_t const &root, Withdrawal const &withdrawal)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "WithdrawalQueued(bytes32,(address,address,address,uint256,uint32,"
        "address[],uint256[]))");
    static_assert(
        signature ==
        0x9009ab153e8014fbfb02f2217f5cde7aa7f9ad734ae85ca3ee3f4ca2fdd499f9_bytes32);

    AbiEncoder encoder;
    encoder.add_bytes32(root);
    encoder.add_tuple(abi_encode_withdrawal(withdrawal));
    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_data(encoder.encode_final())
                         .build());
}

void DelegationManager::emit_withdrawal_completed_event(bytes32_t const &root)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("WithdrawalCompleted(bytes32)");
    static_assert(
        signature ==
        0xc97098c2f658800b4df29001527f7324bcdffcf6e8751a699ab920a1eced5b1d_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_data(root)
                         .build());
}

void DelegationManager::emit_min_withdrawal_delay_blocks_set_event(
    uint256_t const &previous, uint256_t const &value)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "MinWithdrawalDelayBlocksSet(uint256,uint256)");
    static_assert(
        signature ==
        0xafa003cd76f87ff9d62b35beea889920f33c0c42b8d45b74954d61d50f4b6b69_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_data(abi_encode_uint(u256_be{previous}))
                         .add_data(abi_encode_uint(u256_be{value}))
                         .build());
}

void DelegationManager::emit_strategy_withdrawal_delay_blocks_set_event(
    Address const &strategy, uint256_t const &previous,
    uint256_t const &value)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "StrategyWithdrawalDelayBlocksSet(address,uint256,uint256)");
    static_assert(
        signature ==
        0x0e7efa738e8b0ce6376a0c1af471655540d2e9a81647d7b09ed823018426576d_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_data(abi_encode_address(strategy))
                         .add_data(abi_encode_uint(u256_be{previous}))
                         .add_data(abi_encode_uint(u256_be{value}))
                         .build());
}

void DelegationManager::emit_pause_event(
    bool const paused, Address const &account, uint256_t const &status)
{
    constexpr bytes32_t paused_signature =
        abi_encode_event_signature("Paused(address,uint256)");
    static_assert(
        paused_signature ==
        0xab40a374bc51de372200a8bc981af8c9ecdc08dfdaef0bb6e09f88f3c616ef3d_bytes32);
    constexpr bytes32_t unpaused_signature =
        abi_encode_event_signature("Unpaused(address,uint256)");
    static_assert(
        unpaused_signature ==
        0x3582d1828e26bf56bd801502bc021ac0bc8afb57c826e4986b45593c8fad389c_bytes32);

    state_.store_log(
        EventBuilder(
            DELEGATION_MANAGER_CA,
            paused ? paused_signature : unpaused_signature)
            .add_topic(abi_encode_address(account))
            .add_data(abi_encode_uint(u256_be{status}))
            .build());
}

void DelegationManager::emit_ownership_transferred_event(
    Address const &previous, Address const &owner)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("OwnershipTransferred(address,address)");
    static_assert(
        signature ==
        0x8be0079c531659141344cd1fd0a4f28419497f9722a3daafe3b4186f6b6457e0_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_topic(abi_encode_address(previous))
                         .add_topic(abi_encode_address(owner))
                         .build());
}

void DelegationManager::emit_initialized_event(uint8_t const version)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Initialized(uint8)");
    static_assert(
        signature ==
        0x7f26b83ff96e1f2b6a682f133852f6798a09c465da95921460cefb3847402498_bytes32);

    state_.store_log(EventBuilder(DELEGATION_MANAGER_CA, signature)
                         .add_data(abi_encode_uint(u8_be{version}))
                         .build());
}

/////////////
// Helpers //
/////////////

template <typename F>
std::invoke_result_t<F> DelegationManager::non_reentrant(F &&f)
{
    if (RESTAKE_UNLIKELY(!is_initialized())) {
        return DelegationError::NotInitialized;
    }
    if (RESTAKE_UNLIKELY(vars.reentrancy_status.load())) {
        LOG_WARNING("DelegationManager: rejected reentrant call");
        return DelegationError::ReentrantCall;
    }
    vars.reentrancy_status.store(true);
    auto res = std::forward<F>(f)();
    vars.reentrancy_status.clear();
    return res;
}

Result<void>
DelegationManager::when_not_paused(uint8_t const index) const noexcept
{
    if (RESTAKE_UNLIKELY(paused(index))) {
        return DelegationError::PausedOperation;
    }
    return outcome::success();
}

Result<void>
DelegationManager::only_owner(Address const &msg_sender) const noexcept
{
    if (RESTAKE_UNLIKELY(msg_sender != owner())) {
        return DelegationError::Unauthorized;
    }
    return outcome::success();
}

uint256_t DelegationManager::chain_id() const noexcept
{
    return intx::be::load<uint256_t>(tx_context_.chain_id);
}

uint256_t DelegationManager::block_number() const noexcept
{
    return static_cast<uint64_t>(tx_context_.block_number);
}

uint256_t DelegationManager::block_timestamp() const noexcept
{
    return static_cast<uint64_t>(tx_context_.block_timestamp);
}

void DelegationManager::set_operator_details(
    Address const &op, OperatorDetails const &details)
{
    vars.operator_details(op).store(details);
    emit_operator_details_modified_event(op, details);
}

Result<void> DelegationManager::set_min_withdrawal_delay_blocks_(
    uint256_t const &new_min_withdrawal_delay_blocks)
{
    if (RESTAKE_UNLIKELY(
            new_min_withdrawal_delay_blocks > MAX_WITHDRAWAL_DELAY_BLOCKS)) {
        return DelegationError::WithdrawalDelayTooLarge;
    }
    uint256_t const previous = min_withdrawal_delay_blocks();
    vars.min_withdrawal_delay_blocks.store(new_min_withdrawal_delay_blocks);
    emit_min_withdrawal_delay_blocks_set_event(
        previous, new_min_withdrawal_delay_blocks);
    return outcome::success();
}

Result<void> DelegationManager::set_strategy_withdrawal_delay_blocks_(
    std::vector<Address> const &strategies,
    std::vector<uint256_t> const &withdrawal_delay_blocks)
{
    if (RESTAKE_UNLIKELY(strategies.size() != withdrawal_delay_blocks.size())) {
        return DelegationError::InputLengthMismatch;
    }
    for (size_t i = 0; i < strategies.size(); ++i) {
        if (RESTAKE_UNLIKELY(
                withdrawal_delay_blocks[i] > MAX_WITHDRAWAL_DELAY_BLOCKS)) {
            return DelegationError::WithdrawalDelayTooLarge;
        }
        auto delay = vars.strategy_withdrawal_delay_blocks(strategies[i]);
        uint256_t const previous = delay.load().native();
        delay.store(withdrawal_delay_blocks[i]);
        emit_strategy_withdrawal_delay_blocks_set_event(
            strategies[i], previous, withdrawal_delay_blocks[i]);
    }
    return outcome::success();
}

Result<void> DelegationManager::increase_operator_shares(
    Address const &op, Address const &staker, Address const &strategy,
    uint256_t const &shares)
{
    auto operator_shares = vars.operator_shares(op, strategy);
    BOOST_OUTCOME_TRY(
        auto const updated,
        checked_add(operator_shares.load().native(), shares));
    operator_shares.store(updated);
    emit_operator_shares_event(true, op, staker, strategy, shares);
    return outcome::success();
}

Result<void> DelegationManager::decrease_operator_shares(
    Address const &op, Address const &staker, Address const &strategy,
    uint256_t const &shares)
{
    auto operator_shares = vars.operator_shares(op, strategy);
    uint256_t const current = operator_shares.load().native();
    if (RESTAKE_UNLIKELY(current < shares)) {
        return DelegationError::InsufficientShares;
    }
    operator_shares.store(current - shares);
    emit_operator_shares_event(false, op, staker, strategy, shares);
    return outcome::success();
}

Result<void> DelegationManager::delegate(
    Address const &staker, Address const &op,
    SignatureWithExpiry const &approver_signature_and_expiry,
    bytes32_t const &approver_salt, Address const &msg_sender)
{
    Address const approver = delegation_approver(op);

    // the approver and the operator itself never need a signature
    if (approver != Address{} && msg_sender != approver && msg_sender != op) {
        uint256_t const expiry = approver_signature_and_expiry.expiry;
        if (RESTAKE_UNLIKELY(expiry < block_timestamp())) {
            return DelegationError::SignatureExpired;
        }
        auto salt_spent = vars.approver_salt_spent(approver, approver_salt);
        if (RESTAKE_UNLIKELY(salt_spent.load())) {
            return DelegationError::SaltAlreadySpent;
        }
        salt_spent.store(true);

        bytes32_t const digest = calculate_delegation_approval_digest_hash(
            staker, op, approver, approver_salt, expiry);
        if (RESTAKE_UNLIKELY(!signature_checker_.is_valid_signature(
                approver, digest, approver_signature_and_expiry.signature))) {
            LOG_DEBUG(
                "DelegationManager: invalid approver signature from {} for "
                "staker {}",
                approver,
                staker);
            return DelegationError::InvalidSignature;
        }
    }

    vars.delegated_to(staker).store(op);
    emit_staker_delegated_event(staker, op);

    Deposits const deposits = strategy_manager_.get_deposits(staker);
    RESTAKE_ASSERT(deposits.strategies.size() == deposits.shares.size());
    for (size_t i = 0; i < deposits.strategies.size(); ++i) {
        if (deposits.shares[i] == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(increase_operator_shares(
            op, staker, deposits.strategies[i], deposits.shares[i]));
    }

    LOG_DEBUG(
        "DelegationManager: staker {} delegated to operator {} with {} "
        "strategies",
        staker,
        op,
        deposits.strategies.size());
    return outcome::success();
}

Result<bytes32_t> DelegationManager::remove_shares_and_queue_withdrawal(
    Address const &staker, Address const &op, Address const &withdrawer,
    std::vector<Address> const &strategies,
    std::vector<uint256_t> const &shares)
{
    RESTAKE_ASSERT(strategies.size() == shares.size());
    // start_block is stored as uint32; a wider block number would wrap and
    // unlock the withdrawal early
    uint256_t const start_block = block_number();
    RESTAKE_ASSERT(
        start_block <= uint256_t{std::numeric_limits<uint32_t>::max()});

    if (RESTAKE_UNLIKELY(staker == Address{})) {
        return DelegationError::ZeroAddress;
    }
    if (RESTAKE_UNLIKELY(strategies.empty())) {
        return DelegationError::InputArrayEmpty;
    }

    if (op != Address{}) {
        for (size_t i = 0; i < strategies.size(); ++i) {
            BOOST_OUTCOME_TRY(
                decrease_operator_shares(op, staker, strategies[i], shares[i]));
        }
    }

    auto cumulative = vars.cumulative_withdrawals_queued(staker);
    uint256_t const nonce = cumulative.load().native();
    BOOST_OUTCOME_TRY(auto const next_nonce, checked_add(nonce, 1));
    cumulative.store(next_nonce);

    Withdrawal const withdrawal{
        .staker = staker,
        .delegated_to = op,
        .withdrawer = withdrawer,
        .nonce = nonce,
        .start_block = static_cast<uint32_t>(start_block),
        .strategies = strategies,
        .shares = shares};
    bytes32_t const root = calculate_withdrawal_root(withdrawal);
    vars.pending_withdrawals(root).store(true);
    emit_withdrawal_queued_event(root, withdrawal);

    for (size_t i = 0; i < strategies.size(); ++i) {
        BOOST_OUTCOME_TRY(
            strategy_manager_.remove_shares(staker, strategies[i], shares[i]));
    }

    LOG_DEBUG(
        "DelegationManager: queued withdrawal {} for staker {} nonce {}",
        root,
        staker,
        nonce);
    return root;
}

Result<void> DelegationManager::complete_queued_withdrawal_(
    Withdrawal const &withdrawal, std::vector<Address> const &tokens,
    bool const receive_as_tokens, Address const &msg_sender)
{
    BOOST_OUTCOME_TRY(when_not_paused(PAUSED_EXIT_WITHDRAWAL_QUEUE));

    bytes32_t const root = calculate_withdrawal_root(withdrawal);
    auto pending = vars.pending_withdrawals(root);
    if (RESTAKE_UNLIKELY(!pending.load())) {
        return DelegationError::WithdrawalNotPending;
    }
    if (RESTAKE_UNLIKELY(msg_sender != withdrawal.withdrawer)) {
        return DelegationError::Unauthorized;
    }
    if (RESTAKE_UNLIKELY(
            receive_as_tokens &&
            tokens.size() != withdrawal.strategies.size())) {
        return DelegationError::InputLengthMismatch;
    }
    uint256_t const unlock_block =
        uint256_t{withdrawal.start_block} +
        get_withdrawal_delay(withdrawal.strategies);
    if (RESTAKE_UNLIKELY(block_number() < unlock_block)) {
        return DelegationError::WithdrawalDelayNotElapsed;
    }

    pending.clear();

    // shares re-enter the ledger of whoever the withdrawer is delegated to now
    Address const current_operator = delegated_to(msg_sender);
    if (!receive_as_tokens && current_operator != Address{}) {
        for (size_t i = 0; i < withdrawal.strategies.size(); ++i) {
            BOOST_OUTCOME_TRY(increase_operator_shares(
                current_operator,
                msg_sender,
                withdrawal.strategies[i],
                withdrawal.shares[i]));
        }
    }
    emit_withdrawal_completed_event(root);

    for (size_t i = 0; i < withdrawal.strategies.size(); ++i) {
        if (receive_as_tokens) {
            BOOST_OUTCOME_TRY(strategy_manager_.withdraw_shares_as_tokens(
                msg_sender,
                withdrawal.strategies[i],
                withdrawal.shares[i],
                tokens[i]));
        }
        else {
            Address const token = i < tokens.size() ? tokens[i] : Address{};
            BOOST_OUTCOME_TRY(strategy_manager_.add_shares(
                msg_sender,
                token,
                withdrawal.strategies[i],
                withdrawal.shares[i]));
        }
    }

    LOG_DEBUG(
        "DelegationManager: completed withdrawal {} as {}",
        root,
        receive_as_tokens ? "tokens" : "shares");
    return outcome::success();
}

////////////////////
// Initialization //
////////////////////

Result<void> DelegationManager::initialize(
    Address const &initial_owner, Address const &pauser_registry,
    uint256_t const &initial_paused_status,
    uint256_t const &min_withdrawal_delay_blocks,
    std::vector<Address> const &strategies,
    std::vector<uint256_t> const &withdrawal_delay_blocks,
    Address const &msg_sender)
{
    if (RESTAKE_UNLIKELY(is_initialized())) {
        return DelegationError::AlreadyInitialized;
    }
    if (RESTAKE_UNLIKELY(
            initial_owner == Address{} || pauser_registry == Address{})) {
        return DelegationError::ZeroAddress;
    }

    vars.pauser_registry.store(pauser_registry);
    vars.paused_status.store(initial_paused_status);
    emit_pause_event(true, msg_sender, initial_paused_status);

    vars.owner.store(initial_owner);
    emit_ownership_transferred_event(Address{}, initial_owner);

    BOOST_OUTCOME_TRY(
        set_min_withdrawal_delay_blocks_(min_withdrawal_delay_blocks));
    BOOST_OUTCOME_TRY(set_strategy_withdrawal_delay_blocks_(
        strategies, withdrawal_delay_blocks));

    uint256_t const id = chain_id();
    vars.initial_chain_id.store(id);
    vars.cached_domain_separator.store(
        compute_domain_separator(id, DELEGATION_MANAGER_CA));

    vars.initialized.store(INITIALIZED_VERSION);
    emit_initialized_event(INITIALIZED_VERSION);

    LOG_INFO(
        "DelegationManager: initialized with owner {}, chain id {}, min "
        "withdrawal delay {}",
        initial_owner,
        id,
        min_withdrawal_delay_blocks);
    return outcome::success();
}

bool DelegationManager::is_initialized() const noexcept
{
    return vars.initialized.load().native() != 0;
}

///////////////////////
// Operator Registry //
///////////////////////

Result<void> DelegationManager::register_as_operator(
    OperatorDetails const &details, std::string_view const metadata_uri,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        if (RESTAKE_UNLIKELY(is_delegated(msg_sender))) {
            return DelegationError::AlreadyDelegated;
        }
        if (RESTAKE_UNLIKELY(
                details.staker_opt_out_window_blocks.native() >
                MAX_STAKER_OPT_OUT_WINDOW_BLOCKS)) {
            return DelegationError::OptOutWindowTooLarge;
        }
        BOOST_OUTCOME_TRY(when_not_paused(PAUSED_NEW_DELEGATION));

        set_operator_details(msg_sender, details);
        BOOST_OUTCOME_TRY(delegate(
            msg_sender,
            msg_sender,
            SignatureWithExpiry{},
            bytes32_t{},
            msg_sender));
        emit_operator_registered_event(msg_sender, details);
        emit_operator_metadata_uri_updated_event(msg_sender, metadata_uri);

        LOG_INFO(
            "DelegationManager: registered operator {} with approver {}",
            msg_sender,
            details.delegation_approver);
        return outcome::success();
    });
}

Result<void> DelegationManager::modify_operator_details(
    OperatorDetails const &details, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        if (RESTAKE_UNLIKELY(!is_operator(msg_sender))) {
            return DelegationError::NotOperator;
        }
        if (RESTAKE_UNLIKELY(
                details.staker_opt_out_window_blocks.native() >
                MAX_STAKER_OPT_OUT_WINDOW_BLOCKS)) {
            return DelegationError::OptOutWindowTooLarge;
        }
        set_operator_details(msg_sender, details);
        return outcome::success();
    });
}

Result<void> DelegationManager::update_operator_metadata_uri(
    std::string_view const metadata_uri, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        if (RESTAKE_UNLIKELY(!is_operator(msg_sender))) {
            return DelegationError::NotOperator;
        }
        emit_operator_metadata_uri_updated_event(msg_sender, metadata_uri);
        return outcome::success();
    });
}

bool DelegationManager::is_operator(Address const &op) const noexcept
{
    return op != Address{} && vars.delegated_to(op).load() == op;
}

OperatorDetails
DelegationManager::operator_details(Address const &op) const noexcept
{
    return vars.operator_details(op).load();
}

Address
DelegationManager::delegation_approver(Address const &op) const noexcept
{
    return operator_details(op).delegation_approver;
}

uint32_t DelegationManager::staker_opt_out_window_blocks(
    Address const &op) const noexcept
{
    return operator_details(op).staker_opt_out_window_blocks.native();
}

////////////////
// Delegation //
////////////////

Result<void> DelegationManager::delegate_to(
    Address const &op, SignatureWithExpiry const &approver_signature_and_expiry,
    bytes32_t const &approver_salt, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(when_not_paused(PAUSED_NEW_DELEGATION));
        if (RESTAKE_UNLIKELY(is_delegated(msg_sender))) {
            return DelegationError::AlreadyDelegated;
        }
        if (RESTAKE_UNLIKELY(!is_operator(op))) {
            return DelegationError::NotOperator;
        }
        return delegate(
            msg_sender,
            op,
            approver_signature_and_expiry,
            approver_salt,
            msg_sender);
    });
}

Result<void> DelegationManager::delegate_to_by_signature(
    Address const &staker, Address const &op,
    SignatureWithExpiry const &staker_signature_and_expiry,
    SignatureWithExpiry const &approver_signature_and_expiry,
    bytes32_t const &approver_salt, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(when_not_paused(PAUSED_NEW_DELEGATION));
        uint256_t const expiry = staker_signature_and_expiry.expiry;
        if (RESTAKE_UNLIKELY(expiry < block_timestamp())) {
            return DelegationError::SignatureExpired;
        }
        if (RESTAKE_UNLIKELY(is_delegated(staker))) {
            return DelegationError::AlreadyDelegated;
        }
        if (RESTAKE_UNLIKELY(!is_operator(op))) {
            return DelegationError::NotOperator;
        }

        bytes32_t const digest =
            calculate_staker_delegation_digest_hash(staker, op, expiry);
        if (RESTAKE_UNLIKELY(!signature_checker_.is_valid_signature(
                staker, digest, staker_signature_and_expiry.signature))) {
            LOG_DEBUG(
                "DelegationManager: invalid staker signature for {}", staker);
            return DelegationError::InvalidSignature;
        }
        return delegate(
            staker,
            op,
            approver_signature_and_expiry,
            approver_salt,
            msg_sender);
    });
}

Result<std::vector<bytes32_t>> DelegationManager::undelegate(
    Address const &staker, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<std::vector<bytes32_t>> {
        BOOST_OUTCOME_TRY(when_not_paused(PAUSED_ENTER_WITHDRAWAL_QUEUE));
        if (RESTAKE_UNLIKELY(!is_delegated(staker))) {
            return DelegationError::NotDelegated;
        }
        if (RESTAKE_UNLIKELY(is_operator(staker))) {
            return DelegationError::OperatorCannotUndelegate;
        }
        Address const op = delegated_to(staker);
        if (RESTAKE_UNLIKELY(
                msg_sender != staker && msg_sender != op &&
                msg_sender != delegation_approver(op))) {
            return DelegationError::Unauthorized;
        }

        if (msg_sender != staker) {
            emit_staker_undelegated_event(true, staker, op);
        }
        emit_staker_undelegated_event(false, staker, op);
        vars.delegated_to(staker).clear();

        Deposits const deposits = strategy_manager_.get_deposits(staker);
        RESTAKE_ASSERT(deposits.strategies.size() == deposits.shares.size());

        std::vector<bytes32_t> roots;
        roots.reserve(deposits.strategies.size());
        for (size_t i = 0; i < deposits.strategies.size(); ++i) {
            if (deposits.shares[i] == 0) {
                continue;
            }
            std::vector<Address> const strategies{deposits.strategies[i]};
            std::vector<uint256_t> const shares{deposits.shares[i]};
            BOOST_OUTCOME_TRY(
                auto const root,
                remove_shares_and_queue_withdrawal(
                    staker, op, staker, strategies, shares));
            roots.push_back(root);
        }

        LOG_INFO(
            "DelegationManager: staker {} undelegated from {} by {}, {} "
            "withdrawals queued",
            staker,
            op,
            msg_sender,
            roots.size());
        return roots;
    });
}

Address DelegationManager::delegated_to(Address const &staker) const noexcept
{
    return vars.delegated_to(staker).load();
}

bool DelegationManager::is_delegated(Address const &staker) const noexcept
{
    return delegated_to(staker) != Address{};
}

Deposits DelegationManager::get_delegatable_shares(Address const &staker)
{
    return strategy_manager_.get_deposits(staker);
}

//////////////////
// Share Ledger //
//////////////////

Result<void> DelegationManager::increase_delegated_shares(
    Address const &staker, Address const &strategy, uint256_t const &shares,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        if (RESTAKE_UNLIKELY(msg_sender != strategy_manager_.address())) {
            return DelegationError::Unauthorized;
        }
        if (!is_delegated(staker)) {
            return outcome::success();
        }
        return increase_operator_shares(
            delegated_to(staker), staker, strategy, shares);
    });
}

Result<void> DelegationManager::decrease_delegated_shares(
    Address const &staker, Address const &strategy, uint256_t const &shares,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        if (RESTAKE_UNLIKELY(msg_sender != strategy_manager_.address())) {
            return DelegationError::Unauthorized;
        }
        if (!is_delegated(staker)) {
            return outcome::success();
        }
        return decrease_operator_shares(
            delegated_to(staker), staker, strategy, shares);
    });
}

uint256_t DelegationManager::operator_shares(
    Address const &op, Address const &strategy) const noexcept
{
    return vars.operator_shares(op, strategy).load().native();
}

std::vector<uint256_t> DelegationManager::get_operator_shares(
    Address const &op, std::vector<Address> const &strategies) const
{
    std::vector<uint256_t> shares;
    shares.reserve(strategies.size());
    for (auto const &strategy : strategies) {
        shares.push_back(operator_shares(op, strategy));
    }
    return shares;
}

//////////////////////
// Withdrawal Queue //
//////////////////////

Result<std::vector<bytes32_t>> DelegationManager::queue_withdrawals(
    std::vector<QueuedWithdrawalParams> const &params,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<std::vector<bytes32_t>> {
        BOOST_OUTCOME_TRY(when_not_paused(PAUSED_ENTER_WITHDRAWAL_QUEUE));

        Address const op = delegated_to(msg_sender);
        std::vector<bytes32_t> roots;
        roots.reserve(params.size());
        for (auto const &param : params) {
            if (RESTAKE_UNLIKELY(
                    param.strategies.size() != param.shares.size())) {
                return DelegationError::InputLengthMismatch;
            }
            if (RESTAKE_UNLIKELY(param.withdrawer != msg_sender)) {
                return DelegationError::WithdrawerMismatch;
            }
            BOOST_OUTCOME_TRY(
                auto const root,
                remove_shares_and_queue_withdrawal(
                    msg_sender,
                    op,
                    param.withdrawer,
                    param.strategies,
                    param.shares));
            roots.push_back(root);
        }
        return roots;
    });
}

Result<void> DelegationManager::complete_queued_withdrawal(
    Withdrawal const &withdrawal, std::vector<Address> const &tokens,
    uint256_t const &, bool const receive_as_tokens, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        return complete_queued_withdrawal_(
            withdrawal, tokens, receive_as_tokens, msg_sender);
    });
}

Result<void> DelegationManager::complete_queued_withdrawals(
    std::vector<Withdrawal> const &withdrawals,
    std::vector<std::vector<Address>> const &tokens,
    std::vector<uint256_t> const &middleware_times_indexes,
    std::vector<bool> const &receive_as_tokens, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        size_t const n = withdrawals.size();
        if (RESTAKE_UNLIKELY(
                tokens.size() != n || middleware_times_indexes.size() != n ||
                receive_as_tokens.size() != n)) {
            return DelegationError::InputLengthMismatch;
        }
        for (size_t i = 0; i < n; ++i) {
            BOOST_OUTCOME_TRY(complete_queued_withdrawal_(
                withdrawals[i], tokens[i], receive_as_tokens[i], msg_sender));
        }
        return outcome::success();
    });
}

uint256_t DelegationManager::get_withdrawal_delay(
    std::vector<Address> const &strategies) const noexcept
{
    uint256_t delay = min_withdrawal_delay_blocks();
    for (auto const &strategy : strategies) {
        delay = std::max(delay, strategy_withdrawal_delay_blocks(strategy));
    }
    return delay;
}

bytes32_t
DelegationManager::calculate_withdrawal_root(Withdrawal const &withdrawal) const
{
    return delegation::calculate_withdrawal_root(withdrawal);
}

bool DelegationManager::pending_withdrawals(
    bytes32_t const &root) const noexcept
{
    return vars.pending_withdrawals(root).load();
}

uint256_t DelegationManager::cumulative_withdrawals_queued(
    Address const &staker) const noexcept
{
    return vars.cumulative_withdrawals_queued(staker).load().native();
}

uint256_t DelegationManager::min_withdrawal_delay_blocks() const noexcept
{
    return vars.min_withdrawal_delay_blocks.load().native();
}

uint256_t DelegationManager::strategy_withdrawal_delay_blocks(
    Address const &strategy) const noexcept
{
    return vars.strategy_withdrawal_delay_blocks(strategy).load().native();
}

Result<void> DelegationManager::set_min_withdrawal_delay_blocks(
    uint256_t const &new_min_withdrawal_delay_blocks,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_owner(msg_sender));
        return set_min_withdrawal_delay_blocks_(
            new_min_withdrawal_delay_blocks);
    });
}

Result<void> DelegationManager::set_strategy_withdrawal_delay_blocks(
    std::vector<Address> const &strategies,
    std::vector<uint256_t> const &withdrawal_delay_blocks,
    Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_owner(msg_sender));
        return set_strategy_withdrawal_delay_blocks_(
            strategies, withdrawal_delay_blocks);
    });
}

///////////////////////////
// Signatures and Replay //
///////////////////////////

bytes32_t DelegationManager::domain_separator() const
{
    uint256_t const id = chain_id();
    if (id == vars.initial_chain_id.load().native()) {
        return vars.cached_domain_separator.load();
    }
    return compute_domain_separator(id, DELEGATION_MANAGER_CA);
}

bytes32_t DelegationManager::calculate_staker_delegation_digest_hash(
    Address const &staker, Address const &op, uint256_t const &expiry) const
{
    return typed_data_digest(
        domain_separator(), staker_delegation_struct_hash(staker, op, expiry));
}

bytes32_t DelegationManager::calculate_delegation_approval_digest_hash(
    Address const &staker, Address const &op,
    Address const &delegation_approver, bytes32_t const &approver_salt,
    uint256_t const &expiry) const
{
    return typed_data_digest(
        domain_separator(),
        delegation_approval_struct_hash(
            delegation_approver, staker, op, approver_salt, expiry));
}

bool DelegationManager::delegation_approver_salt_is_spent(
    Address const &delegation_approver, bytes32_t const &salt) const noexcept
{
    return vars.approver_salt_spent(delegation_approver, salt).load();
}

///////////////////////////
// Pausing and Ownership //
///////////////////////////

Result<void> DelegationManager::pause(
    uint256_t const &new_paused_status, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        PauserRegistry const registry{state_, pauser_registry()};
        if (RESTAKE_UNLIKELY(!registry.is_pauser(msg_sender))) {
            return DelegationError::Unauthorized;
        }
        uint256_t const current = paused();
        // pausing may only set additional bits
        if (RESTAKE_UNLIKELY((current & new_paused_status) != current)) {
            return DelegationError::InvalidPauseStatus;
        }
        vars.paused_status.store(new_paused_status);
        emit_pause_event(true, msg_sender, new_paused_status);
        LOG_INFO(
            "DelegationManager: {} set paused status {}",
            msg_sender,
            new_paused_status);
        return outcome::success();
    });
}

Result<void> DelegationManager::pause_all(Address const &msg_sender)
{
    return pause(PAUSE_ALL, msg_sender);
}

Result<void> DelegationManager::unpause(
    uint256_t const &new_paused_status, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        PauserRegistry const registry{state_, pauser_registry()};
        if (RESTAKE_UNLIKELY(msg_sender != registry.unpauser())) {
            return DelegationError::Unauthorized;
        }
        uint256_t const current = paused();
        // unpausing may only clear bits
        if (RESTAKE_UNLIKELY((~current & ~new_paused_status) != ~current)) {
            return DelegationError::InvalidPauseStatus;
        }
        vars.paused_status.store(new_paused_status);
        emit_pause_event(false, msg_sender, new_paused_status);
        LOG_INFO(
            "DelegationManager: {} set paused status {}",
            msg_sender,
            new_paused_status);
        return outcome::success();
    });
}

uint256_t DelegationManager::paused() const noexcept
{
    return vars.paused_status.load().native();
}

bool DelegationManager::paused(uint8_t const index) const noexcept
{
    return (static_cast<uint64_t>(paused() >> index) & 1) != 0;
}

Result<void> DelegationManager::transfer_ownership(
    Address const &new_owner, Address const &msg_sender)
{
    return non_reentrant([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_owner(msg_sender));
        if (RESTAKE_UNLIKELY(new_owner == Address{})) {
            return DelegationError::ZeroAddress;
        }
        Address const previous = owner();
        vars.owner.store(new_owner);
        emit_ownership_transferred_event(previous, new_owner);
        return outcome::success();
    });
}

Address DelegationManager::owner() const noexcept
{
    return vars.owner.load();
}

Address DelegationManager::pauser_registry() const noexcept
{
    return vars.pauser_registry.load();
}

RESTAKE_DELEGATION_NAMESPACE_END
