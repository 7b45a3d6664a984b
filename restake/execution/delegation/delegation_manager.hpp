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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_key.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/delegation/config.hpp>
#include <restake/execution/delegation/strategy_manager.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/delegation/util/withdrawal.hpp>

#include <evmc/evmc.h>

#include <bit>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

class SignatureChecker;

struct OperatorDetails
{
    // When non-zero, stakers need this account's signature to delegate.
    Address delegation_approver;
    u32_be staker_opt_out_window_blocks;
};

static_assert(sizeof(OperatorDetails) == 24);
static_assert(alignof(OperatorDetails) == 1);

struct SignatureWithExpiry
{
    byte_string signature;
    uint256_t expiry;
};

// Tracks which operator every staker is delegated to, the shares delegated to
// each operator per strategy, and the queue of withdrawals that move shares
// out of the system after a delay. Strategy shares themselves live in the
// StrategyManager.
//
// All state is kept in the storage of DELEGATION_MANAGER_CA. Every mutating
// operation takes the caller as `msg_sender` and is expected to run inside a
// State checkpoint that the caller rejects when the result is an error.
class DelegationManager
{
    State &state_;
    evmc_tx_context const &tx_context_;
    StrategyManager &strategy_manager_;
    SignatureChecker const &signature_checker_;

public:
    DelegationManager(
        State &, evmc_tx_context const &, StrategyManager &,
        SignatureChecker const &);

    ////////////////////////////////
    // Delegation Storage Variables
    ////////////////////////////////
    class Variables
    {
        State &state_;

        // Single slot values all under namespace 0x0
        static constexpr auto AddressInitialized{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressOwner{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressPauserRegistry{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressPausedStatus{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};
        static constexpr auto AddressMinWithdrawalDelay{
            0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};
        static constexpr auto AddressInitialChainId{
            0x0000000000000000000000000000000000000000000000000000000000000006_bytes32};
        static constexpr auto AddressDomainSeparator{
            0x0000000000000000000000000000000000000000000000000000000000000007_bytes32};
        static constexpr auto AddressReentrancyStatus{
            0x0000000000000000000000000000000000000000000000000000000000000008_bytes32};

        // Namespaces for mappings. Each mapping "owns" all the address space
        // under the namespace byte.
        enum Namespace : uint8_t
        {
            NSOperatorDetails = 0x10,
            NSDelegatedTo = 0x11,
            NSOperatorShares = 0x12,
            NSCumulativeWithdrawals = 0x13,
            NSPendingWithdrawals = 0x14,
            NSStrategyWithdrawalDelay = 0x15,
            NSApproverSaltSpent = 0x16,
        };

        template <Namespace ns, typename T>
        StorageVariable<T>
        address_mapping(Address const &address) const noexcept
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = ns, .address = address, .slots = {}};

            return {
                state_, DELEGATION_MANAGER_CA, std::bit_cast<bytes32_t>(key)};
        }

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // Version of the last completed initializer, zero before initialize.
        StorageVariable<u8_be> initialized{
            state_, DELEGATION_MANAGER_CA, AddressInitialized};

        StorageVariable<Address> owner{
            state_, DELEGATION_MANAGER_CA, AddressOwner};

        StorageVariable<Address> pauser_registry{
            state_, DELEGATION_MANAGER_CA, AddressPauserRegistry};

        // Bit i set means the operation guarded by PauseFlag i is paused.
        StorageVariable<u256_be> paused_status{
            state_, DELEGATION_MANAGER_CA, AddressPausedStatus};

        StorageVariable<u256_be> min_withdrawal_delay_blocks{
            state_, DELEGATION_MANAGER_CA, AddressMinWithdrawalDelay};

        // The chain id at initialization, used to tell whether the cached
        // domain separator is still valid.
        StorageVariable<u256_be> initial_chain_id{
            state_, DELEGATION_MANAGER_CA, AddressInitialChainId};

        StorageVariable<bytes32_t> cached_domain_separator{
            state_, DELEGATION_MANAGER_CA, AddressDomainSeparator};

        // Set while a mutating operation is in progress.
        StorageVariable<bool> reentrancy_status{
            state_, DELEGATION_MANAGER_CA, AddressReentrancyStatus};

        ////////////////
        //  Mappings  //
        ////////////////

        // mapping(address => OperatorDetails) _operatorDetails
        StorageVariable<OperatorDetails>
        operator_details(Address const &op) const noexcept
        {
            return address_mapping<NSOperatorDetails, OperatorDetails>(op);
        }

        // mapping(address => address) delegatedTo
        //
        // An operator is delegated to itself.
        StorageVariable<Address>
        delegated_to(Address const &staker) const noexcept
        {
            return address_mapping<NSDelegatedTo, Address>(staker);
        }

        // mapping(address => mapping(address => uint256)) operatorShares
        StorageVariable<u256_be>
        operator_shares(
            Address const &op, Address const &strategy) const noexcept
        {
            struct
            {
                uint8_t ns;
                Address op;
                Address strategy;
            } key{.ns = NSOperatorShares, .op = op, .strategy = strategy};

            return {state_, DELEGATION_MANAGER_CA, hashed_storage_key(key)};
        }

        // mapping(address => uint256) cumulativeWithdrawalsQueued
        //
        // Doubles as the nonce of the staker's next withdrawal.
        StorageVariable<u256_be>
        cumulative_withdrawals_queued(Address const &staker) const noexcept
        {
            return address_mapping<NSCumulativeWithdrawals, u256_be>(staker);
        }

        // mapping(bytes32 => bool) pendingWithdrawals
        StorageVariable<bool>
        pending_withdrawals(bytes32_t const &root) const noexcept
        {
            struct
            {
                uint8_t ns;
                bytes32_t root;
            } key{.ns = NSPendingWithdrawals, .root = root};

            return {state_, DELEGATION_MANAGER_CA, hashed_storage_key(key)};
        }

        // mapping(address => uint256) strategyWithdrawalDelayBlocks
        StorageVariable<u256_be>
        strategy_withdrawal_delay_blocks(
            Address const &strategy) const noexcept
        {
            return address_mapping<NSStrategyWithdrawalDelay, u256_be>(
                strategy);
        }

        // mapping(address => mapping(bytes32 => bool))
        //     delegationApproverSaltIsSpent
        StorageVariable<bool> approver_salt_spent(
            Address const &approver, bytes32_t const &salt) const noexcept
        {
            struct
            {
                uint8_t ns;
                Address approver;
                bytes32_t salt;
            } key{
                .ns = NSApproverSaltSpent,
                .approver = approver,
                .salt = salt};

            return {state_, DELEGATION_MANAGER_CA, hashed_storage_key(key)};
        }
    };

    Variables vars;

private:
    ////////////
    // Events //
    ////////////

    // event OperatorRegistered(
    //     address indexed operator,
    //     OperatorDetails operatorDetails);
    void emit_operator_registered_event(
        Address const &op, OperatorDetails const &details);

    // event OperatorDetailsModified(
    //     address indexed operator,
    //     OperatorDetails newOperatorDetails);
    void emit_operator_details_modified_event(
        Address const &op, OperatorDetails const &details);

    // event OperatorMetadataURIUpdated(
    //     address indexed operator,
    //     string metadataURI);
    void emit_operator_metadata_uri_updated_event(
        Address const &op, std::string_view metadata_uri);

    // event OperatorSharesIncreased(
    //     address indexed operator,
    //     address staker,
    //     address strategy,
    //     uint256 shares);
    // event OperatorSharesDecreased(...) with the same layout
    void emit_operator_shares_event(
        bool increased, Address const &op, Address const &staker,
        Address const &strategy, uint256_t const &shares);

    // event StakerDelegated(address indexed staker, address indexed operator);
    void emit_staker_delegated_event(Address const &staker, Address const &op);

    // event StakerUndelegated(
    //     address indexed staker,
    //     address indexed operator);
    // event StakerForceUndelegated(...) with the same layout
    void emit_staker_undelegated_event(
        bool forced, Address const &staker, Address const &op);

    // event WithdrawalQueued(bytes32 withdrawalRoot, Withdrawal withdrawal);
    void emit_withdrawal_queued_event(
        bytes32_t const &root, Withdrawal const &withdrawal);

    // event WithdrawalCompleted(bytes32 withdrawalRoot);
    void emit_withdrawal_completed_event(bytes32_t const &root);

    // event MinWithdrawalDelayBlocksSet(uint256 previousValue,
    //                                   uint256 newValue);
    void emit_min_withdrawal_delay_blocks_set_event(
        uint256_t const &previous, uint256_t const &value);

    // event StrategyWithdrawalDelayBlocksSet(
    //     address strategy,
    //     uint256 previousValue,
    //     uint256 newValue);
    void emit_strategy_withdrawal_delay_blocks_set_event(
        Address const &strategy, uint256_t const &previous,
        uint256_t const &value);

    // event Paused(address indexed account, uint256 newPausedStatus);
    // event Unpaused(address indexed account, uint256 newPausedStatus);
    void emit_pause_event(
        bool paused, Address const &account, uint256_t const &status);

    // event OwnershipTransferred(
    //     address indexed previousOwner,
    //     address indexed newOwner);
    void emit_ownership_transferred_event(
        Address const &previous, Address const &owner);

    // event Initialized(uint8 version);
    void emit_initialized_event(uint8_t version);

    /////////////
    // Helpers //
    /////////////

    // Runs `f` with the reentrancy flag held. Fails if the contract is not
    // initialized or the flag is already held.
    template <typename F>
    std::invoke_result_t<F> non_reentrant(F &&f);

    Result<void> when_not_paused(uint8_t index) const noexcept;
    Result<void> only_owner(Address const &msg_sender) const noexcept;

    void set_operator_details(Address const &op, OperatorDetails const &);
    Result<void> set_min_withdrawal_delay_blocks_(uint256_t const &);
    Result<void> set_strategy_withdrawal_delay_blocks_(
        std::vector<Address> const &strategies,
        std::vector<uint256_t> const &withdrawal_delay_blocks);

    Result<void> increase_operator_shares(
        Address const &op, Address const &staker, Address const &strategy,
        uint256_t const &shares);
    Result<void> decrease_operator_shares(
        Address const &op, Address const &staker, Address const &strategy,
        uint256_t const &shares);

    // Checks the approver signature when the operator requires one, then
    // records the delegation and moves the staker's shares to the operator.
    Result<void> delegate(
        Address const &staker, Address const &op,
        SignatureWithExpiry const &approver_signature_and_expiry,
        bytes32_t const &approver_salt, Address const &msg_sender);

    // Removes the shares from the operator and the staker, and records a
    // pending withdrawal. Storage is updated before the strategy manager is
    // called.
    Result<bytes32_t> remove_shares_and_queue_withdrawal(
        Address const &staker, Address const &op, Address const &withdrawer,
        std::vector<Address> const &strategies,
        std::vector<uint256_t> const &shares);

    Result<void> complete_queued_withdrawal_(
        Withdrawal const &, std::vector<Address> const &tokens,
        bool receive_as_tokens, Address const &msg_sender);

    uint256_t chain_id() const noexcept;
    uint256_t block_number() const noexcept;
    uint256_t block_timestamp() const noexcept;

public:
    ////////////////////
    // Initialization //
    ////////////////////

    Result<void> initialize(
        Address const &initial_owner, Address const &pauser_registry,
        uint256_t const &initial_paused_status,
        uint256_t const &min_withdrawal_delay_blocks,
        std::vector<Address> const &strategies,
        std::vector<uint256_t> const &withdrawal_delay_blocks,
        Address const &msg_sender);

    bool is_initialized() const noexcept;

    ///////////////////////
    // Operator Registry //
    ///////////////////////

    // Registers the caller as an operator and delegates it to itself.
    Result<void> register_as_operator(
        OperatorDetails const &, std::string_view metadata_uri,
        Address const &msg_sender);

    Result<void>
    modify_operator_details(OperatorDetails const &, Address const &msg_sender);

    Result<void> update_operator_metadata_uri(
        std::string_view metadata_uri, Address const &msg_sender);

    bool is_operator(Address const &) const noexcept;
    OperatorDetails operator_details(Address const &op) const noexcept;
    Address delegation_approver(Address const &op) const noexcept;
    uint32_t staker_opt_out_window_blocks(Address const &op) const noexcept;

    ////////////////
    // Delegation //
    ////////////////

    Result<void> delegate_to(
        Address const &op,
        SignatureWithExpiry const &approver_signature_and_expiry,
        bytes32_t const &approver_salt, Address const &msg_sender);

    // Delegates `staker` on behalf of a relayer, authorized by the staker's
    // signature over the staker delegation digest.
    Result<void> delegate_to_by_signature(
        Address const &staker, Address const &op,
        SignatureWithExpiry const &staker_signature_and_expiry,
        SignatureWithExpiry const &approver_signature_and_expiry,
        bytes32_t const &approver_salt, Address const &msg_sender);

    // Removes the staker's delegation and queues one withdrawal per strategy
    // with the staker as withdrawer. Returns the withdrawal roots.
    Result<std::vector<bytes32_t>>
    undelegate(Address const &staker, Address const &msg_sender);

    Address delegated_to(Address const &staker) const noexcept;
    bool is_delegated(Address const &staker) const noexcept;

    // The staker's current deposits, as reported by the strategy manager.
    Deposits get_delegatable_shares(Address const &staker);

    //////////////////
    // Share Ledger //
    //////////////////

    // Called by the strategy manager when a staker's shares grow.
    Result<void> increase_delegated_shares(
        Address const &staker, Address const &strategy,
        uint256_t const &shares, Address const &msg_sender);

    // Called by the strategy manager when a staker's shares shrink.
    Result<void> decrease_delegated_shares(
        Address const &staker, Address const &strategy,
        uint256_t const &shares, Address const &msg_sender);

    uint256_t
    operator_shares(Address const &op, Address const &strategy) const noexcept;

    std::vector<uint256_t> get_operator_shares(
        Address const &op, std::vector<Address> const &strategies) const;

    //////////////////////
    // Withdrawal Queue //
    //////////////////////

    Result<std::vector<bytes32_t>> queue_withdrawals(
        std::vector<QueuedWithdrawalParams> const &,
        Address const &msg_sender);

    // `middleware_times_index` is accepted for interface compatibility and
    // ignored.
    Result<void> complete_queued_withdrawal(
        Withdrawal const &, std::vector<Address> const &tokens,
        uint256_t const &middleware_times_index, bool receive_as_tokens,
        Address const &msg_sender);

    // All completions succeed or none do.
    Result<void> complete_queued_withdrawals(
        std::vector<Withdrawal> const &withdrawals,
        std::vector<std::vector<Address>> const &tokens,
        std::vector<uint256_t> const &middleware_times_indexes,
        std::vector<bool> const &receive_as_tokens, Address const &msg_sender);

    // Number of blocks a withdrawal over `strategies` has to wait: the largest
    // of the global minimum and each strategy's delay.
    uint256_t
    get_withdrawal_delay(std::vector<Address> const &strategies) const noexcept;

    bytes32_t calculate_withdrawal_root(Withdrawal const &) const;
    bool pending_withdrawals(bytes32_t const &root) const noexcept;
    uint256_t
    cumulative_withdrawals_queued(Address const &staker) const noexcept;
    uint256_t min_withdrawal_delay_blocks() const noexcept;
    uint256_t
    strategy_withdrawal_delay_blocks(Address const &strategy) const noexcept;

    Result<void> set_min_withdrawal_delay_blocks(
        uint256_t const &new_min_withdrawal_delay_blocks,
        Address const &msg_sender);

    Result<void> set_strategy_withdrawal_delay_blocks(
        std::vector<Address> const &strategies,
        std::vector<uint256_t> const &withdrawal_delay_blocks,
        Address const &msg_sender);

    ///////////////////////////
    // Signatures and Replay //
    ///////////////////////////

    bytes32_t domain_separator() const;

    bytes32_t calculate_staker_delegation_digest_hash(
        Address const &staker, Address const &op,
        uint256_t const &expiry) const;

    bytes32_t calculate_delegation_approval_digest_hash(
        Address const &staker, Address const &op,
        Address const &delegation_approver, bytes32_t const &approver_salt,
        uint256_t const &expiry) const;

    bool delegation_approver_salt_is_spent(
        Address const &delegation_approver,
        bytes32_t const &salt) const noexcept;

    ///////////////////////////
    // Pausing and Ownership //
    ///////////////////////////

    Result<void>
    pause(uint256_t const &new_paused_status, Address const &msg_sender);
    Result<void> pause_all(Address const &msg_sender);
    Result<void>
    unpause(uint256_t const &new_paused_status, Address const &msg_sender);

    uint256_t paused() const noexcept;
    bool paused(uint8_t index) const noexcept;

    Result<void>
    transfer_ownership(Address const &new_owner, Address const &msg_sender);

    Address owner() const noexcept;
    Address pauser_registry() const noexcept;
};

RESTAKE_DELEGATION_NAMESPACE_END
