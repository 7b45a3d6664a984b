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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/delegation_manager.hpp>
#include <restake/execution/delegation/signature_checker.hpp>
#include <restake/execution/delegation/test_fixtures_gtest.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/delegation/util/eip712.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <utility>

using namespace restake;
using namespace restake::delegation;
using namespace restake::delegation::test;
using namespace intx::literals;

namespace
{
    constexpr auto SECP256K1_ORDER =
        0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;

    constexpr auto APPROVER_SECRET{
        0x00000000000000000000000000000000000000000000000000000000000a9904_bytes32};
    constexpr auto STAKER_SECRET{
        0x0000000000000000000000000000000000000000000000000000000000057a4e_bytes32};
    constexpr auto SALT{
        0x0000000000000000000000000000000000000000000000000000000000005a17_bytes32};
    constexpr auto WALLET = 0xc0de_address;

    // Accepts exactly one signature blob.
    class SingleKeyWallet : public ContractSigner
    {
        byte_string accepted_;

    public:
        explicit SingleKeyWallet(byte_string accepted)
            : accepted_{std::move(accepted)}
        {
        }

        uint32_t is_valid_signature(
            bytes32_t const &, byte_string_view const signature) override
        {
            return signature == accepted_ ? ERC1271_MAGIC_VALUE : 0xffffffff;
        }
    };

    // The same signature with s mirrored into the upper half of the order.
    byte_string make_high_s(byte_string signature)
    {
        auto const s = intx::be::unsafe::load<uint256_t>(&signature[32]);
        intx::be::unsafe::store(&signature[32], SECP256K1_ORDER - s);
        signature[64] = signature[64] == 27 ? 28 : 27;
        return signature;
    }

    struct SignatureTest : public DelegationTest
    {
        Address const approver = secp_address(APPROVER_SECRET);
        Address const signer = secp_address(STAKER_SECRET);
        uint256_t const expiry{static_cast<uint64_t>(START_TIMESTAMP + 100)};

        SignatureWithExpiry approve(
            Address const &staker, bytes32_t const &salt,
            bytes32_t const &secret = APPROVER_SECRET)
        {
            return SignatureWithExpiry{
                .signature = sign_digest(
                    contract.calculate_delegation_approval_digest_hash(
                        staker, OPERATOR, approver, salt, expiry),
                    secret),
                .expiry = expiry};
        }

        Result<void> delegate_to_by_signature(
            SignatureWithExpiry const &staker_signature,
            SignatureWithExpiry const &approver_signature = {},
            bytes32_t const &salt = {})
        {
            state.push();
            auto res = contract.delegate_to_by_signature(
                signer,
                OPERATOR,
                staker_signature,
                approver_signature,
                salt,
                RELAYER);
            post_call(res.has_error());
            return res;
        }
    };
}

TEST(EcdsaVerifier, recovers_signer)
{
    EcdsaVerifier const verifier{};
    bytes32_t const digest{0x1234};
    auto const signature = sign_digest(digest, STAKER_SECRET);
    auto const signer = secp_address(STAKER_SECRET);

    EXPECT_TRUE(verifier.verify(signer, digest, signature));
    EXPECT_FALSE(verifier.verify(WALLET, digest, signature));
    EXPECT_FALSE(verifier.verify(signer, bytes32_t{0x1235}, signature));

    // v in {0, 1} is accepted as well
    byte_string raw = signature;
    raw[64] -= 27;
    EXPECT_TRUE(verifier.verify(signer, digest, raw));
}

TEST(EcdsaVerifier, rejects_malformed_signatures)
{
    EcdsaVerifier const verifier{};
    bytes32_t const digest{0x1234};
    auto const signature = sign_digest(digest, STAKER_SECRET);
    auto const signer = secp_address(STAKER_SECRET);

    EXPECT_FALSE(verifier.verify(signer, digest, make_high_s(signature)));
    EXPECT_FALSE(
        verifier.verify(signer, digest, signature.substr(0, 64)));
    EXPECT_FALSE(verifier.verify(signer, digest, byte_string{}));

    byte_string bad_v = signature;
    bad_v[64] = 29;
    EXPECT_FALSE(verifier.verify(signer, digest, bad_v));
}

TEST(SignatureChecker, dispatches_to_contract_wallets)
{
    SignatureChecker checker;
    bytes32_t const digest{0x42};
    byte_string const blob{0xca, 0xfe};
    SingleKeyWallet wallet{blob};

    // unregistered, the blob is checked as an ECDSA signature
    EXPECT_FALSE(checker.is_valid_signature(WALLET, digest, blob));
    checker.register_contract_signer(WALLET, wallet);

    EXPECT_TRUE(checker.is_valid_signature(WALLET, digest, blob));
    EXPECT_FALSE(checker.is_valid_signature(
        WALLET, digest, sign_digest(digest, STAKER_SECRET)));

    // other accounts still go through ECDSA
    auto const signer = secp_address(STAKER_SECRET);
    EXPECT_TRUE(checker.is_valid_signature(
        signer, digest, sign_digest(digest, STAKER_SECRET)));
    EXPECT_FALSE(checker.is_valid_signature(signer, digest, blob));
}

TEST_F(SignatureTest, approver_signature_admits_staker_once)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    auto const signature = approve(STAKER, SALT);

    EXPECT_FALSE(contract.delegation_approver_salt_is_spent(approver, SALT));
    ASSERT_FALSE(delegate_to(STAKER, OPERATOR, signature, SALT).has_error());
    EXPECT_EQ(contract.delegated_to(STAKER), OPERATOR);
    EXPECT_TRUE(contract.delegation_approver_salt_is_spent(approver, SALT));

    ASSERT_FALSE(undelegate(STAKER, STAKER).has_error());
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, signature, SALT).assume_error(),
        DelegationError::SaltAlreadySpent);
    EXPECT_FALSE(contract.is_delegated(STAKER));

    // a fresh salt is a fresh approval
    bytes32_t const next_salt{0x5a18};
    EXPECT_FALSE(
        delegate_to(STAKER, OPERATOR, approve(STAKER, next_salt), next_salt)
            .has_error());
}

TEST_F(SignatureTest, approver_signature_is_bound_to_staker)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    auto const signature = approve(STAKER, SALT);

    EXPECT_EQ(
        delegate_to(OTHER_STAKER, OPERATOR, signature, SALT).assume_error(),
        DelegationError::InvalidSignature);
    EXPECT_FALSE(contract.delegation_approver_salt_is_spent(approver, SALT));
    EXPECT_FALSE(delegate_to(STAKER, OPERATOR, signature, SALT).has_error());
}

TEST_F(SignatureTest, approver_signature_from_wrong_key)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, approve(STAKER, SALT, STAKER_SECRET), SALT)
            .assume_error(),
        DelegationError::InvalidSignature);
    EXPECT_FALSE(contract.delegation_approver_salt_is_spent(approver, SALT));
    EXPECT_FALSE(contract.is_delegated(STAKER));

    auto signature = approve(STAKER, SALT);
    signature.signature = make_high_s(signature.signature);
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, signature, SALT).assume_error(),
        DelegationError::InvalidSignature);
}

TEST_F(SignatureTest, approver_signature_expiry)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());

    SignatureWithExpiry expired{
        .signature = sign_digest(
            contract.calculate_delegation_approval_digest_hash(
                STAKER, OPERATOR, approver, SALT, START_TIMESTAMP - 1),
            APPROVER_SECRET),
        .expiry = START_TIMESTAMP - 1};
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, expired, SALT).assume_error(),
        DelegationError::SignatureExpired);

    // valid through the expiry timestamp itself
    SignatureWithExpiry last_second{
        .signature = sign_digest(
            contract.calculate_delegation_approval_digest_hash(
                STAKER, OPERATOR, approver, SALT, START_TIMESTAMP),
            APPROVER_SECRET),
        .expiry = START_TIMESTAMP};
    EXPECT_FALSE(delegate_to(STAKER, OPERATOR, last_second, SALT).has_error());
}

TEST_F(SignatureTest, operator_and_approver_skip_approval)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    ASSERT_FALSE(delegate_to(approver, OPERATOR).has_error());
    EXPECT_EQ(contract.delegated_to(approver), OPERATOR);
    EXPECT_FALSE(contract.delegation_approver_salt_is_spent(approver, SALT));
}

TEST_F(SignatureTest, delegate_to_by_signature)
{
    ASSERT_FALSE(register_as_operator(OPERATOR).has_error());
    ASSERT_FALSE(deposit(signer, STRATEGY_A, ONE_ETHER).has_error());

    SignatureWithExpiry const signature{
        .signature = sign_digest(
            contract.calculate_staker_delegation_digest_hash(
                signer, OPERATOR, expiry),
            STAKER_SECRET),
        .expiry = expiry};
    ASSERT_FALSE(delegate_to_by_signature(signature).has_error());
    EXPECT_EQ(contract.delegated_to(signer), OPERATOR);
    EXPECT_EQ(contract.operator_shares(OPERATOR, STRATEGY_A), ONE_ETHER);
    EXPECT_FALSE(contract.is_delegated(RELAYER));
}

TEST_F(SignatureTest, delegate_to_by_signature_revert)
{
    ASSERT_FALSE(register_as_operator(OPERATOR).has_error());

    SignatureWithExpiry const other_operator{
        .signature = sign_digest(
            contract.calculate_staker_delegation_digest_hash(
                signer, OTHER_OPERATOR, expiry),
            STAKER_SECRET),
        .expiry = expiry};
    EXPECT_EQ(
        delegate_to_by_signature(other_operator).assume_error(),
        DelegationError::InvalidSignature);

    SignatureWithExpiry const wrong_expiry{
        .signature = other_operator.signature, .expiry = expiry + 1};
    EXPECT_EQ(
        delegate_to_by_signature(wrong_expiry).assume_error(),
        DelegationError::InvalidSignature);

    SignatureWithExpiry const expired{
        .signature = {}, .expiry = START_TIMESTAMP - 1};
    EXPECT_EQ(
        delegate_to_by_signature(expired).assume_error(),
        DelegationError::SignatureExpired);
    EXPECT_FALSE(contract.is_delegated(signer));
}

TEST_F(SignatureTest, relayed_delegation_needs_approver_signature)
{
    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    SignatureWithExpiry const signature{
        .signature = sign_digest(
            contract.calculate_staker_delegation_digest_hash(
                signer, OPERATOR, expiry),
            STAKER_SECRET),
        .expiry = expiry};

    EXPECT_EQ(
        delegate_to_by_signature(signature).assume_error(),
        DelegationError::SignatureExpired);
    EXPECT_FALSE(
        delegate_to_by_signature(signature, approve(signer, SALT), SALT)
            .has_error());
    EXPECT_TRUE(contract.delegation_approver_salt_is_spent(approver, SALT));
}

TEST_F(SignatureTest, contract_wallet_approver)
{
    byte_string const blob{0xde, 0xad, 0xbe, 0xef};
    SingleKeyWallet wallet{blob};
    signature_checker.register_contract_signer(WALLET, wallet);
    ASSERT_FALSE(register_as_operator(OPERATOR, WALLET).has_error());

    SignatureWithExpiry const rejected{
        .signature = approve(STAKER, SALT).signature, .expiry = expiry};
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, rejected, SALT).assume_error(),
        DelegationError::InvalidSignature);

    SignatureWithExpiry const accepted{.signature = blob, .expiry = expiry};
    EXPECT_FALSE(delegate_to(STAKER, OPERATOR, accepted, SALT).has_error());
    EXPECT_TRUE(contract.delegation_approver_salt_is_spent(WALLET, SALT));
}

TEST_F(SignatureTest, domain_separator_follows_chain_id)
{
    auto const cached = contract.domain_separator();
    EXPECT_EQ(cached, compute_domain_separator(CHAIN_ID, DELEGATION_MANAGER_CA));

    ASSERT_FALSE(register_as_operator(OPERATOR, approver).has_error());
    auto const signature = approve(STAKER, SALT);

    set_chain_id(5);
    EXPECT_EQ(
        contract.domain_separator(),
        compute_domain_separator(5, DELEGATION_MANAGER_CA));
    EXPECT_NE(contract.domain_separator(), cached);

    // signed for the old chain
    EXPECT_EQ(
        delegate_to(STAKER, OPERATOR, signature, SALT).assume_error(),
        DelegationError::InvalidSignature);
    EXPECT_FALSE(
        delegate_to(STAKER, OPERATOR, approve(STAKER, SALT), SALT).has_error());

    set_chain_id(CHAIN_ID);
    EXPECT_EQ(contract.domain_separator(), cached);
}
