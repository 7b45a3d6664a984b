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
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// A smart contract wallet. Returns ERC1271_MAGIC_VALUE when it accepts
// `signature` over `digest`, anything else otherwise.
class ContractSigner
{
public:
    virtual ~ContractSigner() = default;

    virtual uint32_t
    is_valid_signature(bytes32_t const &digest, byte_string_view signature) = 0;
};

class SignatureVerifier
{
public:
    virtual ~SignatureVerifier() = default;

    virtual bool verify(
        Address const &signer, bytes32_t const &digest,
        byte_string_view signature) const = 0;
};

// Recovers the signer of a 65 byte secp256k1 signature and compares it to the
// expected address.
class EcdsaVerifier final : public SignatureVerifier
{
public:
    bool verify(
        Address const &signer, bytes32_t const &digest,
        byte_string_view signature) const override;
};

class ContractSignatureVerifier final : public SignatureVerifier
{
    ContractSigner &wallet_;

public:
    explicit ContractSignatureVerifier(ContractSigner &wallet)
        : wallet_{wallet}
    {
    }

    bool verify(
        Address const &signer, bytes32_t const &digest,
        byte_string_view signature) const override;
};

// Picks the verification path for a signer: accounts with a registered
// contract wallet are checked through it, every other account through ECDSA
// recovery.
class SignatureChecker
{
    EcdsaVerifier ecdsa_{};
    ankerl::unordered_dense::map<Address, ContractSigner *> wallets_{};

public:
    void register_contract_signer(Address const &, ContractSigner &);

    bool is_valid_signature(
        Address const &signer, bytes32_t const &digest,
        byte_string_view signature) const;
};

RESTAKE_DELEGATION_NAMESPACE_END
