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
#include <restake/core/likely.h>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/execution/delegation/signature_checker.hpp>
#include <restake/execution/delegation/util/constants.hpp>
#include <restake/execution/delegation/util/secp256k1.hpp>

#include <quill/Quill.h>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

bool EcdsaVerifier::verify(
    Address const &signer, bytes32_t const &digest,
    byte_string_view const signature) const
{
    Secp256k1RecoverableSignature const sig{signature};
    if (RESTAKE_UNLIKELY(!sig.is_valid() || !sig.is_low_s())) {
        return false;
    }
    auto const recovered = sig.recover(digest);
    return recovered.has_value() && recovered.value() == signer;
}

bool ContractSignatureVerifier::verify(
    Address const &, bytes32_t const &digest,
    byte_string_view const signature) const
{
    return wallet_.is_valid_signature(digest, signature) ==
           ERC1271_MAGIC_VALUE;
}

void SignatureChecker::register_contract_signer(
    Address const &address, ContractSigner &wallet)
{
    LOG_INFO("SignatureChecker: contract wallet registered at {}", address);
    wallets_[address] = &wallet;
}

bool SignatureChecker::is_valid_signature(
    Address const &signer, bytes32_t const &digest,
    byte_string_view const signature) const
{
    auto const it = wallets_.find(signer);
    if (it != wallets_.end()) {
        return ContractSignatureVerifier{*it->second}.verify(
            signer, digest, signature);
    }
    return ecdsa_.verify(signer, digest, signature);
}

RESTAKE_DELEGATION_NAMESPACE_END
