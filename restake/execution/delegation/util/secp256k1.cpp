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
#include <restake/core/keccak.hpp>
#include <restake/execution/delegation/util/secp256k1.hpp>

#include <algorithm>
#include <memory>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

Address address_from_secpkey(byte_string_fixed<65> const &serialized_pubkey)
{
    Address eth_address{};
    RESTAKE_ASSERT(serialized_pubkey[0] == 4);
    byte_string_view view{serialized_pubkey.data() + 1, 64};
    auto const hash = keccak256(view);
    std::copy_n(hash.bytes + 12, sizeof(Address), eth_address.bytes);
    return eth_address;
}

secp256k1_context const *get_secp_context()
{
    thread_local std::unique_ptr<
        secp256k1_context,
        decltype(&secp256k1_context_destroy)> const
        secp_context(
            secp256k1_context_create(SECP256K1_CONTEXT_VERIFY),
            &secp256k1_context_destroy);
    return secp_context.get();
}

Secp256k1RecoverableSignature::Secp256k1RecoverableSignature(
    byte_string_view const serialized)
    : sig_{}
    , parse_result_{0}
{
    if (serialized.size() != 65) {
        return;
    }
    int recid = serialized[64];
    if (recid >= 27) {
        recid -= 27;
    }
    if (recid != 0 && recid != 1) {
        return;
    }
    parse_result_ = secp256k1_ecdsa_recoverable_signature_parse_compact(
        get_secp_context(), &sig_, serialized.data(), recid);
}

bool Secp256k1RecoverableSignature::is_low_s() const noexcept
{
    secp256k1_ecdsa_signature plain;
    secp256k1_ecdsa_recoverable_signature_convert(
        get_secp_context(), &plain, &sig_);
    // returns 1 when the input was not already normalized
    return secp256k1_ecdsa_signature_normalize(
               get_secp_context(), nullptr, &plain) == 0;
}

std::optional<Address>
Secp256k1RecoverableSignature::recover(bytes32_t const &digest) const noexcept
{
    secp256k1_pubkey pubkey;
    if (secp256k1_ecdsa_recover(
            get_secp_context(), &pubkey, &sig_, digest.bytes) != 1) {
        return std::nullopt;
    }

    byte_string_fixed<65> serialized;
    size_t uncompressed_pubkey_size = 65;
    secp256k1_ec_pubkey_serialize(
        get_secp_context(),
        serialized.data(),
        &uncompressed_pubkey_size,
        &pubkey,
        SECP256K1_EC_UNCOMPRESSED);
    RESTAKE_ASSERT(uncompressed_pubkey_size == serialized.size());
    return address_from_secpkey(serialized);
}

RESTAKE_DELEGATION_NAMESPACE_END
