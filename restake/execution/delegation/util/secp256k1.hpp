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

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <optional>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

Address address_from_secpkey(byte_string_fixed<65> const &);

secp256k1_context const *get_secp_context();

// A 65 byte `r || s || v` signature as produced by an externally owned
// account. `v` is either {0, 1} or {27, 28}.
class Secp256k1RecoverableSignature
{
    secp256k1_ecdsa_recoverable_signature sig_;
    int parse_result_;

public:
    explicit Secp256k1RecoverableSignature(byte_string_view serialized);

    bool is_valid() const noexcept
    {
        return parse_result_ == 1;
    }

    // Signatures with s in the upper half of the curve order are malleable
    // and rejected.
    bool is_low_s() const noexcept;

    std::optional<Address> recover(bytes32_t const &digest) const noexcept;
};

RESTAKE_DELEGATION_NAMESPACE_END
