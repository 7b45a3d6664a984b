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

#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>

#include <cthash/sha3/common.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

RESTAKE_NAMESPACE_BEGIN

// cthash implements SHA-3, which differs from the EVM's keccak-256 only in the
// domain padding. With no suffix bits the first padding byte is 0x01, which
// is the original keccak padding.
struct Keccak256Config
{
    static constexpr size_t digest_length_bit = 256u;
    static constexpr size_t capacity_bit = 2 * digest_length_bit;
    static constexpr size_t rate_bit = 1600u - capacity_bit;
    static constexpr auto suffix = cthash::keccak_suffix(0, 0x00);
};

using ConstevalKeccak256 = cthash::keccak_hasher<Keccak256Config>;

consteval auto consteval_keccak256(std::string_view const text)
{
    return ConstevalKeccak256{}.update(std::span{text}).final();
}

// First four bytes of the signature hash, read big endian.
consteval uint32_t abi_encode_selector(std::string_view const signature)
{
    auto const h = consteval_keccak256(signature);
    uint32_t selector = 0;
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
        selector = (selector << 8) | static_cast<uint32_t>(h[i]);
    }
    return selector;
}

consteval bytes32_t abi_encode_event_signature(std::string_view const event)
{
    return std::bit_cast<bytes32_t>(consteval_keccak256(event));
}

// EIP-712 type hash of a canonical type string.
consteval bytes32_t abi_encode_type_hash(std::string_view const type_string)
{
    return std::bit_cast<bytes32_t>(consteval_keccak256(type_string));
}

RESTAKE_NAMESPACE_END
