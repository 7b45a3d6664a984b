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
#include <restake/core/config.hpp>
#include <restake/core/keccak.hpp>

#include <type_traits>

RESTAKE_NAMESPACE_BEGIN

// Storage key for a mapping whose packed key does not fit in one slot, such as
// a mapping keyed by two addresses. The packed key is hashed, which spreads
// the entries over the whole slot space.
template <typename Key>
    requires std::has_unique_object_representations_v<Key>
bytes32_t hashed_storage_key(Key const &key)
{
    return to_bytes(keccak256(byte_string_view{
        reinterpret_cast<unsigned char const *>(&key), sizeof(Key)}));
}

RESTAKE_NAMESPACE_END
