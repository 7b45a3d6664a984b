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
#include <restake/core/int.hpp>
#include <restake/core/unaligned.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <type_traits>

RESTAKE_NAMESPACE_BEGIN

// Typed view of a value kept in account storage. The object representation of
// T fills consecutive slots starting at the slot it is constructed with, and
// the bytes past the end of T in the last slot are zero. A value whose slots
// are all zero is absent for load_checked().
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    // number of slots occupied
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

private:
    using Image = std::array<bytes32_t, N>;

    State &state_;
    Address const account_;
    uint256_t const first_slot_;

    bytes32_t slot(size_t const i) const noexcept
    {
        return intx::be::store<bytes32_t>(first_slot_ + i);
    }

    Image read() const noexcept
    {
        Image image;
        for (size_t i = 0; i < N; ++i) {
            image[i] = state_.get_storage(account_, slot(i));
        }
        return image;
    }

    void write(Image const &image)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(account_, slot(i), image[i]);
        }
    }

public:
    StorageVariable(
        State &state, Address const &account, bytes32_t const &first_slot)
        : state_{state}
        , account_{account}
        , first_slot_{intx::be::load<uint256_t>(first_slot)}
    {
    }

    T load() const noexcept
    {
        Image const image = read();
        return unaligned_load<T>(image[0].bytes);
    }

    std::optional<T> load_checked() const noexcept
    {
        Image const image = read();
        if (std::ranges::all_of(image, [](bytes32_t const &word) {
                return word == bytes32_t{};
            })) {
            return std::nullopt;
        }
        return unaligned_load<T>(image[0].bytes);
    }

    void store(T const &value)
    {
        Image image{};
        std::memcpy(image.data(), &value, sizeof(T));
        write(image);
    }

    void clear()
    {
        write(Image{});
    }
};

RESTAKE_NAMESPACE_END
