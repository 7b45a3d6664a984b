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

#include <restake/core/config.hpp>
#include <restake/core/int.hpp>

#include <intx/intx.hpp>

#include <concepts>
#include <cstddef>

RESTAKE_NAMESPACE_BEGIN

// Unsigned integer held most significant byte first, the byte order of an EVM
// word. Every integer written to storage or fed to a hash goes through this
// type so the bytes do not depend on the host.
template <typename T>
    requires(unsigned_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const value) noexcept
    {
        assign(value);
    }

    constexpr BigEndian &operator=(T const value) noexcept
    {
        assign(value);
        return *this;
    }

    [[nodiscard]] constexpr T native() const noexcept
    {
        T value{0};
        for (unsigned char const byte : bytes) {
            value = static_cast<T>((value << 8) | T{byte});
        }
        return value;
    }

    constexpr bool operator==(BigEndian const &) const noexcept = default;

private:
    constexpr void assign(T value) noexcept
    {
        for (size_t i = sizeof(T); i > 0; --i) {
            bytes[i - 1] = static_cast<unsigned char>(value);
            value = static_cast<T>(value >> 8);
        }
    }
};

using u8_be = BigEndian<uint8_t>;
using u32_be = BigEndian<uint32_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

// storage layouts rely on the wrapper being a plain byte array
template <typename T>
inline constexpr bool is_packed_big_endian =
    sizeof(BigEndian<T>) == sizeof(T) && alignof(BigEndian<T>) == 1;

static_assert(
    is_packed_big_endian<uint8_t> && is_packed_big_endian<uint32_t> &&
    is_packed_big_endian<uint64_t> && is_packed_big_endian<uint256_t>);

template <typename T>
concept BigEndianType = requires { typename T::native_type; } &&
                        std::same_as<T, BigEndian<typename T::native_type>>;

RESTAKE_NAMESPACE_END
