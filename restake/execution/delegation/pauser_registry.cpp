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

#include <restake/core/likely.h>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/events.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/execution/delegation/pauser_registry.hpp>
#include <restake/execution/delegation/util/delegation_error.hpp>
#include <restake/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

PauserRegistry::PauserRegistry(State &state, Address const &address)
    : state_{state}
    , address_{address}
{
}

void PauserRegistry::set_is_pauser_(Address const &pauser, bool const can_pause)
{
    // event PauserStatusChanged(address pauser, bool canPause)
    constexpr bytes32_t signature =
        abi_encode_event_signature("PauserStatusChanged(address,bool)");
    static_assert(
        signature ==
        0x65d3a1fd4c13f05cba164f80d03ce90fb4b5e21946bfc3ab7dbd434c2d0b9152_bytes32);

    if (can_pause) {
        is_pauser_var(pauser).store(true);
    }
    else {
        is_pauser_var(pauser).clear();
    }
    state_.store_log(EventBuilder(address_, signature)
                         .add_data(abi_encode_address(pauser))
                         .add_data(abi_encode_bool(can_pause))
                         .build());
}

void PauserRegistry::set_unpauser_(Address const &new_unpauser)
{
    // event UnpauserChanged(address previousUnpauser, address newUnpauser)
    constexpr bytes32_t signature =
        abi_encode_event_signature("UnpauserChanged(address,address)");
    static_assert(
        signature ==
        0x06b4167a2528887a1e97a366eefe8549bfbf1ea3e6ac81cb2564a934d20e8892_bytes32);

    Address const previous = unpauser();
    unpauser_var().store(new_unpauser);
    state_.store_log(EventBuilder(address_, signature)
                         .add_data(abi_encode_address(previous))
                         .add_data(abi_encode_address(new_unpauser))
                         .build());
}

Result<void> PauserRegistry::initialize(
    std::vector<Address> const &pausers, Address const &unpauser)
{
    if (RESTAKE_UNLIKELY(unpauser_var().load_checked().has_value())) {
        return DelegationError::AlreadyInitialized;
    }
    if (RESTAKE_UNLIKELY(unpauser == Address{})) {
        return DelegationError::ZeroAddress;
    }
    for (auto const &pauser : pausers) {
        if (RESTAKE_UNLIKELY(pauser == Address{})) {
            return DelegationError::ZeroAddress;
        }
        set_is_pauser_(pauser, true);
    }
    set_unpauser_(unpauser);
    LOG_INFO(
        "PauserRegistry: initialized with {} pausers, unpauser {}",
        pausers.size(),
        unpauser);
    return outcome::success();
}

bool PauserRegistry::is_pauser(Address const &address) const noexcept
{
    return is_pauser_var(address).load();
}

Address PauserRegistry::unpauser() const noexcept
{
    return unpauser_var().load();
}

Result<void> PauserRegistry::set_is_pauser(
    Address const &pauser, bool const can_pause, Address const &msg_sender)
{
    if (RESTAKE_UNLIKELY(msg_sender != unpauser())) {
        return DelegationError::Unauthorized;
    }
    if (RESTAKE_UNLIKELY(pauser == Address{})) {
        return DelegationError::ZeroAddress;
    }
    set_is_pauser_(pauser, can_pause);
    return outcome::success();
}

Result<void> PauserRegistry::set_unpauser(
    Address const &new_unpauser, Address const &msg_sender)
{
    if (RESTAKE_UNLIKELY(msg_sender != unpauser())) {
        return DelegationError::Unauthorized;
    }
    if (RESTAKE_UNLIKELY(new_unpauser == Address{})) {
        return DelegationError::ZeroAddress;
    }
    set_unpauser_(new_unpauser);
    return outcome::success();
}

RESTAKE_DELEGATION_NAMESPACE_END
