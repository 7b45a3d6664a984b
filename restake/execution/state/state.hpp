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
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

struct AccountState
{
    ankerl::unordered_dense::map<bytes32_t, bytes32_t> storage{};
};

// World state shared by every contract of the system. Writes made after a
// push() become durable on pop_accept() and are discarded on pop_reject(),
// which gives each external call all-or-nothing semantics.
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, VersionStack<AccountState>> current_{};

    VersionStack<std::vector<Receipt::Log>> logs_{
        std::vector<Receipt::Log>{}};

    unsigned version_{0};

    AccountState const *recent_account_state(Address const &) const;

    AccountState &current_account_state(Address const &);

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    unsigned version() const noexcept
    {
        return version_;
    }

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    // number of non-zero storage slots held by the account
    size_t storage_size(Address const &) const;

    ////////////////////////////////////////

    std::vector<Receipt::Log> const &logs() const;

    void store_log(Receipt::Log const &);

    void clear_logs();
};

RESTAKE_NAMESPACE_END
