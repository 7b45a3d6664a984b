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
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/state/state.hpp>

#include <cstddef>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

AccountState const *State::recent_account_state(Address const &address) const
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return nullptr;
    }
    return &it->second.recent();
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (it == current_.end()) {
        it = current_
                 .try_emplace(
                     address, VersionStack<AccountState>{{}, version_})
                 .first;
    }
    return it->second.current(version_);
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    RESTAKE_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    RESTAKE_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const *const account_state = recent_account_state(address);
    if (account_state == nullptr) {
        return {};
    }
    auto const it = account_state->storage.find(key);
    if (it == account_state->storage.end()) {
        return {};
    }
    return it->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = current_account_state(address).storage;
    if (value == bytes32_t{}) {
        storage.erase(key);
    }
    else {
        storage[key] = value;
    }
}

size_t State::storage_size(Address const &address) const
{
    auto const *const account_state = recent_account_state(address);
    if (account_state == nullptr) {
        return 0;
    }
    return account_state->storage.size();
}

std::vector<Receipt::Log> const &State::logs() const
{
    return logs_.recent();
}

void State::store_log(Receipt::Log const &log)
{
    logs_.current(version_).push_back(log);
}

void State::clear_logs()
{
    logs_.current(version_).clear();
}

RESTAKE_NAMESPACE_END
