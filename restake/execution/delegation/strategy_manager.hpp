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

#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/config.hpp>

#include <vector>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// Parallel arrays of the strategies a staker has shares in and the amounts.
struct Deposits
{
    std::vector<Address> strategies;
    std::vector<uint256_t> shares;
};

// The registry of staker deposits the delegation manager accounts against.
// Every mutating call is made by the delegation manager.
class StrategyManager
{
public:
    virtual ~StrategyManager() = default;

    virtual Address const &address() const noexcept = 0;

    virtual Deposits get_deposits(Address const &staker) = 0;

    // Credits shares to a staker. `token` may be zero when the caller does
    // not name the underlying token.
    virtual Result<void> add_shares(
        Address const &staker, Address const &token, Address const &strategy,
        uint256_t const &shares) = 0;

    // Fails when the staker holds fewer than `shares`.
    virtual Result<void> remove_shares(
        Address const &staker, Address const &strategy,
        uint256_t const &shares) = 0;

    virtual Result<void> withdraw_shares_as_tokens(
        Address const &recipient, Address const &strategy,
        uint256_t const &shares, Address const &token) = 0;
};

RESTAKE_DELEGATION_NAMESPACE_END
