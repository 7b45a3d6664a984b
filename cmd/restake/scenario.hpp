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
#include <restake/core/result.hpp>
#include <restake/execution/chain/genesis.hpp>
#include <restake/execution/delegation/util/withdrawal.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

// Replays a json list of calls against a deployment. Each step runs in its own
// checkpoint and carries an expected outcome, "success" or the message of the
// error it should fail with.
class ScenarioRunner
{
    Deployment &deployment_;

    // Every withdrawal queued so far, addressed by position in scenarios.
    std::vector<delegation::Withdrawal> withdrawals_;

    Result<void> call(nlohmann::json const &step);
    bool check(nlohmann::json const &step) const;

    Result<void> queue_withdrawals(nlohmann::json const &step);
    Result<void> undelegate(nlohmann::json const &step);
    Result<void> complete_queued_withdrawal(nlohmann::json const &step);

public:
    explicit ScenarioRunner(Deployment &);

    // Returns the number of steps whose outcome differs from the expectation.
    size_t run(nlohmann::json const &scenario);

    std::vector<delegation::Withdrawal> const &withdrawals() const
    {
        return withdrawals_;
    }
};

RESTAKE_NAMESPACE_END
