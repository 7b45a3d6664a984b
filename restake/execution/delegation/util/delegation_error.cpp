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

#include <restake/execution/delegation/util/delegation_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<restake::delegation::DelegationError>::mapping> const &
quick_status_code_from_enum<restake::delegation::DelegationError>::value_mappings()
{
    using restake::delegation::DelegationError;

    static std::initializer_list<mapping> const v = {
        {DelegationError::Success, "success", {errc::success}},
        {DelegationError::InputLengthMismatch, "input length mismatch", {}},
        {DelegationError::InputArrayEmpty, "input array empty", {}},
        {DelegationError::OptOutWindowTooLarge,
         "staker opt out window too large",
         {}},
        {DelegationError::WithdrawalDelayTooLarge,
         "withdrawal delay too large",
         {}},
        {DelegationError::InvalidPauseStatus, "invalid pause status", {}},
        {DelegationError::ZeroAddress, "zero address", {}},
        {DelegationError::Unauthorized, "unauthorized", {}},
        {DelegationError::WithdrawerMismatch,
         "withdrawer is not the caller",
         {}},
        {DelegationError::SignatureExpired, "signature expired", {}},
        {DelegationError::SaltAlreadySpent, "approver salt already spent", {}},
        {DelegationError::InvalidSignature, "invalid signature", {}},
        {DelegationError::NotOperator, "not an operator", {}},
        {DelegationError::AlreadyDelegated, "staker already delegated", {}},
        {DelegationError::NotDelegated, "staker not delegated", {}},
        {DelegationError::OperatorCannotUndelegate,
         "operators cannot undelegate",
         {}},
        {DelegationError::WithdrawalNotPending, "withdrawal not pending", {}},
        {DelegationError::WithdrawalDelayNotElapsed,
         "withdrawal delay not elapsed",
         {}},
        {DelegationError::InsufficientShares,
         "insufficient operator shares",
         {}},
        {DelegationError::AlreadyInitialized, "already initialized", {}},
        {DelegationError::NotInitialized, "not initialized", {}},
        {DelegationError::ReentrantCall, "reentrant call", {}},
        {DelegationError::PausedOperation, "operation paused", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
