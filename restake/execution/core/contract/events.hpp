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

#include <restake/core/assert.h>
#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/receipt.hpp>

#include <cstddef>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

// Assembles a log emitted by a system contract. The event signature is the
// first topic, indexed arguments follow it, and everything else is appended
// to the data already ABI encoded.
class EventBuilder
{
    // LOG0..LOG4
    static constexpr size_t MAX_TOPICS = 4;

    Receipt::Log log_{};

public:
    explicit EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        log_.address = emitter;
        log_.topics.push_back(signature);
    }

    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        RESTAKE_ASSERT(log_.topics.size() < MAX_TOPICS);
        log_.topics.push_back(topic);
        return std::move(*this);
    }

    EventBuilder &&add_data(byte_string_view const data) &&
    {
        log_.data.append(data);
        return std::move(*this);
    }

    Receipt::Log build() &&
    {
        return std::move(log_);
    }
};

RESTAKE_NAMESPACE_END
