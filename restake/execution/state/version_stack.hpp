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
#include <restake/core/config.hpp>

#include <utility>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

// Copy-on-write history of a value across nested checkpoints. A frame is
// recorded only for the checkpoint depths that wrote the value, so reads see
// the innermost frame and depths that never wrote cost nothing.
template <class T>
class VersionStack
{
    struct Frame
    {
        unsigned depth;
        T value;
    };

    std::vector<Frame> frames_;

public:
    explicit VersionStack(T value, unsigned const depth = 0)
    {
        frames_.push_back(Frame{depth, std::move(value)});
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    T const &recent() const
    {
        RESTAKE_ASSERT(!frames_.empty());
        return frames_.back().value;
    }

    // writable value owned by `depth`, copied from the frame below on the
    // first write at that depth
    T &current(unsigned const depth)
    {
        RESTAKE_ASSERT(!frames_.empty());
        if (frames_.back().depth < depth) {
            Frame copy{depth, frames_.back().value};
            frames_.push_back(std::move(copy));
        }
        return frames_.back().value;
    }

    void pop_accept(unsigned const depth)
    {
        RESTAKE_ASSERT(depth > 0 && !frames_.empty());
        if (frames_.back().depth != depth) {
            return;
        }
        auto const n = frames_.size();
        if (n > 1 && frames_[n - 2].depth == depth - 1) {
            frames_[n - 2].value = std::move(frames_[n - 1].value);
            frames_.pop_back();
        }
        else {
            frames_.back().depth = depth - 1;
        }
    }

    // true when no frame below `depth` remains, i.e. the value was created
    // inside the rejected checkpoint
    bool pop_reject(unsigned const depth)
    {
        RESTAKE_ASSERT(depth > 0 && !frames_.empty());
        if (frames_.back().depth == depth) {
            frames_.pop_back();
        }
        return frames_.empty();
    }
};

RESTAKE_NAMESPACE_END
