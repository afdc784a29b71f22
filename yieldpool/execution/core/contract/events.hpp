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

#include <yieldpool/core/byte_string.hpp>
#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/config.hpp>
#include <yieldpool/core/keccak.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/log.hpp>

#include <string_view>
#include <utility>

YIELDPOOL_NAMESPACE_BEGIN

class EventBuilder
{
    Log event_;

public:
    EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        event_.address = emitter;
        event_.topics.push_back(signature);
    }

    // topic0 is the keccak of the canonical signature, e.g.
    // "Staked(address,uint256)"
    EventBuilder(Address const &emitter, std::string_view const signature)
        : EventBuilder{emitter, keccak256(signature)}
    {
    }

    // Add an indexed parameter
    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    // Add a non-indexed parameter
    EventBuilder &&add_data(byte_string_view const data) &&
    {
        event_.data += data;
        return std::move(*this);
    }

    Log &&build() &&
    {
        return std::move(event_);
    }
};

YIELDPOOL_NAMESPACE_END
