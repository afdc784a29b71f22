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

#include <yieldpool/core/assert.h>
#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/config.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/log.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <cstdint>

YIELDPOOL_NAMESPACE_BEGIN

State::State(uint64_t const timestamp)
    : timestamp_{timestamp}
{
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const account = storage_.find(address);
    if (account == storage_.end()) {
        return {};
    }
    auto const slot = account->second.find(key);
    if (slot == account->second.end()) {
        return {};
    }
    return slot->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &slots = storage_[address];
    auto it = slots.find(key);
    bytes32_t const prior = it == slots.end() ? bytes32_t{} : it->second;
    if (prior == value) {
        return;
    }
    if (!checkpoints_.empty()) {
        journal_.push_back(
            JournalEntry{.address = address, .key = key, .prior = prior});
    }
    if (value == bytes32_t{}) {
        slots.erase(key);
    }
    else if (it == slots.end()) {
        slots.emplace(key, value);
    }
    else {
        it->second = value;
    }
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

void State::set_timestamp(uint64_t const timestamp)
{
    YIELDPOOL_ASSERT(timestamp >= timestamp_, "time cannot go backwards");
    timestamp_ = timestamp;
}

void State::advance_time(uint64_t const seconds)
{
    set_timestamp(timestamp_ + seconds);
}

void State::push()
{
    checkpoints_.push_back(
        Checkpoint{.journal_size = journal_.size(), .log_size = logs_.size()});
}

void State::pop_accept()
{
    YIELDPOOL_ASSERT(!checkpoints_.empty());
    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void State::pop_reject()
{
    YIELDPOOL_ASSERT(!checkpoints_.empty());
    auto const checkpoint = checkpoints_.back();
    checkpoints_.pop_back();

    while (journal_.size() > checkpoint.journal_size) {
        auto const &entry = journal_.back();
        auto &slots = storage_[entry.address];
        if (entry.prior == bytes32_t{}) {
            slots.erase(entry.key);
        }
        else {
            slots[entry.key] = entry.prior;
        }
        journal_.pop_back();
    }
    logs_.resize(checkpoint.log_size);
}

YIELDPOOL_NAMESPACE_END
