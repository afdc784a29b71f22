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

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/config.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/log.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <vector>

YIELDPOOL_NAMESPACE_BEGIN

/// Ledger of contract storage, emitted logs and the current block timestamp.
///
/// Writes are journaled while a checkpoint is open: `push()` opens one,
/// `pop_accept()` folds it into the enclosing checkpoint and `pop_reject()`
/// rolls storage and logs back to where `push()` left them. Checkpoints nest.
class State
{
    struct JournalEntry
    {
        Address address;
        bytes32_t key;
        bytes32_t prior;
    };

    struct Checkpoint
    {
        size_t journal_size;
        size_t log_size;
    };

    using Slots = ankerl::unordered_dense::segmented_map<bytes32_t, bytes32_t>;

    ankerl::unordered_dense::segmented_map<Address, Slots> storage_{};
    std::vector<JournalEntry> journal_{};
    std::vector<Checkpoint> checkpoints_{};
    std::vector<Log> logs_{};
    uint64_t timestamp_{0};

public:
    explicit State(uint64_t timestamp = 0);

    State(State const &) = delete;
    State &operator=(State const &) = delete;

    bytes32_t
    get_storage(Address const &address, bytes32_t const &key) const;

    void set_storage(
        Address const &address, bytes32_t const &key, bytes32_t const &value);

    void store_log(Log const &);

    std::vector<Log> const &logs() const
    {
        return logs_;
    }

    uint64_t timestamp() const
    {
        return timestamp_;
    }

    void set_timestamp(uint64_t);

    void advance_time(uint64_t seconds);

    size_t depth() const
    {
        return checkpoints_.size();
    }

    void push();

    void pop_accept();

    void pop_reject();
};

YIELDPOOL_NAMESPACE_END
