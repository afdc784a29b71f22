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

#include <yieldpool/core/config.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <type_traits>
#include <utility>

YIELDPOOL_NAMESPACE_BEGIN

/// Runs `fn` inside a fresh checkpoint. Every storage write and log produced
/// by `fn` is discarded if it returns an error.
template <typename F>
    requires std::is_invocable_v<F>
auto atomically(State &state, F &&fn) -> std::invoke_result_t<F>
{
    state.push();
    auto res = std::forward<F>(fn)();
    if (res.has_error()) {
        state.pop_reject();
    }
    else {
        state.pop_accept();
    }
    return res;
}

YIELDPOOL_NAMESPACE_END
