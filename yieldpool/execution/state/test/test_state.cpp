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

#include <yieldpool/core/bytes.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/core/contract/checked_math.hpp>
#include <yieldpool/execution/core/log.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <gtest/gtest.h>

using namespace yieldpool;

namespace
{
    constexpr auto a{0x5353535353535353535353535353535353535353_address};
    constexpr auto b{0xbebebebebebebebebebebebebebebebebebebebe_address};
    constexpr auto key1{
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32};
    constexpr auto key2{
        0x1234567890123456789012345678901234567890123456789012345678901234_bytes32};
    constexpr auto value1{
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
    constexpr auto value2{
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32};

    Log make_log(Address const &address)
    {
        return Log{.data = {}, .topics = {value1}, .address = address};
    }
}

TEST(State, get_set_storage)
{
    State s{};
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});

    s.set_storage(a, key1, value1);
    s.set_storage(b, key1, value2);
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(b, key1), value2);
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});

    s.set_storage(a, key1, bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
}

TEST(State, reject_restores_storage_and_logs)
{
    State s{};
    s.set_storage(a, key1, value1);
    s.store_log(make_log(a));

    s.push();
    s.set_storage(a, key1, value2);
    s.set_storage(a, key2, value1);
    s.set_storage(b, key1, value2);
    s.store_log(make_log(b));
    EXPECT_EQ(s.logs().size(), 2u);
    s.pop_reject();

    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_EQ(s.get_storage(b, key1), bytes32_t{});
    ASSERT_EQ(s.logs().size(), 1u);
    EXPECT_EQ(s.logs()[0].address, a);
    EXPECT_EQ(s.depth(), 0u);
}

TEST(State, nested_checkpoints)
{
    State s{};
    s.push();
    s.set_storage(a, key1, value1);

    s.push();
    s.set_storage(a, key1, value2);
    s.pop_accept();
    EXPECT_EQ(s.get_storage(a, key1), value2);

    s.push();
    s.set_storage(a, key2, value2);
    s.pop_reject();
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key1), value2);

    // an accepted inner checkpoint is still undone by its parent
    s.pop_reject();
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
}

TEST(State, repeated_writes_restore_oldest_value)
{
    State s{};
    s.set_storage(a, key1, value1);
    s.push();
    s.set_storage(a, key1, value2);
    s.set_storage(a, key1, bytes32_t{});
    s.set_storage(a, key1, value2);
    s.pop_reject();
    EXPECT_EQ(s.get_storage(a, key1), value1);
}

TEST(State, timestamp)
{
    State s{100};
    EXPECT_EQ(s.timestamp(), 100u);
    s.advance_time(50);
    EXPECT_EQ(s.timestamp(), 150u);
    s.set_timestamp(150);
    EXPECT_EQ(s.timestamp(), 150u);
}

TEST(State, atomically)
{
    State s{};
    auto const ok = atomically(s, [&]() -> Result<void> {
        s.set_storage(a, key1, value1);
        return outcome::success();
    });
    EXPECT_FALSE(ok.has_error());
    EXPECT_EQ(s.get_storage(a, key1), value1);

    auto const failed = atomically(s, [&]() -> Result<int> {
        s.set_storage(a, key1, value2);
        s.store_log(make_log(a));
        return MathError::Overflow;
    });
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.assume_error(), MathError::Overflow);
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_TRUE(s.logs().empty());
    EXPECT_EQ(s.depth(), 0u);
}
