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

#include <yieldpool/core/int.hpp>
#include <yieldpool/core/result.hpp>
#include <yieldpool/execution/core/address.hpp>
#include <yieldpool/execution/staking/config.hpp>
#include <yieldpool/execution/staking/protocol.hpp>
#include <yieldpool/execution/staking/util/caller.hpp>

#include <nlohmann/json_fwd.hpp>

#include <quill/LogLevel.h>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <utility>
#include <vector>

YIELDPOOL_STAKING_NAMESPACE_BEGIN

enum class GenesisError
{
    Success = 0,
    UnreadableFile,
    MalformedConfig,
    InvalidAddress,
    InvalidAmount,
    UnknownLogLevel,
    TimestampInPast,
    InvalidDecimals,
};

struct GenesisToken
{
    Address token{};
    uint8_t decimals{18};
    std::vector<std::pair<Address, uint256_t>> alloc{};
};

struct GenesisReward
{
    Address token{};
    Address distributor{};
    uint64_t duration{0};
};

struct GenesisRoute
{
    Address token{};
    Address swap_pool{};
};

struct GenesisPriceFeed
{
    Address token{};
    uint256_t price{0};
};

struct ProtocolConfig
{
    uint64_t timestamp{0};
    quill::LogLevel log_level{quill::LogLevel::Info};
    ProtocolAddresses addresses{};
    Address staking_token{};
    uint64_t default_slippage_bps{0};
    uint64_t max_price_age{0};
    std::vector<GenesisToken> tokens{};
    std::vector<GenesisReward> rewards{};
    std::vector<GenesisRoute> routes{};
    std::vector<GenesisPriceFeed> price_feeds{};
    std::vector<Address> swap_tokens{};
};

Result<ProtocolConfig> read_protocol_config(nlohmann::json const &);

Result<ProtocolConfig>
read_protocol_config(std::filesystem::path const &config_file);

/// Deploys the configured tokens and brings the protocol to its initial
/// state. Either every ledger write is applied or none is; the clock and
/// the log level are set before the first write and stay set.
Result<void>
load_genesis(Protocol &, Caller const &admin, ProtocolConfig const &);

YIELDPOOL_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<yieldpool::staking::GenesisError>
    : quick_status_code_from_enum_defaults<yieldpool::staking::GenesisError>
{
    static constexpr auto const domain_name = "Genesis Error";
    static constexpr auto const domain_uuid =
        "e5b8a0f1-3d27-4c9e-a64b-1f70c2d98e3a";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
