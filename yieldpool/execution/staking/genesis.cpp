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

#include <yieldpool/core/likely.h>
#include <yieldpool/core/log_level_map.hpp>
#include <yieldpool/execution/core/fmt/address_fmt.hpp>
#include <yieldpool/execution/staking/genesis.hpp>
#include <yieldpool/execution/state/atomic.hpp>
#include <yieldpool/execution/state/state.hpp>
#include <yieldpool/execution/token/erc20.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <quill/Quill.h>

#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<Address> parse_address(std::string const &hex)
{
    auto const address = evmc::from_hex<Address>(hex);
    if (YIELDPOOL_UNLIKELY(!address.has_value())) {
        return GenesisError::InvalidAddress;
    }
    return address.value();
}

Result<Address> parse_address(nlohmann::json const &j)
{
    if (YIELDPOOL_UNLIKELY(!j.is_string())) {
        return GenesisError::InvalidAddress;
    }
    return parse_address(j.get<std::string>());
}

// decimal or 0x-prefixed hex strings, or plain json numbers
Result<uint256_t> parse_amount(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return uint256_t{j.get<uint64_t>()};
    }
    if (YIELDPOOL_UNLIKELY(!j.is_string())) {
        return GenesisError::InvalidAmount;
    }
    try {
        return intx::from_string<uint256_t>(j.get<std::string>());
    }
    catch (std::invalid_argument const &) {
        return GenesisError::InvalidAmount;
    }
    catch (std::out_of_range const &) {
        return GenesisError::InvalidAmount;
    }
}

Result<uint64_t> parse_u64(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(auto const value, parse_amount(j));
    if (YIELDPOOL_UNLIKELY(value > std::numeric_limits<uint64_t>::max())) {
        return GenesisError::InvalidAmount;
    }
    return static_cast<uint64_t>(value);
}

Result<ProtocolAddresses> parse_addresses(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(auto const pool, parse_address(j.at("pool")));
    BOOST_OUTCOME_TRY(auto const processor, parse_address(j.at("processor")));
    BOOST_OUTCOME_TRY(auto const gateway, parse_address(j.at("gateway")));
    BOOST_OUTCOME_TRY(auto const oracle, parse_address(j.at("oracle")));
    return ProtocolAddresses{
        .pool = pool,
        .processor = processor,
        .gateway = gateway,
        .oracle = oracle};
}

Result<GenesisToken>
parse_token(std::string const &key, nlohmann::json const &info)
{
    GenesisToken token{};
    BOOST_OUTCOME_TRY(auto const address, parse_address(key));
    token.token = address;
    BOOST_OUTCOME_TRY(auto const decimals, parse_u64(info.at("decimals")));
    if (YIELDPOOL_UNLIKELY(decimals > Erc20::MAX_DECIMALS)) {
        return GenesisError::InvalidDecimals;
    }
    token.decimals = static_cast<uint8_t>(decimals);
    if (!info.contains("alloc")) {
        return token;
    }
    for (auto const &[holder, amount] : info.at("alloc").items()) {
        BOOST_OUTCOME_TRY(auto const holder_address, parse_address(holder));
        BOOST_OUTCOME_TRY(auto const value, parse_amount(amount));
        token.alloc.emplace_back(holder_address, value);
    }
    return token;
}

Result<ProtocolConfig> parse_config(nlohmann::json const &j)
{
    ProtocolConfig config{};

    if (j.contains("timestamp")) {
        BOOST_OUTCOME_TRY(auto const timestamp, parse_u64(j.at("timestamp")));
        config.timestamp = timestamp;
    }
    if (j.contains("log_level")) {
        auto const it =
            log_level_map.find(j.at("log_level").get<std::string>());
        if (YIELDPOOL_UNLIKELY(it == log_level_map.end())) {
            return GenesisError::UnknownLogLevel;
        }
        config.log_level = it->second;
    }

    BOOST_OUTCOME_TRY(auto const addresses, parse_addresses(j));
    config.addresses = addresses;
    BOOST_OUTCOME_TRY(
        auto const staking_token, parse_address(j.at("staking_token")));
    config.staking_token = staking_token;

    if (j.contains("default_slippage_bps")) {
        BOOST_OUTCOME_TRY(
            auto const bps, parse_u64(j.at("default_slippage_bps")));
        config.default_slippage_bps = bps;
    }
    if (j.contains("max_price_age")) {
        BOOST_OUTCOME_TRY(auto const age, parse_u64(j.at("max_price_age")));
        config.max_price_age = age;
    }

    if (j.contains("tokens")) {
        for (auto const &[key, info] : j.at("tokens").items()) {
            BOOST_OUTCOME_TRY(auto token, parse_token(key, info));
            config.tokens.push_back(std::move(token));
        }
    }

    if (j.contains("rewards")) {
        for (auto const &entry : j.at("rewards")) {
            BOOST_OUTCOME_TRY(auto const token, parse_address(entry.at("token")));
            BOOST_OUTCOME_TRY(
                auto const distributor, parse_address(entry.at("distributor")));
            BOOST_OUTCOME_TRY(
                auto const duration, parse_u64(entry.at("duration")));
            config.rewards.push_back(GenesisReward{
                .token = token,
                .distributor = distributor,
                .duration = duration});
        }
    }

    if (j.contains("routes")) {
        for (auto const &entry : j.at("routes")) {
            BOOST_OUTCOME_TRY(auto const token, parse_address(entry.at("token")));
            BOOST_OUTCOME_TRY(
                auto const swap_pool, parse_address(entry.at("swap_pool")));
            config.routes.push_back(
                GenesisRoute{.token = token, .swap_pool = swap_pool});
        }
    }

    if (j.contains("price_feeds")) {
        for (auto const &entry : j.at("price_feeds")) {
            BOOST_OUTCOME_TRY(auto const token, parse_address(entry.at("token")));
            BOOST_OUTCOME_TRY(auto const price, parse_amount(entry.at("price")));
            config.price_feeds.push_back(
                GenesisPriceFeed{.token = token, .price = price});
        }
    }

    if (j.contains("swap_tokens")) {
        for (auto const &entry : j.at("swap_tokens")) {
            BOOST_OUTCOME_TRY(auto const token, parse_address(entry));
            config.swap_tokens.push_back(token);
        }
    }

    return config;
}

YIELDPOOL_STAKING_ANONYMOUS_NAMESPACE_END

YIELDPOOL_STAKING_NAMESPACE_BEGIN

Result<ProtocolConfig> read_protocol_config(nlohmann::json const &j)
{
    if (YIELDPOOL_UNLIKELY(!j.is_object())) {
        return GenesisError::MalformedConfig;
    }
    try {
        return parse_config(j);
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed protocol config: {}", e.what());
        return GenesisError::MalformedConfig;
    }
}

Result<ProtocolConfig>
read_protocol_config(std::filesystem::path const &config_file)
{
    std::ifstream ifile(config_file);
    if (YIELDPOOL_UNLIKELY(!ifile.is_open())) {
        LOG_ERROR("cannot open protocol config {}", config_file.string());
        return GenesisError::UnreadableFile;
    }
    auto const j = nlohmann::json::parse(ifile, nullptr, false);
    if (YIELDPOOL_UNLIKELY(j.is_discarded())) {
        LOG_ERROR("protocol config {} is not json", config_file.string());
        return GenesisError::MalformedConfig;
    }
    return read_protocol_config(j);
}

Result<void> load_genesis(
    Protocol &protocol, Caller const &admin, ProtocolConfig const &config)
{
    State &state = protocol.state();
    if (YIELDPOOL_UNLIKELY(config.timestamp < state.timestamp())) {
        return GenesisError::TimestampInPast;
    }
    quill::get_root_logger()->set_log_level(config.log_level);
    state.set_timestamp(config.timestamp);

    return atomically(state, [&]() -> Result<void> {
        for (auto const &token : config.tokens) {
            Erc20 erc20{state, token.token};
            BOOST_OUTCOME_TRY(erc20.create(token.decimals));
            for (auto const &[holder, amount] : token.alloc) {
                BOOST_OUTCOME_TRY(erc20.mint(holder, amount));
            }
        }

        BOOST_OUTCOME_TRY(
            protocol.pool().initialize(admin, config.staking_token));

        for (auto const &reward : config.rewards) {
            BOOST_OUTCOME_TRY(protocol.scheduler().add_reward(
                admin, reward.token, reward.distributor, reward.duration));
        }
        for (auto const &route : config.routes) {
            BOOST_OUTCOME_TRY(protocol.processor().set_reward_route(
                admin, route.token, route.swap_pool));
        }
        if (config.max_price_age != 0) {
            BOOST_OUTCOME_TRY(
                protocol.oracle().set_max_price_age(admin, config.max_price_age));
        }
        for (auto const &feed : config.price_feeds) {
            BOOST_OUTCOME_TRY(
                protocol.oracle().set_price(admin, feed.token, feed.price));
        }
        for (auto const &token : config.swap_tokens) {
            BOOST_OUTCOME_TRY(
                protocol.gateway().set_token_allowed(admin, token, true));
        }
        if (config.default_slippage_bps != 0) {
            BOOST_OUTCOME_TRY(protocol.processor().set_default_slippage(
                admin, config.default_slippage_bps));
        }

        LOG_INFO(
            "genesis loaded at {}: {} tokens, {} reward tokens, pool {}",
            config.timestamp,
            config.tokens.size(),
            config.rewards.size(),
            config.addresses.pool);
        return outcome::success();
    });
}

YIELDPOOL_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<yieldpool::staking::GenesisError>::mapping> const &
quick_status_code_from_enum<yieldpool::staking::GenesisError>::value_mappings()
{
    using yieldpool::staking::GenesisError;

    static std::initializer_list<mapping> const v = {
        {GenesisError::Success, "success", {errc::success}},
        {GenesisError::UnreadableFile, "cannot read config file", {}},
        {GenesisError::MalformedConfig, "malformed config", {}},
        {GenesisError::InvalidAddress, "invalid address", {}},
        {GenesisError::InvalidAmount, "invalid amount", {}},
        {GenesisError::UnknownLogLevel, "unknown log level", {}},
        {GenesisError::TimestampInPast, "timestamp in the past", {}},
        {GenesisError::InvalidDecimals, "invalid token decimals", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
