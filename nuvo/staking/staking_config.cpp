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

#include <nuvo/core/likely.h>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

NUVO_STAKING_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view KNOWN_KEYS[] = {
    "min_deposit",
    "max_deposit",
    "max_deposits_per_user",
    "commission_bps",
    "daily_withdrawal_limit",
    "auto_compound_interval",
    "min_auto_compound_amount",
    "max_active_skills",
    "max_actions_per_day",
    "suspicious_threshold",
    "suspicion_increment",
    "suspicion_decay_period",
    "tier_apy_bps",
};

Result<uint256_t> parse_amount(nlohmann::json const &value)
{
    if (NUVO_UNLIKELY(!value.is_string())) {
        return StakingError::InvalidInput;
    }
    try {
        return intx::from_string<uint256_t>(value.get<std::string>());
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR(
            "config: bad amount '{}': {}", value.get<std::string>(), e.what());
    }
    catch (std::out_of_range const &) {
        LOG_ERROR(
            "config: amount '{}' out of range", value.get<std::string>());
    }
    return StakingError::InvalidInput;
}

Result<void> read_amount(
    nlohmann::json const &object, char const *const key, uint256_t &out)
{
    if (!object.contains(key)) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto const amount, parse_amount(object.at(key)));
    out = amount;
    return outcome::success();
}

template <typename T>
Result<void>
read_unsigned(nlohmann::json const &object, char const *const key, T &out)
{
    if (!object.contains(key)) {
        return outcome::success();
    }
    auto const &value = object.at(key);
    if (NUVO_UNLIKELY(!value.is_number_unsigned())) {
        LOG_ERROR("config: '{}' must be an unsigned integer", key);
        return StakingError::InvalidInput;
    }
    auto const raw = value.get<uint64_t>();
    if (NUVO_UNLIKELY(raw > std::numeric_limits<T>::max())) {
        LOG_ERROR("config: '{}' out of range", key);
        return StakingError::InvalidInput;
    }
    out = static_cast<T>(raw);
    return outcome::success();
}

// "tier_apy_bps": {"0": 500, "30": 1000, ...}
Result<void> read_tier_apys(
    nlohmann::json const &object,
    std::array<uint64_t, LOCKUP_TIER_COUNT> &apys)
{
    if (!object.contains("tier_apy_bps")) {
        return outcome::success();
    }
    auto const &tiers = object.at("tier_apy_bps");
    if (NUVO_UNLIKELY(!tiers.is_object())) {
        return StakingError::InvalidInput;
    }
    for (auto const &[days, value] : tiers.items()) {
        auto const it = std::find_if(
            LOCKUP_TIER_DAYS.begin(),
            LOCKUP_TIER_DAYS.end(),
            [&days](uint16_t const d) { return std::to_string(d) == days; });
        if (NUVO_UNLIKELY(it == LOCKUP_TIER_DAYS.end())) {
            LOG_ERROR("config: unknown lockup tier '{}'", days);
            return StakingError::InvalidLockupDuration;
        }
        if (NUVO_UNLIKELY(!value.is_number_unsigned())) {
            return StakingError::InvalidInput;
        }
        apys[static_cast<size_t>(it - LOCKUP_TIER_DAYS.begin())] =
            value.get<uint64_t>();
    }
    return outcome::success();
}

NUVO_STAKING_ANONYMOUS_NAMESPACE_END

NUVO_STAKING_NAMESPACE_BEGIN

Result<void> validate(StakingConfig const &config)
{
    if (NUVO_UNLIKELY(
            config.min_deposit == 0 ||
            config.min_deposit > config.max_deposit)) {
        return StakingError::InvalidInput;
    }
    if (NUVO_UNLIKELY(config.commission_bps > BPS_DENOMINATOR)) {
        return StakingError::InvalidInput;
    }
    if (NUVO_UNLIKELY(
            config.max_deposits_per_user == 0 ||
            config.auto_compound_interval == 0 ||
            config.max_active_skills == 0 || config.max_actions_per_day == 0 ||
            config.suspicious_threshold == 0)) {
        return StakingError::InvalidInput;
    }
    for (auto const apy : config.tier_apy_bps) {
        if (NUVO_UNLIKELY(apy > MAX_APY_BPS)) {
            return StakingError::InvalidApy;
        }
    }
    return outcome::success();
}

Result<StakingConfig> load_staking_config(nlohmann::json const &object)
{
    if (NUVO_UNLIKELY(!object.is_object())) {
        return StakingError::InvalidInput;
    }
    for (auto const &[key, value] : object.items()) {
        if (std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) ==
            std::end(KNOWN_KEYS)) {
            LOG_WARNING("config: ignoring unknown key '{}'", key);
        }
    }

    StakingConfig config;
    BOOST_OUTCOME_TRY(read_amount(object, "min_deposit", config.min_deposit));
    BOOST_OUTCOME_TRY(read_amount(object, "max_deposit", config.max_deposit));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "max_deposits_per_user", config.max_deposits_per_user));
    BOOST_OUTCOME_TRY(
        read_unsigned(object, "commission_bps", config.commission_bps));
    BOOST_OUTCOME_TRY(read_amount(
        object, "daily_withdrawal_limit", config.daily_withdrawal_limit));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "auto_compound_interval", config.auto_compound_interval));
    BOOST_OUTCOME_TRY(read_amount(
        object, "min_auto_compound_amount", config.min_auto_compound_amount));
    BOOST_OUTCOME_TRY(
        read_unsigned(object, "max_active_skills", config.max_active_skills));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "max_actions_per_day", config.max_actions_per_day));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "suspicious_threshold", config.suspicious_threshold));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "suspicion_increment", config.suspicion_increment));
    BOOST_OUTCOME_TRY(read_unsigned(
        object, "suspicion_decay_period", config.suspicion_decay_period));
    BOOST_OUTCOME_TRY(read_tier_apys(object, config.tier_apy_bps));

    BOOST_OUTCOME_TRY(validate(config));
    return config;
}

NUVO_STAKING_NAMESPACE_END
