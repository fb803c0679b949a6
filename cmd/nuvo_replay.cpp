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

#include <nuvo/core/address.hpp>
#include <nuvo/core/config.hpp>
#include <nuvo/core/fmt/address_fmt.hpp>
#include <nuvo/core/fmt/amount_fmt.hpp>
#include <nuvo/core/int.hpp>
#include <nuvo/core/log_level_map.hpp>
#include <nuvo/core/result.hpp>
#include <nuvo/staking/in_memory_settlement.hpp>
#include <nuvo/staking/staking_config.hpp>
#include <nuvo/staking/staking_engine.hpp>
#include <nuvo/staking/util/staking_error.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

NUVO_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;
using namespace NUVO_STAKING_NAMESPACE;

// Who signs an action when the scenario does not name a sender
enum class Role
{
    User,
    Keeper,
    Notifier,
    Owner,
};

std::unordered_map<std::string, Role> const OPERATIONS = {
    {"deposit", Role::User},
    {"withdraw", Role::User},
    {"withdraw_all", Role::User},
    {"compound", Role::User},
    {"claim_bonus", Role::User},
    {"emergency_withdraw", Role::User},
    {"enable_auto_compound", Role::User},
    {"disable_auto_compound", Role::User},
    {"perform_auto_compound", Role::Keeper},
    {"batch_auto_compound", Role::Keeper},
    {"activate_skill", Role::Notifier},
    {"deactivate_skill", Role::Notifier},
    {"set_rarity", Role::Notifier},
    {"credit_quest", Role::Notifier},
    {"credit_achievement", Role::Notifier},
    {"pause", Role::Owner},
    {"unpause", Role::Owner},
    {"ban", Role::Owner},
    {"unban", Role::Owner},
    {"set_apy", Role::Owner},
    {"toggle_tier", Role::Owner},
    {"fund", Role::Owner},
    {"migrate", Role::Owner}};

struct Roles
{
    Address owner;
    Address notifier;
    Address keeper;
};

Address parse_address(std::string const &text)
{
    auto const address = evmc::from_hex<Address>(text);
    if (!address.has_value()) {
        throw std::invalid_argument{"bad address '" + text + "'"};
    }
    return *address;
}

Address parse_address(json const &value)
{
    return parse_address(value.get<std::string>());
}

uint256_t parse_amount(json const &value)
{
    return intx::from_string<uint256_t>(value.get<std::string>());
}

json load_json(fs::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error{"cannot open " + path.string()};
    }
    return json::parse(in);
}

Address
sender_for(Role const role, json const &action, Roles const &roles)
{
    if (action.contains("sender")) {
        return parse_address(action.at("sender"));
    }
    switch (role) {
    case Role::Owner:
        return roles.owner;
    case Role::Notifier:
        return roles.notifier;
    case Role::Keeper:
        return roles.keeper;
    case Role::User:
        break;
    }
    throw std::invalid_argument{"action needs a sender"};
}

Result<void> paid(CallContext const &ctx, Result<uint256_t> res)
{
    BOOST_OUTCOME_TRY(auto const amount, std::move(res));
    LOG_INFO("replay: {} received {}", ctx.sender, amount);
    return outcome::success();
}

Result<void> batch(
    StakingEngine &engine, CallContext const &ctx, json const &action)
{
    std::vector<Address> users;
    if (action.contains("users")) {
        for (auto const &user : action.at("users")) {
            users.push_back(parse_address(user));
        }
    }
    else {
        // keeper sweep over every enrolled user
        constexpr size_t page_size = 50;
        for (size_t offset = 0;; offset += page_size) {
            auto const page =
                engine.auto_compound_users_page(offset, page_size);
            users.insert(users.end(), page.users.begin(), page.users.end());
            if (offset + page_size >= page.total) {
                break;
            }
        }
    }
    BOOST_OUTCOME_TRY(
        auto const results, engine.batch_auto_compound(ctx, users));
    for (auto const &result : results) {
        if (result.outcome.has_error()) {
            LOG_INFO(
                "replay: auto-compound for {} skipped: {}",
                result.user,
                result.outcome.error().message().c_str());
        }
        else {
            LOG_INFO(
                "replay: auto-compounded {} for {}",
                result.outcome.value(),
                result.user);
        }
    }
    return outcome::success();
}

Result<void> apply(
    StakingEngine &engine, std::string const &op, CallContext const &ctx,
    json const &action)
{
    auto const user = [&] { return parse_address(action.at("user")); };
    auto const amount = [&] { return parse_amount(action.at("amount")); };
    auto const lockup_days = [&] {
        return action.at("lockup_days").get<uint16_t>();
    };

    if (op == "deposit") {
        return engine.deposit(
            ctx, amount(), action.value("lockup_days", uint16_t{0}));
    }
    if (op == "withdraw") {
        return paid(ctx, engine.withdraw(ctx));
    }
    if (op == "withdraw_all") {
        return paid(ctx, engine.withdraw_all(ctx));
    }
    if (op == "compound") {
        return paid(ctx, engine.compound(ctx));
    }
    if (op == "claim_bonus") {
        return paid(ctx, engine.claim_bonus_rewards(ctx));
    }
    if (op == "emergency_withdraw") {
        return paid(ctx, engine.emergency_withdraw(ctx));
    }
    if (op == "enable_auto_compound") {
        return engine.enable_auto_compound(
            ctx, parse_amount(action.at("min_amount")));
    }
    if (op == "disable_auto_compound") {
        return engine.disable_auto_compound(ctx);
    }
    if (op == "perform_auto_compound") {
        BOOST_OUTCOME_TRY(
            auto const compounded, engine.perform_auto_compound(ctx, user()));
        LOG_INFO("replay: auto-compounded {}", compounded);
        return outcome::success();
    }
    if (op == "batch_auto_compound") {
        return batch(engine, ctx, action);
    }
    if (op == "activate_skill") {
        return engine.notify_skill_activation(
            ctx,
            user(),
            action.at("source_id").get<uint64_t>(),
            action.at("skill_type").get<uint8_t>(),
            action.value("effect_bps", uint16_t{0}));
    }
    if (op == "deactivate_skill") {
        return engine.notify_skill_deactivation(
            ctx, user(), action.at("source_id").get<uint64_t>());
    }
    if (op == "set_rarity") {
        return engine.set_skill_rarity(
            ctx,
            action.at("source_id").get<uint64_t>(),
            action.at("rarity").get<uint8_t>());
    }
    if (op == "credit_quest") {
        return engine.notify_quest_reward(ctx, user(), amount());
    }
    if (op == "credit_achievement") {
        return engine.notify_achievement_reward(ctx, user(), amount());
    }
    if (op == "pause") {
        return engine.pause(ctx);
    }
    if (op == "unpause") {
        return engine.unpause(ctx);
    }
    if (op == "ban") {
        return engine.ban_user(
            ctx, user(), action.value("reason", std::string{}));
    }
    if (op == "unban") {
        return engine.unban_user(ctx, user());
    }
    if (op == "set_apy") {
        return engine.set_tier_apy(
            ctx, lockup_days(), action.at("apy_bps").get<uint64_t>());
    }
    if (op == "toggle_tier") {
        return engine.toggle_tier(ctx, lockup_days());
    }
    if (op == "fund") {
        return engine.add_reward_funds(ctx, amount());
    }
    if (op == "migrate") {
        return engine.migrate(ctx, parse_address(action.at("destination")));
    }
    return StakingError::InvalidInput;
}

int replay(
    fs::path const &scenario_path, fs::path const &config_path,
    bool const fail_fast)
{
    StakingConfig config{};
    if (!config_path.empty()) {
        auto const loaded = load_staking_config(load_json(config_path));
        if (loaded.has_error()) {
            LOG_ERROR(
                "invalid config {}: {}",
                config_path.string(),
                loaded.error().message().c_str());
            return EXIT_FAILURE;
        }
        config = loaded.value();
    }

    auto const scenario = load_json(scenario_path);
    Address const owner = parse_address(scenario.at("owner"));
    Roles const roles{
        .owner = owner,
        .notifier = parse_address(scenario.at("notifier")),
        .keeper = scenario.contains("keeper")
                      ? parse_address(scenario.at("keeper"))
                      : owner};
    Address const treasury = parse_address(scenario.at("treasury"));
    uint64_t const start_time = scenario.value("start_time", uint64_t{0});

    InMemorySettlement settlement;
    StakingEngine engine{config, settlement, owner, treasury, roles.notifier};
    if (scenario.contains("balances")) {
        for (auto const &[holder, balance] : scenario.at("balances").items()) {
            settlement.mint(parse_address(holder), parse_amount(balance));
        }
    }

    size_t executed = 0;
    size_t failed = 0;
    uint64_t last_time = start_time;
    for (auto const &action : scenario.at("actions")) {
        auto const op = action.at("op").get<std::string>();
        auto const it = OPERATIONS.find(op);
        if (it == OPERATIONS.end()) {
            LOG_ERROR("unknown action '{}'", op);
            return EXIT_FAILURE;
        }
        uint64_t const now = start_time + action.value("at", uint64_t{0});
        if (now < last_time) {
            LOG_ERROR("action {} at {} runs backwards in time", op, now);
            return EXIT_FAILURE;
        }
        last_time = now;

        CallContext const ctx{
            .sender = sender_for(it->second, action, roles), .timestamp = now};
        auto const res = apply(engine, op, ctx, action);
        ++executed;
        if (res.has_error()) {
            ++failed;
            LOG_WARNING(
                "t={} {} by {} failed: {}",
                now,
                op,
                ctx.sender,
                res.error().message().c_str());
            if (fail_fast) {
                return EXIT_FAILURE;
            }
        }
        else {
            LOG_INFO("t={} {} by {}", now, op, ctx.sender);
        }
    }

    auto const pool = engine.pool_state();
    LOG_INFO(
        "pool: principal {} reserve {} users {} paused {} migrated {}",
        pool.total_pool_balance,
        pool.reward_reserve,
        pool.unique_users_count,
        pool.paused,
        pool.migrated);
    LOG_INFO(
        "custody {} treasury {} holds {}",
        settlement.custody_balance(),
        pool.treasury,
        settlement.balance_of(pool.treasury));
    LOG_INFO("{} actions replayed, {} failed", executed, failed);

    if (!engine.invariants_hold()) {
        LOG_ERROR("pool invariants violated");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

NUVO_ANONYMOUS_NAMESPACE_END

using namespace nuvo;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"nuvo_replay"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario;
    fs::path config;
    bool fail_fast = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--scenario", scenario, "scenario file to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--config", config, "staking config overrides")
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_flag("--fail_fast", fail_fast, "stop at the first failed action");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) %(file_name):%(line_number) LOG_%(log_level)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        return replay(scenario, config, fail_fast);
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("malformed json: {}", e.what());
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR("bad scenario value: {}", e.what());
    }
    catch (std::exception const &e) {
        LOG_ERROR("replay aborted: {}", e.what());
    }
    return EXIT_FAILURE;
}
