#include "app_constants.hpp"
#include "async/scheduler.hpp"
#include "cache/cache_engine.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "storage/storage_error.hpp"
#include "warming/cache_warmer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace
{

using TierCache::Cache::CacheEngine;

int PrintResult(const nlohmann::json &result, bool ok)
{
    std::cout << result.dump(2) << std::endl;
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

nlohmann::json WarmResultsToJson(const TierCache::Warming::WarmResults &results)
{
    nlohmann::json json = nlohmann::json::object();
    for (const auto &[name, result] : results) {
        json[name] = {
            {      "count",       result.count},
            {"duration_ms", result.duration_ms},
        };
    }
    return json;
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(TierCache::Constants::APP_NAME) + " diagnostic tool",
                 std::string(TierCache::Constants::CLI_NAME)};
    app.require_subcommand(1);

    std::string config_path_str;
    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    app.set_version_flag("-v,--version", std::string(TierCache::Constants::APP_VERSION_STRING));

    std::string key;
    std::string value_str;
    std::int64_t ttl = 0;

    auto *get_cmd = app.add_subcommand("get", "Read a key through the tier hierarchy");
    get_cmd->add_option("key", key, "Cache key")->required();

    auto *set_cmd = app.add_subcommand("set", "Write a JSON value to every available tier");
    set_cmd->add_option("key", key, "Cache key")->required();
    set_cmd->add_option("value", value_str, "Value as JSON text")->required();
    set_cmd->add_option("--ttl", ttl, "Time to live in seconds")->check(CLI::PositiveNumber);

    auto *delete_cmd = app.add_subcommand("delete", "Remove a key from every tier");
    delete_cmd->add_option("key", key, "Cache key")->required();

    auto *clear_cmd   = app.add_subcommand("clear", "Flush every tier");
    auto *cleanup_cmd = app.add_subcommand("cleanup", "Remove expired entries");
    auto *status_cmd  = app.add_subcommand("status", "Show tiers, health and statistics");
    auto *warm_cmd    = app.add_subcommand("warm", "Run the configured warmers");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (console) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(TierCache::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(TierCache::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(TierCache::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(TierCache::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Load Configuration
    std::filesystem::path config_path(config_path_str);
    auto config_result = TierCache::Config::loadConfigFromFileVerbose(config_path);
    if (!config_result) {
        spdlog::critical("Error loading configuration: {}", config_result.error());
        return EXIT_FAILURE;
    }

    // Initialize Logging Level from Config
    spdlog::set_level(config_result->global_settings.log_level);
    spdlog::debug(
        "Logging level set to: {}",
        spdlog::level::to_string_view(config_result->global_settings.log_level)
    );

    const auto default_ttl = config_result->global_settings.default_ttl;
    const auto warmers     = config_result->warmers;
    CacheEngine engine(std::move(*config_result));

    try {
        if (*get_cmd) {
            auto value = engine.Get(key);
            nlohmann::json result = {
                {"key", key},
                {"found", value.has_value()},
                {"value", value ? *value : nlohmann::json(nullptr)},
            };
            if (auto tier = engine.LastUsedTier(); tier && value) {
                result["tier"] = TierCache::Config::TierToString(*tier);
            }
            return PrintResult(result, value.has_value());
        }

        if (*set_cmd) {
            auto value = nlohmann::json::parse(value_str, nullptr, false);
            if (value.is_discarded()) {
                spdlog::error("Value is not valid JSON: {}", value_str);
                return EXIT_FAILURE;
            }
            const bool ok = engine.Set(key, value, ttl > 0 ? ttl : default_ttl);
            return PrintResult({{"key", key}, {"stored", ok}}, ok);
        }

        if (*delete_cmd) {
            const bool ok = engine.Delete(key);
            return PrintResult({{"key", key}, {"deleted", ok}}, ok);
        }

        if (*clear_cmd) {
            const bool ok = engine.Clear();
            return PrintResult({{"cleared", ok}}, ok);
        }

        if (*cleanup_cmd) {
            return PrintResult({{"removed", engine.Cleanup()}}, true);
        }

        if (*status_cmd) {
            auto warmer = TierCache::Warming::CacheWarmer::FromConfig(warmers, default_ttl);
            nlohmann::json status = {
                {  "tiers", engine.TierStatus()},
                {  "stats",   engine.GetStats()},
                {  "debug",      engine.Debug()},
                {"warmers", warmer->WarmerNames()},
            };
            return PrintResult(status, true);
        }

        if (*warm_cmd) {
            auto warmer = TierCache::Warming::CacheWarmer::FromConfig(warmers, default_ttl);
            TierCache::Warming::WarmResults results;
            if (engine.IsAsyncEnabled()) {
                TierCache::Async::EventLoop loop;
                auto promise = warmer->WarmAllAsync(engine, loop);
                loop.RunUntilIdle();
                if (promise.IsRejected()) {
                    std::rethrow_exception(promise.Error());
                }
                results = promise.Value();
            } else {
                results = warmer->WarmAll(engine);
            }
            return PrintResult(
                {{"results", WarmResultsToJson(results)}, {"stats", warmer->StatsJson()}}, true
            );
        }
    } catch (const TierCache::Storage::StorageException &e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_FAILURE;
}
