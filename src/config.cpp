#include "minstrel/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace minstrel {

namespace {

std::string get_or(const env_lookup& env, const std::string& name, const std::string& fallback)
{
    auto value = env(name);
    return value && !value->empty() ? *value : fallback;
}

unsigned long get_number(const env_lookup& env, const std::string& name, unsigned long fallback,
                         unsigned long max = std::numeric_limits<unsigned>::max())
{
    auto value = env(name);
    if (!value || value->empty()) {
        return fallback;
    }

    std::size_t   used   = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(*value, &used, 10);
    } catch (const std::exception&) {
        throw std::runtime_error(name + ": expected a number, got '" + *value + "'");
    }
    if (used != value->size() || (*value)[0] == '-' || parsed > max) {
        throw std::runtime_error(name + ": expected a number up to " + std::to_string(max)
                                 + ", got '" + *value + "'");
    }
    return parsed;
}

std::chrono::seconds get_seconds(const env_lookup& env, const std::string& name, std::chrono::seconds fallback)
{
    const auto value = get_number(env, name, static_cast<unsigned long>(fallback.count()));
    if (value == 0) {
        throw std::runtime_error(name + ": must be at least one second");
    }
    return std::chrono::seconds(value);
}

bool get_flag(const env_lookup& env, const std::string& name, bool fallback)
{
    auto value = env(name);
    if (!value || value->empty()) {
        return fallback;
    }
    if (*value == "1" || *value == "true" || *value == "yes") {
        return true;
    }
    if (*value == "0" || *value == "false" || *value == "no") {
        return false;
    }
    throw std::runtime_error(name + ": expected true or false, got '" + *value + "'");
}

} // namespace

env_lookup process_environment()
{
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

bot_config load_config(const env_lookup& env)
{
    bot_config cfg;

    // "token" is what the bot has always read; MINSTREL_TOKEN wins when both are set.
    cfg.token = get_or(env, "MINSTREL_TOKEN", get_or(env, "token", ""));
    if (cfg.token.empty()) {
        throw std::runtime_error("no bot token: set MINSTREL_TOKEN");
    }

    cfg.lavalink.host       = get_or(env, "LAVALINK_HOST", "127.0.0.1");
    cfg.lavalink.port       = static_cast<uint16_t>(get_number(env, "LAVALINK_PORT", 2333, 65535));
    cfg.lavalink.https      = get_flag(env, "LAVALINK_HTTPS", false);
    cfg.lavalink.password   = get_or(env, "LAVALINK_PASSWORD", "youshallnotpass");
    cfg.lavalink.session_id = get_or(env, "LAVALINK_SESSION", "default");

    auto& policy = cfg.subscription.connection;
    policy.ready_timeout       = get_seconds(env, "MINSTREL_READY_TIMEOUT", policy.ready_timeout);
    policy.recovery_window     = get_seconds(env, "MINSTREL_RECOVERY_WINDOW", policy.recovery_window);
    policy.rejoin_backoff      = get_seconds(env, "MINSTREL_REJOIN_BACKOFF", policy.rejoin_backoff);
    policy.max_rejoin_attempts = static_cast<unsigned>(
        get_number(env, "MINSTREL_REJOIN_ATTEMPTS", policy.max_rejoin_attempts));

    cfg.subscription.idle_timeout = get_seconds(env, "MINSTREL_IDLE_TIMEOUT", cfg.subscription.idle_timeout);
    cfg.poll_interval             = get_seconds(env, "MINSTREL_POLL_SECONDS", cfg.poll_interval);
    cfg.track_retries = static_cast<unsigned>(get_number(env, "MINSTREL_TRACK_RETRIES", cfg.track_retries));

    const std::string level = get_or(env, "MINSTREL_LOG_LEVEL", "info");
    cfg.log_level = spdlog::level::from_str(level);
    if (cfg.log_level == spdlog::level::off && level != "off") {
        throw std::runtime_error("MINSTREL_LOG_LEVEL: unknown level '" + level + "'");
    }

    return cfg;
}

} // namespace minstrel
