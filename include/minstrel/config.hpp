#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "minstrel/audio/options.hpp"
#include "minstrel/lavalink/node_config.hpp"

namespace minstrel {

struct bot_config {
    std::string                  token;
    lavalink::node_config        lavalink;
    audio::subscription_options  subscription;
    std::chrono::seconds         poll_interval{1};
    unsigned                     track_retries = 1;
    spdlog::level::level_enum    log_level = spdlog::level::info;
};

// Looks up one variable; std::nullopt when unset.
using env_lookup = std::function<std::optional<std::string>(const std::string& name)>;

env_lookup process_environment();

// Throws std::runtime_error when the token is missing or a value is malformed.
bot_config load_config(const env_lookup& env = process_environment());

} // namespace minstrel
