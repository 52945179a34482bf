#pragma once

#include <dpp/dpp.h>
#include <vector>

#include "minstrel/audio/subscription_registry.hpp"
#include "minstrel/lavalink/track_resolver.hpp"

namespace minstrel::music {

struct context {
    dpp::cluster&                 bot;
    audio::subscription_registry& registry;
    lavalink::track_resolver&     resolver;
    unsigned                      track_retries = 1;
};

/// Build the music slash commands (/play, /next, /now, /pause, /skip, /stop,
/// /queue, /swap, /shuffle, /clear, /move, /nowplaying).
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Dispatch a music slash command to the correct handler.
/// Returns false when the command is not a music command.
bool route_slashcommand(const dpp::slashcommand_t& ev, context& ctx);

/// Lifecycle callbacks for tracks requested through the commands.
audio::track_handlers make_track_handlers(dpp::cluster& bot, unsigned track_retries);

} // namespace minstrel::music
