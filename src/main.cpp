#include <dpp/dpp.h>                        // D++

#include <spdlog/spdlog.h>                  // Logging
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>

#include "minstrel/config.hpp"                    // Environment configuration
#include "minstrel/audio/subscription_registry.hpp"
#include "minstrel/lavalink/client.hpp"           // Lavalink connection
#include "minstrel/lavalink/track_resolver.hpp"
#include "minstrel/discord/voice_gateway.hpp"     // Voice glue for Lavalink
#include "minstrel/discord/timer_scheduler.hpp"
#include "minstrel/discord/channel_sink.hpp"
#include "minstrel/commands/music.hpp"            // Music slash commands

namespace {

// D++ reports through on_log; everything ends up in the same spdlog logger.
void log_to_spdlog(const dpp::log_t& event) {
    switch (event.severity) {
        case dpp::ll_trace:    spdlog::trace("[dpp] {}", event.message);    break;
        case dpp::ll_debug:    spdlog::debug("[dpp] {}", event.message);    break;
        case dpp::ll_info:     spdlog::info("[dpp] {}", event.message);     break;
        case dpp::ll_warning:  spdlog::warn("[dpp] {}", event.message);     break;
        case dpp::ll_error:    spdlog::error("[dpp] {}", event.message);    break;
        case dpp::ll_critical:
        default:               spdlog::critical("[dpp] {}", event.message); break;
    }
}

int run(const minstrel::bot_config& cfg) {
    dpp::cluster bot(cfg.token, dpp::i_default_intents);
    bot.on_log(log_to_spdlog);

    // ---------- Lavalink node ----------
    minstrel::lavalink::node lavalink(bot, cfg.lavalink);
    minstrel::lavalink::track_resolver resolver(lavalink);

    // ---------- Guild audio ----------
    minstrel::discord::timer_scheduler timers(bot);
    minstrel::discord::channel_sink    sink(bot);
    minstrel::discord::voice_gateway   gateway(bot, lavalink, timers, cfg.poll_interval);
    minstrel::audio::subscription_registry registry(gateway, timers, sink, cfg.subscription);

    minstrel::music::context ctx{ bot, registry, resolver, cfg.track_retries };

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&gateway](const dpp::voice_state_update_t& ev) {
        gateway.handle_voice_state_update(ev);
    });

    bot.on_voice_server_update([&gateway](const dpp::voice_server_update_t& ev) {
        gateway.handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&ctx](const dpp::slashcommand_t& event) {
        if (!minstrel::music::route_slashcommand(event, ctx)) {
            spdlog::debug("ignoring unknown command /{}", event.command.get_command_name());
        }
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &lavalink](const dpp::ready_t& event) {
        (void)event;

        spdlog::info("Logged in as {}", bot.me.username);

        if (dpp::run_once<struct ensure_lavalink_session>()) {
            lavalink.ensure_session();
        }

        if (dpp::run_once<struct register_bot_commands>()) {
            spdlog::info("Registering slash commands...");
            bot.global_bulk_command_create(minstrel::music::make_commands(bot));
        }
    });

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);

    registry.stop_all();
    return 0;
}

} // namespace

int main() {
    spdlog::set_default_logger(spdlog::stdout_color_mt("minstrel"));

    minstrel::bot_config cfg;
    try {
        cfg = minstrel::load_config();
    } catch (const std::exception& e) {
        spdlog::critical("configuration error: {}", e.what());
        return 1;
    }
    spdlog::set_level(cfg.log_level);

    try {
        return run(cfg);
    } catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
        return 1;
    }
}
