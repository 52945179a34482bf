#include "minstrel/commands/music.hpp"

#include <algorithm>
#include <cstdint>
#include <thread>
#include <variant>

namespace minstrel::music {

namespace {

using audio::player_status;

constexpr std::size_t results_per_page = 10;
constexpr std::chrono::seconds ready_wait{15};

const char* const not_playing = "Not currently playing on this server";
const char* const not_in_voice = "You must be a user and inside of a voice channel to use this command";

enum class placement {
    back,  // /play
    front, // /next
    now    // /now
};

dpp::snowflake caller_voice_channel(const dpp::slashcommand_t& event) {
    dpp::guild* g = dpp::find_guild(event.command.guild_id);
    if (g == nullptr) {
        return {};
    }
    auto it = g->voice_members.find(event.command.get_issuing_user().id);
    if (it == g->voice_members.end()) {
        return {};
    }
    return it->second.channel_id;
}

std::string requester_name(const dpp::slashcommand_t& event) {
    const std::string nickname = event.command.member.get_nickname();
    return nickname.empty() ? event.command.get_issuing_user().username : nickname;
}

std::string optional_string(const dpp::slashcommand_t& event, const std::string& name) {
    const dpp::command_value value = event.get_parameter(name);
    return std::holds_alternative<std::string>(value) ? std::get<std::string>(value) : std::string();
}

void handle_unpause(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.edit_original_response(dpp::message(not_playing));
        return;
    }
    if (sub->player_state() != player_status::paused) {
        event.edit_original_response(dpp::message(
            "Cannot unpause, the audio player is not currently paused. If you are trying to queue up a song, "
            "make sure you see the [song] parameter appear while typing the command"));
        return;
    }

    sub->set_notify_target(event.command.channel_id);
    event.edit_original_response(dpp::message(sub->resume() ? "Unpaused" : "Could not unpause, try again later"));
}

// Runs on its own thread: waiting for the voice connection and asking
// Lavalink both block.
void handle_play(const dpp::slashcommand_t& event, context& ctx, placement where) {
    const std::string query = optional_string(event, "song");
    if (query.empty()) {
        handle_unpause(event, ctx);
        return;
    }

    const dpp::snowflake voice_channel = caller_voice_channel(event);
    if (voice_channel.empty()) {
        event.edit_original_response(dpp::message(not_in_voice));
        return;
    }

    const audio::session_key guild_id = event.command.guild_id;
    auto sub = ctx.registry.get_or_create(guild_id, audio::join_target{ guild_id, voice_channel },
                                          event.command.channel_id);

    if (!sub->await_ready(ready_wait)) {
        event.edit_original_response(dpp::message(
            "Could not establish a voice connection within 15 seconds, please try again later"));
        return;
    }

    lavalink::resolve_result result =
        ctx.resolver.resolve(query, requester_name(event), make_track_handlers(ctx.bot, ctx.track_retries));
    if (!result.error.empty() || result.tracks.empty()) {
        event.edit_original_response(dpp::message(result.error.empty() ? "No results found" : result.error));
        return;
    }

    if (result.playlist) {
        if (where != placement::back) {
            event.edit_original_response(dpp::message("This command cannot be used with playlists"));
            return;
        }
        const std::size_t count = result.tracks.size();
        sub->bulk_enqueue(std::move(result.tracks));

        std::string reply = "Enqueued **" + std::to_string(count) + "** tracks from the playlist";
        if (!result.playlist_name.empty()) {
            reply += " `" + result.playlist_name + "`";
        }
        event.edit_original_response(dpp::message(reply));
        return;
    }

    std::shared_ptr<audio::track> t = result.tracks.front();
    if (where == placement::back) {
        const std::size_t position = sub->queue_size();
        sub->enqueue(t);
        event.edit_original_response(dpp::message(
            "Enqueued `" + t->title() + "` at position `" + std::to_string(position) + "`"));
        return;
    }

    const bool was_playing = sub->now_playing() != nullptr;
    sub->enqueue_next(t);
    if (where == placement::now && was_playing) {
        // The idle transition plays the track we just put in front.
        sub->skip(true);
    }
    event.edit_original_response(dpp::message("Enqueued `" + t->title() + "` at position `0`"));
}

void handle_queue(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(dpp::message(not_playing).set_flags(dpp::m_ephemeral));
        return;
    }
    sub->set_notify_target(event.command.channel_id);

    const std::size_t size = sub->queue_size();
    if (size == 0) {
        event.reply(dpp::message("The queue is currently empty").set_flags(dpp::m_ephemeral));
        return;
    }

    const dpp::command_value value = event.get_parameter("page");
    std::int64_t page = std::holds_alternative<std::int64_t>(value) ? std::get<std::int64_t>(value) : 0;
    const std::int64_t highest = static_cast<std::int64_t>((size + results_per_page - 1) / results_per_page) - 1;
    page = std::max<std::int64_t>(0, std::min(page, highest));

    const std::size_t first = static_cast<std::size_t>(page) * results_per_page;
    std::string out = "Queue Page `" + std::to_string(page) + "` of `" + std::to_string(highest) + "`";
    std::size_t index = first;
    for (const auto& t : sub->queued(first, results_per_page)) {
        out += "\n`" + std::to_string(index++) + "` `" + t->title() + "`";
    }

    event.reply(dpp::message(out).set_flags(dpp::m_ephemeral));
}

void handle_swap(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(not_playing);
        return;
    }

    const char* const melon = "If you swap a melon with a melon what do you get? A melon";
    if (sub->queue_size() < 2) {
        event.reply(melon);
        return;
    }

    const std::int64_t index1 = std::get<std::int64_t>(event.get_parameter("index1"));
    const std::int64_t index2 = std::get<std::int64_t>(event.get_parameter("index2"));
    if (index1 < 0 || index2 < 0) {
        event.reply("Index can't be less than 0");
        return;
    }

    sub->set_notify_target(event.command.channel_id);

    // Clamped and checked again under the queue's own lock: a track may have
    // ended since the size was read.
    const auto swapped = sub->swap(static_cast<std::size_t>(index1), static_cast<std::size_t>(index2));
    if (!swapped) {
        event.reply(sub->queue_size() < 2 ? melon : "Indices cannot be the same");
        return;
    }
    event.reply("Swapped positions `" + std::to_string(swapped->first) + "` and `"
                + std::to_string(swapped->second) + "` in the queue");
}

void handle_skip(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(not_playing);
        return;
    }
    sub->set_notify_target(event.command.channel_id);

    const player_status status = sub->player_state();
    if (status == player_status::idle || status == player_status::buffering) {
        event.reply("Cannot skip since a track is not playing yet");
        return;
    }

    auto skipping = sub->now_playing();
    if (!sub->skip()) {
        event.reply("Could not skip, try again later");
        return;
    }
    event.reply("Skipped `" + (skipping ? skipping->title() : std::string("the current track")) + "`");
}

void handle_pause(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(not_playing);
        return;
    }
    if (sub->player_state() == player_status::paused) {
        event.reply("Already paused. You can use /play without entering a song name to unpause");
        return;
    }

    sub->set_notify_target(event.command.channel_id);
    event.reply(sub->pause() ? "Paused" : "Nothing is playing right now");
}

void handle_now_playing(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(not_playing);
        return;
    }

    auto current = sub->now_playing();
    if (!current) {
        event.reply("Nothing is playing right now");
        return;
    }
    event.reply("Now playing `" + current->title() + "` (`" + audio::format_duration(current->duration())
                + "`) requested by `" + current->requester() + "`");
}

void handle_move(const dpp::slashcommand_t& event, context& ctx) {
    auto sub = ctx.registry.get(event.command.guild_id);
    if (!sub) {
        event.reply(not_playing);
        return;
    }
    sub->set_notify_target(event.command.channel_id);

    const dpp::snowflake voice_channel = caller_voice_channel(event);
    if (voice_channel.empty()) {
        event.reply(not_in_voice);
        return;
    }

    sub->join(audio::join_target{ event.command.guild_id, voice_channel });
    event.reply("Moved!");
}

} // namespace

audio::track_handlers make_track_handlers(dpp::cluster& bot, unsigned track_retries) {
    audio::track_handlers handlers;

    handlers.on_start = [](audio::track& t) {
        auto sub = t.owner();
        if (!sub) {
            return;
        }
        audio::notice n;
        n.kind    = audio::notice_kind::now_playing;
        n.text    = "Now playing `" + t.title() + "`";
        n.subject = t.shared_from_this();
        sub->notify(n);
    };

    handlers.on_finish = [](audio::track& t) {
        auto sub = t.owner();
        if (!sub) {
            return;
        }
        audio::notice n;
        n.kind = audio::notice_kind::finished;
        n.text = "Finished playing `" + t.title() + "`. There are currently `"
               + std::to_string(sub->queue_size()) + "` songs left in the queue";
        sub->notify(n);
    };

    handlers.on_error = [&bot, track_retries](audio::track& t, audio::track_failure failure, const std::string& reason) {
        auto sub = t.owner();
        if (!sub) {
            return;
        }

        if (failure == audio::track_failure::playback && t.retries() < track_retries) {
            bot.log(dpp::ll_info, "Retrying '" + t.title() + "' after: " + reason);
            sub->retry(t.shared_from_this());
            return;
        }

        audio::notice n;
        n.kind    = audio::notice_kind::error;
        n.text    = "Error: " + reason;
        n.subject = t.shared_from_this();
        sub->notify(n);
    };

    return handlers;
}

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot) {
    auto song_option = [](const std::string& description) {
        return dpp::command_option(dpp::co_string, "song", description, false);
    };

    dpp::slashcommand play("play", "Enqueues a new track, or unpauses the current track when no song is given", bot.me.id);
    play.add_option(song_option("Song name | URL | playlist URL"));

    dpp::slashcommand next("next", "Same as /play, but adds to the beginning of the queue", bot.me.id);
    next.add_option(song_option("Song name | URL"));

    dpp::slashcommand now("now", "Same as /play, but skips the current track and plays immediately", bot.me.id);
    now.add_option(song_option("Song name | URL"));

    dpp::slashcommand queue("queue", "Displays the queue", bot.me.id);
    queue.add_option(dpp::command_option(dpp::co_integer, "page", "The page of the queue you want to view", false));

    dpp::slashcommand swap("swap", "Swaps the position of 2 songs in the queue", bot.me.id);
    swap.add_option(dpp::command_option(dpp::co_integer, "index1", "The first index being swapped", true));
    swap.add_option(dpp::command_option(dpp::co_integer, "index2", "The second index being swapped", true));

    return {
        play,
        next,
        now,
        dpp::slashcommand("pause", "Pauses the current song", bot.me.id),
        dpp::slashcommand("skip", "Skips the current song", bot.me.id),
        dpp::slashcommand("stop", "Stops playing on this server. The bot leaves and the queue is lost", bot.me.id),
        queue,
        swap,
        dpp::slashcommand("shuffle", "Shuffles the queue", bot.me.id),
        dpp::slashcommand("clear", "Clears the queue", bot.me.id),
        dpp::slashcommand("move", "Moves the bot to the channel you are currently in", bot.me.id),
        dpp::slashcommand("nowplaying", "Shows the track that is playing", bot.me.id)
    };
}

bool route_slashcommand(const dpp::slashcommand_t& event, context& ctx) {
    const std::string name = event.command.get_command_name();

    if (name == "play" || name == "next" || name == "now") {
        const placement where = name == "play" ? placement::back
                              : name == "next" ? placement::front
                                               : placement::now;
        event.thinking();
        std::thread([event, &ctx, where]() {
            try {
                handle_play(event, ctx, where);
            } catch (const std::exception& e) {
                ctx.bot.log(dpp::ll_error, std::string("/play failed: ") + e.what());
                event.edit_original_response(dpp::message("Something went wrong, please try again later"));
            }
        }).detach();
        return true;
    }

    if (name == "queue") {
        handle_queue(event, ctx);
    } else if (name == "swap") {
        handle_swap(event, ctx);
    } else if (name == "skip") {
        handle_skip(event, ctx);
    } else if (name == "pause") {
        handle_pause(event, ctx);
    } else if (name == "nowplaying") {
        handle_now_playing(event, ctx);
    } else if (name == "move") {
        handle_move(event, ctx);
    } else if (name == "shuffle" || name == "clear" || name == "stop") {
        auto sub = ctx.registry.get(event.command.guild_id);
        if (!sub) {
            event.reply(not_playing);
            return true;
        }
        if (name == "shuffle") {
            sub->set_notify_target(event.command.channel_id);
            sub->shuffle();
            event.reply("Shuffled!");
        } else if (name == "clear") {
            sub->set_notify_target(event.command.channel_id);
            sub->clear();
            event.reply("Queue Cleared!");
        } else {
            sub->stop();
            event.reply("Stopped and left the voice channel");
        }
    } else {
        return false;
    }
    return true;
}

} // namespace minstrel::music
