#include "minstrel/lavalink/track_resolver.hpp"

#include <spdlog/spdlog.h>

namespace minstrel::lavalink {

track_resolver::track_resolver(node& lavalink)
    : m_lavalink(lavalink)
{
}

bool track_resolver::is_url(const std::string& query)
{
    return query.rfind("http://", 0) == 0 || query.rfind("https://", 0) == 0;
}

resolve_result track_resolver::resolve(const std::string& query,
                                       const std::string& requester,
                                       const audio::track_handlers& handlers) const
{
    resolve_result result;

    const std::string identifier = is_url(query) ? query : "ytsearch:" + query;
    load_result loaded = m_lavalink.load_tracks(identifier);

    switch (loaded.type) {
        case load_type::error:
            result.error = loaded.error_message.empty() ? "Failed to load the track" : loaded.error_message;
            return result;
        case load_type::empty:
            result.error = "No results for `" + query + "`";
            return result;
        case load_type::search:
            // Only the best match is queued.
            if (loaded.tracks.size() > 1) {
                loaded.tracks.resize(1);
            }
            break;
        case load_type::playlist:
            result.playlist      = true;
            result.playlist_name = loaded.playlist_name;
            break;
        case load_type::track:
            break;
    }

    if (loaded.tracks.empty()) {
        result.error = "No results for `" + query + "`";
        return result;
    }

    result.tracks.reserve(loaded.tracks.size());
    for (const auto& t : loaded.tracks) {
        result.tracks.push_back(make_track(t, requester, handlers));
    }

    spdlog::debug("resolved '{}' to {} track(s)", query, result.tracks.size());
    return result;
}

std::shared_ptr<audio::track> track_resolver::make_track(const track& loaded,
                                                         const std::string& requester,
                                                         const audio::track_handlers& handlers) const
{
    audio::track_info info;
    info.title     = loaded.title;
    info.author    = loaded.author;
    info.uri       = loaded.uri;
    info.duration  = std::chrono::milliseconds(loaded.length_ms);
    info.requester = requester;
    info.is_stream = loaded.is_stream;

    node& lavalink = m_lavalink;
    std::string encoded = loaded.encoded;

    // Entries that arrive without an encoded blob are looked up again by
    // author and title when they reach the front of the queue.
    auto factory = [&lavalink, encoded](const audio::track& t) -> audio::audio_resource {
        if (!encoded.empty()) {
            return audio::audio_resource{ encoded, t.title() };
        }

        const std::string search = "ytsearch:" + t.info().author + " - " + t.title();
        load_result found = lavalink.load_tracks(search);
        if (found.tracks.empty() || found.tracks.front().encoded.empty()) {
            throw audio::resource_error("Could not find a playable source for `" + t.title() + "`");
        }
        return audio::audio_resource{ found.tracks.front().encoded, t.title() };
    };

    return std::make_shared<audio::track>(std::move(info), std::move(factory), handlers);
}

} // namespace minstrel::lavalink
