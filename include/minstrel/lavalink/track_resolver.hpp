#pragma once

#include <memory>
#include <string>
#include <vector>

#include "minstrel/audio/track.hpp"
#include "minstrel/lavalink/client.hpp"

namespace minstrel::lavalink {

struct resolve_result {
    std::vector<std::shared_ptr<audio::track>> tracks;
    bool                                       playlist = false;
    std::string                                playlist_name;
    std::string                                error; // empty on success
};

// Turns what a user typed into playable tracks.
class track_resolver {
public:
    explicit track_resolver(node& lavalink);

    // URLs are loaded as-is, anything else becomes a YouTube search whose
    // first hit is used.
    resolve_result resolve(const std::string& query,
                           const std::string& requester,
                           const audio::track_handlers& handlers) const;

    static bool is_url(const std::string& query);

private:
    std::shared_ptr<audio::track> make_track(const track& loaded,
                                             const std::string& requester,
                                             const audio::track_handlers& handlers) const;

    node& m_lavalink;
};

} // namespace minstrel::lavalink
