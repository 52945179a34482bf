#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <unordered_map>
#include <cstdint>

#include <dpp/dpp.h>
#include <dpp/json_fwd.h>

#include "minstrel/lavalink/node_config.hpp"

namespace minstrel::lavalink {

using json = dpp::json;

struct track {
    std::string  encoded;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::int64_t length_ms = 0;
    bool         is_stream = false;
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type          type = load_type::empty;
    std::vector<track> tracks;
    std::string        playlist_name; // for load_type::playlist
    std::string        error_message; // for load_type::error
};

// What GET /v4/sessions/{sessionId}/players/{guildId} reports.
struct player_snapshot {
    bool         has_track   = false;
    std::string  encoded;
    bool         paused      = false;
    bool         connected   = false;
    std::int64_t position_ms = 0;
};

class node {
public:
    explicit node(dpp::cluster& cluster, const node_config& cfg);

    // Hook these from your bot:
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    // PATCH /v4/sessions/{sessionId}; call once the bot is ready.
    void ensure_session();

    // Track lookup
    load_result load_tracks(const std::string& identifier) const;

    // Player controls
    bool play(dpp::snowflake guild_id, const std::string& encoded_track, bool no_replace = false);
    bool stop(dpp::snowflake guild_id);
    bool pause(dpp::snowflake guild_id, bool pause_flag);

    // Sends the cached Discord voice credentials; false until all three are known.
    bool update_voice(dpp::snowflake guild_id);

    // std::nullopt when Lavalink could not be asked; has_track == false when
    // there is no player or nothing is loaded.
    std::optional<player_snapshot> fetch_player(dpp::snowflake guild_id) const;

    // DELETE the player and forget the cached voice state.
    bool destroy_player(dpp::snowflake guild_id);

private:
    struct voice_state {
        std::string session_id;      // Discord voice session id
        std::string token;
        std::string endpoint;
    };

    struct http_response {
        uint16_t    status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    dpp::cluster& m_cluster;
    node_config   m_cfg;
    std::string   m_base_url;

    // Lavalink v4 session id (used in /v4/sessions/{sessionId}/players/...)
    std::string   m_session_id;

    mutable std::mutex m_voice_mutex;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    http_response http_request(dpp::http_method method,
                               const std::string& path,
                               const std::string& body = "") const;

    // Complete Discord credentials for the guild, if all three are cached.
    std::optional<voice_state> voice_credentials(dpp::snowflake guild_id) const;
    static void put_voice(json& payload, const voice_state& vs);

    std::string player_path(dpp::snowflake guild_id) const;

    bool send_player_update(dpp::snowflake guild_id,
                            const json& payload,
                            bool no_replace);
};

} // namespace minstrel::lavalink
