#include "minstrel/lavalink/client.hpp"

#include <future>
#include <map>

#include <dpp/json.h>

namespace minstrel::lavalink {

namespace {

const char* method_name(dpp::http_method method) {
    switch (method) {
        case dpp::m_get:    return "GET";
        case dpp::m_post:   return "POST";
        case dpp::m_put:    return "PUT";
        case dpp::m_patch:  return "PATCH";
        case dpp::m_delete: return "DELETE";
        default:            return "?";
    }
}

load_type parse_load_type(const std::string& name) {
    if (name == "track") {
        return load_type::track;
    }
    if (name == "playlist") {
        return load_type::playlist;
    }
    if (name == "search") {
        return load_type::search;
    }
    if (name == "error") {
        return load_type::error;
    }
    return load_type::empty;
}

track parse_track(const json& item) {
    track t;
    if (item.contains("encoded") && item["encoded"].is_string()) {
        t.encoded = item["encoded"].get<std::string>();
    }
    if (item.contains("info") && item["info"].is_object()) {
        const auto& info = item["info"];
        t.title     = info.value("title", "");
        t.author    = info.value("author", "");
        t.length_ms = info.value("length", static_cast<std::int64_t>(0));
        t.is_stream = info.value("isStream", false);
        if (info.contains("uri") && info["uri"].is_string()) {
            t.uri = info["uri"].get<std::string>();
        }
    }
    return t;
}

std::vector<track> parse_tracks(const json& items) {
    std::vector<track> out;
    if (items.is_array()) {
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(parse_track(item));
        }
    }
    return out;
}

} // namespace

node::node(dpp::cluster& cluster, const node_config& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
    , m_base_url(std::string(cfg.https ? "https://" : "http://") + cfg.host + ":" + std::to_string(cfg.port))
    , m_session_id(cfg.session_id)
{
    m_cluster.log(dpp::ll_info, "Lavalink node " + m_base_url + ", session '" + m_session_id + "'");
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev) {
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    const dpp::snowflake guild_id = ev.state.guild_id;
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    if (ev.state.channel_id.empty()) {
        // The old credentials are useless for the next join.
        m_voice_states.erase(guild_id);
        m_cluster.log(dpp::ll_debug, "Guild " + guild_id.str() + ": voice state dropped");
        return;
    }

    m_voice_states[guild_id].session_id = ev.state.session_id;
    m_cluster.log(dpp::ll_debug, "Guild " + guild_id.str() + ": voice session " + ev.state.session_id);
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev) {
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    voice_state& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;
    m_cluster.log(dpp::ll_debug, "Guild " + ev.guild_id.str() + ": voice server " + ev.endpoint);
}

std::optional<node::voice_state> node::voice_credentials(dpp::snowflake guild_id) const {
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto it = m_voice_states.find(guild_id);
    if (it == m_voice_states.end()
        || it->second.session_id.empty() || it->second.token.empty() || it->second.endpoint.empty()) {
        return std::nullopt;
    }
    return it->second;
}

void node::put_voice(json& payload, const voice_state& vs) {
    payload["voice"] = {
        { "token",     vs.token },
        { "endpoint",  vs.endpoint },
        { "sessionId", vs.session_id }
    };
}

std::string node::player_path(dpp::snowflake guild_id) const {
    return "/v4/sessions/" + m_session_id + "/players/" + guild_id.str();
}

node::http_response node::http_request(dpp::http_method method,
                                       const std::string& path,
                                       const std::string& body) const
{
    const std::multimap<std::string, std::string> headers{
        { "Authorization", m_cfg.password },
        { "User-Id",       m_cluster.me.id.str() },
        { "Client-Name",   "Minstrel" }
    };

    m_cluster.log(dpp::ll_trace, std::string("Lavalink ") + method_name(method) + " " + path);

    // Shared so a late completion never touches a destroyed promise.
    auto done   = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto result = done->get_future();

    m_cluster.request(m_base_url + path, method,
                      [done](const dpp::http_request_completion_t& cc) { done->set_value(cc); },
                      body,
                      body.empty() ? "text/plain" : "application/json",
                      headers);

    http_response response;
    try {
        const dpp::http_request_completion_t cc = result.get();
        response.status = static_cast<uint16_t>(cc.status);
        response.body   = cc.body;
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_warning, std::string("Lavalink request failed: ") + e.what());
        return response;
    }

    if (response.status == 404) {
        m_cluster.log(dpp::ll_debug, std::string("Lavalink 404 on ") + method_name(method) + " " + path);
    } else if (!response.ok()) {
        m_cluster.log(dpp::ll_warning,
                      "Lavalink " + std::to_string(response.status) + " on " + method_name(method) + " " + path
                      + (response.body.empty() ? std::string() : ": " + response.body));
    }
    return response;
}

void node::ensure_session() {
    const json payload = { { "resuming", true }, { "timeout", 60 } };

    if (!http_request(dpp::m_patch, "/v4/sessions/" + m_session_id, payload.dump()).ok()) {
        m_cluster.log(dpp::ll_warning, "Could not configure Lavalink session '" + m_session_id + "'");
        return;
    }
    m_cluster.log(dpp::ll_info, "Lavalink session '" + m_session_id + "' is ready");
}

load_result node::load_tracks(const std::string& identifier) const {
    load_result result;

    const http_response response =
        http_request(dpp::m_get, "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier));
    if (!response.ok() || response.body.empty()) {
        result.type          = load_type::error;
        result.error_message = "Lavalink did not answer the track lookup";
        return result;
    }

    json j;
    try {
        j = json::parse(response.body);
    } catch (const json::exception& e) {
        m_cluster.log(dpp::ll_warning, std::string("Unreadable /loadtracks answer: ") + e.what());
        result.type          = load_type::error;
        result.error_message = "Lavalink sent an unreadable answer";
        return result;
    }

    result.type = parse_load_type(j.value("loadType", ""));
    const json data = j.contains("data") ? j["data"] : json();

    switch (result.type) {
        case load_type::track:
            if (data.is_object()) {
                result.tracks.push_back(parse_track(data));
            }
            break;
        case load_type::search:
            result.tracks = parse_tracks(data);
            break;
        case load_type::playlist:
            if (data.is_object()) {
                if (data.contains("info") && data["info"].is_object()) {
                    result.playlist_name = data["info"].value("name", "");
                }
                if (data.contains("tracks")) {
                    result.tracks = parse_tracks(data["tracks"]);
                }
            }
            break;
        case load_type::error:
            result.error_message = data.is_object() ? data.value("message", "unknown error") : "unknown error";
            m_cluster.log(dpp::ll_warning, "Lookup of '" + identifier + "' failed: " + result.error_message);
            break;
        case load_type::empty:
            break;
    }

    m_cluster.log(dpp::ll_debug,
                  "'" + identifier + "' resolved to " + std::to_string(result.tracks.size()) + " track(s)");
    return result;
}

bool node::send_player_update(dpp::snowflake guild_id,
                              const json& payload,
                              bool no_replace)
{
    if (m_session_id.empty()) {
        m_cluster.log(dpp::ll_warning, "No Lavalink session, dropping player update");
        return false;
    }

    m_cluster.log(dpp::ll_trace, "Guild " + guild_id.str() + ": player update " + payload.dump());
    const std::string path = player_path(guild_id) + (no_replace ? "?noReplace=true" : "?noReplace=false");
    return http_request(dpp::m_patch, path, payload.dump()).ok();
}

bool node::play(dpp::snowflake guild_id,
                const std::string& encoded_track,
                bool no_replace)
{
    json payload;
    payload["track"]["encoded"] = encoded_track;
    payload["paused"]           = false;
    if (auto vs = voice_credentials(guild_id)) {
        put_voice(payload, *vs);
    }
    return send_player_update(guild_id, payload, no_replace);
}

bool node::stop(dpp::snowflake guild_id) {
    json payload;
    payload["track"]["encoded"] = nullptr;
    return send_player_update(guild_id, payload, false);
}

bool node::pause(dpp::snowflake guild_id, bool pause_flag) {
    const json payload = { { "paused", pause_flag } };
    return send_player_update(guild_id, payload, false);
}

bool node::update_voice(dpp::snowflake guild_id) {
    auto vs = voice_credentials(guild_id);
    if (!vs) {
        m_cluster.log(dpp::ll_debug, "Guild " + guild_id.str() + ": voice credentials incomplete");
        return false;
    }

    json payload = json::object();
    put_voice(payload, *vs);
    return send_player_update(guild_id, payload, false);
}

std::optional<player_snapshot> node::fetch_player(dpp::snowflake guild_id) const {
    const http_response response = http_request(dpp::m_get, player_path(guild_id));
    if (response.status == 404) {
        return player_snapshot{};
    }
    if (!response.ok()) {
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(response.body);
    } catch (const json::exception& e) {
        m_cluster.log(dpp::ll_warning, std::string("Unreadable player answer: ") + e.what());
        return std::nullopt;
    }

    player_snapshot snapshot;
    if (j.contains("track") && j["track"].is_object()) {
        snapshot.has_track = true;
        snapshot.encoded   = j["track"].value("encoded", "");
    }
    snapshot.paused = j.value("paused", false);
    if (j.contains("state") && j["state"].is_object()) {
        snapshot.connected   = j["state"].value("connected", false);
        snapshot.position_ms = j["state"].value("position", static_cast<std::int64_t>(0));
    }
    return snapshot;
}

bool node::destroy_player(dpp::snowflake guild_id) {
    {
        std::lock_guard<std::mutex> lock(m_voice_mutex);
        m_voice_states.erase(guild_id);
    }
    if (m_session_id.empty()) {
        return false;
    }

    const http_response response = http_request(dpp::m_delete, player_path(guild_id));
    return response.ok() || response.status == 404;
}

} // namespace minstrel::lavalink
