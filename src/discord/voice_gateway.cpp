#include "minstrel/discord/voice_gateway.hpp"

#include <dpp/json.h>

#include "minstrel/lavalink/player.hpp"

namespace minstrel::discord {

using audio::connection_state;
using audio::connection_status;
using audio::disconnect_reason;

// ---------- link_state ----------

link_state::link_state(voice_gateway& gw, dpp::snowflake guild)
    : gateway(gw)
    , guild_id(guild)
{
}

void link_state::set_listener(audio::voice_connection::state_listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

connection_state link_state::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

dpp::snowflake link_state::channel() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel_id;
}

void link_state::set_channel(dpp::snowflake channel_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channel_id = channel_id;
}

void link_state::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed   = true;
    m_listener = nullptr;
}

void link_state::set_state(const connection_state& next)
{
    connection_state                        old;
    audio::voice_connection::state_listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_state.status == connection_status::destroyed) {
            return;
        }
        old      = m_state;
        m_state  = next;
        listener = m_listener;
    }
    if (listener) {
        listener(old, next);
    }
}

void link_state::on_voice_state(dpp::snowflake channel_id)
{
    const connection_state current = state();
    if (current.status == connection_status::destroyed) {
        return;
    }

    if (channel_id.empty()) {
        // Discord does not tell a kick from a move here; both look like 4014.
        connection_state lost;
        lost.status     = connection_status::disconnected;
        lost.reason     = disconnect_reason::websocket_close;
        lost.close_code = audio::close_code_moved_or_kicked;
        set_state(lost);
        return;
    }

    // Mute and deafen changes repeat the channel we are already in.
    if (current.status == connection_status::ready && channel_id == channel()) {
        return;
    }

    set_channel(channel_id);
    set_state(connection_state{ connection_status::connecting });

    // A move inside the same voice server sends no new credentials.
    if (gateway.lavalink().update_voice(guild_id)) {
        set_state(connection_state{ connection_status::ready });
    }
}

void link_state::on_voice_server()
{
    if (state().status == connection_status::destroyed) {
        return;
    }

    if (gateway.lavalink().update_voice(guild_id)) {
        set_state(connection_state{ connection_status::ready });
        return;
    }

    connection_state lost;
    lost.status = connection_status::disconnected;
    lost.reason = disconnect_reason::endpoint_removed;
    set_state(lost);
}

// ---------- voice_link ----------

voice_link::voice_link(voice_gateway& gateway, dpp::snowflake guild_id)
    : m_state(std::make_shared<link_state>(gateway, guild_id))
{
    gateway.add(m_state);
}

voice_link::~voice_link()
{
    m_state->close();
    m_state->gateway.remove(m_state);
}

void voice_link::set_state_listener(state_listener listener)
{
    m_state->set_listener(std::move(listener));
}

connection_state voice_link::state() const
{
    return m_state->state();
}

void voice_link::join(const audio::join_target& target)
{
    m_state->set_channel(target.channel_id);
    signal(target.channel_id);
}

void voice_link::rejoin()
{
    signal(m_state->channel());
}

void voice_link::destroy()
{
    if (m_state->state().status == connection_status::destroyed) {
        return;
    }

    voice_gateway& gateway = m_state->gateway;
    gateway.send_voice_state(m_state->guild_id, dpp::snowflake());
    if (!gateway.lavalink().destroy_player(m_state->guild_id)) {
        gateway.m_cluster.log(dpp::ll_warning,
                              "Could not delete the Lavalink player of guild " + m_state->guild_id.str());
    }
    m_state->set_state(connection_state{ connection_status::destroyed });
}

void voice_link::signal(dpp::snowflake channel_id)
{
    if (m_state->gateway.send_voice_state(m_state->guild_id, channel_id)) {
        m_state->set_state(connection_state{ connection_status::signalling });
        return;
    }

    connection_state lost;
    lost.status = connection_status::disconnected;
    lost.reason = disconnect_reason::adapter_unavailable;
    m_state->set_state(lost);
}

// ---------- voice_gateway ----------

voice_gateway::voice_gateway(dpp::cluster& cluster, lavalink::node& lavalink, audio::scheduler& timers,
                             std::chrono::seconds poll_interval)
    : m_cluster(cluster)
    , m_lavalink(lavalink)
    , m_timers(timers)
    , m_poll_interval(poll_interval)
{
}

std::unique_ptr<audio::voice_connection> voice_gateway::open_connection(audio::session_key key)
{
    return std::make_unique<voice_link>(*this, dpp::snowflake(key));
}

std::unique_ptr<audio::playback_engine> voice_gateway::create_engine(audio::session_key key)
{
    return std::make_unique<lavalink::player>(m_lavalink, m_timers, dpp::snowflake(key), m_poll_interval);
}

void voice_gateway::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }
    m_lavalink.handle_voice_state_update(ev);

    if (auto link = find(ev.state.guild_id)) {
        link->on_voice_state(ev.state.channel_id);
    }
}

void voice_gateway::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    m_lavalink.handle_voice_server_update(ev);

    if (auto link = find(ev.guild_id)) {
        link->on_voice_server();
    }
}

bool voice_gateway::send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        m_cluster.log(dpp::ll_warning, "Guild " + guild_id.str() + " is not in the cache");
        return false;
    }

    dpp::discord_client* shard = m_cluster.get_shard(g->shard_id);
    if (shard == nullptr) {
        m_cluster.log(dpp::ll_warning,
                      "No shard " + std::to_string(g->shard_id) + " for guild " + guild_id.str());
        return false;
    }

    dpp::json payload;
    payload["op"]                = 4;
    payload["d"]["guild_id"]     = guild_id.str();
    payload["d"]["channel_id"]   = channel_id.empty() ? dpp::json(nullptr) : dpp::json(channel_id.str());
    payload["d"]["self_mute"]    = false;
    payload["d"]["self_deaf"]    = true;

    m_cluster.log(dpp::ll_debug,
                  "Voice state for guild " + guild_id.str() + " -> "
                  + (channel_id.empty() ? std::string("none") : channel_id.str()));

    shard->queue_message(shard->jsonobj_to_string(payload));
    return true;
}

void voice_gateway::add(const std::shared_ptr<link_state>& link)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_links[link->guild_id] = link;
}

void voice_gateway::remove(const std::shared_ptr<link_state>& link)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_links.find(link->guild_id);
    if (it == m_links.end()) {
        return;
    }
    auto current = it->second.lock();
    if (!current || current == link) {
        m_links.erase(it);
    }
}

std::shared_ptr<link_state> voice_gateway::find(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_links.find(guild_id);
    return it == m_links.end() ? nullptr : it->second.lock();
}

} // namespace minstrel::discord
