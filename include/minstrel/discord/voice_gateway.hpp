#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <dpp/dpp.h>

#include "minstrel/audio/transport.hpp"
#include "minstrel/lavalink/client.hpp"

namespace minstrel::discord {

class voice_gateway;

// State shared between a voice_link and the gateway that feeds it Discord
// events. The gateway only holds it weakly, so an event racing the link's
// destruction finds either a live state or nothing.
//
// signalling   opcode 4 sent, waiting for Discord
// connecting   Discord moved our voice state into a channel
// ready        Lavalink accepted the voice server credentials
// disconnected our voice state lost its channel (close code 4014)
class link_state {
public:
    link_state(voice_gateway& gateway, dpp::snowflake guild_id);

    void on_voice_state(dpp::snowflake channel_id);
    void on_voice_server();

    void set_listener(audio::voice_connection::state_listener listener);
    audio::connection_state state() const;
    dpp::snowflake channel() const;
    void set_channel(dpp::snowflake channel_id);
    void set_state(const audio::connection_state& next);

    // Drops the listener; later events are ignored.
    void close();

    voice_gateway&       gateway;
    const dpp::snowflake guild_id;

private:
    mutable std::mutex                      m_mutex;
    bool                                    m_closed = false;
    dpp::snowflake                          m_channel_id;
    audio::connection_state                 m_state;
    audio::voice_connection::state_listener m_listener;
};

// One guild's voice connection: Discord gateway opcode 4 for joining and
// leaving, Lavalink for the media link.
class voice_link : public audio::voice_connection {
public:
    voice_link(voice_gateway& gateway, dpp::snowflake guild_id);
    ~voice_link() override;

    voice_link(const voice_link&)            = delete;
    voice_link& operator=(const voice_link&) = delete;

    void set_state_listener(state_listener listener) override;
    audio::connection_state state() const override;

    void join(const audio::join_target& target) override;
    void rejoin() override;
    void destroy() override;

private:
    void signal(dpp::snowflake channel_id);

    std::shared_ptr<link_state> m_state;
};

class voice_gateway : public audio::voice_transport {
public:
    voice_gateway(dpp::cluster& cluster, lavalink::node& lavalink, audio::scheduler& timers,
                  std::chrono::seconds poll_interval);

    std::unique_ptr<audio::voice_connection> open_connection(audio::session_key key) override;
    std::unique_ptr<audio::playback_engine> create_engine(audio::session_key key) override;

    // Hook these from the cluster; they feed both Lavalink and the guild's link.
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    // Gateway opcode 4; a zero channel leaves. False when the guild's shard is unknown.
    bool send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id);

    lavalink::node& lavalink() { return m_lavalink; }

private:
    friend class voice_link;

    void add(const std::shared_ptr<link_state>& link);
    void remove(const std::shared_ptr<link_state>& link);
    std::shared_ptr<link_state> find(dpp::snowflake guild_id);

    dpp::cluster&        m_cluster;
    lavalink::node&      m_lavalink;
    audio::scheduler&    m_timers;
    std::chrono::seconds m_poll_interval;

    std::mutex                                                     m_mutex;
    std::unordered_map<dpp::snowflake, std::weak_ptr<link_state>> m_links;
};

} // namespace minstrel::discord
