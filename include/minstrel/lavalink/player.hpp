#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include <dpp/dpp.h>

#include "minstrel/audio/transport.hpp"
#include "minstrel/lavalink/client.hpp"

namespace minstrel::lavalink {

// playback_engine backed by one Lavalink player.
//
// Lavalink state is observed by polling the player every poll_interval while
// something is loaded: no track means idle, a paused player is paused, a
// player whose voice link dropped is auto-paused, anything else is playing.
class player : public audio::playback_engine {
public:
    player(node& lavalink, audio::scheduler& timers, dpp::snowflake guild_id,
           std::chrono::seconds poll_interval);
    ~player() override;

    player(const player&)            = delete;
    player& operator=(const player&) = delete;

    void set_listeners(state_listener on_state, error_listener on_error) override;
    audio::player_status status() const override;

    void play(const audio::audio_resource& resource) override;
    bool pause() override;
    bool resume() override;
    bool stop(bool force) override;

private:
    // Outlives the player while a poll is in flight.
    struct shared_state {
        shared_state(node& n, audio::scheduler& t, dpp::snowflake g, std::chrono::seconds i)
            : lavalink(n), timers(t), guild_id(g), poll_interval(i) {}

        node&                    lavalink;
        audio::scheduler&        timers;
        const dpp::snowflake     guild_id;
        const std::chrono::seconds poll_interval;

        std::mutex               mutex;
        audio::player_status     status     = audio::player_status::idle;
        std::uint64_t            generation = 0;
        bool                     closed     = false;
        audio::scheduler::handle poll       = audio::scheduler::invalid_handle;
        state_listener           on_state;
        error_listener           on_error;
    };

    // False when expected_generation no longer matches; nothing is applied then.
    static bool set_status(const std::shared_ptr<shared_state>& st, audio::player_status next,
                           std::optional<std::uint64_t> expected_generation = std::nullopt);
    static void schedule_poll(const std::shared_ptr<shared_state>& st);
    static void poll(const std::shared_ptr<shared_state>& st);

    std::shared_ptr<shared_state> m_state;
};

} // namespace minstrel::lavalink
