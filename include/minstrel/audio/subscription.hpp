#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "minstrel/audio/connection_state_machine.hpp"
#include "minstrel/audio/event_strand.hpp"
#include "minstrel/audio/options.hpp"
#include "minstrel/audio/player_state_machine.hpp"
#include "minstrel/audio/track.hpp"
#include "minstrel/audio/track_queue.hpp"
#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

class subscription_registry;

/// Everything one guild is doing right now: its voice connection, its player
/// and its queue.
///
/// Created lazily by subscription_registry::get_or_create() and torn down by
/// stop(), which also runs when the connection is destroyed. A stopped
/// subscription is never reused. Public members lock the event strand, so
/// they may be called from any thread.
class subscription : public std::enable_shared_from_this<subscription> {
public:
    subscription(session_key                       key,
                 channel_id                        notify_target,
                 std::unique_ptr<voice_connection> connection,
                 std::unique_ptr<playback_engine>  engine,
                 scheduler&                        timers,
                 notification_sink&                sink,
                 subscription_registry&            registry,
                 const subscription_options&       options = {});

    subscription(const subscription&)            = delete;
    subscription& operator=(const subscription&) = delete;

    // Wires the state machines and joins the voice channel.
    void start(const join_target& target);

    // Redirects the connection to another channel of the same guild.
    void join(const join_target& target);
    bool await_ready(std::chrono::milliseconds timeout);

    void enqueue(std::shared_ptr<track> t);
    void enqueue_next(std::shared_ptr<track> t);
    void bulk_enqueue(std::vector<std::shared_ptr<track>> tracks, bool shuffle_after = true);
    void clear();
    // Clamps both indices to the last entry and swaps them. std::nullopt when
    // fewer than two tracks are queued or the clamped indices coincide.
    std::optional<std::pair<std::size_t, std::size_t>> swap(std::size_t i, std::size_t j);
    void shuffle();

    // Requeues a failed track at the front and plays it again without
    // letting the idle transition advance past it.
    void retry(std::shared_ptr<track> t);

    void process_queue();

    bool pause();
    bool resume();
    // Ends the current track; the idle transition plays the next one.
    bool skip(bool force = false);

    // Terminal and idempotent.
    void stop();

    std::shared_ptr<track> now_playing() const;
    std::size_t queue_size() const;
    std::vector<std::shared_ptr<track>> queued(std::size_t offset, std::size_t count) const;

    player_status player_state() const;
    connection_status connection_state() const;
    bool destroyed() const;

    session_key key() const { return m_key; }
    channel_id notify_target() const;
    void set_notify_target(channel_id target);

    // Sends to the last known notification target.
    void notify(const notice& message);

private:
    void attach_track(const std::shared_ptr<track>& t);
    void on_connection_destroyed(destroy_cause cause);
    void on_idle_timeout();

    const session_key             m_key;
    std::shared_ptr<event_strand> m_strand;
    notification_sink&            m_sink;
    subscription_registry&        m_registry;

    channel_id m_notify_target;
    bool       m_destroyed = false;

    track_queue              m_queue;
    connection_state_machine m_connection;
    player_state_machine     m_player;
};

} // namespace minstrel::audio
