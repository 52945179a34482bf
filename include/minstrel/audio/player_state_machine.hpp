#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "minstrel/audio/event_strand.hpp"
#include "minstrel/audio/track.hpp"
#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

/// Wraps a playback_engine and drives queue advancement.
///
/// Entering Idle ends a play attempt: the finished track gets on_finish
/// (unless it errored), the advance handler runs (unless suppressed) and the
/// idle guard is armed. Entering Playing fires on_start once per attempt.
/// Like connection_state_machine, every member expects the strand to be held.
class player_state_machine {
public:
    using advance_handler      = std::function<void()>;
    using idle_timeout_handler = std::function<void()>;

    player_state_machine(std::unique_ptr<playback_engine> engine,
                         std::shared_ptr<event_strand>    strand,
                         scheduler&                       timers,
                         std::chrono::seconds             idle_timeout = std::chrono::seconds(30));
    ~player_state_machine();

    player_state_machine(const player_state_machine&)            = delete;
    player_state_machine& operator=(const player_state_machine&) = delete;

    void set_advance_handler(advance_handler handler) { m_on_advance = std::move(handler); }
    void set_idle_timeout_handler(idle_timeout_handler handler) { m_on_idle_timeout = std::move(handler); }

    // Installs the engine listeners.
    void attach();

    void play(std::shared_ptr<track> t, const audio_resource& resource);
    bool pause();
    bool resume();
    bool stop(bool force = false);

    // Silences the machine for good: no callbacks, no guards, engine stopped.
    void shutdown();

    void suppress_auto_advance(bool suppress) { m_suppress_advance = suppress; }
    bool auto_advance_suppressed() const { return m_suppress_advance; }

    std::shared_ptr<track> current_track() const { return m_current; }
    player_status status() const { return m_status; }

    // Transition functions, driven by the engine listeners.
    void handle_status(player_status new_status);
    void handle_error(const std::string& message);

private:
    void arm_idle_guard();
    void cancel_idle_guard();

    std::unique_ptr<playback_engine> m_engine;
    std::shared_ptr<event_strand>    m_strand;
    scheduler&                       m_timers;
    std::chrono::seconds             m_idle_timeout;

    advance_handler      m_on_advance;
    idle_timeout_handler m_on_idle_timeout;

    player_status          m_status = player_status::idle;
    std::shared_ptr<track> m_current;
    bool                   m_started          = false;
    bool                   m_suppress_advance = false;
    bool                   m_shut_down        = false;

    scheduler::handle m_idle_guard = scheduler::invalid_handle;
};

} // namespace minstrel::audio
