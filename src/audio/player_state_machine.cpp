#include "minstrel/audio/player_state_machine.hpp"

#include <spdlog/spdlog.h>

namespace minstrel::audio {

player_state_machine::player_state_machine(std::unique_ptr<playback_engine> engine,
                                           std::shared_ptr<event_strand>    strand,
                                           scheduler&                       timers,
                                           std::chrono::seconds             idle_timeout)
    : m_engine(std::move(engine))
    , m_strand(std::move(strand))
    , m_timers(timers)
    , m_idle_timeout(idle_timeout)
    , m_status(m_engine->status())
{
}

player_state_machine::~player_state_machine()
{
    cancel_idle_guard();
}

void player_state_machine::attach()
{
    m_engine->set_listeners(
        event_strand::wrap(m_strand, [this](player_status, player_status new_status) {
            // Delivered after a later play() or stop() already moved the engine on.
            if (m_engine->status() != new_status) {
                spdlog::debug("dropping stale player event {}", to_string(new_status));
                return;
            }
            handle_status(new_status);
        }),
        event_strand::wrap(m_strand, [this](const std::string& message) {
            handle_error(message);
        }));
}

void player_state_machine::play(std::shared_ptr<track> t, const audio_resource& resource)
{
    if (m_shut_down) {
        return;
    }
    spdlog::debug("playing '{}'", resource.description);
    m_current = std::move(t);
    m_started = false;

    // Handing over a resource leaves Idle at once, whatever the engine
    // reports later.
    if (m_status == player_status::idle) {
        m_status = player_status::buffering;
    }
    m_engine->play(resource);
}

bool player_state_machine::pause()
{
    return !m_shut_down && m_engine->pause();
}

bool player_state_machine::resume()
{
    return !m_shut_down && m_engine->resume();
}

bool player_state_machine::stop(bool force)
{
    return !m_shut_down && m_engine->stop(force);
}

void player_state_machine::shutdown()
{
    if (m_shut_down) {
        return;
    }
    m_shut_down = true;
    cancel_idle_guard();
    m_current.reset();
    m_engine->stop(true);
}

void player_state_machine::handle_status(player_status new_status)
{
    const player_status old_status = m_status;
    if (old_status == new_status) {
        return;
    }
    m_status = new_status;

    if (m_shut_down) {
        return;
    }
    spdlog::debug("player {} -> {}", to_string(old_status), to_string(new_status));

    if (new_status == player_status::idle) {
        std::shared_ptr<track> finished = std::move(m_current);
        m_current.reset();
        m_started = false;

        if (!finished) {
            spdlog::debug("player went idle without a track");
        } else if (!finished->errored()) {
            finished->on_finish();
        }

        if (!m_suppress_advance && m_on_advance) {
            m_on_advance();
        }

        // Armed even when the advance handed over the next track: only
        // Playing clears it.
        if (m_status != player_status::playing && !m_shut_down) {
            arm_idle_guard();
        }
    } else if (new_status == player_status::playing) {
        cancel_idle_guard();
        if (m_current && !m_started) {
            m_started = true;
            m_current->on_start();
        }
    }
}

void player_state_machine::handle_error(const std::string& message)
{
    if (m_shut_down) {
        return;
    }

    std::shared_ptr<track> failed = m_current;
    if (!failed) {
        spdlog::warn("playback error without a track: {}", message);
        return;
    }

    spdlog::warn("playback of '{}' failed: {}", failed->title(), message);
    failed->mark_errored();
    failed->on_error(track_failure::playback, message);
}

void player_state_machine::arm_idle_guard()
{
    cancel_idle_guard();
    m_idle_guard = m_timers.schedule_after(
        m_idle_timeout, event_strand::wrap(m_strand, [this] {
            m_idle_guard = scheduler::invalid_handle;
            if (m_shut_down || m_status == player_status::playing) {
                return;
            }
            spdlog::info("nothing played for {}s", m_idle_timeout.count());
            if (m_on_idle_timeout) {
                m_on_idle_timeout();
            }
        }));
}

void player_state_machine::cancel_idle_guard()
{
    if (m_idle_guard != scheduler::invalid_handle) {
        m_timers.cancel(m_idle_guard);
        m_idle_guard = scheduler::invalid_handle;
    }
}

} // namespace minstrel::audio
