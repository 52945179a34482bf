#include "minstrel/audio/connection_state_machine.hpp"

#include <spdlog/spdlog.h>

namespace minstrel::audio {

const char* to_string(destroy_cause cause)
{
    switch (cause) {
    case destroy_cause::requested:
        return "requested";
    case destroy_cause::idle_timeout:
        return "idle timeout";
    case destroy_cause::kicked:
        return "kicked or moved without recovery";
    case destroy_cause::rejoin_exhausted:
        return "rejoin attempts exhausted";
    case destroy_cause::ready_timeout:
        return "not ready in time";
    case destroy_cause::transport:
        return "destroyed by transport";
    }
    return "unknown";
}

connection_state_machine::connection_state_machine(std::unique_ptr<voice_connection> connection,
                                                   std::shared_ptr<event_strand>     strand,
                                                   scheduler&                        timers,
                                                   connection_policy                 policy)
    : m_connection(std::move(connection))
    , m_strand(std::move(strand))
    , m_timers(timers)
    , m_policy(policy)
    , m_state(m_connection->state())
{
}

connection_state_machine::~connection_state_machine()
{
    cancel_all();
    if (!m_destroyed) {
        m_destroyed = true;
        m_connection->destroy();
    }
}

void connection_state_machine::attach()
{
    m_connection->set_state_listener(event_strand::wrap(
        m_strand, [this](const connection_state&, const connection_state& new_state) {
            handle_state_change(new_state);
        }));
}

void connection_state_machine::join(const join_target& target)
{
    if (m_destroyed) {
        spdlog::debug("join ignored for guild {}: connection destroyed", target.guild_id);
        return;
    }
    spdlog::debug("joining voice channel {} in guild {}", target.channel_id, target.guild_id);
    m_connection->join(target);
}

bool connection_state_machine::await_ready(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::recursive_mutex> lock(m_strand->mutex());
    m_ready_cv.wait_for(lock, timeout, [this] {
        return m_destroyed || m_state.status == connection_status::ready;
    });
    return !m_destroyed && m_state.status == connection_status::ready;
}

void connection_state_machine::destroy(destroy_cause cause)
{
    if (m_destroyed) {
        return;
    }
    enter_destroyed(cause, /*tell_transport=*/true);
}

void connection_state_machine::handle_state_change(const connection_state& new_state)
{
    if (m_destroyed) {
        return;
    }

    const connection_state old_state = m_state;
    m_state = new_state;
    spdlog::debug("voice connection {} -> {}", to_string(old_state.status), to_string(new_state.status));

    switch (new_state.status) {
    case connection_status::ready:
        m_rejoin_attempts = 0;
        m_ready_lock      = false;
        cancel(m_ready_guard);
        cancel(m_recovery_guard);
        cancel(m_rejoin_timer);
        m_ready_cv.notify_all();
        break;

    case connection_status::disconnected:
        on_disconnected(new_state);
        break;

    case connection_status::connecting:
        // A moved connection comes back through Connecting.
        cancel(m_recovery_guard);
        arm_ready_guard();
        break;

    case connection_status::signalling:
        arm_ready_guard();
        break;

    case connection_status::destroyed:
        enter_destroyed(destroy_cause::transport, /*tell_transport=*/false);
        break;
    }
}

void connection_state_machine::on_disconnected(const connection_state& state)
{
    // The disconnect policy supersedes a pending ready guard.
    cancel(m_ready_guard);
    m_ready_lock = false;

    if (state.reason == disconnect_reason::websocket_close
        && state.close_code == close_code_moved_or_kicked)
    {
        spdlog::info("voice connection closed with {}, waiting {}s for it to recover",
                     state.close_code, m_policy.recovery_window.count());
        cancel(m_recovery_guard);
        m_recovery_guard = m_timers.schedule_after(
            m_policy.recovery_window, event_strand::wrap(m_strand, [this] {
                m_recovery_guard = scheduler::invalid_handle;
                spdlog::warn("voice connection did not recover, treating it as a disconnect");
                destroy(destroy_cause::kicked);
            }));
        return;
    }

    if (m_rejoin_attempts < m_policy.max_rejoin_attempts) {
        const auto delay = m_policy.rejoin_backoff * static_cast<int>(m_rejoin_attempts + 1);
        spdlog::info("voice connection lost, rejoining in {}s (attempt {}/{})",
                     delay.count(), m_rejoin_attempts + 1, m_policy.max_rejoin_attempts);
        cancel(m_rejoin_timer);
        m_rejoin_timer = m_timers.schedule_after(
            delay, event_strand::wrap(m_strand, [this] {
                m_rejoin_timer = scheduler::invalid_handle;
                if (m_state.status != connection_status::disconnected) {
                    return;
                }
                ++m_rejoin_attempts;
                m_connection->rejoin();
            }));
        return;
    }

    spdlog::error("voice connection lost after {} rejoin attempts", m_rejoin_attempts);
    destroy(destroy_cause::rejoin_exhausted);
}

void connection_state_machine::arm_ready_guard()
{
    if (m_ready_lock) {
        return;
    }
    m_ready_lock  = true;
    m_ready_guard = m_timers.schedule_after(
        m_policy.ready_timeout, event_strand::wrap(m_strand, [this] {
            m_ready_guard = scheduler::invalid_handle;
            m_ready_lock  = false;
            if (m_state.status != connection_status::ready) {
                spdlog::error("voice connection not ready after {}s", m_policy.ready_timeout.count());
                destroy(destroy_cause::ready_timeout);
            }
        }));
}

void connection_state_machine::enter_destroyed(destroy_cause cause, bool tell_transport)
{
    m_destroyed    = true;
    m_cause        = cause;
    m_state        = connection_state{};
    m_state.status = connection_status::destroyed;
    cancel_all();

    spdlog::info("voice connection destroyed: {}", to_string(cause));

    if (tell_transport) {
        m_connection->destroy();
    }
    m_ready_cv.notify_all();

    if (m_on_destroyed) {
        m_on_destroyed(cause);
    }
}

void connection_state_machine::cancel(scheduler::handle& h)
{
    if (h != scheduler::invalid_handle) {
        m_timers.cancel(h);
        h = scheduler::invalid_handle;
    }
}

void connection_state_machine::cancel_all()
{
    cancel(m_ready_guard);
    cancel(m_recovery_guard);
    cancel(m_rejoin_timer);
    m_ready_lock = false;
}

} // namespace minstrel::audio
