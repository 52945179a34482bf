#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>

#include "minstrel/audio/event_strand.hpp"
#include "minstrel/audio/options.hpp"
#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

enum class destroy_cause {
    requested,        // stop command or subscription teardown
    idle_timeout,     // nothing played for the idle window
    kicked,           // moved-or-kicked close that did not recover
    rejoin_exhausted, // every rejoin attempt failed
    ready_timeout,    // never reached Ready inside the guard window
    transport         // the transport reported Destroyed by itself
};

const char* to_string(destroy_cause cause);

/// Wraps a voice_connection and owns its reconnection policy.
///
/// All members must be called with the strand held; listeners and timers
/// installed by attach() take it themselves. await_ready() is the exception:
/// it takes the strand and must be called without holding it.
class connection_state_machine {
public:
    using destroyed_handler = std::function<void(destroy_cause)>;

    connection_state_machine(std::unique_ptr<voice_connection> connection,
                             std::shared_ptr<event_strand>     strand,
                             scheduler&                        timers,
                             connection_policy                 policy = {});
    ~connection_state_machine();

    connection_state_machine(const connection_state_machine&)            = delete;
    connection_state_machine& operator=(const connection_state_machine&) = delete;

    void set_destroyed_handler(destroyed_handler handler) { m_on_destroyed = std::move(handler); }

    // Installs the transport listener.
    void attach();

    // No-op once destroyed.
    void join(const join_target& target);

    // false on timeout or destruction; never throws for a timeout.
    bool await_ready(std::chrono::milliseconds timeout);

    // Idempotent; Destroyed is terminal.
    void destroy(destroy_cause cause = destroy_cause::requested);

    // Transition function, driven by the transport listener.
    void handle_state_change(const connection_state& new_state);

    connection_status status() const { return m_state.status; }
    bool destroyed() const { return m_destroyed; }
    unsigned rejoin_attempts() const { return m_rejoin_attempts; }
    destroy_cause cause() const { return m_cause; }

private:
    void on_disconnected(const connection_state& state);
    void arm_ready_guard();
    void enter_destroyed(destroy_cause cause, bool tell_transport);
    void cancel(scheduler::handle& h);
    void cancel_all();

    std::unique_ptr<voice_connection> m_connection;
    std::shared_ptr<event_strand>     m_strand;
    scheduler&                        m_timers;
    connection_policy                 m_policy;
    destroyed_handler                 m_on_destroyed;

    connection_state m_state;
    unsigned         m_rejoin_attempts = 0;
    bool             m_ready_lock      = false;
    bool             m_destroyed       = false;
    destroy_cause    m_cause           = destroy_cause::requested;

    scheduler::handle m_ready_guard    = scheduler::invalid_handle;
    scheduler::handle m_recovery_guard = scheduler::invalid_handle;
    scheduler::handle m_rejoin_timer   = scheduler::invalid_handle;

    std::condition_variable_any m_ready_cv;
};

} // namespace minstrel::audio
