#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "minstrel/audio/options.hpp"
#include "minstrel/audio/subscription.hpp"
#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

/// Process-wide table of live subscriptions, at most one per session key.
class subscription_registry {
public:
    subscription_registry(voice_transport&     transport,
                          scheduler&           timers,
                          notification_sink&   sink,
                          subscription_options options = {});
    ~subscription_registry();

    subscription_registry(const subscription_registry&)            = delete;
    subscription_registry& operator=(const subscription_registry&) = delete;

    // Returns the live subscription for the key (retargeting its notifications)
    // or creates one, which joins join_target.
    std::shared_ptr<subscription> get_or_create(session_key        key,
                                                const join_target& target,
                                                channel_id         notify_target);

    // nullptr when absent
    std::shared_ptr<subscription> get(session_key key) const;

    // Only erases when the entry is still `expected`; called by subscription::stop().
    bool remove(session_key key, const subscription* expected);

    // Stops every live subscription.
    void stop_all();

    std::size_t size() const;

private:
    voice_transport&     m_transport;
    scheduler&           m_timers;
    notification_sink&   m_sink;
    subscription_options m_options;

    mutable std::mutex                                                m_mutex;
    std::unordered_map<session_key, std::shared_ptr<subscription>> m_subscriptions;
};

} // namespace minstrel::audio
