#include "minstrel/audio/subscription_registry.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace minstrel::audio {

subscription_registry::subscription_registry(voice_transport&     transport,
                                             scheduler&           timers,
                                             notification_sink&   sink,
                                             subscription_options options)
    : m_transport(transport)
    , m_timers(timers)
    , m_sink(sink)
    , m_options(options)
{
}

subscription_registry::~subscription_registry()
{
    stop_all();
}

std::shared_ptr<subscription> subscription_registry::get_or_create(session_key        key,
                                                                   const join_target& target,
                                                                   channel_id         notify_target)
{
    for (;;) {
        std::shared_ptr<subscription> sub;
        bool created = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_subscriptions.find(key);
            if (it != m_subscriptions.end()) {
                sub = it->second;
            } else {
                sub = std::make_shared<subscription>(key,
                                                     notify_target,
                                                     m_transport.open_connection(key),
                                                     m_transport.create_engine(key),
                                                     m_timers,
                                                     m_sink,
                                                     *this,
                                                     m_options);
                m_subscriptions.emplace(key, sub);
                created = true;
            }
        }

        // Outside the table lock: starting may tear the subscription down again,
        // and teardown calls remove().
        if (created) {
            spdlog::info("created subscription for guild {}", key);
            sub->start(target);
            return sub;
        }

        // stop() marks the subscription destroyed before it leaves the table.
        if (sub->destroyed()) {
            spdlog::debug("guild {}: replacing a subscription that is shutting down", key);
            remove(key, sub.get());
            continue;
        }

        sub->set_notify_target(notify_target);
        return sub;
    }
}

std::shared_ptr<subscription> subscription_registry::get(session_key key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscriptions.find(key);
    if (it == m_subscriptions.end()) {
        return nullptr;
    }
    return it->second;
}

bool subscription_registry::remove(session_key key, const subscription* expected)
{
    std::shared_ptr<subscription> removed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscriptions.find(key);
        if (it == m_subscriptions.end() || it->second.get() != expected) {
            return false;
        }
        removed = std::move(it->second);
        m_subscriptions.erase(it);
    }
    spdlog::info("removed subscription for guild {}", key);
    return true;
}

void subscription_registry::stop_all()
{
    std::vector<std::shared_ptr<subscription>> live;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        live.reserve(m_subscriptions.size());
        for (const auto& entry : m_subscriptions) {
            live.push_back(entry.second);
        }
    }
    for (const auto& sub : live) {
        sub->stop();
    }
}

std::size_t subscription_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

} // namespace minstrel::audio
