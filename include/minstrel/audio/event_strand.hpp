#pragma once

#include <memory>
#include <mutex>
#include <utility>

namespace minstrel::audio {

/// Serializes every event delivered to one subscription.
///
/// Transport listeners, engine listeners and timer tasks are wrapped with
/// wrap(): the wrapped call keeps the owner alive while it runs and holds the
/// strand mutex, so each handler runs to completion before the next one for
/// the same subscription. Once the owner is gone, wrapped calls do nothing.
class event_strand {
public:
    void bind(std::weak_ptr<void> owner)
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        m_owner = std::move(owner);
    }

    std::recursive_mutex& mutex() const { return m_mutex; }

    template <typename Fn>
    void dispatch(Fn&& fn) const
    {
        std::shared_ptr<void> owner;
        {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            owner = m_owner.lock();
        }
        if (!owner) {
            return;
        }

        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::forward<Fn>(fn)();
    }

    template <typename Fn>
    static auto wrap(const std::shared_ptr<event_strand>& strand, Fn fn)
    {
        return [strand, fn = std::move(fn)](auto&&... args) {
            strand->dispatch([&] { fn(std::forward<decltype(args)>(args)...); });
        };
    }

private:
    mutable std::recursive_mutex m_mutex;
    std::weak_ptr<void>          m_owner;
};

} // namespace minstrel::audio
