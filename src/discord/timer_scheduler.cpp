#include "minstrel/discord/timer_scheduler.hpp"

#include <memory>
#include <vector>

namespace minstrel::discord {

timer_scheduler::timer_scheduler(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

timer_scheduler::~timer_scheduler()
{
    std::vector<dpp::timer> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_timers) {
            pending.push_back(entry.second);
        }
        m_timers.clear();
    }
    for (dpp::timer t : pending) {
        m_cluster.stop_timer(t);
    }
}

audio::scheduler::handle timer_scheduler::schedule_after(std::chrono::seconds delay, task fn)
{
    handle h = invalid_handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        h = m_next++;
        m_timers.emplace(h, dpp::timer{});
    }

    // The cluster only knows repeating timers: the first tick stops its own timer.
    auto shared_fn = std::make_shared<task>(std::move(fn));
    const dpp::timer t = m_cluster.start_timer([this, h, shared_fn](dpp::timer self) {
        bool live = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            live = m_timers.erase(h) > 0;
        }
        m_cluster.stop_timer(self);
        if (live) {
            (*shared_fn)();
        }
    }, static_cast<uint64_t>(delay.count()));

    bool gone = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_timers.find(h);
        if (it != m_timers.end()) {
            it->second = t;
        } else {
            gone = true;
        }
    }
    if (gone) {
        // Cancelled (or fired) before the cluster handed us its timer.
        m_cluster.stop_timer(t);
    }
    return h;
}

void timer_scheduler::cancel(handle h)
{
    dpp::timer t{};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_timers.find(h);
        if (it == m_timers.end()) {
            return;
        }
        t = it->second;
        m_timers.erase(it);
    }
    if (t != dpp::timer{}) {
        m_cluster.stop_timer(t);
    }
}

} // namespace minstrel::discord
