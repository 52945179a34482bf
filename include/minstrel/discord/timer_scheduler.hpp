#pragma once

#include <mutex>
#include <unordered_map>

#include <dpp/dpp.h>

#include "minstrel/audio/transport.hpp"

namespace minstrel::discord {

// One-shot timers on top of the cluster's repeating timers.
class timer_scheduler : public audio::scheduler {
public:
    explicit timer_scheduler(dpp::cluster& cluster);
    ~timer_scheduler() override;

    handle schedule_after(std::chrono::seconds delay, task fn) override;
    void cancel(handle h) override;

private:
    dpp::cluster& m_cluster;

    std::mutex                            m_mutex;
    handle                                m_next = 1;
    std::unordered_map<handle, dpp::timer> m_timers;
};

} // namespace minstrel::discord
