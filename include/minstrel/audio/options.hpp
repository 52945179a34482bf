#pragma once

#include <chrono>

namespace minstrel::audio {

struct connection_policy {
    std::chrono::seconds ready_timeout{15};   // Signalling/Connecting -> Ready
    std::chrono::seconds recovery_window{5};  // after a moved-or-kicked close
    std::chrono::seconds rejoin_backoff{5};   // wait = (attempts + 1) * backoff
    unsigned             max_rejoin_attempts = 5;
};

struct subscription_options {
    connection_policy    connection;
    std::chrono::seconds idle_timeout{30};
};

} // namespace minstrel::audio
