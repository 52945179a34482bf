#pragma once

#include <dpp/dpp.h>

#include "minstrel/audio/transport.hpp"

namespace minstrel::discord {

// Posts notices to text channels; now-playing notices become an embed.
class channel_sink : public audio::notification_sink {
public:
    explicit channel_sink(dpp::cluster& cluster);

    void send(audio::channel_id target, const audio::notice& message) override;

    static dpp::message render(audio::channel_id target, const audio::notice& message);

private:
    dpp::cluster& m_cluster;
};

} // namespace minstrel::discord
