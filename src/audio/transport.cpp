#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

const char* to_string(connection_status status)
{
    switch (status) {
    case connection_status::signalling:
        return "signalling";
    case connection_status::connecting:
        return "connecting";
    case connection_status::ready:
        return "ready";
    case connection_status::disconnected:
        return "disconnected";
    case connection_status::destroyed:
        return "destroyed";
    }
    return "unknown";
}

const char* to_string(player_status status)
{
    switch (status) {
    case player_status::idle:
        return "idle";
    case player_status::buffering:
        return "buffering";
    case player_status::playing:
        return "playing";
    case player_status::paused:
        return "paused";
    case player_status::auto_paused:
        return "autopaused";
    }
    return "unknown";
}

} // namespace minstrel::audio
