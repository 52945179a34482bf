#pragma once

#include <cstdint>
#include <string>

namespace minstrel::lavalink {

struct node_config {
    std::string host;       // e.g. "127.0.0.1"
    uint16_t    port = 2333;
    bool        https = false;
    std::string password;   // Lavalink password
    std::string session_id; // Lavalink v4 session id, e.g. "default"
};

} // namespace minstrel::lavalink
