#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace minstrel::audio {

class track;

// Guild id; one subscription per key.
using session_key = std::uint64_t;

// Text channel that receives status messages.
using channel_id = std::uint64_t;

struct join_target {
    std::uint64_t guild_id   = 0;
    std::uint64_t channel_id = 0;
};

// ---------- voice connection ----------

enum class connection_status {
    signalling,
    connecting,
    ready,
    disconnected,
    destroyed
};

enum class disconnect_reason {
    none,
    websocket_close,
    adapter_unavailable,
    endpoint_removed,
    manual
};

// Close code sent when the bot was moved to another channel or kicked from it.
constexpr int close_code_moved_or_kicked = 4014;

struct connection_state {
    connection_status status = connection_status::signalling;
    disconnect_reason reason = disconnect_reason::none;
    int               close_code = 0;
};

class voice_connection {
public:
    using state_listener = std::function<void(const connection_state& old_state,
                                              const connection_state& new_state)>;

    virtual ~voice_connection() = default;

    virtual void set_state_listener(state_listener listener) = 0;
    virtual connection_state state() const = 0;

    // Joining a channel in a guild that is already joined redirects the connection.
    virtual void join(const join_target& target) = 0;
    virtual void rejoin() = 0;
    virtual void destroy() = 0;
};

// ---------- playback engine ----------

enum class player_status {
    idle,
    buffering,
    playing,
    paused,
    auto_paused
};

// A prepared, ready-to-stream handle produced from a track. Played once.
struct audio_resource {
    std::string locator;     // transport specific (Lavalink encoded track)
    std::string description; // for logs
};

class playback_engine {
public:
    using state_listener = std::function<void(player_status old_status, player_status new_status)>;
    using error_listener = std::function<void(const std::string& message)>;

    virtual ~playback_engine() = default;

    virtual void set_listeners(state_listener on_state, error_listener on_error) = 0;
    virtual player_status status() const = 0;

    virtual void play(const audio_resource& resource) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual bool stop(bool force) = 0;
};

// ---------- transport factory ----------

class voice_transport {
public:
    virtual ~voice_transport() = default;

    virtual std::unique_ptr<voice_connection> open_connection(session_key key) = 0;
    virtual std::unique_ptr<playback_engine> create_engine(session_key key) = 0;
};

// ---------- notifications ----------

enum class notice_kind {
    now_playing,
    finished,
    inactivity,
    connection_lost,
    error,
    info
};

struct notice {
    notice_kind                  kind = notice_kind::info;
    std::string                  text;
    std::shared_ptr<const track> subject;
};

class notification_sink {
public:
    virtual ~notification_sink() = default;
    virtual void send(channel_id target, const notice& message) = 0;
};

// ---------- timers ----------

class scheduler {
public:
    using task   = std::function<void()>;
    using handle = std::uint64_t;

    static constexpr handle invalid_handle = 0;

    virtual ~scheduler() = default;

    // One-shot. The returned handle is never invalid_handle.
    virtual handle schedule_after(std::chrono::seconds delay, task fn) = 0;
    virtual void cancel(handle h) = 0;
};

const char* to_string(connection_status status);
const char* to_string(player_status status);

} // namespace minstrel::audio
