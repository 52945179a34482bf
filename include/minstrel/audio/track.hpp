#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "minstrel/audio/transport.hpp"

namespace minstrel::audio {

class subscription;
class track;

// Thrown by a resource factory when a track cannot be turned into a stream.
class resource_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class track_failure {
    production, // the resource could not be created
    playback    // the engine failed mid-stream
};

struct track_info {
    std::string               title;
    std::string               author;
    std::string               uri;
    std::chrono::milliseconds duration{0};
    std::string               requester;
    bool                      is_stream = false;
};

// Lifecycle callbacks bound to one track at construction.
struct track_handlers {
    std::function<void(track&)>                                           on_start;
    std::function<void(track&)>                                           on_finish;
    std::function<void(track&, track_failure, const std::string& reason)> on_error;
};

class track : public std::enable_shared_from_this<track> {
public:
    using resource_factory = std::function<audio_resource(const track&)>;

    track(track_info info, resource_factory factory, track_handlers handlers);

    // Resets the errored flag, then asks the factory for a stream.
    // Throws resource_error (or whatever the factory throws) on failure.
    audio_resource produce_resource();

    const track_info& info() const { return m_info; }
    const std::string& title() const { return m_info.title; }
    std::chrono::milliseconds duration() const { return m_info.duration; }
    const std::string& requester() const { return m_info.requester; }

    bool errored() const { return m_errored; }
    void mark_errored() { m_errored = true; }

    unsigned retries() const { return m_retries; }
    void count_retry() { ++m_retries; }

    std::shared_ptr<subscription> owner() const { return m_owner.lock(); }
    void attach(std::weak_ptr<subscription> owner) { m_owner = std::move(owner); }

    void on_start();
    void on_finish();
    void on_error(track_failure failure, const std::string& reason);

private:
    track_info                 m_info;
    resource_factory           m_factory;
    track_handlers             m_handlers;
    std::weak_ptr<subscription> m_owner;
    bool                       m_errored = false;
    unsigned                   m_retries = 0;
};

std::string format_duration(std::chrono::milliseconds duration);

} // namespace minstrel::audio
