#include "minstrel/audio/track.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace minstrel::audio {

track::track(track_info info, resource_factory factory, track_handlers handlers)
    : m_info(std::move(info))
    , m_factory(std::move(factory))
    , m_handlers(std::move(handlers))
{
}

audio_resource track::produce_resource()
{
    m_errored = false;

    if (!m_factory) {
        throw resource_error("no stream source for '" + m_info.title + "'");
    }
    return m_factory(*this);
}

// A throwing handler must not break the state machine that called it.
void track::on_start()
{
    if (!m_handlers.on_start) {
        return;
    }
    try {
        m_handlers.on_start(*this);
    } catch (const std::exception& e) {
        spdlog::warn("on_start handler for '{}' threw: {}", m_info.title, e.what());
    }
}

void track::on_finish()
{
    if (!m_handlers.on_finish) {
        return;
    }
    try {
        m_handlers.on_finish(*this);
    } catch (const std::exception& e) {
        spdlog::warn("on_finish handler for '{}' threw: {}", m_info.title, e.what());
    }
}

void track::on_error(track_failure failure, const std::string& reason)
{
    if (!m_handlers.on_error) {
        return;
    }
    try {
        m_handlers.on_error(*this, failure, reason);
    } catch (const std::exception& e) {
        spdlog::warn("on_error handler for '{}' threw: {}", m_info.title, e.what());
    }
}

std::string format_duration(std::chrono::milliseconds duration)
{
    const auto total   = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    const auto hours   = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setfill('0') << std::setw(2);
    }
    oss << minutes << ":" << std::setfill('0') << std::setw(2) << seconds;
    return oss.str();
}

} // namespace minstrel::audio
