#include "minstrel/audio/subscription.hpp"

#include "minstrel/audio/subscription_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace minstrel::audio {

using lock_type = std::lock_guard<std::recursive_mutex>;

subscription::subscription(session_key                       key,
                           channel_id                        notify_target,
                           std::unique_ptr<voice_connection> connection,
                           std::unique_ptr<playback_engine>  engine,
                           scheduler&                        timers,
                           notification_sink&                sink,
                           subscription_registry&            registry,
                           const subscription_options&       options)
    : m_key(key)
    , m_strand(std::make_shared<event_strand>())
    , m_sink(sink)
    , m_registry(registry)
    , m_notify_target(notify_target)
    , m_connection(std::move(connection), m_strand, timers, options.connection)
    , m_player(std::move(engine), m_strand, timers, options.idle_timeout)
{
    m_connection.set_destroyed_handler([this](destroy_cause cause) { on_connection_destroyed(cause); });
    m_player.set_advance_handler([this] { process_queue(); });
    m_player.set_idle_timeout_handler([this] { on_idle_timeout(); });
}

void subscription::start(const join_target& target)
{
    lock_type lock(m_strand->mutex());
    m_strand->bind(weak_from_this());
    m_connection.attach();
    m_player.attach();
    m_connection.join(target);
}

void subscription::join(const join_target& target)
{
    lock_type lock(m_strand->mutex());
    m_connection.join(target);
}

bool subscription::await_ready(std::chrono::milliseconds timeout)
{
    return m_connection.await_ready(timeout);
}

void subscription::enqueue(std::shared_ptr<track> t)
{
    lock_type lock(m_strand->mutex());
    if (m_destroyed) {
        return;
    }
    spdlog::debug("guild {}: enqueued '{}'", m_key, t->title());
    attach_track(t);
    m_queue.enqueue(std::move(t));
    process_queue();
}

void subscription::enqueue_next(std::shared_ptr<track> t)
{
    lock_type lock(m_strand->mutex());
    if (m_destroyed) {
        return;
    }
    spdlog::debug("guild {}: enqueued '{}' at the front", m_key, t->title());
    attach_track(t);
    m_queue.enqueue_next(std::move(t));
    process_queue();
}

void subscription::bulk_enqueue(std::vector<std::shared_ptr<track>> tracks, bool shuffle_after)
{
    lock_type lock(m_strand->mutex());
    if (m_destroyed) {
        return;
    }
    spdlog::debug("guild {}: enqueued {} tracks", m_key, tracks.size());
    for (const auto& t : tracks) {
        attach_track(t);
    }
    m_queue.bulk_enqueue(std::move(tracks), shuffle_after);
    process_queue();
}

void subscription::clear()
{
    lock_type lock(m_strand->mutex());
    m_queue.clear();
}

std::optional<std::pair<std::size_t, std::size_t>> subscription::swap(std::size_t i, std::size_t j)
{
    lock_type lock(m_strand->mutex());
    if (m_queue.size() < 2) {
        return std::nullopt;
    }
    const std::size_t last = m_queue.size() - 1;
    i = std::min(i, last);
    j = std::min(j, last);
    if (i == j) {
        return std::nullopt;
    }
    m_queue.swap(i, j);
    return std::make_pair(i, j);
}

void subscription::shuffle()
{
    lock_type lock(m_strand->mutex());
    m_queue.shuffle();
}

void subscription::retry(std::shared_ptr<track> t)
{
    lock_type lock(m_strand->mutex());
    if (m_destroyed) {
        return;
    }
    spdlog::info("guild {}: retrying '{}'", m_key, t->title());
    t->count_retry();
    attach_track(t);
    m_player.suppress_auto_advance(true);
    m_queue.enqueue_next(std::move(t));
    m_player.stop(true);
    process_queue();
}

void subscription::process_queue()
{
    lock_type lock(m_strand->mutex());
    m_player.suppress_auto_advance(false);

    if (m_queue.locked() || m_player.status() != player_status::idle || m_queue.empty()) {
        spdlog::debug("guild {}: queue not processed (locked={}, player={}, queued={})",
                      m_key, m_queue.locked(), to_string(m_player.status()), m_queue.size());
        return;
    }

    m_queue.try_lock();
    std::shared_ptr<track> next = m_queue.pop_front();

    audio_resource resource;
    try {
        resource = next->produce_resource();
    } catch (const std::exception& e) {
        spdlog::warn("guild {}: could not produce '{}': {}", m_key, next->title(), e.what());
        next->mark_errored();
        next->on_error(track_failure::production, e.what());
        if (!m_destroyed) {
            m_queue.unlock();
            process_queue();
        }
        return;
    }

    m_player.play(next, resource);
    if (m_destroyed) {
        return;
    }
    m_queue.unlock();

    // An attempt that ended while the queue was locked could not advance.
    if (m_player.status() == player_status::idle && !m_player.auto_advance_suppressed()) {
        process_queue();
    }
}

bool subscription::pause()
{
    lock_type lock(m_strand->mutex());
    return !m_destroyed && m_player.pause();
}

bool subscription::resume()
{
    lock_type lock(m_strand->mutex());
    return !m_destroyed && m_player.resume();
}

bool subscription::skip(bool force)
{
    lock_type lock(m_strand->mutex());
    return !m_destroyed && m_player.stop(force);
}

void subscription::stop()
{
    auto self = shared_from_this();
    lock_type lock(m_strand->mutex());
    if (m_destroyed) {
        return;
    }
    m_destroyed = true;
    spdlog::info("guild {}: stopping subscription", m_key);

    // Stays locked: nothing is dequeued after teardown.
    m_queue.try_lock();
    m_queue.clear();
    m_player.shutdown();
    if (!m_connection.destroyed()) {
        m_connection.destroy(destroy_cause::requested);
    }
    m_registry.remove(m_key, this);
}

std::shared_ptr<track> subscription::now_playing() const
{
    lock_type lock(m_strand->mutex());
    return m_player.current_track();
}

std::size_t subscription::queue_size() const
{
    lock_type lock(m_strand->mutex());
    return m_queue.size();
}

std::vector<std::shared_ptr<track>> subscription::queued(std::size_t offset, std::size_t count) const
{
    lock_type lock(m_strand->mutex());
    return m_queue.slice(offset, count);
}

player_status subscription::player_state() const
{
    lock_type lock(m_strand->mutex());
    return m_player.status();
}

connection_status subscription::connection_state() const
{
    lock_type lock(m_strand->mutex());
    return m_connection.status();
}

bool subscription::destroyed() const
{
    lock_type lock(m_strand->mutex());
    return m_destroyed;
}

channel_id subscription::notify_target() const
{
    lock_type lock(m_strand->mutex());
    return m_notify_target;
}

void subscription::set_notify_target(channel_id target)
{
    lock_type lock(m_strand->mutex());
    m_notify_target = target;
}

void subscription::notify(const notice& message)
{
    lock_type lock(m_strand->mutex());
    m_sink.send(m_notify_target, message);
}

void subscription::attach_track(const std::shared_ptr<track>& t)
{
    t->attach(weak_from_this());
}

void subscription::on_connection_destroyed(destroy_cause cause)
{
    if (m_destroyed) {
        return;
    }

    if (cause != destroy_cause::requested && cause != destroy_cause::idle_timeout) {
        notice lost;
        lost.kind = notice_kind::connection_lost;
        lost.text = std::string("Left the voice channel: ") + to_string(cause);
        notify(lost);
    }
    stop();
}

void subscription::on_idle_timeout()
{
    if (m_destroyed) {
        return;
    }

    notice idle;
    idle.kind = notice_kind::inactivity;
    idle.text = "Left the voice channel because nothing was played for a while";
    notify(idle);

    m_connection.destroy(destroy_cause::idle_timeout);
}

} // namespace minstrel::audio
