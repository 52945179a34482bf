#include "minstrel/lavalink/player.hpp"

#include <spdlog/spdlog.h>

namespace minstrel::lavalink {

using audio::player_status;

player::player(node& lavalink, audio::scheduler& timers, dpp::snowflake guild_id,
               std::chrono::seconds poll_interval)
    : m_state(std::make_shared<shared_state>(lavalink, timers, guild_id, poll_interval))
{
}

player::~player()
{
    audio::scheduler::handle pending = audio::scheduler::invalid_handle;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->closed = true;
        m_state->on_state = nullptr;
        m_state->on_error = nullptr;
        std::swap(pending, m_state->poll);
    }
    if (pending != audio::scheduler::invalid_handle) {
        m_state->timers.cancel(pending);
    }
}

void player::set_listeners(state_listener on_state, error_listener on_error)
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->on_state = std::move(on_state);
    m_state->on_error = std::move(on_error);
}

player_status player::status() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->status;
}

void player::play(const audio::audio_resource& resource)
{
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        generation = ++m_state->generation;
    }
    set_status(m_state, player_status::buffering);

    if (m_state->lavalink.play(m_state->guild_id, resource.locator)) {
        schedule_poll(m_state);
        return;
    }

    error_listener on_error;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        on_error = m_state->on_error;
    }
    if (on_error) {
        on_error("Lavalink refused to play " + resource.description);
    }

    // The error listener may already have stopped this attempt and started another.
    set_status(m_state, player_status::idle, generation);
}

bool player::pause()
{
    const player_status now = status();
    if (now != player_status::playing && now != player_status::buffering) {
        return false;
    }
    if (!m_state->lavalink.pause(m_state->guild_id, true)) {
        return false;
    }
    set_status(m_state, player_status::paused);
    return true;
}

bool player::resume()
{
    const player_status now = status();
    if (now != player_status::paused && now != player_status::auto_paused) {
        return false;
    }
    if (!m_state->lavalink.pause(m_state->guild_id, false)) {
        return false;
    }
    set_status(m_state, player_status::playing);
    return true;
}

bool player::stop(bool force)
{
    const player_status now = status();
    if (now == player_status::idle) {
        return false;
    }
    // Lavalink has no notion of a graceful stop; force only matters for logging.
    spdlog::debug("stopping guild {} player (force={})", m_state->guild_id.str(), force);
    if (!m_state->lavalink.stop(m_state->guild_id)) {
        spdlog::warn("Lavalink did not stop the player of guild {}", m_state->guild_id.str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        ++m_state->generation;
    }
    set_status(m_state, player_status::idle);
    return true;
}

bool player::set_status(const std::shared_ptr<shared_state>& st, player_status next,
                        std::optional<std::uint64_t> expected_generation)
{
    player_status  old = player_status::idle;
    state_listener listener;
    {
        std::lock_guard<std::mutex> lock(st->mutex);
        if (expected_generation && st->generation != *expected_generation) {
            return false;
        }
        if (st->closed || st->status == next) {
            return true;
        }
        old        = st->status;
        st->status = next;
        listener   = st->on_state;
    }
    if (listener) {
        listener(old, next);
    }
    return true;
}

void player::schedule_poll(const std::shared_ptr<shared_state>& st)
{
    std::weak_ptr<shared_state> weak = st;
    std::lock_guard<std::mutex> lock(st->mutex);
    if (st->closed || st->poll != audio::scheduler::invalid_handle) {
        return;
    }
    st->poll = st->timers.schedule_after(st->poll_interval, [weak] {
        if (auto locked = weak.lock()) {
            poll(locked);
        }
    });
}

void player::poll(const std::shared_ptr<shared_state>& st)
{
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(st->mutex);
        st->poll = audio::scheduler::invalid_handle;
        if (st->closed || st->status == player_status::idle) {
            return;
        }
        generation = st->generation;
    }

    const auto snapshot = st->lavalink.fetch_player(st->guild_id);
    if (!snapshot) {
        // Lavalink unreachable this round; keep the last known state.
        schedule_poll(st);
        return;
    }

    player_status next = player_status::playing;
    if (!snapshot->has_track) {
        next = player_status::idle;
    } else if (snapshot->paused) {
        next = player_status::paused;
    } else if (!snapshot->connected) {
        next = player_status::auto_paused;
    }

    // A play() or stop() that raced this request makes its answer stale.
    if (!set_status(st, next, generation)) {
        return;
    }
    if (next != player_status::idle) {
        schedule_poll(st);
    }
}

} // namespace minstrel::lavalink
