#include "minstrel/audio/track_queue.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace minstrel::audio {

track_queue::track_queue()
    : track_queue(static_cast<std::mt19937::result_type>(
          std::chrono::high_resolution_clock::now().time_since_epoch().count()))
{
}

track_queue::track_queue(std::mt19937::result_type seed)
    : m_random_engine(seed)
{
}

void track_queue::enqueue(value_type t)
{
    m_tracks.push_back(std::move(t));
}

void track_queue::enqueue_next(value_type t)
{
    m_tracks.push_back(std::move(t));
    swap(0, m_tracks.size() - 1);
}

void track_queue::bulk_enqueue(std::vector<value_type> tracks, bool shuffle_after)
{
    for (auto& t : tracks) {
        m_tracks.push_back(std::move(t));
    }
    if (shuffle_after) {
        shuffle();
    }
}

void track_queue::clear()
{
    m_tracks.clear();
}

void track_queue::swap(std::size_t i, std::size_t j)
{
    std::swap(m_tracks[i], m_tracks[j]);
}

// Fisher-Yates over the whole queue.
void track_queue::shuffle()
{
    for (std::size_t i = m_tracks.size(); i > 1; --i) {
        std::uniform_int_distribution<std::size_t> dist(0, i - 1);
        swap(i - 1, dist(m_random_engine));
    }
}

track_queue::value_type track_queue::pop_front()
{
    if (m_tracks.empty()) {
        return nullptr;
    }
    value_type t = std::move(m_tracks.front());
    m_tracks.pop_front();
    return t;
}

std::vector<track_queue::value_type> track_queue::slice(std::size_t offset, std::size_t count) const
{
    std::vector<value_type> out;
    if (offset >= m_tracks.size()) {
        return out;
    }
    const std::size_t end = std::min(m_tracks.size(), offset + count);
    out.assign(m_tracks.begin() + static_cast<std::ptrdiff_t>(offset),
               m_tracks.begin() + static_cast<std::ptrdiff_t>(end));
    return out;
}

bool track_queue::try_lock()
{
    if (m_locked) {
        return false;
    }
    m_locked = true;
    return true;
}

} // namespace minstrel::audio
