#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <random>
#include <vector>

#include "minstrel/audio/track.hpp"

namespace minstrel::audio {

/// Ordered tracks waiting to be played; front() is played next.
///
/// The lock flag serializes dequeue-and-produce in subscription::process_queue.
/// Bounds of swap() are the caller's responsibility.
class track_queue {
public:
    using value_type = std::shared_ptr<track>;

    track_queue();
    explicit track_queue(std::mt19937::result_type seed);

    void enqueue(value_type t);
    void enqueue_next(value_type t);
    void bulk_enqueue(std::vector<value_type> tracks, bool shuffle_after = true);
    void clear();
    void swap(std::size_t i, std::size_t j);
    void shuffle();

    // nullptr when empty
    value_type pop_front();

    const value_type& at(std::size_t index) const { return m_tracks.at(index); }
    std::size_t size() const { return m_tracks.size(); }
    bool empty() const { return m_tracks.empty(); }

    // Copies [offset, offset + count) clipped to the queue.
    std::vector<value_type> slice(std::size_t offset, std::size_t count) const;

    bool try_lock();
    void unlock() { m_locked = false; }
    bool locked() const { return m_locked; }

private:
    std::deque<value_type> m_tracks;
    std::mt19937           m_random_engine;
    bool                   m_locked = false;
};

} // namespace minstrel::audio
