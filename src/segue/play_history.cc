#include <segue/play_history.hh>
#include <utility>

namespace segue {
    play_history::play_history(std::size_t max_size)
        : m_max_size(max_size) {
    }

    void play_history::push(queue_track track) {
        if (m_max_size == 0) {
            return;
        }
        m_tracks.emplace_back(std::move(track));
        trim();
    }

    std::optional <queue_track> play_history::pop() {
        if (m_tracks.empty()) {
            return std::nullopt;
        }
        auto track = std::move(m_tracks.back());
        m_tracks.pop_back();
        return track;
    }

    const queue_track* play_history::peek() const {
        return m_tracks.empty() ? nullptr : &m_tracks.back();
    }

    std::vector <queue_track> play_history::get_all() const {
        return {m_tracks.begin(), m_tracks.end()};
    }

    void play_history::clear() {
        m_tracks.clear();
    }

    void play_history::set_max_size(std::size_t max_size) {
        m_max_size = max_size;
        trim();
    }

    void play_history::trim() {
        while (m_tracks.size() > m_max_size) {
            m_tracks.pop_front();
        }
    }
}
