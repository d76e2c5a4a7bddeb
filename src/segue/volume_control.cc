#include <segue/volume_control.hh>
#include <algorithm>
#include <cmath>
#include <limits>

namespace segue {
    volume_control::volume_control(volume_level_t level)
        : m_level(std::min(level, max_level)),
          m_previous_level(m_level) {
    }

    volume_level_t volume_control::set_level(int level) {
        m_level = static_cast <volume_level_t>(std::clamp(level, 0, static_cast <int>(max_level)));
        if (m_muted) {
            // a level chosen while muted is the one unmute() comes back to
            m_previous_level = m_level;
        }
        return m_level;
    }

    bool volume_control::mute() {
        if (m_muted) {
            return false;
        }
        m_previous_level = m_level;
        m_muted = true;
        return true;
    }

    bool volume_control::unmute() {
        if (!m_muted) {
            return false;
        }
        m_muted = false;
        m_level = m_previous_level;
        return true;
    }

    volume_level_t volume_control::effective_level() const {
        return m_muted ? 0 : m_level;
    }

    float volume_control::gain_db() const {
        const auto level = effective_level();
        if (level == 0) {
            return -std::numeric_limits <float>::infinity();
        }
        return (static_cast <float>(level) - static_cast <float>(max_level)) * (-min_gain_db / max_level);
    }

    float volume_control::linear_gain() const {
        if (effective_level() == 0) {
            return 0.0f;
        }
        return std::pow(10.0f, gain_db() / 20.0f);
    }
}
