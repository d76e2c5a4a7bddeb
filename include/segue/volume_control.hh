/**
 * @file volume_control.hh
 * @brief Volume level and mute state
 * @ingroup core
 */

#ifndef SEGUE_VOLUME_CONTROL_HH
#define SEGUE_VOLUME_CONTROL_HH

#include <segue/types.hh>
#include <segue/export_segue.h>

namespace segue {

    /**
     * @class volume_control
     * @brief User-facing volume (0-100) with mute/unmute memory
     *
     * Muting snapshots the current level; unmuting restores it. The level
     * handed to the backend is effective_level(), which is 0 while muted.
     *
     * For consumers that scale samples themselves, gain_db() and
     * linear_gain() map the percent scale onto -60 dB .. 0 dB:
     * - 0%   : silence
     * - 50%  : -30 dB
     * - 80%  : -12 dB
     * - 100% :   0 dB
     */
    class SEGUE_EXPORT volume_control {
        public:
            static constexpr volume_level_t max_level = 100;
            static constexpr float min_gain_db = -60.0f;

            explicit volume_control(volume_level_t level = 80);

            /**
             * @brief Set the level, clamped to [0, 100]
             * @return The stored level
             */
            volume_level_t set_level(int level);

            [[nodiscard]] volume_level_t level() const { return m_level; }

            /**
             * @brief Mute, remembering the current level
             * @return false if already muted
             */
            bool mute();

            /**
             * @brief Unmute, restoring the remembered level
             * @return false if not muted
             */
            bool unmute();

            [[nodiscard]] bool is_muted() const { return m_muted; }

            /**
             * @brief Level remembered by the last mute()
             */
            [[nodiscard]] volume_level_t previous_level() const { return m_previous_level; }

            /**
             * @brief Level the backend should play at
             */
            [[nodiscard]] volume_level_t effective_level() const;

            /**
             * @brief Perceptual gain in dB; -infinity when silent
             */
            [[nodiscard]] float gain_db() const;

            /**
             * @brief Linear gain multiplier; 0 when silent
             */
            [[nodiscard]] float linear_gain() const;

        private:
            volume_level_t m_level;
            volume_level_t m_previous_level;
            bool m_muted = false;
    };

} // namespace segue

#endif // SEGUE_VOLUME_CONTROL_HH
