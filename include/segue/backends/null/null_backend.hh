#ifndef SEGUE_BACKENDS_NULL_BACKEND_HH
#define SEGUE_BACKENDS_NULL_BACKEND_HH

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <segue/audio_backend.hh>
#include <segue/callback_dispatcher.hh>
#include <segue/export_segue.h>

namespace segue {

/**
 * Silent backend with a simulated clock.
 *
 * The Null backend provides:
 * - No actual audio output
 * - A play head that moves only when advance() is called
 * - Load completions, time updates and end-of-track notifications posted
 *   through a callback_dispatcher, like a backend with a real audio thread
 * - Useful for headless runs and for testing the transport
 *
 * A path loads if it was registered with add_track() or names an existing
 * file; anything else completes the load with an io_error.
 *
 * Example usage:
 * @code
 * segue::callback_dispatcher dispatcher;
 * auto backend = std::make_unique<segue::null_backend>(dispatcher);
 * auto* clock = backend.get();
 * clock->add_track("mem://intro", 30.0);
 *
 * segue::transport player(std::move(backend), {});
 * // ...
 * clock->advance(1.0);
 * dispatcher.dispatch();
 * @endcode
 */
class SEGUE_EXPORT null_backend : public audio_backend {
public:
    static constexpr double default_track_duration = 180.0;

    /**
     * @param dispatcher Queue the notifications are posted to; must outlive the backend
     * @param default_duration Duration given to files found on disk
     */
    explicit null_backend(callback_dispatcher& dispatcher,
                          double default_duration = default_track_duration);
    ~null_backend() override;

    null_backend(const null_backend&) = delete;
    null_backend& operator=(const null_backend&) = delete;

    std::string get_name() const override { return "Null"; }

    void load_track(const std::string& path, load_callback_t on_complete) override;
    void play() override;
    void pause() override;
    void stop() override;
    void seek(double seconds) override;
    void set_volume(volume_level_t level) override;

    double get_position() const override { return m_position; }
    double get_duration() const override { return m_duration; }

    void set_ended_callback(ended_callback_t callback) override;
    void set_time_update_callback(time_update_callback_t callback) override;
    void set_error_callback(error_callback_t callback) override;

    // ========================================================================
    // Simulation
    // ========================================================================

    /**
     * Register an in-memory track.
     */
    void add_track(const std::string& path, double duration);

    /**
     * Move the clock forward while playing.
     *
     * Posts a time update and, once the play head reaches the duration, an
     * end-of-track notification.
     */
    void advance(double seconds);

    /**
     * Post an asynchronous device failure.
     */
    void raise_error(const std::string& message);

    [[nodiscard]] bool is_playing() const { return m_playing; }
    [[nodiscard]] volume_level_t volume() const { return m_volume; }
    [[nodiscard]] const std::optional<std::string>& loaded_path() const { return m_loaded; }

private:
    std::optional<double> lookup_duration(const std::string& path) const;

    callback_dispatcher& m_dispatcher;
    callback_dispatcher::token_t m_token;
    double m_default_duration;
    std::map<std::string, double> m_tracks;

    std::optional<std::string> m_loaded;
    double m_position = 0.0;
    double m_duration = 0.0;
    bool m_playing = false;
    volume_level_t m_volume = 100;

    ended_callback_t m_on_ended;
    time_update_callback_t m_on_time_update;
    error_callback_t m_on_error;
};

/**
 * Create a Null backend posting to @p dispatcher.
 */
SEGUE_EXPORT std::unique_ptr<audio_backend> create_null_backend(callback_dispatcher& dispatcher);

} // namespace segue

#endif // SEGUE_BACKENDS_NULL_BACKEND_HH
