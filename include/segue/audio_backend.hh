/**
 * @file audio_backend.hh
 * @brief Audio output capability consumed by the transport
 * @ingroup backends
 */

#ifndef SEGUE_AUDIO_BACKEND_HH
#define SEGUE_AUDIO_BACKEND_HH

#include <exception>
#include <functional>
#include <string>
#include <segue/types.hh>
#include <segue/export_segue.h>

namespace segue {

/**
 * @class audio_backend
 * @brief Abstract interface over the component that actually makes sound
 * @ingroup backends
 *
 * The transport owns exactly one backend and is the only caller of its
 * control methods. Backends decode, output and clamp; they know nothing
 * about queues or history.
 *
 * ## Implementing a Backend
 *
 * @code
 * class my_backend : public audio_backend {
 * public:
 *     void load_track(const std::string& path, load_callback_t done) override {
 *         // open and pre-decode asynchronously, then call
 *         // done(nullptr) or done(std::make_exception_ptr(io_error(...)))
 *     }
 *
 *     void play() override { ... }
 *     // ... implement other methods
 * };
 * @endcode
 *
 * ## Threading
 *
 * Every callback (load completion, ended, time update, error) must be
 * invoked on the thread that owns the transport. A backend that produces
 * notifications on an audio thread posts them through a
 * callback_dispatcher and lets the owner drain it.
 *
 * Control methods report failures by throwing backend_error (or a class
 * derived from it).
 */
class SEGUE_EXPORT audio_backend {
public:
    /// Load completion; a null exception pointer means success
    using load_callback_t = std::function<void(std::exception_ptr)>;
    using ended_callback_t = std::function<void()>;
    /// Current position in seconds
    using time_update_callback_t = std::function<void(double)>;
    using error_callback_t = std::function<void(std::exception_ptr)>;

    virtual ~audio_backend() = default;

    /**
     * Get the name of this backend.
     * @return Backend name (e.g., "Null", "SDL3")
     */
    virtual std::string get_name() const = 0;

    // ========================================================================
    // Transport control
    // ========================================================================

    /**
     * Start loading a track.
     * @param path Resource locator from queue_track::path
     * @param on_complete Invoked once, on the owning thread, when the track
     *        is ready or failed to load
     * @throws backend_error if the request cannot even be issued
     */
    virtual void load_track(const std::string& path, load_callback_t on_complete) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;

    /**
     * Stop output and unload the current track.
     */
    virtual void stop() = 0;

    /**
     * Move the play head.
     * @param seconds Target position; the backend clamps it to the duration
     */
    virtual void seek(double seconds) = 0;

    /**
     * Set output volume.
     * @param level 0 (silent) .. 100 (full scale)
     */
    virtual void set_volume(volume_level_t level) = 0;

    // ========================================================================
    // Position
    // ========================================================================

    /**
     * @return Play head position in seconds
     */
    virtual double get_position() const = 0;

    /**
     * @return Length of the loaded track in seconds, 0 until loaded
     */
    virtual double get_duration() const = 0;

    // ========================================================================
    // Notifications (pass an empty function to detach)
    // ========================================================================

    virtual void set_ended_callback(ended_callback_t callback) = 0;
    virtual void set_time_update_callback(time_update_callback_t callback) = 0;
    virtual void set_error_callback(error_callback_t callback) = 0;
};

} // namespace segue

#endif // SEGUE_AUDIO_BACKEND_HH
