/**
 * @file TonePlayer.hpp
 * @brief Binds a SampleSource to an audio driver for a bounded playback.
 */

#ifndef WAVETONE_CORE_TONE_PLAYER_HPP
#define WAVETONE_CORE_TONE_PLAYER_HPP

#include <chrono>
#include <memory>
#include "../dsp/SampleSource.hpp"
#include "../hal/AudioDriver.hpp"

namespace wavetone {

/**
 * @brief Owns the output stream for the lifetime of one playback.
 *
 * The driver is acquired at construction and released in the destructor,
 * so the device is closed on every exit path. The source is borrowed and
 * must outlive the player.
 */
class TonePlayer {
public:
    /**
     * @throws std::invalid_argument if driver is null or the source is not mono.
     */
    TonePlayer(std::unique_ptr<hal::AudioDriver> driver, SampleSource& source);
    ~TonePlayer();

    TonePlayer(const TonePlayer&) = delete;
    TonePlayer& operator=(const TonePlayer&) = delete;

    /**
     * @brief Start pulling from the source on the driver's thread.
     *
     * @throws std::runtime_error if the device cannot be opened.
     */
    void start();

    void stop();

    bool is_playing() const { return playing_; }

    /**
     * @brief start(), block for the given wall-clock duration, stop().
     *
     * Real-time log entries are drained to stdout while waiting.
     *
     * @throws std::runtime_error if the device cannot be opened or fails
     *         while playing; the device is released before the throw.
     */
    void play_for(std::chrono::milliseconds duration);

    hal::AudioDriver& driver() { return *driver_; }

private:
    void throw_if_failed();

    std::unique_ptr<hal::AudioDriver> driver_;
    SampleSource& source_;
    bool playing_;
};

} // namespace wavetone

#endif // WAVETONE_CORE_TONE_PLAYER_HPP
