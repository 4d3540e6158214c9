/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio hardware drivers.
 *
 * Hardware/OS audio code is kept strictly separate from the DSP code; the
 * only thing crossing the boundary is a block of float samples.
 */

#ifndef WAVETONE_HAL_AUDIO_DRIVER_HPP
#define WAVETONE_HAL_AUDIO_DRIVER_HPP

#include <functional>
#include <span>

namespace wavetone::hal {

/**
 * @brief Abstract base class for audio hardware drivers.
 */
class AudioDriver {
public:
    /**
     * @brief Callback function type for mono audio processing.
     *
     * Called on the driver's processing thread; must be RT-safe.
     */
    using AudioCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and start the processing thread.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop processing and release the device. Safe to call twice.
     */
    virtual void stop() = 0;

    /**
     * @brief True once the device hit an error it could not recover from.
     *
     * The processing thread has stopped by then; the caller should stop()
     * and report. Cleared by the next successful start().
     */
    virtual bool failed() const = 0;

    /**
     * @brief Set the mono processing callback. Call before start().
     */
    virtual void set_callback(AudioCallback callback) = 0;

    /**
     * @brief Get the current sample rate.
     *
     * Before start() this is the requested rate, afterwards the rate the
     * hardware accepted.
     *
     * @return int Sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Get the current block size (buffer size).
     *
     * @return int Number of frames per block.
     */
    virtual int block_size() const = 0;

    /**
     * @brief Get the number of hardware channels.
     */
    virtual int channels() const = 0;
};

} // namespace wavetone::hal

#endif // WAVETONE_HAL_AUDIO_DRIVER_HPP
