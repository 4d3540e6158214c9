/**
 * @file SampleSource.hpp
 * @brief Interface for pull model sample sources.
 *
 * Pull Model: the output device pulls from the source, one sample or one
 * block at a time.
 */

#ifndef WAVETONE_DSP_SAMPLE_SOURCE_HPP
#define WAVETONE_DSP_SAMPLE_SOURCE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>

namespace wavetone {

/**
 * @brief Interface for sources that can be pulled from (Pull Model).
 *
 * A source declares its channel count and sample rate and yields samples
 * indefinitely. Sources that cannot tell how long they are report
 * std::nullopt for frame length and duration; the consumer is then
 * responsible for time-boxing playback.
 */
class SampleSource {
public:
    virtual ~SampleSource() = default;

    virtual int channels() const = 0;

    virtual int sample_rate() const = 0;

    /**
     * @brief Produce the next sample. Must be RT-safe.
     */
    virtual float next_sample() noexcept = 0;

    /**
     * @brief Pull data from this source into output span.
     *
     * @param output Output buffer to fill (mono, block-based)
     */
    virtual void pull(std::span<float> output) noexcept {
        for (auto& sample : output) {
            sample = next_sample();
        }
    }

    /**
     * @brief Frames until the source's parameters may change, if known.
     */
    virtual std::optional<size_t> current_frame_len() const { return std::nullopt; }

    /**
     * @brief Total playback length, if known.
     */
    virtual std::optional<std::chrono::nanoseconds> total_duration() const { return std::nullopt; }
};

} // namespace wavetone

#endif // WAVETONE_DSP_SAMPLE_SOURCE_HPP
