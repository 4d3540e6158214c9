/**
 * @file WaveTable.hpp
 * @brief Immutable single-cycle lookup table for wavetable synthesis.
 *
 * Pre-calculates one cycle into a table; reading from memory is cheaper than
 * computing transcendental functions per sample.
 */

#ifndef WAVETONE_DSP_WAVE_TABLE_HPP
#define WAVETONE_DSP_WAVE_TABLE_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace wavetone {

/**
 * @brief One period of a periodic waveform, values in [-1.0, 1.0].
 *
 * Instances are immutable after construction and are handed around as
 * std::shared_ptr<const WaveTable> so several oscillators may read the
 * same table.
 */
class WaveTable {
public:
    /**
     * @brief Build a sine cycle: entry i = sin(2 * PI * i / length).
     *
     * @param length Number of samples per cycle. Must be > 0.
     * @throws std::invalid_argument if length is 0.
     */
    static std::shared_ptr<const WaveTable> sine(size_t length);

    size_t size() const { return samples_.size(); }

    float operator[](size_t index) const { return samples_[index]; }

    /**
     * @brief Cyclic read: index wraps modulo size().
     */
    float at_cyclic(size_t index) const { return samples_[index % samples_.size()]; }

    std::span<const float> samples() const { return samples_; }

private:
    explicit WaveTable(std::vector<float> samples);

    const std::vector<float> samples_;
};

} // namespace wavetone

#endif // WAVETONE_DSP_WAVE_TABLE_HPP
