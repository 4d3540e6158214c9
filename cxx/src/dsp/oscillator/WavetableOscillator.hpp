/**
 * @file WavetableOscillator.hpp
 * @brief Wavetable oscillator with linear interpolation.
 *
 * Pull Model: Oscillators are source nodes, generate directly.
 */

#ifndef WAVETONE_DSP_OSCILLATOR_WAVETABLE_OSCILLATOR_HPP
#define WAVETONE_DSP_OSCILLATOR_WAVETABLE_OSCILLATOR_HPP

#include <memory>
#include "../SampleSource.hpp"
#include "../WaveTable.hpp"

namespace wavetone {

/**
 * @brief Wavetable oscillator with linear interpolation.
 *
 * Uses a phase accumulator measured in table entries and linear
 * interpolation between neighbouring entries for any playback frequency.
 * The table is shared read-only; the oscillator owns only its phase.
 */
class WavetableOscillator : public SampleSource {
public:
    /**
     * @param sample_rate Sample rate in Hz. Must be > 0.
     * @param table Single-cycle table. Must be non-null and non-empty.
     * @throws std::invalid_argument on either violation.
     */
    WavetableOscillator(int sample_rate, std::shared_ptr<const WaveTable> table);

    /**
     * @brief Set frequency in Hz (instant change, effective on next sample).
     *
     * Zero, negative (reverse playback) and above-Nyquist (aliasing)
     * frequencies are accepted; the latter logs a warning.
     *
     * @throws std::invalid_argument if freq is NaN or infinite.
     */
    void set_frequency(double freq);

    double frequency() const { return frequency_; }

    double phase_increment() const { return phase_increment_; }

    /**
     * @brief Current read position in table entries, in [0, table size).
     */
    double phase() const { return phase_; }

    /**
     * @brief Return to the start of the cycle. Frequency is kept.
     */
    void reset() { phase_ = 0.0; }

    const WaveTable& table() const { return *table_; }

    int channels() const override { return 1; }

    int sample_rate() const override { return sample_rate_; }

    float next_sample() noexcept override;

private:
    void advance() noexcept;

    const int sample_rate_;
    const std::shared_ptr<const WaveTable> table_;
    const double table_size_;
    double frequency_;
    double phase_;
    double phase_increment_;
};

} // namespace wavetone

#endif // WAVETONE_DSP_OSCILLATOR_WAVETABLE_OSCILLATOR_HPP
