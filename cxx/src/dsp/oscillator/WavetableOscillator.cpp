/**
 * @file WavetableOscillator.cpp
 * @brief Wavetable oscillator implementation.
 */

#include "WavetableOscillator.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace wavetone {

namespace {

const WaveTable& require_table(const std::shared_ptr<const WaveTable>& table) {
    if (!table) {
        throw std::invalid_argument("WavetableOscillator: wave table is null");
    }
    if (table->size() == 0) {
        throw std::invalid_argument("WavetableOscillator: wave table is empty");
    }
    return *table;
}

} // namespace

WavetableOscillator::WavetableOscillator(int sample_rate, std::shared_ptr<const WaveTable> table)
    : sample_rate_(sample_rate)
    , table_(std::move(table))
    , table_size_(static_cast<double>(require_table(table_).size()))
    , frequency_(0.0)
    , phase_(0.0)
    , phase_increment_(0.0)
{
    if (sample_rate_ <= 0) {
        throw std::invalid_argument("WavetableOscillator: sample rate must be positive, got " +
                                    std::to_string(sample_rate_));
    }
}

void WavetableOscillator::set_frequency(double freq) {
    if (!std::isfinite(freq)) {
        throw std::invalid_argument("WavetableOscillator: frequency must be finite");
    }

    const double nyquist = static_cast<double>(sample_rate_) / 2.0;
    if (std::fabs(freq) > nyquist) {
        std::cerr << "[Oscillator] Warning: " << freq << " Hz exceeds Nyquist ("
                  << nyquist << " Hz) and will alias" << std::endl;
    }

    frequency_ = freq;
    phase_increment_ = freq * table_size_ / static_cast<double>(sample_rate_);
}

float WavetableOscillator::next_sample() noexcept {
    const WaveTable& table = *table_;

    // phase_ is in [0, size), so truncation is floor
    const size_t i0 = static_cast<size_t>(phase_);
    const size_t i1 = (i0 + 1) % table.size();
    const double w = phase_ - static_cast<double>(i0);

    const double a = table[i0];
    const double b = table[i1];
    const float sample = static_cast<float>((1.0 - w) * a + w * b);

    advance();
    return sample;
}

void WavetableOscillator::advance() noexcept {
    phase_ = std::fmod(phase_ + phase_increment_, table_size_);
    if (phase_ < 0.0) {
        phase_ += table_size_;
    }
    // -tiny + size rounds to size
    if (phase_ >= table_size_) {
        phase_ = 0.0;
    }
}

} // namespace wavetone
