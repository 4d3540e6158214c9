/**
 * @file WaveTable.cpp
 * @brief Wave table builders.
 */

#include "WaveTable.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace wavetone {

WaveTable::WaveTable(std::vector<float> samples)
    : samples_(std::move(samples))
{
}

std::shared_ptr<const WaveTable> WaveTable::sine(size_t length) {
    if (length == 0) {
        throw std::invalid_argument("WaveTable: table length must be greater than zero");
    }

    const double L = static_cast<double>(length);
    std::vector<float> samples(length);
    for (size_t i = 0; i < length; ++i) {
        samples[i] = static_cast<float>(std::sin(2.0 * M_PI * static_cast<double>(i) / L));
    }

    return std::shared_ptr<const WaveTable>(new WaveTable(std::move(samples)));
}

} // namespace wavetone
