/**
 * @file main.cpp
 * @brief Plays a sustained wavetable sine tone on the default ALSA device.
 */

#include <iostream>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <utility>
#include "core/ToneConfig.hpp"
#include "core/TonePlayer.hpp"
#include "dsp/WaveTable.hpp"
#include "dsp/oscillator/WavetableOscillator.hpp"
#include "hal/alsa/AlsaDriver.hpp"

using namespace wavetone;

int main() {
    ToneConfig config;

    try {
        config.validate();
        std::cout << "--- wavetone: " << config.frequency << " Hz for "
                  << config.duration_seconds << " s ---" << std::endl;
        std::cout << config.serialize() << std::endl;

        auto table = WaveTable::sine(static_cast<size_t>(config.table_length));
        WavetableOscillator oscillator(config.sample_rate, table);
        oscillator.set_frequency(config.frequency);

        auto driver = std::make_unique<hal::AlsaDriver>(config.sample_rate, config.block_size, 1, config.device);
        TonePlayer player(std::move(driver), oscillator);

        player.play_for(std::chrono::milliseconds(static_cast<long long>(config.duration_seconds * 1000.0)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Playback error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "--- Playback Complete ---" << std::endl;
    return 0;
}
