#include "TonePlayer.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace wavetone {

TonePlayer::TonePlayer(std::unique_ptr<hal::AudioDriver> driver, SampleSource& source)
    : driver_(std::move(driver))
    , source_(source)
    , playing_(false)
{
    if (!driver_) {
        throw std::invalid_argument("[TonePlayer] audio driver is null");
    }
    if (source_.channels() != 1) {
        throw std::invalid_argument("[TonePlayer] only mono sources are supported, got " +
                                    std::to_string(source_.channels()) + " channels");
    }
}

TonePlayer::~TonePlayer() {
    stop();
}

void TonePlayer::start() {
    if (playing_) return;

    SampleSource* source = &source_;
    driver_->set_callback([source](std::span<float> output) {
        source->pull(output);
    });

    if (!driver_->start()) {
        throw std::runtime_error("[TonePlayer] Failed to start audio driver");
    }
    playing_ = true;

    std::cout << "[TonePlayer] Audio: " << driver_->sample_rate() << " Hz, "
              << driver_->channels() << " channel(s), "
              << driver_->block_size() << " frames/block" << std::endl;

    if (driver_->sample_rate() != source_.sample_rate()) {
        std::cerr << "[TonePlayer] Warning: device runs at " << driver_->sample_rate()
                  << " Hz but the source was built for " << source_.sample_rate()
                  << " Hz; pitch will be shifted" << std::endl;
    }
}

void TonePlayer::stop() {
    if (!playing_) return;
    driver_->stop();
    playing_ = false;
    AudioLogger::instance().flush();
}

void TonePlayer::play_for(std::chrono::milliseconds duration) {
    start();

    auto start_time = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start_time < duration) {
        auto remaining = duration - std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(100)));
        AudioLogger::instance().flush();
        throw_if_failed();
    }

    stop();
    throw_if_failed();
}

void TonePlayer::throw_if_failed() {
    if (!driver_->failed()) return;

    // Releases the device and prints the driver's own account of the error
    stop();
    throw std::runtime_error("[TonePlayer] Audio device failed during playback");
}

} // namespace wavetone
