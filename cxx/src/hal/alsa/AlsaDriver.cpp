/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "../../core/Logger.hpp"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <utility>
#include <pthread.h>

namespace wavetone::hal {

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, const std::string& device)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , format_(SND_PCM_FORMAT_S32_LE)
    , frame_bytes_(0)
    , running_(false)
    , failed_(false)
{
    // Buffers will be resized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    // A thread that ended on a device failure still has to be reaped
    if (processing_thread_.joinable()) {
        stop();
    }

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    failed_ = false;
    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }

    if (pcm_handle_ && !failed_) {
        // Let queued periods play out
        snd_pcm_drain(pcm_handle_);
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;
    snd_pcm_hw_params_t* hw_params;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    // Stack allocation, released automatically on every return path
    snd_pcm_hw_params_alloca(&hw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    format_ = SND_PCM_FORMAT_S32_LE;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, format_)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, format_)) < 0) {
            std::cerr << "ALSA: Cannot set sample format (" << snd_strerror(err) << ")" << std::endl;
            return false;
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, 0)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params, &channels)) < 0) {
        std::cerr << "ALSA: Cannot set channel count (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, 0)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, 0)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using device default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    // Resize internal buffers
    mono_buffer_.assign(static_cast<size_t>(block_size_), 0.0f);
    const size_t bytes_per_sample = static_cast<size_t>(snd_pcm_format_physical_width(format_) / 8);
    frame_bytes_ = bytes_per_sample * static_cast<size_t>(num_channels_);
    interleaved_buffer_.assign(static_cast<size_t>(block_size_) * frame_bytes_, 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    return true;
}

void AlsaDriver::convert_block(std::span<const float> mono, int channels,
                               snd_pcm_format_t format, uint8_t* dst) {
    const size_t ch = static_cast<size_t>(channels);
    if (format == SND_PCM_FORMAT_S16_LE) {
        for (size_t i = 0; i < mono.size(); ++i) {
            const float sample = std::clamp(mono[i], -1.0f, 1.0f);
            const int16_t value = static_cast<int16_t>(sample * 32767.0f);
            for (size_t c = 0; c < ch; ++c) {
                std::memcpy(dst + (i * ch + c) * sizeof(int16_t), &value, sizeof(int16_t));
            }
        }
    } else {
        for (size_t i = 0; i < mono.size(); ++i) {
            const float sample = std::clamp(mono[i], -1.0f, 1.0f);
            // float cannot represent INT32_MAX; scale in double
            const int32_t value = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
            for (size_t c = 0; c < ch; ++c) {
                std::memcpy(dst + (i * ch + c) * sizeof(int32_t), &value, sizeof(int32_t));
            }
        }
    }
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        AudioLogger::instance().log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    while (running_) {
        if (!callback_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        // Kill 'zombie data' clicks if the callback leaves gaps
        std::fill(mono_buffer_.begin(), mono_buffer_.end(), 0.0f);

        auto start_time = std::chrono::steady_clock::now();

        callback_(std::span<float>(mono_buffer_));

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count();
        AudioLogger::instance().log_event("PROC_US", static_cast<float>(duration));

        convert_block(mono_buffer_, num_channels_, format_, interleaved_buffer_.data());

        if (!write_block()) {
            // Unrecoverable: stop the loop and let the owner find out via failed()
            failed_ = true;
            running_ = false;
        }
    }
}

bool AlsaDriver::write_block() {
    const uint8_t* data = interleaved_buffer_.data();
    snd_pcm_uframes_t remaining = static_cast<snd_pcm_uframes_t>(block_size_);

    // Short writes are continued, not dropped
    while (remaining > 0 && running_) {
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, data, remaining);
        if (written < 0) {
            if (!recover_pcm(static_cast<int>(written))) {
                return false;
            }
            continue;
        }
        data += static_cast<size_t>(written) * frame_bytes_;
        remaining -= static_cast<snd_pcm_uframes_t>(written);
    }
    return true;
}

bool AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        AudioLogger::instance().log_message("ALSA", "Underrun (EPIPE), re-preparing");
        if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
            AudioLogger::instance().log_message("ALSA", "Prepare after underrun failed");
            AudioLogger::instance().log_message("ALSA", snd_strerror(err));
            return false;
        }
        return true;
    }

    if (err == -ESTRPIPE) {
        AudioLogger::instance().log_message("ALSA", "Suspended (ESTRPIPE), resuming");
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0 && (err = snd_pcm_prepare(pcm_handle_)) < 0) {
            AudioLogger::instance().log_message("ALSA", "Prepare after suspend failed");
            AudioLogger::instance().log_message("ALSA", snd_strerror(err));
            return false;
        }
        return true;
    }

    AudioLogger::instance().log_message("ALSA", "Write failed, stopping playback");
    AudioLogger::instance().log_message("ALSA", snd_strerror(err));
    return false;
}

} // namespace wavetone::hal
