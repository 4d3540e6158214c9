/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef WAVETONE_HAL_ALSA_DRIVER_HPP
#define WAVETONE_HAL_ALSA_DRIVER_HPP

#include "../AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <vector>
#include <thread>
#include <string>

namespace wavetone::hal {

/**
 * @brief ALSA implementation for Linux.
 *
 * The callback renders mono. If the hardware refuses a single channel the
 * mono signal is duplicated to every channel the device negotiated.
 * Samples are written as S32_LE, or S16_LE when S32 is unavailable.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels.
     * @param device ALSA device name.
     */
    AlsaDriver(int sample_rate = 44100, int block_size = 512, int num_channels = 1, const std::string& device = "default");
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    void set_callback(AudioCallback callback) override;
    bool failed() const override { return failed_; }
    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const override { return num_channels_; }

    /**
     * @brief Convert a mono float block to interleaved integer PCM.
     *
     * Samples are clamped to [-1, 1] and written to every channel.
     * dst must hold mono.size() * channels frames of the given format.
     */
    static void convert_block(std::span<const float> mono, int channels,
                              snd_pcm_format_t format, uint8_t* dst);

private:
    void thread_loop();
    bool setup_pcm();
    bool recover_pcm(int err);
    bool write_block();
    void close_pcm();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    snd_pcm_format_t format_;
    size_t frame_bytes_;
    AudioCallback callback_;
    std::atomic<bool> running_;
    std::atomic<bool> failed_;
    std::thread processing_thread_;

    // Internal buffers
    std::vector<float> mono_buffer_;
    std::vector<uint8_t> interleaved_buffer_;
};

} // namespace wavetone::hal

#endif // WAVETONE_HAL_ALSA_DRIVER_HPP
