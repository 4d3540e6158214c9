/**
 * @file ToneConfig.hpp
 * @brief Compiled-in tone parameters with JSON round trip for logging.
 */

#ifndef WAVETONE_CORE_TONE_CONFIG_HPP
#define WAVETONE_CORE_TONE_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace wavetone {

using json = nlohmann::json;

/**
 * @brief Everything the player needs to know about the tone and the device.
 */
struct ToneConfig {
    // One day; keeps the millisecond conversion in main well inside long long
    static constexpr double MAX_DURATION_SECONDS = 86400.0;

    int version = 1;
    int sample_rate = 44100;
    int table_length = 64;
    double frequency = 30.0;
    double duration_seconds = 5.0;
    std::string device = "default";
    int block_size = 512;

    /**
     * @brief Reject values the oscillator or driver cannot work with.
     *
     * @throws std::invalid_argument naming the first offending field.
     */
    void validate() const;

    // JSON conversion
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ToneConfig, version, sample_rate, table_length,
                                   frequency, duration_seconds, device, block_size)

    /**
     * @brief Convert to an indented JSON string.
     */
    std::string serialize() const {
        json j = *this;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate a JSON document.
     *
     * The program itself runs on the compiled-in defaults; this is the entry
     * point for tests and for checking a config dumped by serialize().
     * Missing keys keep their defaults.
     *
     * @throws std::invalid_argument on malformed JSON, wrong types or
     *         invalid values.
     */
    static ToneConfig from_json_string(const std::string& data);
};

} // namespace wavetone

#endif // WAVETONE_CORE_TONE_CONFIG_HPP
