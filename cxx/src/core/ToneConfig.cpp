#include "ToneConfig.hpp"
#include <cmath>
#include <stdexcept>

namespace wavetone {

void ToneConfig::validate() const {
    if (sample_rate <= 0) {
        throw std::invalid_argument("[ToneConfig] sample_rate must be positive, got " +
                                    std::to_string(sample_rate));
    }
    if (table_length <= 0) {
        throw std::invalid_argument("[ToneConfig] table_length must be positive, got " +
                                    std::to_string(table_length));
    }
    if (!std::isfinite(frequency)) {
        throw std::invalid_argument("[ToneConfig] frequency must be finite");
    }
    if (!std::isfinite(duration_seconds) || duration_seconds < 0.0) {
        throw std::invalid_argument("[ToneConfig] duration_seconds must be a non-negative number");
    }
    if (duration_seconds > MAX_DURATION_SECONDS) {
        throw std::invalid_argument("[ToneConfig] duration_seconds must not exceed " +
                                    std::to_string(MAX_DURATION_SECONDS));
    }
    if (block_size <= 0) {
        throw std::invalid_argument("[ToneConfig] block_size must be positive, got " +
                                    std::to_string(block_size));
    }
    if (device.empty()) {
        throw std::invalid_argument("[ToneConfig] device name is empty");
    }
}

ToneConfig ToneConfig::from_json_string(const std::string& data) {
    ToneConfig config;
    try {
        json j = json::parse(data);
        // Overlay onto defaults so partial documents are accepted
        json merged = config;
        merged.update(j);
        config = merged.get<ToneConfig>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("[ToneConfig] ") + e.what());
    }
    config.validate();
    return config;
}

} // namespace wavetone
