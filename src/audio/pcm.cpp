#include "audio/pcm.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace funnel::audio {

namespace {
constexpr float kMinDb = -50.0f;
constexpr float kMaxDb = -10.0f;
constexpr float kLevelCurve = 2.5f;
constexpr double kMaxAmplitude = 32768.0;
} // namespace

std::vector<int16_t> float_to_pcm16(const float* samples, size_t count) {
    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; ++i) {
        float s = samples[i];
        if (!std::isfinite(s)) {
            throw FunnelError(ErrorCode::EncodingFailure,
                              "non-finite sample at index " + std::to_string(i));
        }
        s = std::clamp(s, -1.0f, 1.0f);
        out[i] = static_cast<int16_t>(std::lround(s * 32767.0f));
    }
    return out;
}

std::string to_le_bytes(const std::vector<int16_t>& samples) {
    std::string bytes(samples.size() * 2, '\0');
    for (size_t i = 0; i < samples.size(); ++i) {
        auto v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
    }
    return bytes;
}

float normalized_level(const int16_t* samples, size_t count) {
    if (count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double v = samples[i];
        sum += v * v;
    }
    double rms = std::sqrt(sum / static_cast<double>(count));
    if (rms <= 0.0) return 0.0f;

    auto db = static_cast<float>(20.0 * std::log10(rms / kMaxAmplitude));
    float normalized = std::clamp((db - kMinDb) / (kMaxDb - kMinDb), 0.0f, 1.0f);
    return std::pow(normalized, kLevelCurve);
}

} // namespace funnel::audio
