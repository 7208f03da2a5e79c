#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace funnel::audio {

/// One outbound frame: mono PCM16 samples at `sample_rate`.
struct AudioFrame {
    std::vector<int16_t> samples;
    int sample_rate = 0;
};

/// round(clamp(s, -1, 1) * 32767) per sample. Throws FunnelError(EncodingFailure) on NaN/inf.
std::vector<int16_t> float_to_pcm16(const float* samples, size_t count);

/// Little-endian byte image of `samples`, the binary wire format.
std::string to_le_bytes(const std::vector<int16_t>& samples);

/// Normalized loudness in [0, 1]: RMS -> dBFS, mapped from [-50, -10] dB, then ^2.5.
float normalized_level(const int16_t* samples, size_t count);

} // namespace funnel::audio
