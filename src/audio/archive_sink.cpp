#include "audio/archive_sink.hpp"

#include <stdexcept>

namespace funnel::audio {

RawPcmFileSink::RawPcmFileSink(std::string path) : path_(std::move(path)) {}

void RawPcmFileSink::write(const AudioFrame& frame) {
    if (!out_.is_open()) {
        out_.open(path_, std::ios::binary | std::ios::trunc);
        if (!out_) throw std::runtime_error("cannot open archive file " + path_);
    }
    std::string bytes = to_le_bytes(frame.samples);
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_) throw std::runtime_error("write to archive file " + path_ + " failed");
    bytes_written_ += bytes.size();
}

void RawPcmFileSink::close() {
    if (out_.is_open()) out_.close();
}

} // namespace funnel::audio
