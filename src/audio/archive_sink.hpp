#pragma once

#include "audio/pcm.hpp"

#include <fstream>
#include <string>

namespace funnel::audio {

// Optional local copy of everything captured. Writes may throw; the capture
// pump isolates failures so the streaming path is never affected.
class ArchiveSink {
public:
    virtual ~ArchiveSink() = default;
    virtual void write(const AudioFrame& frame) = 0;
    virtual void close() = 0;
};

/// Appends raw PCM16LE mono samples to a file.
class RawPcmFileSink : public ArchiveSink {
public:
    explicit RawPcmFileSink(std::string path);

    void write(const AudioFrame& frame) override;
    void close() override;

    const std::string& path() const { return path_; }
    uint64_t bytes_written() const { return bytes_written_; }

private:
    std::string path_;
    std::ofstream out_;
    uint64_t bytes_written_ = 0;
};

} // namespace funnel::audio
