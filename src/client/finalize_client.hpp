#pragma once

#include "common/errors.hpp"
#include "common/protocol.hpp"

#include <chrono>
#include <string>

namespace funnel::client {

// Issues the finalize request for a session, separately from the stream channel.
class FinalizeClient {
public:
    virtual ~FinalizeClient() = default;

    /// Blocks until the relay answers. `audio_bytes_sent` lets the relay wait for
    /// stream frames the request may have overtaken. Throws FunnelError carrying the
    /// relay's error code, or ConnectionFailure when the relay cannot be reached.
    virtual AssembledTranscript finalize(const std::string& session_id, uint64_t audio_bytes_sent) = 0;
};

/// POST /recordings/{id}/done over Boost.Beast.
class BeastFinalizeClient : public FinalizeClient {
public:
    BeastFinalizeClient(std::string host, std::string port,
                        std::chrono::milliseconds timeout = std::chrono::seconds(35));

    AssembledTranscript finalize(const std::string& session_id, uint64_t audio_bytes_sent) override;

private:
    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_;
};

/// Turns a non-2xx relay response into the FunnelError it describes.
FunnelError error_from_response(unsigned status, const std::string& body);

} // namespace funnel::client
