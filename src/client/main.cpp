/**
 * Funnel recorder - command-line client
 *
 * Records from the default microphone (or replays a WAV file), streams it to
 * the relay and prints the live and final transcript.
 *
 * Usage:
 *   funnel_record [--file path.wav] [--host H] [--port P] [--archive out.pcm] [--config funnel.toml]
 */

#include "audio/archive_sink.hpp"
#include "audio/file_playback_source.hpp"
#include "audio/portaudio_source.hpp"
#include "client/finalize_client.hpp"
#include "client/recording_state_machine.hpp"
#include "client/stream_transport.hpp"
#include "common/config.hpp"

#include <iostream>
#include <string>

using namespace funnel;

namespace {

struct Options {
    std::string config_path = "funnel.toml";
    std::string file;
    std::string host;
    std::string port;
    std::string archive;
};

void print_usage() {
    std::cerr << "usage: funnel_record [--file path.wav] [--host H] [--port P] "
                 "[--archive out.pcm] [--config funnel.toml]" << std::endl;
}

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        bool ok = true;
        if (arg == "--file") ok = next(opts.file);
        else if (arg == "--host") ok = next(opts.host);
        else if (arg == "--port") ok = next(opts.port);
        else if (arg == "--archive") ok = next(opts.archive);
        else if (arg == "--config") ok = next(opts.config_path);
        else ok = false;
        if (!ok) return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    ClientConfig cfg;
    try {
        cfg = load_client_config(opts.config_path);
    } catch (const FunnelError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (!opts.host.empty()) cfg.relay_host = opts.host;
    if (!opts.port.empty()) cfg.relay_port = opts.port;
    if (!opts.archive.empty()) cfg.archive_path = opts.archive;

    // Capture strategy is decided once, here.
    std::shared_ptr<audio::PermissionGate> permission;
    audio::AudioSourceFactory source_factory;
    double playback_seconds = 0.0;
    if (!opts.file.empty()) {
        try {
            audio::FilePlaybackSource probe(opts.file);
            probe.start();
            playback_seconds = probe.duration_seconds();
        } catch (const FunnelError& e) {
            std::cerr << "ERROR: " << e.what() << std::endl;
            return 1;
        }
        permission = std::make_shared<audio::GrantedPermission>();
        source_factory = [path = opts.file] {
            return std::make_unique<audio::FilePlaybackSource>(path, 20, true);
        };
    } else {
        permission = std::make_shared<audio::PortAudioPermissionGate>();
        source_factory = [rate = cfg.sample_rate] {
            return std::make_unique<audio::PortAudioSource>(rate);
        };
    }

    std::unique_ptr<audio::RawPcmFileSink> archive;
    if (!cfg.archive_path.empty()) {
        archive = std::make_unique<audio::RawPcmFileSink>(cfg.archive_path);
    }

    auto host = cfg.relay_host;
    auto port = cfg.relay_port;
    client::RecordingStateMachine recorder(
        cfg,
        [host, port] { return std::make_unique<client::BeastStreamTransport>(host, port); },
        std::make_shared<client::BeastFinalizeClient>(host, port, cfg.finalize_timeout),
        permission,
        source_factory,
        archive.get());

    recorder.on_state([](SessionState state) {
        std::cout << "[client] state: " << to_string(state) << std::endl;
    });
    recorder.on_transcript([](const TranscriptSegment& segment, const std::string&) {
        std::cout << (segment.is_final ? "[final]   " : "[interim] ") << segment.text << std::endl;
    });

    try {
        recorder.start();
    } catch (const FunnelError& e) {
        std::cerr << "ERROR (" << to_string(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }

    if (playback_seconds > 0.0) {
        std::cout << "Replaying " << opts.file << " (" << playback_seconds << "s)..." << std::endl;
        auto wait = std::chrono::milliseconds(static_cast<int64_t>(playback_seconds * 1000.0) + 250);
        recorder.wait_for_state(SessionState::Failed, wait);
    } else {
        std::cout << "Recording... press Enter to stop." << std::endl;
        std::string line;
        std::getline(std::cin, line);
    }

    std::optional<AssembledTranscript> result;
    try {
        result = recorder.stop();
    } catch (const FunnelError& e) {
        std::cerr << "ERROR (" << to_string(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }
    if (archive) archive->close();

    if (!result) {
        auto error = recorder.last_error();
        std::cerr << "ERROR: recording ended in state " << to_string(recorder.state())
                  << (error ? std::string(": ") + error->what() : std::string()) << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Recording " << result->session_id << std::endl;
    std::cout << "Duration: " << result->duration << "s, segments: " << result->segments.size()
              << (result->partial ? " (partial)" : "") << std::endl;
    std::cout << std::endl;
    std::cout << (result->transcript.empty() ? "(no speech detected)" : result->transcript) << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    return 0;
}
