#pragma once

#include "common/config.hpp"
#include "relay/session_registry.hpp"

#include <crow.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace funnel::relay {

// Crow application hosting the streaming, finalize and diagnostics routes on
// top of one SessionRegistry, plus the retention reaper thread.
class RelayServer {
public:
    RelayServer(RelayConfig cfg, std::shared_ptr<BackendConnector> connector,
                std::string toml_path = "funnel.toml");
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// Serves until stop() is called or the process is signalled, then waits for
    /// finalize handshakes still in flight.
    void run();
    void stop();

    /// Blocks until the listener is accepting connections.
    void wait_until_ready();

    SessionRegistry& registry() { return registry_; }

private:
    void register_routes();
    void print_banner() const;

    void finalize_route(const crow::request& req, crow::response& res, const std::string& session_id);
    crow::response run_finalize(const std::string& session_id, std::optional<uint64_t> expected_audio_bytes);
    crow::response snapshot_route(const std::string& session_id);

    void wait_for_finalizers();

    void reaper_loop();
    void stop_reaper();

    RelayConfig cfg_;
    std::string toml_path_;
    SessionRegistry registry_;
    crow::SimpleApp app_;

    // Finalize handshakes run off the io threads so one slow backend never stalls
    // the other connections served by the same worker.
    std::mutex finalize_mutex_;
    std::condition_variable finalize_cv_;
    int finalizers_ = 0;

    std::thread reaper_;
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    bool reaper_stop_ = false;
};

} // namespace funnel::relay
