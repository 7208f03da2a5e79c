/**
 * Funnel relay - HTTP/WebSocket front end
 *
 * Routes:
 *   WS   /recordings/{id}/stream        - config frame, then PCM16 audio; transcript events back
 *   POST /recordings/{id}/done          - finalize handshake, returns the assembled transcript
 *   GET  /recordings/{id}               - session diagnostics
 *   GET  /api/metadata                  - project metadata from funnel.toml
 *   GET  /health                        - health check
 *
 * The /api/recordings/... aliases map to the same handlers.
 */

#include "relay/relay_server.hpp"
#include "relay/stream_handler.hpp"

#include <iostream>

namespace funnel::relay {

namespace {

void fill_json(crow::response& res, int status, const json& body) {
    res.code = status;
    res.set_header("Content-Type", "application/json");
    res.add_header("Access-Control-Allow-Origin", "*");
    res.body = body.dump();
}

crow::response json_response(int status, const json& body) {
    crow::response res;
    fill_json(res, status, body);
    return res;
}

crow::response error_response(const FunnelError& e, const std::string& session_id) {
    json body = {
        {"error", to_string(e.code())},
        {"message", e.what()},
        {"recordingId", session_id}
    };
    return json_response(http_status_for(e.code()), body);
}

void fill_preflight(crow::response& res) {
    res.code = 200;
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.add_header("Access-Control-Allow-Headers", "Content-Type");
}

crow::response cors_preflight() {
    crow::response res;
    fill_preflight(res);
    return res;
}

} // namespace

RelayServer::RelayServer(RelayConfig cfg, std::shared_ptr<BackendConnector> connector, std::string toml_path)
    : cfg_(std::move(cfg)),
      toml_path_(std::move(toml_path)),
      registry_(std::move(connector), FinalizeOptions{cfg_.finalize_timeout, 0.5}, cfg_.session_retention) {
    register_routes();
}

RelayServer::~RelayServer() {
    stop_reaper();
    wait_for_finalizers();
}

void RelayServer::run() {
    reaper_ = std::thread(&RelayServer::reaper_loop, this);
    print_banner();

    app_.port(static_cast<uint16_t>(cfg_.port)).bindaddr(cfg_.host);
    if (cfg_.threads > 0) {
        app_.concurrency(static_cast<uint16_t>(cfg_.threads));
    } else {
        app_.multithreaded();
    }
    app_.run();

    stop_reaper();
    wait_for_finalizers();
    registry_.shutdown();
}

void RelayServer::stop() {
    app_.stop();
}

void RelayServer::wait_until_ready() {
    app_.wait_for_server_start();
}

// ============================================================================
// ROUTES
// ============================================================================

void RelayServer::register_routes() {
    StreamLimits limits{cfg_.min_sample_rate, cfg_.max_sample_rate};

    // ========================================================================
    // WS /recordings/{id}/stream - one recording session per connection
    // ========================================================================
    auto on_accept = [](const crow::request& req, void** userdata) -> bool {
        auto id = session_id_from_stream_path(req.url);
        if (!id) {
            std::cout << "[relay] refusing WebSocket upgrade for " << req.url << std::endl;
            return false;
        }
        *userdata = new std::string(*id);
        return true;
    };

    auto on_open = [this, limits](crow::websocket::connection& conn) {
        auto* id = static_cast<std::string*>(conn.userdata());
        if (!id) {
            conn.close("missing session id");
            return;
        }

        auto* handler = new StreamHandler(
            registry_, limits, *id,
            [&conn](const std::string& frame) { conn.send_text(frame); },
            [&conn](const std::string& reason) { conn.close(reason); });
        delete id;
        conn.userdata(handler);
        handler->on_open();
    };

    auto on_message = [](crow::websocket::connection& conn, const std::string& msg, bool is_binary) {
        auto* handler = static_cast<StreamHandler*>(conn.userdata());
        if (!handler) return;
        if (is_binary) {
            handler->on_binary(msg);
        } else {
            handler->on_text(msg);
        }
    };

    auto on_close = [](crow::websocket::connection& conn, const std::string& reason) {
        auto* handler = static_cast<StreamHandler*>(conn.userdata());
        if (!handler) return;
        handler->on_close(reason);
        delete handler;
        conn.userdata(nullptr);
    };

    CROW_ROUTE(app_, "/recordings/<string>/stream")
        .websocket()
        .onaccept(on_accept)
        .onopen(on_open)
        .onmessage(on_message)
        .onclose(on_close);

    CROW_ROUTE(app_, "/api/recordings/<string>/stream")
        .websocket()
        .onaccept(on_accept)
        .onopen(on_open)
        .onmessage(on_message)
        .onclose(on_close);

    // ========================================================================
    // POST /recordings/{id}/done - finalize handshake
    // ========================================================================
    CROW_ROUTE(app_, "/recordings/<string>/done").methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
    ([this](const crow::request& req, crow::response& res, std::string id) {
        finalize_route(req, res, id);
    });

    CROW_ROUTE(app_, "/api/recordings/<string>/done").methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
    ([this](const crow::request& req, crow::response& res, std::string id) {
        finalize_route(req, res, id);
    });

    // ========================================================================
    // GET /recordings/{id} - session diagnostics
    // ========================================================================
    CROW_ROUTE(app_, "/recordings/<string>").methods(crow::HTTPMethod::GET)
    ([this](std::string id) {
        return snapshot_route(id);
    });

    // ========================================================================
    // GET /api/metadata - Project metadata from funnel.toml
    // ========================================================================
    CROW_ROUTE(app_, "/api/metadata").methods(crow::HTTPMethod::GET, crow::HTTPMethod::OPTIONS)
    ([this](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) {
            return cors_preflight();
        }

        try {
            return json_response(200, load_metadata(toml_path_));
        } catch (const std::exception& e) {
            std::cerr << "[relay] error reading metadata: " << e.what() << std::endl;
            json body = {
                {"error", "INTERNAL_SERVER_ERROR"},
                {"message", std::string("Failed to read metadata from ") + toml_path_ + ": " + e.what()}
            };
            return json_response(500, body);
        }
    });

    // ========================================================================
    // GET /health - Health check
    // ========================================================================
    CROW_ROUTE(app_, "/health").methods(crow::HTTPMethod::GET)
    ([this](const crow::request&) {
        json body = {
            {"status", "ok"},
            {"service", "funnel-relay"},
            {"activeSessions", registry_.size()}
        };
        return json_response(200, body);
    });
}

void RelayServer::finalize_route(const crow::request& req, crow::response& res, const std::string& session_id) {
    if (req.method == crow::HTTPMethod::OPTIONS) {
        fill_preflight(res);
        res.end();
        return;
    }

    std::optional<uint64_t> expected_audio_bytes;
    try {
        expected_audio_bytes = parse_finalize_request(req.body);
    } catch (const FunnelError& e) {
        std::cerr << "[relay] finalize " << session_id << ": " << e.what() << std::endl;
        json body = {{"error", to_string(e.code())}, {"message", e.what()}, {"recordingId", session_id}};
        fill_json(res, http_status_for(e.code()), body);
        res.end();
        return;
    }

    std::cout << "[relay] finalize requested for session " << session_id;
    if (expected_audio_bytes) std::cout << " (client streamed " << *expected_audio_bytes << " bytes)";
    std::cout << std::endl;

    {
        std::lock_guard<std::mutex> lock(finalize_mutex_);
        finalizers_++;
    }
    std::thread([this, &res, session_id, expected_audio_bytes] {
        crow::response result = run_finalize(session_id, expected_audio_bytes);
        res.code = result.code;
        res.headers = std::move(result.headers);
        res.body = std::move(result.body);
        res.end();

        std::lock_guard<std::mutex> lock(finalize_mutex_);
        finalizers_--;
        finalize_cv_.notify_all();
    }).detach();
}

crow::response RelayServer::run_finalize(const std::string& session_id, std::optional<uint64_t> expected_audio_bytes) {
    try {
        AssembledTranscript result = registry_.finalize(session_id, expected_audio_bytes);
        return json_response(200, result);
    } catch (const FunnelError& e) {
        std::cerr << "[relay] finalize " << session_id << " failed (" << to_string(e.code())
                  << "): " << e.what() << std::endl;
        return error_response(e, session_id);
    } catch (const std::exception& e) {
        std::cerr << "[relay] finalize " << session_id << " failed: " << e.what() << std::endl;
        return json_response(500, {{"error", "INTERNAL_SERVER_ERROR"}, {"message", e.what()},
                                   {"recordingId", session_id}});
    }
}

void RelayServer::wait_for_finalizers() {
    std::unique_lock<std::mutex> lock(finalize_mutex_);
    finalize_cv_.wait(lock, [this] { return finalizers_ == 0; });
}

crow::response RelayServer::snapshot_route(const std::string& session_id) {
    try {
        return json_response(200, registry_.get(session_id)->snapshot());
    } catch (const FunnelError& e) {
        return error_response(e, session_id);
    }
}

// ============================================================================
// RETENTION
// ============================================================================

void RelayServer::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!reaper_stop_) {
        reaper_cv_.wait_for(lock, cfg_.reaper_interval, [this] { return reaper_stop_; });
        if (reaper_stop_) break;

        lock.unlock();
        try {
            registry_.evict_expired();
        } catch (const std::exception& e) {
            std::cerr << "[relay] reaper: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

void RelayServer::stop_reaper() {
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        reaper_stop_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
}

void RelayServer::print_banner() const {
    std::cout << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Funnel relay running at http://" << cfg_.host << ":" << cfg_.port << std::endl;
    std::cout << std::endl;
    std::cout << "  WS   /recordings/{id}/stream" << std::endl;
    std::cout << "  POST /recordings/{id}/done" << std::endl;
    std::cout << "  GET  /recordings/{id}" << std::endl;
    std::cout << "  GET  /api/metadata" << std::endl;
    std::cout << "  GET  /health" << std::endl;
    std::cout << std::endl;
    std::cout << "Backend: wss://" << cfg_.deepgram_host << " model=" << cfg_.deepgram_model
              << " language=" << cfg_.deepgram_language << std::endl;
    std::cout << "Finalize timeout: " << cfg_.finalize_timeout.count() << "ms, retention: "
              << cfg_.session_retention.count() << "ms" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::endl;
}

} // namespace funnel::relay
