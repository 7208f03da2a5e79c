#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace funnel {

struct RelayConfig {
    std::string deepgram_api_key;
    std::string deepgram_host = "api.deepgram.com";
    std::string deepgram_port = "443";
    std::string deepgram_model = "nova-2";
    std::string deepgram_language = "en-US";
    bool deepgram_interim_results = false;
    bool deepgram_tls = true;
    int port = 8000;
    std::string host = "0.0.0.0";
    int threads = 0; // 0 lets Crow pick one worker per core
    std::chrono::milliseconds finalize_timeout{30000};
    std::chrono::milliseconds session_retention{30000};
    std::chrono::milliseconds reaper_interval{5000};
    int min_sample_rate = 8000;
    int max_sample_rate = 48000;
};

struct ClientConfig {
    std::string relay_host = "127.0.0.1";
    std::string relay_port = "8000";
    int sample_rate = 16000;
    int chunk_ms = 100;
    std::chrono::milliseconds min_duration{500};
    std::chrono::milliseconds ready_timeout{10000};
    std::chrono::milliseconds finalize_timeout{35000};
    size_t queue_capacity = 256;
    std::string archive_path;
};

/// One KEY=value line of a .env file. Accepts an `export ` prefix, single or double
/// quotes, and a trailing ` # comment` after unquoted values. std::nullopt for blanks and comments.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line);

/// Reads a .env file and sets environment variables without overwriting existing ones.
void load_dotenv(const std::string& path = ".env");

/// Defaults, then the [relay] table of `toml_path`, then the environment.
/// Throws FunnelError(ConfigError) when DEEPGRAM_API_KEY is missing or a value is malformed.
RelayConfig load_relay_config(const std::string& toml_path = "funnel.toml");

/// Defaults, then the [client] table of `toml_path`, then the environment.
ClientConfig load_client_config(const std::string& toml_path = "funnel.toml");

/// Converts the [meta] table of `toml_path` to JSON, nested tables and arrays included.
/// Throws std::runtime_error if absent.
nlohmann::json load_metadata(const std::string& toml_path = "funnel.toml");

} // namespace funnel
