#include "common/config.hpp"
#include "common/errors.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

namespace funnel {

using json = nlohmann::json;

namespace {

json toml_to_json(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        json out = json::object();
        for (auto&& [key, val] : *tbl) {
            out[std::string(key.str())] = toml_to_json(val);
        }
        return out;
    }
    if (auto arr = node.as_array()) {
        json out = json::array();
        for (auto&& elem : *arr) out.push_back(toml_to_json(elem));
        return out;
    }
    if (auto s = node.as_string()) return s->get();
    if (auto i = node.as_integer()) return i->get();
    if (auto d = node.as_floating_point()) return d->get();
    if (auto b = node.as_boolean()) return b->get();

    // Dates and times keep their TOML spelling.
    std::ostringstream out;
    if (auto date = node.as_date()) out << *date;
    else if (auto time = node.as_time()) out << *time;
    else if (auto date_time = node.as_date_time()) out << *date_time;
    return out.str();
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

/// Looks a setting up in the environment first, then in one table of funnel.toml.
class SettingSource {
public:
    SettingSource(const std::string& toml_path, const char* section) {
        std::ifstream probe(toml_path);
        if (!probe.is_open()) return;
        try {
            file_ = toml::parse_file(toml_path);
        } catch (const toml::parse_error& e) {
            throw FunnelError(ErrorCode::ConfigError,
                              "failed to parse " + toml_path + ": " + std::string(e.description()));
        }
        section_ = file_[section].as_table();
    }

    std::optional<std::string> get(const char* env_key, const char* toml_key) const {
        const char* env = std::getenv(env_key);
        if (env && *env) return std::string(env);
        if (!section_) return std::nullopt;

        const toml::node* node = section_->get(toml_key);
        if (!node) return std::nullopt;
        json value = toml_to_json(*node);
        if (value.is_string()) return value.get<std::string>();
        if (value.is_structured()) {
            throw FunnelError(ErrorCode::ConfigError, std::string(toml_key) + " must be a single value");
        }
        return value.dump();
    }

private:
    toml::table file_;
    const toml::table* section_ = nullptr;
};

int parse_int(const char* key, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw FunnelError(ErrorCode::ConfigError, std::string(key) + " must be an integer, got '" + value + "'");
    }
}

bool parse_bool(const char* key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw FunnelError(ErrorCode::ConfigError, std::string(key) + " must be a boolean, got '" + value + "'");
}

void apply(const SettingSource& src, const char* env_key, const char* toml_key, std::string& out) {
    if (auto v = src.get(env_key, toml_key)) out = *v;
}

void apply(const SettingSource& src, const char* env_key, const char* toml_key, int& out) {
    if (auto v = src.get(env_key, toml_key)) out = parse_int(env_key, *v);
}

void apply(const SettingSource& src, const char* env_key, const char* toml_key, bool& out) {
    if (auto v = src.get(env_key, toml_key)) out = parse_bool(env_key, *v);
}

void apply(const SettingSource& src, const char* env_key, const char* toml_key, std::chrono::milliseconds& out) {
    if (auto v = src.get(env_key, toml_key)) {
        int ms = parse_int(env_key, *v);
        if (ms < 0) throw FunnelError(ErrorCode::ConfigError, std::string(env_key) + " must not be negative");
        out = std::chrono::milliseconds(ms);
    }
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line) {
    std::string text = trim(line);
    if (text.empty() || text[0] == '#') return std::nullopt;
    if (text.rfind("export ", 0) == 0) text = trim(text.substr(7));

    auto pos = text.find('=');
    if (pos == std::string::npos) return std::nullopt;
    std::string key = trim(text.substr(0, pos));
    std::string val = trim(text.substr(pos + 1));
    if (key.empty()) return std::nullopt;

    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
        val = val.substr(1, val.size() - 2);
    } else {
        auto comment = val.find(" #");
        if (comment != std::string::npos) val = trim(val.substr(0, comment));
    }
    return std::make_pair(key, val);
}

void load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (auto entry = parse_dotenv_line(line)) {
            setenv(entry->first.c_str(), entry->second.c_str(), 0); // Don't overwrite existing
        }
    }
}

RelayConfig load_relay_config(const std::string& toml_path) {
    load_dotenv();
    SettingSource src(toml_path, "relay");

    RelayConfig cfg;
    apply(src, "DEEPGRAM_API_KEY", "deepgram_api_key", cfg.deepgram_api_key);
    if (cfg.deepgram_api_key.empty()) {
        throw FunnelError(ErrorCode::ConfigError,
                          "DEEPGRAM_API_KEY environment variable is required. "
                          "Please copy sample.env to .env and add your API key");
    }

    apply(src, "DEEPGRAM_HOST", "deepgram_host", cfg.deepgram_host);
    apply(src, "DEEPGRAM_PORT", "deepgram_port", cfg.deepgram_port);
    apply(src, "DEEPGRAM_MODEL", "deepgram_model", cfg.deepgram_model);
    apply(src, "DEEPGRAM_LANGUAGE", "deepgram_language", cfg.deepgram_language);
    apply(src, "DEEPGRAM_INTERIM_RESULTS", "deepgram_interim_results", cfg.deepgram_interim_results);
    apply(src, "DEEPGRAM_TLS", "deepgram_tls", cfg.deepgram_tls);
    apply(src, "PORT", "port", cfg.port);
    apply(src, "HOST", "host", cfg.host);
    apply(src, "RELAY_THREADS", "threads", cfg.threads);
    apply(src, "FINALIZE_TIMEOUT_MS", "finalize_timeout_ms", cfg.finalize_timeout);
    apply(src, "SESSION_RETENTION_MS", "session_retention_ms", cfg.session_retention);
    apply(src, "REAPER_INTERVAL_MS", "reaper_interval_ms", cfg.reaper_interval);
    apply(src, "MIN_SAMPLE_RATE", "min_sample_rate", cfg.min_sample_rate);
    apply(src, "MAX_SAMPLE_RATE", "max_sample_rate", cfg.max_sample_rate);

    if (cfg.threads < 0) throw FunnelError(ErrorCode::ConfigError, "RELAY_THREADS must not be negative");
    if (cfg.min_sample_rate <= 0 || cfg.min_sample_rate > cfg.max_sample_rate) {
        throw FunnelError(ErrorCode::ConfigError, "MIN_SAMPLE_RATE must be positive and not above MAX_SAMPLE_RATE");
    }
    return cfg;
}

ClientConfig load_client_config(const std::string& toml_path) {
    load_dotenv();
    SettingSource src(toml_path, "client");

    ClientConfig cfg;
    int queue_capacity = static_cast<int>(cfg.queue_capacity);
    apply(src, "FUNNEL_RELAY_HOST", "relay_host", cfg.relay_host);
    apply(src, "FUNNEL_RELAY_PORT", "relay_port", cfg.relay_port);
    apply(src, "FUNNEL_SAMPLE_RATE", "sample_rate", cfg.sample_rate);
    apply(src, "FUNNEL_CHUNK_MS", "chunk_ms", cfg.chunk_ms);
    apply(src, "FUNNEL_MIN_DURATION_MS", "min_duration_ms", cfg.min_duration);
    apply(src, "FUNNEL_READY_TIMEOUT_MS", "ready_timeout_ms", cfg.ready_timeout);
    apply(src, "FUNNEL_FINALIZE_TIMEOUT_MS", "finalize_timeout_ms", cfg.finalize_timeout);
    apply(src, "FUNNEL_QUEUE_CAPACITY", "queue_capacity", queue_capacity);
    apply(src, "FUNNEL_ARCHIVE_PATH", "archive_path", cfg.archive_path);

    if (cfg.sample_rate <= 0) throw FunnelError(ErrorCode::ConfigError, "FUNNEL_SAMPLE_RATE must be positive");
    if (cfg.chunk_ms <= 0) throw FunnelError(ErrorCode::ConfigError, "FUNNEL_CHUNK_MS must be positive");
    if (queue_capacity <= 0) throw FunnelError(ErrorCode::ConfigError, "FUNNEL_QUEUE_CAPACITY must be positive");
    cfg.queue_capacity = static_cast<size_t>(queue_capacity);
    return cfg;
}

json load_metadata(const std::string& toml_path) {
    auto tbl = toml::parse_file(toml_path);
    auto meta_node = tbl["meta"];
    if (!meta_node.is_table()) {
        throw std::runtime_error("Missing [meta] section in " + toml_path);
    }

    return toml_to_json(*meta_node.as_table());
}

} // namespace funnel
