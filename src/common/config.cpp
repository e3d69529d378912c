#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* env_value(const char* key) {
    const char* value = std::getenv(key);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

void env_string(const char* key, std::string& out) {
    if (const char* value = env_value(key)) out = value;
}

template <typename Int>
void env_int(const char* key, Int& out) {
    const char* value = env_value(key);
    if (!value) return;
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) throw std::out_of_range("negative");
        out = static_cast<Int>(parsed);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring invalid value for ", key, ": '", value, "'");
    }
}

void env_ms(const char* key, std::chrono::milliseconds& out) {
    long long ms = out.count();
    env_int(key, ms);
    out = std::chrono::milliseconds(ms);
}

void env_bool(const char* key, bool& out) {
    const char* value = env_value(key);
    if (!value) return;
    std::string v = value;
    if (v == "1" || v == "true" || v == "yes") out = true;
    else if (v == "0" || v == "false" || v == "no") out = false;
    else LOG_WARN("Ignoring invalid value for ", key, ": '", v, "'");
}

template <typename T>
void json_get(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

void json_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
        out = std::chrono::milliseconds(it->get<long long>());
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config config;
    if (!path.empty()) {
        std::ifstream file(path);
        if (file.is_open()) {
            std::stringstream ss;
            ss << file.rdbuf();
            config.merge_json(ss.str());
            LOG_INFO("Loaded configuration from ", path);
        } else {
            LOG_WARN("Config file ", path, " not found, using defaults");
        }
    }
    config.apply_env();
    return config;
}

void Config::merge_json(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("failed to parse config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("failed to parse config: top-level value must be an object");
    }

    try {
        json_get(root, "data_dir", data_dir);

        if (auto it = root.find("download"); it != root.end() && it->is_object()) {
            const json& d = *it;
            json_get(d, "worker_count", download.worker_count);
            json_get(d, "queue_buffer", download.queue_buffer);
            json_get(d, "buffer_size", download.buffer_size);
            json_get(d, "max_retries", download.max_retries);
            json_ms(d, "retry_delay_ms", download.retry_delay);
            json_ms(d, "progress_interval_ms", download.progress_interval);
            json_get(d, "progress_percent_threshold", download.progress_percent_threshold);
            json_ms(d, "checksum_timeout_ms", download.checksum_timeout);
            json_ms(d, "shutdown_grace_ms", download.shutdown_grace);
        }
        if (auto it = root.find("database"); it != root.end() && it->is_object()) {
            json_get(*it, "path", database.path);
            json_ms(*it, "busy_timeout_ms", database.busy_timeout);
            json_get(*it, "journal_mode", database.journal_mode);
        }
        if (auto it = root.find("http"); it != root.end() && it->is_object()) {
            json_get(*it, "verify_tls", http.verify_tls);
            json_get(*it, "max_redirects", http.max_redirects);
            json_get(*it, "user_agent", http.user_agent);
            json_get(*it, "max_checksum_bytes", http.max_checksum_bytes);
        }
        if (auto it = root.find("progress"); it != root.end() && it->is_object()) {
            json_get(*it, "buffer_size", progress.buffer_size);
        }
        if (auto it = root.find("log"); it != root.end() && it->is_object()) {
            json_get(*it, "level", log.level);
            json_get(*it, "file", log.file);
            json_get(*it, "console", log.console);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
}

void Config::apply_env() {
    env_string("DATA_DIR", data_dir);

    env_int("WORKER_COUNT", download.worker_count);
    env_int("QUEUE_BUFFER", download.queue_buffer);
    env_int("BUFFER_SIZE", download.buffer_size);
    env_int("MAX_RETRIES", download.max_retries);
    env_ms("RETRY_DELAY_MS", download.retry_delay);
    env_ms("PROGRESS_UPDATE_INTERVAL_MS", download.progress_interval);
    env_int("PROGRESS_PERCENT_THRESHOLD", download.progress_percent_threshold);
    env_ms("CHECKSUM_TIMEOUT_MS", download.checksum_timeout);
    env_ms("SHUTDOWN_GRACE_MS", download.shutdown_grace);

    env_string("DB_PATH", database.path);
    env_ms("DB_BUSY_TIMEOUT_MS", database.busy_timeout);
    env_string("DB_JOURNAL_MODE", database.journal_mode);

    env_bool("VERIFY_TLS", http.verify_tls);
    env_int("PROGRESS_BUFFER", progress.buffer_size);

    env_string("LOG_LEVEL", log.level);
    env_string("LOG_FILE", log.file);

    if (download.worker_count == 0) {
        LOG_WARN("worker_count must be at least 1, using 1");
        download.worker_count = 1;
    }
    if (download.buffer_size == 0) {
        download.buffer_size = 32 * 1024;
    }
}

fs::path Config::isos_dir() const {
    return fs::path(data_dir) / "isos";
}

fs::path Config::tmp_dir() const {
    return isos_dir() / ".tmp";
}

fs::path Config::db_path() const {
    if (!database.path.empty()) return database.path;
    return fs::path(data_dir) / "db" / "isos.db";
}
