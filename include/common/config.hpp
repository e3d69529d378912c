#ifndef ISOFETCH_CONFIG_HPP
#define ISOFETCH_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

struct DownloadConfig {
    size_t worker_count = 2;
    size_t queue_buffer = 100;
    size_t buffer_size = 32 * 1024;
    int max_retries = 5;
    std::chrono::milliseconds retry_delay{100};
    std::chrono::milliseconds progress_interval{1000};
    int progress_percent_threshold = 1;
    std::chrono::milliseconds checksum_timeout{30000};
    std::chrono::milliseconds shutdown_grace{5000};
};

struct DatabaseConfig {
    std::string path;                 // empty: <data_dir>/db/isos.db
    std::chrono::milliseconds busy_timeout{5000};
    std::string journal_mode = "WAL";
};

struct HttpConfig {
    bool verify_tls = true;
    int max_redirects = 10;
    std::string user_agent = "isofetch/1.0";
    size_t max_checksum_bytes = 1024 * 1024;
};

struct ProgressConfig {
    size_t buffer_size = 256;
};

struct LogConfig {
    std::string level = "info";
    std::string file;                 // empty: console only
    bool console = true;
};

struct Config {
    std::string data_dir = "./data";
    DownloadConfig download;
    DatabaseConfig database;
    HttpConfig http;
    ProgressConfig progress;
    LogConfig log;

    /**
     * @brief Builds the effective configuration.
     *
     * Starts from defaults, overlays the JSON file at `path` when it is
     * non-empty, then applies environment overrides (DATA_DIR, WORKER_COUNT, ...).
     * @throws ConfigError if the file exists but cannot be parsed.
     */
    static Config load(const std::string& path = "");

    // Overlays values present in a JSON document.
    void merge_json(const std::string& json_text);
    void apply_env();

    std::filesystem::path isos_dir() const;
    std::filesystem::path tmp_dir() const;
    std::filesystem::path db_path() const;
};

#endif // ISOFETCH_CONFIG_HPP
