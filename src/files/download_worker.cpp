#include "files/download_worker.hpp"
#include "files/file_utils.hpp"
#include "crypto/checksum_parser.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <thread>
#include <vector>

namespace {

// Removes the scratch file on every exit path. After a successful rename
// there is nothing left to remove.
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        if (fs::exists(path_, ec)) {
            fs::remove(path_, ec);
            if (ec) LOG_WARN("Failed to remove temp file ", path_.string(), ": ", ec.message());
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

private:
    fs::path path_;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string cancellation_message(const CancellationToken& token) {
    return token.reason() == CancelReason::kShutdown ? CancelReason::kShutdown
                                                     : CancelReason::kCancelled;
}

} // namespace

DownloadWorker::DownloadWorker(JobStore& store, HttpTransport& transport, fs::path isos_dir,
                               DownloadConfig config, HttpConfig http_config,
                               std::shared_ptr<ProgressSink> sink)
    : store_(store),
      transport_(transport),
      isos_dir_(std::move(isos_dir)),
      config_(std::move(config)),
      http_config_(std::move(http_config)),
      sink_(std::move(sink)) {}

bool DownloadWorker::process(Job& job, const CancellationToken& token) {
    const fs::path tmp_file = FileUtils::temp_path(isos_dir_, job);
    const fs::path final_file = FileUtils::final_path(isos_dir_, job);

    try {
        FileUtils::ensure_directory(tmp_file.parent_path());
        FileUtils::ensure_directory(final_file.parent_path());
    } catch (const fs::filesystem_error& e) {
        fail(job, std::string("failed to create directory: ") + e.what());
        return false;
    }

    TempFileGuard guard(tmp_file);
    std::string checksum_text;

    set_status(job, JobStatus::Downloading, 0);
    LOG_INFO("Downloading ", job.filename, " from ", job.download_url);

    try {
        download(job, tmp_file, token);

        if (!job.checksum_url.empty()) {
            set_status(job, JobStatus::Verifying, 100);
            checksum_text = verify(job, tmp_file, token);
        }

        // Past this point a cancel() is refused and the job is published.
        if (!token.try_commit()) {
            throw CancelledError(token.reason());
        }

        std::error_code ec;
        fs::rename(tmp_file, final_file, ec);
        if (ec) {
            throw std::runtime_error("failed to move file to final location: " + ec.message());
        }
    } catch (const CancelledError&) {
        fail(job, cancellation_message(token));
        return false;
    } catch (const std::exception& e) {
        // A read aborted by cancel() surfaces as a transport error.
        if (token.is_cancelled()) {
            fail(job, cancellation_message(token));
        } else {
            fail(job, e.what());
        }
        return false;
    }

    if (!checksum_text.empty()) {
        write_sidecar(job, final_file, checksum_text);
    }

    job.status = JobStatus::Complete;
    job.progress = 100;
    job.error_message.clear();
    job.completed_at = std::chrono::system_clock::now();
    persist_terminal(job);
    notify(job);

    LOG_INFO("Download complete: ", job.filename, " (", job.size_bytes, " bytes)");
    return true;
}

void DownloadWorker::download(Job& job, const fs::path& dest, const CancellationToken& token) {
    try {
        Url::parse(job.download_url);
    } catch (const HttpError& e) {
        throw std::runtime_error(std::string("failed to create request: ") + e.what());
    }

    std::unique_ptr<HttpResponse> response;
    try {
        response = transport_.get(job.download_url, token);
    } catch (const HttpError& e) {
        throw std::runtime_error(std::string("download error: ") + e.what());
    }

    if (!response->ok()) {
        throw std::runtime_error("download failed with status: " + response->status_line());
    }

    std::optional<uint64_t> total = response->content_length();
    if (total && *total > 0 && job.size_bytes == 0) {
        job.size_bytes = static_cast<int64_t>(*total);
        store_.update_size(job.id, job.size_bytes);
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to write to file: cannot open " + dest.string() + ": " +
                                 std::strerror(errno));
    }

    std::vector<char> buffer(std::max<size_t>(config_.buffer_size, 1));
    uint64_t downloaded = 0;
    int last_percent = 0;
    auto last_emit = std::chrono::steady_clock::now();

    while (true) {
        token.throw_if_cancelled();

        size_t n = 0;
        try {
            n = response->read_some(buffer.data(), buffer.size());
        } catch (const HttpError& e) {
            throw std::runtime_error(std::string("download error: ") + e.what());
        }
        if (n == 0) break;

        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error(std::string("failed to write to file: ") + std::strerror(errno));
        }
        downloaded += n;

        int percent = 0;
        if (total && *total > 0) {
            percent = static_cast<int>(std::min<uint64_t>(downloaded * 100 / *total, 100));
        }

        auto now = std::chrono::steady_clock::now();
        if (percent >= last_percent + config_.progress_percent_threshold ||
            now - last_emit >= config_.progress_interval) {
            set_status(job, JobStatus::Downloading, percent);
            last_percent = percent;
            last_emit = now;
        }
    }

    out.close();
    if (out.fail()) {
        throw std::runtime_error(std::string("failed to write to file: ") + std::strerror(errno));
    }
    LOG_DEBUG("Job ", job.id, " received ", downloaded, " bytes");
}

std::string DownloadWorker::verify(Job& job, const fs::path& file, const CancellationToken& token) {
    ChecksumAlgorithm algorithm = Hasher::parse_algorithm(job.checksum_type);

    // Bounded by its own deadline, but still torn down by cancel() or shutdown.
    CancellationToken fetch_token = token.with_timeout(config_.checksum_timeout);

    std::string listing;
    std::string expected;
    try {
        listing = transport_.fetch_text(job.checksum_url, fetch_token, http_config_.max_checksum_bytes);
        expected = ChecksumParser::find_checksum(listing, job.original_filename());
    } catch (const CancelledError& e) {
        token.throw_if_cancelled();
        throw std::runtime_error(std::string("failed to fetch checksum: ") + e.what());
    } catch (const IsofetchError& e) {
        throw std::runtime_error(std::string("failed to fetch checksum: ") + e.what());
    }

    std::string actual;
    try {
        actual = Hasher::file_digest(file, algorithm, token);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string("failed to compute checksum: ") + e.what());
    }

    if (to_lower(actual) != to_lower(expected)) {
        throw ChecksumMismatchError(expected, actual);
    }

    job.checksum = actual;
    store_.update_checksum(job.id, actual);
    LOG_INFO("Checksum verified for ", job.filename, " (", job.checksum_type, ")");
    return listing;
}

void DownloadWorker::write_sidecar(const Job& job, const fs::path& final_path,
                                   const std::string& text) {
    fs::path sidecar = FileUtils::sidecar_path(final_path, job.checksum_type);
    std::ofstream out(sidecar, std::ios::binary | std::ios::trunc);
    out << text;
    out.close();
    if (out.fail()) {
        LOG_WARN("Failed to save checksum file for ", job.id, ": ", sidecar.string());
    }
}

void DownloadWorker::set_status(Job& job, JobStatus status, int progress) {
    job.status = status;
    job.progress = progress;
    store_.update_progress(job.id, progress, status);
    notify(job);
}

void DownloadWorker::fail(Job& job, const std::string& message) {
    job.status = JobStatus::Failed;
    job.error_message = message;
    persist_terminal(job);
    notify(job);
    LOG_WARN("Download failed for ", job.filename, " [", job.id, "]: ", message);
}

bool DownloadWorker::persist_terminal(const Job& job) {
    const int attempts = std::max(1, config_.max_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (store_.update_job(job)) return true;
        if (attempt < attempts) {
            std::this_thread::sleep_for(config_.retry_delay);
        }
    }
    LOG_ERR("Failed to record ", to_string(job.status), " for job ", job.id, " after ",
            attempts, " attempts");
    return false;
}

void DownloadWorker::notify(const Job& job) {
    if (sink_) sink_->notify(job.id, job.progress, job.status);
}
