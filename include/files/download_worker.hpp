#ifndef ISOFETCH_DOWNLOAD_WORKER_HPP
#define ISOFETCH_DOWNLOAD_WORKER_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "job.hpp"
#include "progress_sink.hpp"
#include "../common/cancellation.hpp"
#include "../common/config.hpp"
#include "../network/http_client.hpp"
#include "../storage/job_store.hpp"

namespace fs = std::filesystem;

// Reasons the dispatcher cancels with; the worker records them verbatim.
namespace CancelReason {
inline const std::string kCancelled = "download cancelled";
inline const std::string kShutdown = "download cancelled: shutting down";
} // namespace CancelReason

/**
 * Executes one job end to end:
 *
 *   Pending -> Downloading -> (Verifying) -> Complete | Failed
 *
 * The payload is streamed into <isos>/.tmp, optionally checked against a
 * remote checksum listing, then renamed into <isos>/<file_path>. The public
 * path therefore only ever holds complete, verified files.
 */
class DownloadWorker {
public:
    DownloadWorker(JobStore& store, HttpTransport& transport, fs::path isos_dir,
                   DownloadConfig config, HttpConfig http_config,
                   std::shared_ptr<ProgressSink> sink);

    /**
     * @brief Runs the job to a terminal state.
     *
     * Every failure, cancellation included, is recorded on the job and in the
     * store; nothing propagates to the caller.
     * @return true if the job ended Complete.
     */
    bool process(Job& job, const CancellationToken& token);

private:
    void download(Job& job, const fs::path& dest, const CancellationToken& token);
    // Returns the checksum listing so it can be stored beside the image.
    std::string verify(Job& job, const fs::path& file, const CancellationToken& token);
    void write_sidecar(const Job& job, const fs::path& final_path, const std::string& text);

    void set_status(Job& job, JobStatus status, int progress);
    void fail(Job& job, const std::string& message);
    bool persist_terminal(const Job& job);
    void notify(const Job& job);

    JobStore& store_;
    HttpTransport& transport_;
    fs::path isos_dir_;
    DownloadConfig config_;
    HttpConfig http_config_;
    std::shared_ptr<ProgressSink> sink_;
};

#endif // ISOFETCH_DOWNLOAD_WORKER_HPP
