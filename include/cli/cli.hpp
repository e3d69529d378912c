#ifndef ISOFETCH_CLI_HPP
#define ISOFETCH_CLI_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "../files/download_manager.hpp"
#include "../files/progress_hub.hpp"
#include "../service/job_service.hpp"

// Interactive front end. Reads commands from stdin and prints progress
// events from the hub. SIGINT and SIGTERM end run() like `quit` does.
class CLI {
public:
    CLI(JobService& service, DownloadManager& manager, ProgressHub& hub);
    ~CLI();

    void run();
    void stop();

    // Executes one command line. Returns false once the CLI should exit.
    bool handle_command(const std::string& line);

private:
    void print_help();
    void prompt();
    void read_next_line();
    void run_blocking();
    void on_progress(const std::string& message);

    void cmd_add(const std::vector<std::string>& args);
    void cmd_list(const std::vector<std::string>& args);
    void cmd_status(const std::vector<std::string>& args);
    void cmd_cancel(const std::vector<std::string>& args);
    void cmd_retry(const std::vector<std::string>& args);
    void cmd_delete(const std::vector<std::string>& args);

    // Accepts a full id or a unique prefix of one.
    std::string resolve_id(const std::string& id_or_prefix);

    JobService& service_;
    DownloadManager& manager_;
    ProgressHub& hub_;
    ProgressHub::SubscriptionId subscription_;

    asio::io_context io_;
    asio::signal_set signals_;
    std::unique_ptr<asio::posix::stream_descriptor> input_;
    asio::streambuf input_buffer_;
    std::atomic<bool> running_;

    std::mutex output_mutex_;
    // Last status/progress printed per job, to keep the console readable.
    std::map<std::string, std::pair<std::string, int>> last_shown_;
};

#endif // ISOFETCH_CLI_HPP
