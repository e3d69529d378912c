#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <unistd.h>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace {

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

std::string format_time(const Timestamp& t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm local_tm{};
    localtime_r(&tt, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %X");
    return ss.str();
}

std::string format_size(int64_t bytes) {
    if (bytes <= 0) return "-";
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return ss.str();
}

} // namespace

CLI::CLI(JobService& service, DownloadManager& manager, ProgressHub& hub)
    : service_(service),
      manager_(manager),
      hub_(hub),
      signals_(io_, SIGINT, SIGTERM),
      running_(false) {
    subscription_ = hub_.subscribe([this](const std::string& message) { on_progress(message); });
}

CLI::~CLI() {
    hub_.unsubscribe(subscription_);
}

void CLI::run() {
    running_ = true;
    print_help();

    signals_.async_wait([this](const asio::error_code& ec, int signo) {
        if (ec) return;
        LOG_INFO("Received signal ", signo, ", shutting down");
        stop();
    });

    // Duplicate so closing the descriptor leaves the process's stdin alone.
    int input_fd = ::dup(STDIN_FILENO);
    if (input_fd < 0) {
        LOG_WARN("Cannot duplicate stdin, reading it directly");
    } else {
        try {
            input_ = std::make_unique<asio::posix::stream_descriptor>(io_, input_fd);
        } catch (const asio::system_error& e) {
            // Regular files cannot be registered with epoll.
            LOG_DEBUG("stdin is not pollable (", e.what(), "), reading it directly");
            ::close(input_fd);
            input_.reset();
        }
    }

    if (!input_) {
        run_blocking();
        return;
    }

    prompt();
    read_next_line();
    io_.run();
}

void CLI::run_blocking() {
    std::thread signal_thread([this] { io_.run(); });

    std::string line;
    prompt();
    while (running_ && std::getline(std::cin, line)) {
        if (!handle_command(line)) break;
        prompt();
    }
    stop();
    if (signal_thread.joinable()) signal_thread.join();
}

void CLI::stop() {
    running_ = false;
    io_.stop();
}

void CLI::read_next_line() {
    asio::async_read_until(*input_, input_buffer_, '\n',
        [this](const asio::error_code& ec, size_t) {
            if (ec) {
                // EOF on stdin behaves like quit.
                if (ec != asio::error::operation_aborted) stop();
                return;
            }
            std::istream is(&input_buffer_);
            std::string line;
            std::getline(is, line);

            if (!handle_command(line)) {
                stop();
                return;
            }
            prompt();
            read_next_line();
        });
}

void CLI::prompt() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "> " << std::flush;
}

void CLI::print_help() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "Available commands:\n"
              << "  add <name> <version> <arch> <url> [checksum_url [checksum_type]] [--edition E]\n"
              << "                          - Queue a new image download\n"
              << "  list                    - List all downloads\n"
              << "  status <id>             - Show one download in detail\n"
              << "  cancel <id>             - Cancel a running download\n"
              << "  retry <id>              - Retry a failed download\n"
              << "  delete <id>             - Delete a download and its files\n"
              << "  help                    - Show this help\n"
              << "  quit / exit             - Exit\n"
              << "Ids may be abbreviated to any unique prefix. Quote names containing spaces.\n"
              << std::endl;
}

bool CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if (cmd.empty()) return true;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> std::quoted(arg)) args.push_back(arg);

    try {
        if (cmd == "add") cmd_add(args);
        else if (cmd == "list" || cmd == "ls") cmd_list(args);
        else if (cmd == "status") cmd_status(args);
        else if (cmd == "cancel") cmd_cancel(args);
        else if (cmd == "retry") cmd_retry(args);
        else if (cmd == "delete" || cmd == "rm") cmd_delete(args);
        else if (cmd == "help") print_help();
        else if (cmd == "quit" || cmd == "exit") return false;
        else std::cout << "Unknown command: " << cmd << std::endl;
    } catch (const AlreadyExistsError& e) {
        std::cout << "Error: " << e.what() << " (id " << e.existing_id() << ")" << std::endl;
    } catch (const IsofetchError& e) {
        std::cout << "Error: " << e.what() << std::endl;
    }
    return true;
}

void CLI::cmd_add(const std::vector<std::string>& args) {
    CreateJobRequest request;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--edition") {
            if (i + 1 >= args.size()) {
                std::cout << "Usage: --edition <edition>" << std::endl;
                return;
            }
            request.edition = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() < 4 || positional.size() > 6) {
        std::cout << "Usage: add <name> <version> <arch> <url> [checksum_url [checksum_type]] [--edition E]"
                  << std::endl;
        return;
    }

    request.name = positional[0];
    request.version = positional[1];
    request.arch = positional[2];
    request.download_url = positional[3];
    if (positional.size() > 4) request.checksum_url = positional[4];
    if (positional.size() > 5) request.checksum_type = positional[5];

    Job job = service_.create(request);
    std::cout << "Queued " << job.filename << "\n"
              << "ID: " << job.id << "\n"
              << "Path: " << job.download_link << std::endl;
}

void CLI::cmd_list(const std::vector<std::string>&) {
    auto jobs = service_.list();
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (jobs.empty()) {
        std::cout << "No downloads." << std::endl;
        return;
    }
    std::cout << std::left << std::setw(10) << "ID" << std::setw(13) << "STATUS"
              << std::setw(6) << "PCT" << std::setw(11) << "SIZE" << "FILE" << std::endl;
    for (const auto& job : jobs) {
        std::cout << std::left << std::setw(10) << short_id(job.id)
                  << std::setw(13) << to_string(job.status)
                  << std::setw(6) << (std::to_string(job.progress) + "%")
                  << std::setw(11) << format_size(job.size_bytes)
                  << job.filename << std::endl;
    }
    std::cout << manager_.active_count() << " active, " << manager_.queued_count() << " queued"
              << std::endl;
}

void CLI::cmd_status(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: status <id>" << std::endl;
        return;
    }
    auto job = service_.get(resolve_id(args[0]));
    if (!job) {
        std::cout << "Job not found: " << args[0] << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "ID:        " << job->id << "\n"
              << "Name:      " << job->name << " " << job->version
              << (job->edition.empty() ? "" : " " + job->edition) << " (" << job->arch << ")\n"
              << "File:      " << job->file_path << "\n"
              << "Link:      " << job->download_link << "\n"
              << "Source:    " << job->download_url << "\n";
    if (!job->checksum_url.empty()) {
        std::cout << "Checksum:  " << job->checksum_type << " from " << job->checksum_url << "\n";
    }
    if (!job->checksum.empty()) {
        std::cout << "Verified:  " << job->checksum << "\n";
    }
    std::cout << "Status:    " << to_string(job->status) << " (" << job->progress << "%)"
              << (manager_.is_active(job->id) ? ", running" : "") << "\n"
              << "Size:      " << format_size(job->size_bytes) << "\n"
              << "Created:   " << format_time(job->created_at) << "\n";
    if (job->completed_at) {
        std::cout << "Completed: " << format_time(*job->completed_at) << "\n";
    }
    if (!job->error_message.empty()) {
        std::cout << "Error:     " << job->error_message << "\n";
    }
    std::cout << std::flush;
}

void CLI::cmd_cancel(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: cancel <id>" << std::endl;
        return;
    }
    std::string id = resolve_id(args[0]);
    if (service_.cancel(id)) {
        std::cout << "Cancelling " << short_id(id) << std::endl;
    } else {
        std::cout << "No running download with id " << args[0] << std::endl;
    }
}

void CLI::cmd_retry(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: retry <id>" << std::endl;
        return;
    }
    Job job = service_.retry(resolve_id(args[0]));
    std::cout << "Re-queued " << job.filename << std::endl;
}

void CLI::cmd_delete(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: delete <id>" << std::endl;
        return;
    }
    std::string id = resolve_id(args[0]);
    service_.remove(id);
    std::cout << "Deleted " << short_id(id) << std::endl;
}

std::string CLI::resolve_id(const std::string& id_or_prefix) {
    if (service_.get(id_or_prefix)) return id_or_prefix;

    std::string match;
    for (const auto& job : service_.list()) {
        if (job.id.rfind(id_or_prefix, 0) != 0) continue;
        if (!match.empty()) {
            throw ValidationError("ambiguous id prefix: " + id_or_prefix);
        }
        match = job.id;
    }
    return match.empty() ? id_or_prefix : match;
}

void CLI::on_progress(const std::string& message) {
    json event = json::parse(message, nullptr, false);
    if (event.is_discarded() || !event.contains("payload")) return;

    const auto& payload = event["payload"];
    std::string id = payload.value("id", "");
    std::string status = payload.value("status", "");
    int progress = payload.value("progress", 0);

    std::lock_guard<std::mutex> lock(output_mutex_);
    auto& last = last_shown_[id];
    // Status changes always; downloading progress in steps of 10%.
    bool changed = last.first != status;
    bool stepped = status == "downloading" && progress / 10 != last.second / 10;
    if (!changed && !stepped) return;
    last = {status, progress};

    std::cout << "\n[" << short_id(id) << "] " << status << " " << progress << "%" << std::endl;
    if (status == "complete" || status == "failed") {
        last_shown_.erase(id);
    }
}
