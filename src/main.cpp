#include <iostream>
#include <memory>
#include <string>

#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "files/download_manager.hpp"
#include "files/file_utils.hpp"
#include "files/progress_hub.hpp"
#include "network/http_client.hpp"
#include "service/job_service.hpp"
#include "storage/storage_manager.hpp"

void print_usage() {
    std::cout << "Usage: isofetch [--config <path>]\n"
              << "Options:\n"
              << "  --config <path>   JSON configuration file (environment variables override it)\n"
              << "  --help            Show this message\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            print_usage();
            return 1;
        }
    }

    Config config;
    try {
        config = Config::load(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    // Initialize Logger
    Logger::instance().init(config.log.file);
    Logger::instance().set_level(parse_log_level(config.log.level));
    Logger::instance().set_console(config.log.console);
    LOG_INFO("Starting isofetch (data: ", config.data_dir, ")");

    try {
        FileUtils::ensure_directory(config.isos_dir());
        FileUtils::ensure_directory(config.tmp_dir());

        // 1. Setup Storage
        StorageManager storage_manager(config.db_path().string(), config.database);
        if (!storage_manager.is_open()) {
            LOG_ERR("Cannot continue without a database");
            return 1;
        }

        // 2. Progress fan-out
        auto hub = std::make_shared<ProgressHub>(config.progress.buffer_size);

        // 3. Dispatcher and worker pool
        DownloadManager manager(storage_manager, std::make_shared<AsioHttpTransport>(config.http),
                                config);
        manager.set_progress_sink(hub);

        JobService service(storage_manager, manager, config.isos_dir());
        service.recover_interrupted();

        manager.start();

        CLI cli(service, manager, *hub);
        cli.run();

        std::cout << "\nShutting down..." << std::endl;
        manager.shutdown();
        hub->stop();
    } catch (const std::exception& e) {
        LOG_ERR("Fatal Error: ", e.what());
        return 1;
    }

    LOG_INFO("isofetch stopped");
    return 0;
}
