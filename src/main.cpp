#include <iostream>
#include <string>
#include <chrono>
#include <filesystem>

#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "files/volume_splitter.hpp"
#include "pipeline/upload_pipeline.hpp"
#include "transport/local_transport.hpp"

void print_usage() {
    std::cout << "Usage: burstpack <mode> [options]\n"
              << "Modes:\n"
              << "  interactive [config.json]   - Run the upload pipeline with a CLI (default mode,\n"
              << "                                config defaults to " << ConfigLoader::DEFAULT_CONFIG_FILE << ")\n"
              << "  split <file> <max_bytes>    - Split a file into numbered parts.\n";
}

int run_interactive(const std::string& config_path) {
    Config config = ConfigLoader::load(config_path);
    Logger::instance().init(config.log_file, config.log_level);
    LOG_INFO("Starting burstpack with config ", config_path);

    LocalTransport transport(config.media_root, config.outbox_dir, config.max_media_bytes);
    UploadPipeline pipeline(config, transport);
    pipeline.start();

    std::cout << "burstpack ready. Media root: " << config.media_root.string()
              << ", outbox: " << config.outbox_dir.string() << std::endl;

    CLI cli(pipeline, config);
    cli.run();

    // Let running bursts finish: the quiet period, the drain wait and one
    // round of downloads is the longest any of them can still take.
    auto max_wait = config.quiet_period + config.max_drain_wait + config.download_timeout;
    std::cout << "Waiting for pending work..." << std::endl;
    if (!pipeline.wait_idle(max_wait)) {
        LOG_WARN("Pending work did not finish in ", max_wait.count(), "ms, dropping it");
    }
    pipeline.stop();
    return 0;
}

int run_split(const std::string& file, const std::string& max_bytes_arg) {
    Logger::instance().init(Config().log_file);
    int64_t max_bytes = std::stoll(max_bytes_arg);
    auto parts = VolumeSplitter::split(file, max_bytes);
    for (const auto& part : parts) {
        std::cout << part.string() << " (" << std::filesystem::file_size(part) << " bytes)" << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string mode = "interactive";
    if (argc > 1) {
        mode = argv[1];
    }

    try {
        if (mode == "interactive") {
            std::string config_path = argc > 2 ? argv[2] : ConfigLoader::DEFAULT_CONFIG_FILE;
            return run_interactive(config_path);
        } else if (mode == "split" && argc == 4) {
            return run_split(argv[2], argv[3]);
        } else if (argc == 2 && std::filesystem::path(mode).extension() == ".json") {
            return run_interactive(mode);
        } else {
            print_usage();
            return 1;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
