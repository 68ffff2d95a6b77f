#ifndef BURSTPACK_CONFIG_HPP
#define BURSTPACK_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "logger.hpp"

enum class ArchiveCompression {
    DEFLATE,
    STORE
};

struct Config {
    std::string archive_name = "Monitor.zip";
    std::filesystem::path work_root = "./temp";

    std::chrono::milliseconds quiet_period{3000};
    std::chrono::milliseconds download_timeout{120000};
    std::chrono::milliseconds max_drain_wait{30000};
    std::chrono::milliseconds drain_poll_interval{200};

    // 0 disables splitting.
    uint64_t archive_size_limit_bytes = 48ull * 1024 * 1024;
    ArchiveCompression compression = ArchiveCompression::DEFLATE;

    bool eager_download = true;
    unsigned worker_threads = 4;

    // Local transport
    std::filesystem::path media_root = "./media";
    std::filesystem::path outbox_dir = "./outbox";
    uint64_t max_media_bytes = 20ull * 1024 * 1024;

    std::string log_file = "logs/burstpack.log";
    LogLevel log_level = LogLevel::INFO;
};

class ConfigLoader {
public:
    // The default path for the configuration file.
    static constexpr const char* DEFAULT_CONFIG_FILE = "burstpack.json";

    /**
     * @brief Loads the configuration from a JSON file.
     *
     * A missing file yields the defaults. Keys that are absent keep their
     * default value; unknown keys are ignored.
     *
     * @param path The JSON file to read.
     * @return The validated configuration.
     * @throws ConfigError on malformed JSON, a wrongly typed value or a value out of range.
     */
    static Config load(const std::filesystem::path& path);

    /**
     * @brief Parses a configuration from JSON text.
     * @throws ConfigError as load() does.
     */
    static Config parse(const std::string& json_text);

    // Checks the cross-field rules and creates work_root.
    static void validate(const Config& config);
};

#endif // BURSTPACK_CONFIG_HPP
