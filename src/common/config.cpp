#include "common/config.hpp"
#include "common/errors.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    std::string lowercase(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    template<typename T>
    T read_value(const json& j, const char* key, T fallback) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return fallback;
        try {
            return it->get<T>();
        } catch (const json::exception& e) {
            throw ConfigError(std::string("Invalid value for ") + key + ": " + e.what());
        }
    }

    std::chrono::milliseconds read_millis(const json& j, const char* key, std::chrono::milliseconds fallback,
                                          bool allow_zero) {
        int64_t value = read_value<int64_t>(j, key, fallback.count());
        if (value < 0 || (!allow_zero && value == 0)) {
            throw ConfigError(std::string(key) + (allow_zero ? " must not be negative" : " must be greater than zero"));
        }
        return std::chrono::milliseconds(value);
    }
}

void from_json(const json& j, Config& c) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    c.archive_name = read_value<std::string>(j, "archive_name", c.archive_name);
    c.work_root = read_value<std::string>(j, "work_root", c.work_root.string());

    c.quiet_period = read_millis(j, "quiet_period_ms", c.quiet_period, false);
    c.download_timeout = read_millis(j, "download_timeout_ms", c.download_timeout, false);
    c.max_drain_wait = read_millis(j, "max_drain_wait_ms", c.max_drain_wait, true);
    c.drain_poll_interval = read_millis(j, "drain_poll_interval_ms", c.drain_poll_interval, false);

    double limit_mb = read_value<double>(j, "archive_size_limit_mb",
                                         static_cast<double>(c.archive_size_limit_bytes) / (1024.0 * 1024.0));
    if (limit_mb < 0) {
        throw ConfigError("archive_size_limit_mb must not be negative");
    }
    if (limit_mb > static_cast<double>(std::numeric_limits<uint64_t>::max() / (1024 * 1024))) {
        throw ConfigError("archive_size_limit_mb is too large");
    }
    c.archive_size_limit_bytes = static_cast<uint64_t>(limit_mb * 1024 * 1024);

    std::string compression = lowercase(read_value<std::string>(j, "archive_compression", "deflate"));
    if (compression == "deflate") {
        c.compression = ArchiveCompression::DEFLATE;
    } else if (compression == "store") {
        c.compression = ArchiveCompression::STORE;
    } else {
        throw ConfigError("archive_compression must be 'deflate' or 'store', got: " + compression);
    }

    c.eager_download = read_value<bool>(j, "eager_download", c.eager_download);

    int64_t threads = read_value<int64_t>(j, "worker_threads", c.worker_threads);
    if (threads <= 0) {
        throw ConfigError("worker_threads must be greater than zero");
    }
    c.worker_threads = static_cast<unsigned>(threads);

    c.media_root = read_value<std::string>(j, "media_root", c.media_root.string());
    c.outbox_dir = read_value<std::string>(j, "outbox_dir", c.outbox_dir.string());

    int64_t max_media = read_value<int64_t>(j, "max_media_bytes", static_cast<int64_t>(c.max_media_bytes));
    if (max_media <= 0) {
        throw ConfigError("max_media_bytes must be greater than zero");
    }
    c.max_media_bytes = static_cast<uint64_t>(max_media);

    c.log_file = read_value<std::string>(j, "log_file", c.log_file);
    std::string level = read_value<std::string>(j, "log_level", "INFO");
    auto parsed = parse_log_level(level);
    if (!parsed) {
        throw ConfigError("Unknown log_level: " + level);
    }
    c.log_level = *parsed;
}

Config ConfigLoader::parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Could not parse configuration: ") + e.what());
    }

    Config config;
    from_json(j, config);
    return config;
}

Config ConfigLoader::load(const fs::path& path) {
    Config config;
    std::ifstream read_file(path);
    if (!read_file.is_open()) {
        LOG_INFO("No configuration file at ", path, ", using defaults.");
    } else {
        std::stringstream buffer;
        buffer << read_file.rdbuf();
        std::string text = buffer.str();
        if (text.find_first_not_of(" \t\r\n") != std::string::npos) {
            config = parse(text);
        }
    }
    validate(config);
    return config;
}

void ConfigLoader::validate(const Config& config) {
    if (config.archive_name.empty() || !ends_with(lowercase(config.archive_name), ".zip")) {
        throw ConfigError("archive_name must end with .zip");
    }
    if (fs::path(config.archive_name).has_parent_path()) {
        throw ConfigError("archive_name must be a plain file name: " + config.archive_name);
    }
    if (config.work_root.empty()) {
        throw ConfigError("work_root is required");
    }

    std::error_code ec;
    fs::create_directories(config.work_root, ec);
    if (ec) {
        throw ConfigError("Cannot create work_root " + config.work_root.string() + ": " + ec.message());
    }
}
