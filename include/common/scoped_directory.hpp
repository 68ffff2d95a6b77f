#ifndef BURSTPACK_SCOPED_DIRECTORY_HPP
#define BURSTPACK_SCOPED_DIRECTORY_HPP

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "logger.hpp"

// Creates a directory and removes it, with everything inside, when it goes out of scope.
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path_.string() + ": " + ec.message());
        }
    }

    ~ScopedDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Could not remove ", path_, ": ", ec.message());
        } else {
            LOG_DEBUG("Cleaned work directory ", path_);
        }
    }

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

#endif // BURSTPACK_SCOPED_DIRECTORY_HPP
