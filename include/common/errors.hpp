#ifndef BURSTPACK_ERRORS_HPP
#define BURSTPACK_ERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid or missing setting. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// One item could not be fetched (timeout, not found, size exceeded).
// Soft: the item is surfaced back to the user and the run continues.
class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& what) : std::runtime_error(what) {}
};

// One volume or notice could not be sent. Not retried.
class DeliveryError : public std::runtime_error {
public:
    explicit DeliveryError(const std::string& what) : std::runtime_error(what) {}
};

// Nothing was downloaded, so there is nothing to archive.
class EmptyResultError : public std::runtime_error {
public:
    explicit EmptyResultError(const std::string& what) : std::runtime_error(what) {}
};

// Container creation or volume split failed.
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};

#endif // BURSTPACK_ERRORS_HPP
