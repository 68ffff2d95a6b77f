#ifndef BURSTPACK_DOWNLOAD_COORDINATOR_HPP
#define BURSTPACK_DOWNLOAD_COORDINATOR_HPP

#include "archive_builder.hpp"
#include "../session/session_state.hpp"
#include "../transport/transport.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct FailedItem {
    MediaItem item;
    std::string reason;
};

struct DownloadOutcome {
    std::vector<DownloadedFile> files;  // arrival order
    std::vector<FailedItem> failed;     // arrival order
};

class DownloadCoordinator {
public:
    DownloadCoordinator(Transport& transport, std::chrono::milliseconds download_timeout);

    // Fetches one item into the session's download directory. Does nothing
    // and returns false if the item was already claimed by someone else.
    // A failed fetch is recorded on the session, never thrown.
    bool download_item(SessionState& session, const MediaItem& item);

    // Fetches an item the caller already claimed with claim_download.
    // Skips the fetch if the session was closed in the meantime.
    void fetch_claimed(SessionState& session, const MediaItem& item);

    // Gathers the result of every item, in arrival order, and gives each
    // downloaded file its unique name inside the archive. Items nobody has
    // started yet are fetched now, one after the other; results of earlier
    // downloads (eager, or from a superseded run) are reused. Items still in
    // flight are reported as failed. Returns nullopt as soon as the session
    // is no longer at epoch.
    std::optional<DownloadOutcome> collect(SessionState& session, const std::vector<MediaItem>& items,
                                           uint64_t epoch);

private:
    Transport& transport_;
    std::chrono::milliseconds download_timeout_;
};

#endif //BURSTPACK_DOWNLOAD_COORDINATOR_HPP
