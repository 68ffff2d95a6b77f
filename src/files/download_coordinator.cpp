#include "files/download_coordinator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "files/file_naming.hpp"
#include <filesystem>

DownloadCoordinator::DownloadCoordinator(Transport& transport, std::chrono::milliseconds download_timeout)
    : transport_(transport), download_timeout_(download_timeout) {}

bool DownloadCoordinator::download_item(SessionState& session, const MediaItem& item) {
    if (!session.claim_download(item.sequence)) {
        return false;
    }
    fetch_claimed(session, item);
    return true;
}

void DownloadCoordinator::fetch_claimed(SessionState& session, const MediaItem& item) {
    if (session.closed()) {
        session.finish_download(item.sequence, std::string("Session closed"));
        return;
    }

    fs::path target_path = session.local_path(item);
    std::optional<std::string> error;
    try {
        transport_.fetch(item, target_path, download_timeout_);
        LOG_INFO("Downloaded item ", item.sequence, " for user_id=", session.user_id(), " to ", target_path.filename());
    } catch (const DownloadError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        // Filesystem errors and the like count as a failed download too.
        error = std::string("Unexpected fetch failure: ") + e.what();
    }

    if (error) {
        LOG_WARN("Failed to download ref=", item.ref, " for user_id=", session.user_id(), ": ", *error);
        std::error_code ec;
        fs::remove(target_path, ec);
    }
    session.finish_download(item.sequence, error);
}

std::optional<DownloadOutcome> DownloadCoordinator::collect(SessionState& session, const std::vector<MediaItem>& items,
                                                            uint64_t epoch) {
    DownloadOutcome outcome;
    // Names are handed out over the archived files only, so a failed item
    // never pushes a later one onto a suffixed name.
    FileNaming::NameAllocator names;

    for (const auto& item : items) {
        if (!session.is_current(epoch)) {
            return std::nullopt;
        }

        DownloadSlot slot = session.download_slot(item.sequence);
        if (slot.state == DownloadState::NOT_STARTED) {
            download_item(session, item);
            slot = session.download_slot(item.sequence);
        }

        switch (slot.state) {
            case DownloadState::DONE:
                outcome.files.push_back({session.local_path(item), names.allocate(item.display_name, item.extension),
                                         item.display_name});
                break;
            case DownloadState::FAILED:
                outcome.failed.push_back({item, slot.error});
                break;
            case DownloadState::IN_FLIGHT:
                LOG_WARN("Item ", item.sequence, " for user_id=", session.user_id(),
                         " still downloading after the drain wait, handing it back");
                outcome.failed.push_back({item, "Download still in progress"});
                break;
            case DownloadState::NOT_STARTED:
                outcome.failed.push_back({item, "Download never started"});
                break;
        }
    }

    LOG_DEBUG("Collected ", outcome.files.size(), " files and ", outcome.failed.size(),
              " failures for user_id=", session.user_id());
    return outcome;
}
