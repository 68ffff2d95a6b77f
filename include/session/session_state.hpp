#ifndef BURSTPACK_SESSION_STATE_HPP
#define BURSTPACK_SESSION_STATE_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "media_item.hpp"
#include "../files/file_naming.hpp"

namespace fs = std::filesystem;

enum class RunState {
    ARMED,      // waiting out the quiet period
    DRAINING,   // waiting for in-flight downloads
    FINALIZED,  // owns the session's build step
    CANCELLED   // superseded by a newer arrival
};

// A scheduled finalize attempt, identified by the epoch it was armed with.
class PendingRun {
public:
    virtual ~PendingRun() = default;
    virtual uint64_t epoch() const = 0;
    virtual RunState state() const = 0;
    virtual void cancel() = 0;
};

enum class DownloadState {
    NOT_STARTED,
    IN_FLIGHT,
    DONE,
    FAILED
};

struct DownloadSlot {
    DownloadState state = DownloadState::NOT_STARTED;
    std::string error;
};

enum class ClaimResult {
    CLAIMED,
    BUSY,   // downloads still running, or another run holds the build step
    STALE   // epoch moved on, or the session was closed
};

/**
 * @brief Mutable record of one user's burst.
 *
 * Every member is guarded by the session's own mutex; callers never lock it
 * themselves. The epoch is the sequence number of the latest item, so any
 * arrival changes it.
 */
class SessionState {
public:
    SessionState(UserId user_id, Destination destination, fs::path download_dir);
    ~SessionState();

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    UserId user_id() const { return user_id_; }
    Destination destination() const;
    const fs::path& download_dir() const { return download_dir_; }

    // Cancels the pending run, appends the item and advances the epoch.
    // Returns nullopt when the session is already closed; the caller must
    // resolve a fresh session and try again.
    std::optional<MediaItem> append(const IncomingMedia& media, const Destination& destination);

    // Installs run as the pending run if its epoch is still current.
    bool arm(std::shared_ptr<PendingRun> run);

    uint64_t epoch() const;
    bool is_current(uint64_t epoch) const;
    bool closed() const;
    std::chrono::steady_clock::time_point last_activity() const;

    std::vector<MediaItem> items_snapshot() const;
    size_t item_count() const;
    int in_flight() const;

    // Download bookkeeping. claim_download moves a NOT_STARTED slot to
    // IN_FLIGHT and counts it; finish_download records the result.
    bool claim_download(uint32_t sequence);
    void finish_download(uint32_t sequence, const std::optional<std::string>& error);
    DownloadSlot download_slot(uint32_t sequence) const;
    // Download location. Archive names are only given out to finished downloads.
    fs::path local_path(const MediaItem& item) const {
        return download_dir_ / ("item-" + std::to_string(item.sequence) + item.extension);
    }

    // Only one run at a time may hold the build step. With force set the
    // in-flight count is ignored (drain wait exceeded).
    ClaimResult try_begin_finalize(uint64_t epoch, bool force);
    void end_finalize();
    bool finalizing() const;

    // Closes the session if epoch is still current. After this no item can
    // be appended and the pending run is cancelled.
    bool close_if_current(uint64_t epoch);

    // Cancels the pending run, drops all items and closes the session.
    void close();

    void remove_download_dir();

private:
    void cancel_pending_locked();

    const UserId user_id_;
    Destination destination_;
    const fs::path download_dir_;

    mutable std::mutex mutex_;
    std::vector<MediaItem> items_;
    std::map<uint32_t, DownloadSlot> downloads_;
    uint32_t next_sequence_ = 1;
    uint64_t epoch_ = 0;
    int in_flight_ = 0;
    bool finalizing_ = false;
    bool closed_ = false;
    std::chrono::steady_clock::time_point last_activity_;
    std::shared_ptr<PendingRun> pending_run_;
};

#endif //BURSTPACK_SESSION_STATE_HPP
