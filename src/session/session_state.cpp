#include "session/session_state.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

SessionState::SessionState(UserId user_id, Destination destination, fs::path download_dir)
    : user_id_(user_id),
      destination_(std::move(destination)),
      download_dir_(std::move(download_dir)),
      last_activity_(std::chrono::steady_clock::now()) {}

SessionState::~SessionState() {
    remove_download_dir();
}

Destination SessionState::destination() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destination_;
}

void SessionState::cancel_pending_locked() {
    if (!pending_run_) return;
    RunState state = pending_run_->state();
    if (state == RunState::ARMED || state == RunState::DRAINING) {
        pending_run_->cancel();
    }
    pending_run_.reset();
}

std::optional<MediaItem> SessionState::append(const IncomingMedia& media, const Destination& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }

    cancel_pending_locked();

    MediaItem item;
    item.ref = media.ref;
    item.caption = media.caption;
    item.mime_type = media.mime_type;
    item.file_name = media.file_name;
    item.sequence = next_sequence_++;

    bool has_caption = media.caption &&
        std::any_of(media.caption->begin(), media.caption->end(),
                    [](unsigned char c) { return !std::isspace(c); });
    item.display_name = has_caption ? *media.caption : FileNaming::default_display_name(item.sequence);
    item.extension = FileNaming::resolve_extension(media.file_name, media.mime_type);

    items_.push_back(item);
    downloads_[item.sequence] = DownloadSlot{};
    epoch_ = item.sequence;
    last_activity_ = std::chrono::steady_clock::now();
    destination_ = destination;
    return item;
}

bool SessionState::arm(std::shared_ptr<PendingRun> run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !run || run->epoch() != epoch_) {
        return false;
    }
    if (pending_run_ && pending_run_ != run) {
        cancel_pending_locked();
    }
    pending_run_ = std::move(run);
    return true;
}

uint64_t SessionState::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

bool SessionState::is_current(uint64_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && epoch_ == epoch;
}

bool SessionState::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::chrono::steady_clock::time_point SessionState::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

std::vector<MediaItem> SessionState::items_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

size_t SessionState::item_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

int SessionState::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

bool SessionState::claim_download(uint32_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = downloads_.find(sequence);
    if (closed_ || it == downloads_.end() || it->second.state != DownloadState::NOT_STARTED) {
        return false;
    }
    it->second.state = DownloadState::IN_FLIGHT;
    ++in_flight_;
    return true;
}

void SessionState::finish_download(uint32_t sequence, const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = downloads_.find(sequence);
    if (it == downloads_.end() || it->second.state != DownloadState::IN_FLIGHT) {
        return;
    }
    if (error) {
        it->second.state = DownloadState::FAILED;
        it->second.error = *error;
    } else {
        it->second.state = DownloadState::DONE;
    }
    --in_flight_;
}

DownloadSlot SessionState::download_slot(uint32_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = downloads_.find(sequence);
    if (it == downloads_.end()) {
        return DownloadSlot{};
    }
    return it->second;
}

ClaimResult SessionState::try_begin_finalize(uint64_t epoch, bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || epoch != epoch_) {
        return ClaimResult::STALE;
    }
    if (finalizing_) {
        return ClaimResult::BUSY;
    }
    if (in_flight_ > 0 && !force) {
        return ClaimResult::BUSY;
    }
    finalizing_ = true;
    return ClaimResult::CLAIMED;
}

void SessionState::end_finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    finalizing_ = false;
}

bool SessionState::finalizing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalizing_;
}

bool SessionState::close_if_current(uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || epoch != epoch_) {
        return false;
    }
    closed_ = true;
    cancel_pending_locked();
    return true;
}

void SessionState::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cancel_pending_locked();
    items_.clear();
}

void SessionState::remove_download_dir() {
    std::error_code ec;
    fs::remove_all(download_dir_, ec);
    if (ec) {
        LOG_WARN("Could not remove ", download_dir_, ": ", ec.message());
    }
}
