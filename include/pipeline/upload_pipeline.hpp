#ifndef BURSTPACK_UPLOAD_PIPELINE_HPP
#define BURSTPACK_UPLOAD_PIPELINE_HPP

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../common/config.hpp"
#include "../files/archive_builder.hpp"
#include "../files/download_coordinator.hpp"
#include "../session/debounce_scheduler.hpp"
#include "../session/session_registry.hpp"
#include "../transport/transport.hpp"

// What one delivered burst looked like.
struct FinalizeReport {
    UserId user_id = 0;
    uint64_t epoch = 0;
    size_t archived_files = 0;
    size_t failed_items = 0;
    size_t total_volumes = 0;
    size_t delivered_volumes = 0;
    bool empty_result = false;
    bool archive_failed = false;
};

/**
 * @brief Upload aggregation: queue items per user, wait for the burst to go
 * quiet, download, archive, split and deliver.
 *
 * Timers run on one io_context thread; downloads, archive builds and
 * deliveries run on a worker pool.
 */
class UploadPipeline {
public:
    static constexpr const char* FAILED_ITEMS_TEXT = "These files could not be downloaded, send them separately:";
    static constexpr const char* EMPTY_RESULT_TEXT = "Could not download any file. Please send the messages again.";
    static constexpr const char* ARCHIVE_FAILED_TEXT = "Could not build the archive. Please send the files again.";

    UploadPipeline(const Config& config, Transport& transport);
    ~UploadPipeline();

    UploadPipeline(const UploadPipeline&) = delete;
    UploadPipeline& operator=(const UploadPipeline&) = delete;

    void start();
    // Drops every live session and joins all threads. Pending bursts are lost.
    void stop();

    // Queues one item for the user and (re)starts the quiet period.
    MediaItem submit(UserId user_id, const Destination& destination, const IncomingMedia& media);

    // The user declined the burst.
    bool discard(UserId user_id);

    std::vector<SessionSummary> sessions() const { return registry_.snapshot(); }

    // Waits until no session is live and no task is queued. False on timeout.
    bool wait_idle(std::chrono::milliseconds max_wait);

    // Observer for finished bursts, called on a worker thread.
    void set_on_finalized(std::function<void(const FinalizeReport&)> callback);

    const DebounceScheduler& scheduler() const { return scheduler_; }

private:
    void finalize(const std::shared_ptr<SessionState>& session, uint64_t epoch);
    void deliver_results(const std::shared_ptr<SessionState>& session, const DownloadOutcome& outcome,
                         const std::vector<ArchiveVolume>& volumes, FinalizeReport& report);
    void send_text(const Destination& destination, const std::string& text);
    void post_task(std::function<void()> task);

    Config config_;
    Transport& transport_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread io_thread_;
    std::unique_ptr<asio::thread_pool> workers_;

    SessionRegistry registry_;
    DownloadCoordinator coordinator_;
    ArchiveBuilder builder_;
    DebounceScheduler scheduler_;

    std::atomic<size_t> pending_tasks_{0};
    std::atomic<uint64_t> run_counter_{0};
    std::atomic<bool> running_{false};

    std::mutex observer_mutex_;
    std::function<void(const FinalizeReport&)> on_finalized_;
};

#endif //BURSTPACK_UPLOAD_PIPELINE_HPP
