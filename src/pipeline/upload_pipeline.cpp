#include "pipeline/upload_pipeline.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/scoped_directory.hpp"

UploadPipeline::UploadPipeline(const Config& config, Transport& transport)
    : config_(config),
      transport_(transport),
      work_guard_(asio::make_work_guard(io_context_)),
      workers_(std::make_unique<asio::thread_pool>(config.worker_threads)),
      registry_(config.work_root),
      coordinator_(transport, config.download_timeout),
      builder_(config.archive_name, config.archive_size_limit_bytes, config.compression),
      scheduler_(io_context_, config.quiet_period, config.max_drain_wait, config.drain_poll_interval,
                 [this](std::shared_ptr<SessionState> session, uint64_t epoch) {
                     post_task([this, session, epoch]() { finalize(session, epoch); });
                 }) {}

UploadPipeline::~UploadPipeline() {
    stop();
}

void UploadPipeline::start() {
    if (running_.exchange(true)) return;
    io_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            LOG_ERR("Timer thread stopped: ", e.what());
        }
    });
    LOG_INFO("Upload pipeline started with ", config_.worker_threads, " workers, quiet period ",
             config_.quiet_period.count(), "ms");
}

void UploadPipeline::stop() {
    if (!running_.exchange(false)) return;

    size_t dropped = registry_.size();
    registry_.clear();
    workers_->join();

    work_guard_.reset();
    if (io_thread_.joinable()) io_thread_.join();
    LOG_INFO("Upload pipeline stopped, ", dropped, " unfinished sessions dropped");
}

MediaItem UploadPipeline::submit(UserId user_id, const Destination& destination, const IncomingMedia& media) {
    std::shared_ptr<SessionState> session;
    std::optional<MediaItem> item;
    // A session committed between resolve and append is closed; the next
    // resolve starts a fresh one.
    while (!item) {
        session = registry_.resolve(user_id, destination);
        item = session->append(media, destination);
    }

    LOG_INFO("Queued item ", item->sequence, " (", item->display_name, item->extension, ") for user_id=", user_id);

    // Claimed here, so a queued download already counts as in flight for the drain.
    if (config_.eager_download && session->claim_download(item->sequence)) {
        MediaItem queued = *item;
        post_task([this, session, queued]() { coordinator_.fetch_claimed(*session, queued); });
    }
    scheduler_.on_arrival(session, item->sequence);
    return *item;
}

bool UploadPipeline::discard(UserId user_id) {
    bool discarded = registry_.discard(user_id);
    if (discarded) {
        LOG_INFO("Discarded session for user_id=", user_id);
    }
    return discarded;
}

bool UploadPipeline::wait_idle(std::chrono::milliseconds max_wait) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    while (registry_.size() > 0 || pending_tasks_.load() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void UploadPipeline::set_on_finalized(std::function<void(const FinalizeReport&)> callback) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    on_finalized_ = std::move(callback);
}

void UploadPipeline::post_task(std::function<void()> task) {
    ++pending_tasks_;
    asio::post(*workers_, [this, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERR("Worker task failed: ", e.what());
        }
        --pending_tasks_;
    });
}

void UploadPipeline::finalize(const std::shared_ptr<SessionState>& session, uint64_t epoch) {
    const UserId user_id = session->user_id();
    try {
        std::vector<MediaItem> items = session->items_snapshot();
        LOG_INFO("Finalizing ", items.size(), " items for user_id=", user_id, " at epoch ", epoch);

        std::optional<DownloadOutcome> outcome = coordinator_.collect(*session, items, epoch);
        if (!outcome || !session->is_current(epoch)) {
            LOG_DEBUG("Epoch ", epoch, " for user_id=", user_id, " superseded while downloading");
            session->end_finalize();
            return;
        }

        ScopedDirectory run_dir(config_.work_root /
                                ("run-" + std::to_string(user_id) + "-" + std::to_string(epoch) + "-" +
                                 std::to_string(++run_counter_)));

        FinalizeReport report;
        report.user_id = user_id;
        report.epoch = epoch;
        report.failed_items = outcome->failed.size();

        std::vector<ArchiveVolume> volumes;
        try {
            volumes = builder_.build(outcome->files, run_dir.path());
            report.archived_files = outcome->files.size();
            report.total_volumes = volumes.size();
        } catch (const EmptyResultError&) {
            report.empty_result = true;
        } catch (const ArchiveError& e) {
            LOG_ERR("Archive build failed for user_id=", user_id, ": ", e.what());
            report.archive_failed = true;
        }

        // Anything that arrived while building belongs to the next burst;
        // this run loses and its archive is thrown away with run_dir.
        if (!registry_.commit(session, epoch)) {
            LOG_DEBUG("Epoch ", epoch, " for user_id=", user_id, " superseded before delivery");
            session->end_finalize();
            return;
        }

        deliver_results(session, *outcome, volumes, report);
        session->remove_download_dir();

        LOG_INFO("Finished burst for user_id=", user_id, ": ", report.archived_files, " files in ",
                 report.delivered_volumes, "/", report.total_volumes, " volumes, ", report.failed_items, " failed");

        std::function<void(const FinalizeReport&)> observer;
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            observer = on_finalized_;
        }
        if (observer) observer(report);
    } catch (const std::exception& e) {
        LOG_ERR("Finalize failed for user_id=", user_id, ": ", e.what());
        registry_.remove(session);
        session->remove_download_dir();
    }
}

void UploadPipeline::deliver_results(const std::shared_ptr<SessionState>& session, const DownloadOutcome& outcome,
                                     const std::vector<ArchiveVolume>& volumes, FinalizeReport& report) {
    const Destination destination = session->destination();

    if (!outcome.failed.empty()) {
        send_text(destination, FAILED_ITEMS_TEXT);
        for (const auto& failed : outcome.failed) {
            try {
                transport_.notify_unprocessed(destination, failed.item);
            } catch (const DeliveryError& e) {
                LOG_ERR("Could not hand back item ", failed.item.sequence, " to ", destination, ": ", e.what());
            }
        }
    }

    if (report.empty_result) {
        send_text(destination, EMPTY_RESULT_TEXT);
        return;
    }
    if (report.archive_failed) {
        send_text(destination, ARCHIVE_FAILED_TEXT);
        return;
    }

    for (const auto& volume : volumes) {
        try {
            transport_.deliver(destination, volume);
            ++report.delivered_volumes;
            LOG_INFO("Delivered ", volume.path.filename(), " (", volume.index, "/", volume.total, ", ",
                     volume.size_bytes, " bytes) to ", destination);
        } catch (const DeliveryError& e) {
            LOG_ERR("Delivery of volume ", volume.index, "/", volume.total, " to ", destination,
                    " failed: ", e.what());
        }
    }
}

void UploadPipeline::send_text(const Destination& destination, const std::string& text) {
    try {
        transport_.notify_text(destination, text);
    } catch (const DeliveryError& e) {
        LOG_ERR("Could not send message to ", destination, ": ", e.what());
    }
}
