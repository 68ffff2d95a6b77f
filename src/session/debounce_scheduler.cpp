#include "session/debounce_scheduler.hpp"
#include "common/logger.hpp"

class DebounceScheduler::FinalizeRun : public PendingRun, public std::enable_shared_from_this<FinalizeRun> {
public:
    FinalizeRun(asio::io_context& io_context, uint64_t epoch)
        : strand_(asio::make_strand(io_context)), timer_(strand_), epoch_(epoch) {}

    uint64_t epoch() const override { return epoch_; }
    RunState state() const override { return state_.load(); }

    // Safe from any thread: the timer itself is only touched on the strand.
    void cancel() override {
        state_.store(RunState::CANCELLED);
        asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
    }

    bool advance(RunState from, RunState to) { return state_.compare_exchange_strong(from, to); }

    asio::strand<asio::io_context::executor_type>& strand() { return strand_; }
    asio::steady_timer& timer() { return timer_; }

    std::chrono::steady_clock::time_point drain_deadline;

private:
    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    const uint64_t epoch_;
    std::atomic<RunState> state_{RunState::ARMED};
};

DebounceScheduler::DebounceScheduler(asio::io_context& io_context,
                                     std::chrono::milliseconds quiet_period,
                                     std::chrono::milliseconds max_drain_wait,
                                     std::chrono::milliseconds drain_poll_interval,
                                     FinalizeHandler on_finalize)
    : io_context_(io_context),
      quiet_period_(quiet_period),
      max_drain_wait_(max_drain_wait),
      drain_poll_interval_(drain_poll_interval),
      on_finalize_(std::move(on_finalize)) {}

void DebounceScheduler::on_arrival(const std::shared_ptr<SessionState>& session, uint64_t epoch) {
    auto run = std::make_shared<FinalizeRun>(io_context_, epoch);
    if (!session->arm(run)) {
        LOG_DEBUG("Epoch ", epoch, " for user_id=", session->user_id(), " already superseded, not arming");
        return;
    }

    asio::post(run->strand(), [this, session, run]() {
        if (run->state() == RunState::CANCELLED) return;
        run->timer().expires_after(quiet_period_);
        run->timer().async_wait([this, session, run](const asio::error_code& error) {
            on_quiet_period_elapsed(session, run, error);
        });
    });
    LOG_DEBUG("Armed finalize run for user_id=", session->user_id(), " at epoch ", epoch);
}

void DebounceScheduler::on_quiet_period_elapsed(const std::shared_ptr<SessionState>& session,
                                                const std::shared_ptr<FinalizeRun>& run,
                                                const asio::error_code& error) {
    if (error == asio::error::operation_aborted || run->state() == RunState::CANCELLED) {
        LOG_DEBUG("Finalize run for user_id=", session->user_id(), " at epoch ", run->epoch(), " cancelled");
        return;
    }
    if (error) {
        LOG_WARN("Quiet period timer for user_id=", session->user_id(), " failed: ", error.message());
    }

    if (!session->is_current(run->epoch())) {
        ++stale_runs_;
        LOG_DEBUG("Finalize run for user_id=", session->user_id(), " at epoch ", run->epoch(), " is stale");
        return;
    }
    if (!run->advance(RunState::ARMED, RunState::DRAINING)) {
        return;
    }

    run->drain_deadline = std::chrono::steady_clock::now() + max_drain_wait_;
    poll_drain(session, run);
}

void DebounceScheduler::poll_drain(const std::shared_ptr<SessionState>& session,
                                   const std::shared_ptr<FinalizeRun>& run) {
    if (run->state() == RunState::CANCELLED) {
        ++stale_runs_;
        LOG_DEBUG("Finalize run for user_id=", session->user_id(), " cancelled while draining");
        return;
    }

    bool deadline_passed = std::chrono::steady_clock::now() >= run->drain_deadline;
    switch (session->try_begin_finalize(run->epoch(), deadline_passed)) {
        case ClaimResult::STALE:
            ++stale_runs_;
            LOG_DEBUG("Finalize run for user_id=", session->user_id(), " superseded while draining");
            return;

        case ClaimResult::CLAIMED: {
            if (!run->advance(RunState::DRAINING, RunState::FINALIZED)) {
                session->end_finalize();
                return;
            }
            int still_running = session->in_flight();
            if (still_running > 0) {
                LOG_WARN("Drain wait exceeded for user_id=", session->user_id(), " with ", still_running,
                         " downloads in flight, finalizing with the files available");
            }
            ++finalized_runs_;
            try {
                on_finalize_(session, run->epoch());
            } catch (const std::exception& e) {
                LOG_ERR("Finalize handler failed for user_id=", session->user_id(), ": ", e.what());
                session->end_finalize();
            }
            return;
        }

        case ClaimResult::BUSY:
            break;
    }

    run->timer().expires_after(drain_poll_interval_);
    // An aborted wait means the run was cancelled; poll_drain accounts for it.
    run->timer().async_wait([this, session, run](const asio::error_code&) {
        poll_drain(session, run);
    });
}
