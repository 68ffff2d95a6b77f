#ifndef BURSTPACK_DEBOUNCE_SCHEDULER_HPP
#define BURSTPACK_DEBOUNCE_SCHEDULER_HPP

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include "session_state.hpp"

/**
 * @brief Decides, per session, when a burst has gone quiet.
 *
 * Every arrival arms a new run with the session's new epoch and cancels the
 * previous one. A run that survives the quiet period drains (waits for the
 * session's in-flight downloads, at most max_drain_wait), claims the build
 * step and hands the session to the finalize handler. The epoch is checked
 * whenever the run wakes up; a run whose epoch is gone stops without a trace.
 *
 * Timers run on the given io_context, each run on its own strand.
 */
class DebounceScheduler {
public:
    // Called once per burst, from an io_context thread, after the build step
    // was claimed. The handler must call session->end_finalize() if it gives
    // the step back without tearing the session down.
    using FinalizeHandler = std::function<void(std::shared_ptr<SessionState>, uint64_t epoch)>;

    DebounceScheduler(asio::io_context& io_context,
                      std::chrono::milliseconds quiet_period,
                      std::chrono::milliseconds max_drain_wait,
                      std::chrono::milliseconds drain_poll_interval,
                      FinalizeHandler on_finalize);

    // Arms a run for the item that just moved the session to epoch.
    void on_arrival(const std::shared_ptr<SessionState>& session, uint64_t epoch);

    // Runs that reached the finalize handler.
    uint64_t finalized_runs() const { return finalized_runs_.load(); }
    // Runs that found their epoch gone, or were cancelled while draining.
    uint64_t stale_runs() const { return stale_runs_.load(); }

private:
    class FinalizeRun;

    void on_quiet_period_elapsed(const std::shared_ptr<SessionState>& session,
                                 const std::shared_ptr<FinalizeRun>& run,
                                 const asio::error_code& error);
    void poll_drain(const std::shared_ptr<SessionState>& session, const std::shared_ptr<FinalizeRun>& run);

    asio::io_context& io_context_;
    std::chrono::milliseconds quiet_period_;
    std::chrono::milliseconds max_drain_wait_;
    std::chrono::milliseconds drain_poll_interval_;
    FinalizeHandler on_finalize_;

    std::atomic<uint64_t> finalized_runs_{0};
    std::atomic<uint64_t> stale_runs_{0};
};

#endif //BURSTPACK_DEBOUNCE_SCHEDULER_HPP
