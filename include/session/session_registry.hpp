#ifndef BURSTPACK_SESSION_REGISTRY_HPP
#define BURSTPACK_SESSION_REGISTRY_HPP

#include <unordered_map>
#include <string>
#include <vector>
#include <mutex>
#include <memory>
#include <filesystem>

#include "session_state.hpp"

struct SessionSummary {
    UserId user_id;
    size_t items;
    int in_flight;
    bool finalizing;
};

// Process-wide map from user to the live session of the current burst.
//
// Lock order is registry first, then session; session methods never call
// back into the registry.
class SessionRegistry {
public:
    explicit SessionRegistry(std::filesystem::path work_root);

    // Returns the user's live session or creates an empty one.
    std::shared_ptr<SessionState> resolve(UserId user_id, const Destination& destination);

    std::shared_ptr<SessionState> find(UserId user_id) const;

    // Cancels the pending run, drops the items and removes the entry.
    // Returns false (and does nothing) if the user has no session.
    bool discard(UserId user_id);

    // Detaches the session if epoch is still its current epoch. Only the run
    // that wins this call may deliver; later arrivals start a new session.
    bool commit(const std::shared_ptr<SessionState>& session, uint64_t epoch);

    // Tears the session down whatever its epoch.
    void remove(const std::shared_ptr<SessionState>& session);

    // Closes and removes every session.
    void clear();

    std::vector<SessionSummary> snapshot() const;
    size_t size() const;

private:
    void erase_if_same_locked(const std::shared_ptr<SessionState>& session);

    mutable std::mutex mutex_;
    std::unordered_map<UserId, std::shared_ptr<SessionState>> sessions_;
    std::filesystem::path work_root_;
    uint64_t next_instance_ = 1;
};

#endif //BURSTPACK_SESSION_REGISTRY_HPP
