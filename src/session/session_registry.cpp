#include "session/session_registry.hpp"
#include "common/logger.hpp"
#include <algorithm>

SessionRegistry::SessionRegistry(std::filesystem::path work_root) : work_root_(std::move(work_root)) {}

std::shared_ptr<SessionState> SessionRegistry::resolve(UserId user_id, const Destination& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it != sessions_.end() && !it->second->closed()) {
        return it->second;
    }

    // One directory per session instance, so a burst never sees files of the previous one.
    std::string dir_name = "session-" + std::to_string(user_id) + "-" + std::to_string(next_instance_++);
    auto session = std::make_shared<SessionState>(user_id, destination, work_root_ / dir_name);
    sessions_[user_id] = session;
    LOG_DEBUG("Created session for user_id=", user_id);
    return session;
}

std::shared_ptr<SessionState> SessionRegistry::find(UserId user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(user_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    return nullptr;
}

bool SessionRegistry::discard(UserId user_id) {
    std::shared_ptr<SessionState> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(user_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
        session->close();
    }
    LOG_INFO("Discarded session for user_id=", user_id);
    return true;
}

bool SessionRegistry::commit(const std::shared_ptr<SessionState>& session, uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session->close_if_current(epoch)) {
        return false;
    }
    erase_if_same_locked(session);
    return true;
}

void SessionRegistry::remove(const std::shared_ptr<SessionState>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session->close();
    erase_if_same_locked(session);
}

void SessionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [user_id, session] : sessions_) {
        session->close();
    }
    sessions_.clear();
}

void SessionRegistry::erase_if_same_locked(const std::shared_ptr<SessionState>& session) {
    auto it = sessions_.find(session->user_id());
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
}

std::vector<SessionSummary> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> result;
    result.reserve(sessions_.size());
    for (const auto& [user_id, session] : sessions_) {
        result.push_back({user_id, session->item_count(), session->in_flight(), session->finalizing()});
    }
    std::sort(result.begin(), result.end(),
              [](const SessionSummary& a, const SessionSummary& b) { return a.user_id < b.user_id; });
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
