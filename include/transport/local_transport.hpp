#ifndef BURSTPACK_LOCAL_TRANSPORT_HPP
#define BURSTPACK_LOCAL_TRANSPORT_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "transport.hpp"

namespace fs = std::filesystem;

/**
 * @brief Filesystem-backed transport.
 *
 * Media references are paths under media_root (absolute paths are taken
 * as-is). Deliveries land in outbox_dir/<destination>/, and every event is
 * appended as one JSON object per line to outbox_dir/<destination>/journal.jsonl.
 */
class LocalTransport : public Transport {
public:
    static constexpr const char* JOURNAL_FILE = "journal.jsonl";
    static constexpr size_t COPY_BLOCK_SIZE = 256 * 1024;

    LocalTransport(fs::path media_root, fs::path outbox_dir, uint64_t max_media_bytes);

    void fetch(const MediaItem& item, const fs::path& destination_path,
               std::chrono::milliseconds timeout) override;
    void deliver(const Destination& destination, const ArchiveVolume& volume) override;
    void notify_unprocessed(const Destination& destination, const MediaItem& item) override;
    void notify_text(const Destination& destination, const std::string& text) override;

    fs::path outbox_for(const Destination& destination) const;

private:
    fs::path resolve_ref(const std::string& ref) const;
    void append_journal(const Destination& destination, const std::string& line);

    fs::path media_root_;
    fs::path outbox_dir_;
    uint64_t max_media_bytes_;
    std::mutex journal_mutex_;
};

#endif //BURSTPACK_LOCAL_TRANSPORT_HPP
