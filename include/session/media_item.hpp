#ifndef BURSTPACK_MEDIA_ITEM_HPP
#define BURSTPACK_MEDIA_ITEM_HPP

#include <cstdint>
#include <optional>
#include <string>

using UserId = int64_t;

// Where deliveries for a user go (a chat, an outbox folder, ...).
using Destination = std::string;

// What the transport hands over for one uploaded file.
struct IncomingMedia {
    std::string ref;                       // opaque content reference
    std::optional<std::string> caption;
    std::optional<std::string> mime_type;  // declared by the sender
    std::optional<std::string> file_name;  // declared original file name
};

// One queued upload. Built once by the session on arrival, never modified.
struct MediaItem {
    std::string ref;
    std::optional<std::string> caption;
    std::optional<std::string> mime_type;
    std::optional<std::string> file_name;

    uint32_t sequence = 0;        // 1-based, monotonic per session
    std::string display_name;     // caption, or video_NN
    std::string extension;        // ".mp4", ".mov", ...
};

#endif //BURSTPACK_MEDIA_ITEM_HPP
