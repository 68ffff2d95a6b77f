#ifndef BURSTPACK_TRANSPORT_HPP
#define BURSTPACK_TRANSPORT_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include "../session/media_item.hpp"
#include "../files/archive_builder.hpp"

// What the pipeline needs from the chat transport. Implementations must be
// callable from several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Writes the item's bytes to destination_path.
    // Throws DownloadError on timeout, unknown reference or oversized content.
    virtual void fetch(const MediaItem& item, const std::filesystem::path& destination_path,
                       std::chrono::milliseconds timeout) = 0;

    // Sends one volume with its caption. Throws DeliveryError.
    virtual void deliver(const Destination& destination, const ArchiveVolume& volume) = 0;

    // Hands an item that could not be downloaded back to the user as-is.
    // Throws DeliveryError.
    virtual void notify_unprocessed(const Destination& destination, const MediaItem& item) = 0;

    // Plain text message. Throws DeliveryError.
    virtual void notify_text(const Destination& destination, const std::string& text) = 0;
};

#endif //BURSTPACK_TRANSPORT_HPP
