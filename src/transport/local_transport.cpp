#include "transport/local_transport.hpp"
#include "files/file_naming.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <vector>

using json = nlohmann::json;

LocalTransport::LocalTransport(fs::path media_root, fs::path outbox_dir, uint64_t max_media_bytes)
    : media_root_(std::move(media_root)), outbox_dir_(std::move(outbox_dir)), max_media_bytes_(max_media_bytes) {}

fs::path LocalTransport::resolve_ref(const std::string& ref) const {
    fs::path p(ref);
    if (p.is_absolute()) {
        return p;
    }
    fs::path normal = p.lexically_normal();
    if (normal.empty() || *normal.begin() == "..") {
        throw DownloadError("Media reference escapes media root: " + ref);
    }
    return media_root_ / normal;
}

fs::path LocalTransport::outbox_for(const Destination& destination) const {
    return outbox_dir_ / FileNaming::sanitize(destination);
}

void LocalTransport::fetch(const MediaItem& item, const fs::path& destination_path,
                           std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    fs::path source = resolve_ref(item.ref);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw DownloadError("Media not found: " + item.ref);
    }
    uint64_t size = fs::file_size(source, ec);
    if (ec) {
        throw DownloadError("Cannot stat " + item.ref + ": " + ec.message());
    }
    if (size > max_media_bytes_) {
        throw DownloadError("File is too big (" + std::to_string(size) + " > " +
                            std::to_string(max_media_bytes_) + " bytes): " + item.ref);
    }

    fs::create_directories(destination_path.parent_path(), ec);
    if (ec) {
        throw DownloadError("Cannot create " + destination_path.parent_path().string() + ": " + ec.message());
    }

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        throw DownloadError("Failed to open media: " + item.ref);
    }
    std::ofstream output(destination_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw DownloadError("Failed to create " + destination_path.string());
    }

    auto fail = [&](const std::string& reason) {
        output.close();
        std::error_code remove_ec;
        fs::remove(destination_path, remove_ec);
        throw DownloadError(reason);
    };

    std::vector<char> buffer(COPY_BLOCK_SIZE);
    while (input) {
        if (std::chrono::steady_clock::now() > deadline) {
            fail("Download timed out after " + std::to_string(timeout.count()) + " ms: " + item.ref);
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (got <= 0) break;
        output.write(buffer.data(), got);
        if (!output) {
            fail("Failed to write " + destination_path.string());
        }
    }
    if (input.bad()) {
        fail("Failed to read media: " + item.ref);
    }
    output.close();
    if (!output) {
        fail("Failed to flush " + destination_path.string());
    }
}

void LocalTransport::deliver(const Destination& destination, const ArchiveVolume& volume) {
    fs::path target_dir = outbox_for(destination);
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        throw DeliveryError("Cannot create outbox " + target_dir.string() + ": " + ec.message());
    }

    fs::path target = target_dir / volume.path.filename();
    fs::copy_file(volume.path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw DeliveryError("Cannot deliver " + volume.path.filename().string() + ": " + ec.message());
    }

    json record = {
        {"type", "volume"},
        {"file", volume.path.filename().string()},
        {"caption", volume.caption},
        {"part", volume.index},
        {"total", volume.total},
        {"size", volume.size_bytes},
        {"sha256", volume.sha256}
    };
    append_journal(destination, record.dump());
}

void LocalTransport::notify_unprocessed(const Destination& destination, const MediaItem& item) {
    json record = {
        {"type", "unprocessed"},
        {"ref", item.ref},
        {"caption", item.caption ? json(*item.caption) : json(nullptr)}
    };
    append_journal(destination, record.dump());
}

void LocalTransport::notify_text(const Destination& destination, const std::string& text) {
    json record = {
        {"type", "message"},
        {"text", text}
    };
    append_journal(destination, record.dump());
}

void LocalTransport::append_journal(const Destination& destination, const std::string& line) {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    fs::path target_dir = outbox_for(destination);
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        throw DeliveryError("Cannot create outbox " + target_dir.string() + ": " + ec.message());
    }

    std::ofstream journal(target_dir / JOURNAL_FILE, std::ios::app);
    if (!journal.is_open()) {
        throw DeliveryError("Cannot open journal in " + target_dir.string());
    }
    journal << line << "\n";
    journal.flush();
    if (!journal) {
        throw DeliveryError("Cannot write journal in " + target_dir.string());
    }
}
