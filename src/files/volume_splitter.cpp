#include "files/volume_splitter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <vector>

namespace {
    void remove_parts(const std::vector<fs::path>& parts) {
        for (const auto& part : parts) {
            std::error_code ec;
            fs::remove(part, ec);
        }
    }
}

fs::path VolumeSplitter::part_path(const fs::path& source_path, size_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), ".%03zu", index);
    return source_path.parent_path() / (source_path.filename().string() + suffix);
}

std::vector<fs::path> VolumeSplitter::split(const fs::path& source_path, int64_t max_bytes) {
    if (max_bytes <= 0) {
        return {source_path};
    }

    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        throw ArchiveError("File does not exist or is not a regular file: " + source_path.string());
    }
    uint64_t file_size = fs::file_size(source_path, ec);
    if (ec) {
        throw ArchiveError("Cannot stat " + source_path.string() + ": " + ec.message());
    }
    if (file_size == 0) {
        return {source_path};
    }

    std::ifstream file(source_path, std::ios::binary);
    if (!file.is_open()) {
        throw ArchiveError("Failed to open file: " + source_path.string());
    }

    const uint64_t part_limit = static_cast<uint64_t>(max_bytes);
    const uint64_t parts_count = (file_size + part_limit - 1) / part_limit;

    std::vector<fs::path> parts;
    parts.reserve(parts_count);
    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(COPY_BLOCK_SIZE, part_limit)));

    uint64_t remaining = file_size;
    for (uint64_t i = 1; i <= parts_count; ++i) {
        fs::path target_path = part_path(source_path, static_cast<size_t>(i));
        parts.push_back(target_path);

        std::ofstream target(target_path, std::ios::binary | std::ios::trunc);
        if (!target.is_open()) {
            remove_parts(parts);
            throw ArchiveError("Failed to create volume: " + target_path.string());
        }

        uint64_t part_left = std::min(part_limit, remaining);
        while (part_left > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), part_left));
            file.read(buffer.data(), static_cast<std::streamsize>(want));
            std::streamsize got = file.gcount();
            if (got <= 0) {
                target.close();
                remove_parts(parts);
                throw ArchiveError("Unexpected end of file while splitting " + source_path.string());
            }
            target.write(buffer.data(), got);
            if (!target) {
                target.close();
                remove_parts(parts);
                throw ArchiveError("Failed to write volume: " + target_path.string());
            }
            part_left -= static_cast<uint64_t>(got);
            remaining -= static_cast<uint64_t>(got);
        }

        target.close();
        if (!target) {
            remove_parts(parts);
            throw ArchiveError("Failed to flush volume: " + target_path.string());
        }
    }

    file.close();
    fs::remove(source_path, ec);
    if (ec) {
        LOG_WARN("Split ", source_path, " but could not remove it: ", ec.message());
    }
    LOG_DEBUG("Split ", source_path.filename(), " (", file_size, " bytes) into ", parts.size(),
              " volumes of at most ", part_limit, " bytes");
    return parts;
}
