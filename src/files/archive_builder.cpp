#include "files/archive_builder.hpp"
#include "files/volume_splitter.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

struct ArchiveWriteDeleter { void operator()(struct archive* a) { archive_write_free(a); } };
struct ArchiveEntryDeleter { void operator()(struct archive_entry* e) { archive_entry_free(e); } };

std::string archive_error(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

} // namespace

ArchiveBuilder::ArchiveBuilder(std::string archive_name, uint64_t size_limit_bytes, ArchiveCompression compression)
    : archive_name_(std::move(archive_name)), size_limit_bytes_(size_limit_bytes), compression_(compression) {}

std::string ArchiveBuilder::volume_caption(size_t index, size_t total) {
    if (total <= 1) {
        return "Done";
    }
    std::stringstream ss;
    ss << "Done. Archive part " << index << "/" << total << ". Download all parts before extracting.";
    return ss.str();
}

void ArchiveBuilder::write_container(const std::vector<DownloadedFile>& files, const fs::path& archive_path) const {
    std::unique_ptr<struct archive, ArchiveWriteDeleter> writer(archive_write_new());
    if (!writer) {
        throw ArchiveError("archive_write_new failed");
    }
    struct archive* a = writer.get();

    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        throw ArchiveError("Cannot select zip format: " + archive_error(a));
    }
    int r = (compression_ == ArchiveCompression::STORE)
        ? archive_write_zip_set_compression_store(a)
        : archive_write_zip_set_compression_deflate(a);
    if (r != ARCHIVE_OK) {
        throw ArchiveError("Cannot set zip compression: " + archive_error(a));
    }
    if (archive_write_open_filename(a, archive_path.string().c_str()) != ARCHIVE_OK) {
        throw ArchiveError("Cannot create archive " + archive_path.string() + ": " + archive_error(a));
    }

    std::vector<char> buffer(64 * 1024);
    for (const auto& file : files) {
        std::error_code ec;
        uint64_t size = fs::file_size(file.local_path, ec);
        if (ec) {
            throw ArchiveError("Cannot stat " + file.local_path.string() + ": " + ec.message());
        }

        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        const std::string& entry_name = file.archive_name;
        archive_entry_set_pathname_utf8(entry.get(), entry_name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

        if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
            throw ArchiveError("Cannot add " + entry_name + ": " + archive_error(a));
        }

        std::ifstream input(file.local_path, std::ios::binary);
        if (!input.is_open()) {
            throw ArchiveError("Failed to open file: " + file.local_path.string());
        }
        while (input) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = input.gcount();
            if (got <= 0) break;
            if (archive_write_data(a, buffer.data(), static_cast<size_t>(got)) < 0) {
                throw ArchiveError("Cannot write " + entry_name + ": " + archive_error(a));
            }
        }
        if (input.bad()) {
            throw ArchiveError("Failed to read file: " + file.local_path.string());
        }
        if (archive_write_finish_entry(a) < ARCHIVE_WARN) {
            throw ArchiveError("Cannot finish " + entry_name + ": " + archive_error(a));
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        throw ArchiveError("Cannot close archive " + archive_path.string() + ": " + archive_error(a));
    }
}

std::vector<ArchiveVolume> ArchiveBuilder::build(const std::vector<DownloadedFile>& files, const fs::path& work_dir) const {
    if (files.empty()) {
        throw EmptyResultError("Nothing to archive");
    }

    fs::path archive_path = work_dir / archive_name_;
    try {
        write_container(files, archive_path);
    } catch (const ArchiveError&) {
        std::error_code ec;
        fs::remove(archive_path, ec);
        throw;
    }

    std::error_code ec;
    uint64_t archive_size = fs::file_size(archive_path, ec);
    if (ec) {
        throw ArchiveError("Cannot stat " + archive_path.string() + ": " + ec.message());
    }
    LOG_INFO("Created archive ", archive_path.filename(), " with ", files.size(), " entries (", archive_size, " bytes)");

    std::vector<fs::path> part_paths;
    if (size_limit_bytes_ == 0 || archive_size <= size_limit_bytes_) {
        part_paths.push_back(archive_path);
    } else {
        part_paths = VolumeSplitter::split(archive_path, static_cast<int64_t>(size_limit_bytes_));
        LOG_INFO("Archive exceeds limit (", archive_size, " > ", size_limit_bytes_, " bytes), split into ",
                 part_paths.size(), " volumes");
    }

    std::vector<ArchiveVolume> volumes;
    volumes.reserve(part_paths.size());
    for (size_t i = 0; i < part_paths.size(); ++i) {
        ArchiveVolume volume;
        volume.index = i + 1;
        volume.total = part_paths.size();
        volume.path = part_paths[i];
        volume.size_bytes = fs::file_size(part_paths[i], ec);
        if (ec) {
            throw ArchiveError("Cannot stat " + part_paths[i].string() + ": " + ec.message());
        }
        try {
            volume.sha256 = Hasher::hash_to_hex(Hasher::sha256_file(part_paths[i]));
        } catch (const std::runtime_error& e) {
            throw ArchiveError(e.what());
        }
        volume.caption = volume_caption(volume.index, volume.total);
        volumes.push_back(std::move(volume));
    }
    return volumes;
}
