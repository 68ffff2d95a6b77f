#ifndef BURSTPACK_ARCHIVE_BUILDER_HPP
#define BURSTPACK_ARCHIVE_BUILDER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../common/config.hpp"

namespace fs = std::filesystem;

// A successfully downloaded item. archive_name is unique within one burst
// and becomes the entry name inside the archive.
struct DownloadedFile {
    fs::path local_path;
    std::string archive_name;
    std::string display_name;
};

// One physical output unit. Volumes must be consumed in index order.
struct ArchiveVolume {
    size_t index = 1;   // 1-based
    size_t total = 1;
    fs::path path;
    uint64_t size_bytes = 0;
    std::string sha256; // hex
    std::string caption;
};

class ArchiveBuilder {
public:
    ArchiveBuilder(std::string archive_name, uint64_t size_limit_bytes,
                   ArchiveCompression compression = ArchiveCompression::DEFLATE);

    /**
     * @brief Packs the files into one ZIP container inside work_dir and
     * splits it into volumes if it is larger than the size limit.
     *
     * Entries keep the input order. A container at or under the limit (or
     * any container when the limit is 0) is the sole volume; otherwise it is
     * replaced by its parts.
     *
     * @return At least one volume, in index order.
     * @throws EmptyResultError if files is empty.
     * @throws ArchiveError if the container or a part cannot be written.
     */
    std::vector<ArchiveVolume> build(const std::vector<DownloadedFile>& files, const fs::path& work_dir) const;

    // "Done" for a single volume, "Done. Archive part i/n. ..." otherwise.
    static std::string volume_caption(size_t index, size_t total);

    const std::string& archive_name() const { return archive_name_; }
    uint64_t size_limit_bytes() const { return size_limit_bytes_; }

private:
    void write_container(const std::vector<DownloadedFile>& files, const fs::path& archive_path) const;

    std::string archive_name_;
    uint64_t size_limit_bytes_;
    ArchiveCompression compression_;
};

#endif //BURSTPACK_ARCHIVE_BUILDER_HPP
