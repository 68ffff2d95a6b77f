#ifndef BURSTPACK_VOLUME_SPLITTER_HPP
#define BURSTPACK_VOLUME_SPLITTER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class VolumeSplitter {
public:
    // Bytes moved per read while copying a part.
    static constexpr size_t COPY_BLOCK_SIZE = 1024 * 1024;

    /**
     * @brief Splits a file into numbered parts of at most max_bytes each.
     *
     * Parts are written next to the source as "<name>.001", "<name>.002", ...
     * Concatenating them in index order gives back the source byte for byte.
     * The source is removed only once every part has been written; if a
     * part fails, the parts written so far are removed and the source is
     * left untouched, so the call can simply be repeated.
     *
     * @param source_path The file to split.
     * @param max_bytes Maximum part size. A value <= 0 means "do not split".
     * @return The part paths in order, or just source_path when not split
     *         (max_bytes <= 0, or an empty source).
     * @throws ArchiveError if the source cannot be read or a part cannot be written.
     */
    static std::vector<fs::path> split(const fs::path& source_path, int64_t max_bytes);

    // "<name>.NNN" for a 1-based index.
    static fs::path part_path(const fs::path& source_path, size_t index);
};

#endif //BURSTPACK_VOLUME_SPLITTER_HPP
