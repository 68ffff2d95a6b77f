#ifndef BURSTPACK_FILE_NAMING_HPP
#define BURSTPACK_FILE_NAMING_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace FileNaming {

constexpr const char* DEFAULT_EXTENSION = ".mp4";
constexpr const char* DEFAULT_BASE_NAME = "video";

// ':' becomes " -", any of <>"/\|?* and control bytes become '_', then trimmed.
// An empty result becomes "video".
std::string sanitize(const std::string& name);

// Suffix of the declared file name, else the MIME type's usual suffix, else ".mp4".
std::string resolve_extension(const std::optional<std::string>& file_name,
                              const std::optional<std::string>& mime_type);

std::optional<std::string> extension_for_mime(const std::string& mime_type);

// "video_01", "video_02", ...
std::string default_display_name(uint32_t sequence);

/**
 * @brief Hands out unique target file names within one burst.
 *
 * The first request for a base gets "base.ext", later ones "base_01.ext",
 * "base_02.ext" and so on. The result only depends on the order of the
 * requests.
 */
class NameAllocator {
public:
    std::string allocate(const std::string& base_name, const std::string& extension);

    bool contains(const std::string& name) const { return taken_.count(name) > 0; }
    size_t size() const { return taken_.size(); }

private:
    std::set<std::string> taken_;
};

} // namespace FileNaming

#endif //BURSTPACK_FILE_NAMING_HPP
