#include "files/file_naming.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>

namespace FileNaming {

namespace {

constexpr const char* INVALID_FILENAME_CHARS = "<>\"/\\|?*";

// Keeps names well below the usual 255-byte file name limit once a suffix is added.
constexpr size_t MAX_STEM_BYTES = 200;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Cuts at a byte limit without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

const std::map<std::string, std::string>& mime_table() {
    static const std::map<std::string, std::string> table = {
        {"video/mp4", ".mp4"},
        {"video/quicktime", ".mov"},
        {"video/x-matroska", ".mkv"},
        {"video/webm", ".webm"},
        {"video/x-msvideo", ".avi"},
        {"video/mpeg", ".mpeg"},
        {"video/ogg", ".ogv"},
        {"video/3gpp", ".3gp"},
        {"video/x-m4v", ".m4v"},
        {"image/jpeg", ".jpg"},
        {"image/png", ".png"},
        {"image/gif", ".gif"},
        {"audio/mpeg", ".mp3"},
        {"audio/ogg", ".ogg"},
        {"application/zip", ".zip"},
        {"application/pdf", ".pdf"},
    };
    return table;
}

} // namespace

std::string sanitize(const std::string& name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (char ch : name) {
        unsigned char uc = static_cast<unsigned char>(ch);
        if (ch == ':') {
            sanitized += " -";
        } else if (std::strchr(INVALID_FILENAME_CHARS, ch) != nullptr || uc < 0x20 || uc == 0x7F) {
            sanitized += '_';
        } else {
            sanitized += ch;
        }
    }
    std::string candidate = trim(sanitized);
    if (candidate.empty() || candidate == "." || candidate == "..") {
        return DEFAULT_BASE_NAME;
    }
    return candidate;
}

std::optional<std::string> extension_for_mime(const std::string& mime_type) {
    std::string key = lowercase(trim(mime_type.substr(0, mime_type.find(';'))));
    auto it = mime_table().find(key);
    if (it == mime_table().end()) return std::nullopt;
    return it->second;
}

std::string resolve_extension(const std::optional<std::string>& file_name,
                              const std::optional<std::string>& mime_type) {
    if (file_name && !file_name->empty()) {
        std::string suffix = std::filesystem::path(*file_name).extension().string();
        if (!suffix.empty() && suffix != ".") {
            return suffix;
        }
    }
    if (mime_type && !mime_type->empty()) {
        if (auto guessed = extension_for_mime(*mime_type)) {
            return *guessed;
        }
    }
    return DEFAULT_EXTENSION;
}

std::string default_display_name(uint32_t sequence) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "video_%02u", static_cast<unsigned>(sequence));
    return buffer;
}

std::string NameAllocator::allocate(const std::string& base_name, const std::string& extension) {
    std::string stem = sanitize(base_name);

    // "clip.mp4" with extension ".mp4" stays "clip.mp4", not "clip.mp4.mp4".
    if (!extension.empty() && stem.size() > extension.size()) {
        std::string tail = stem.substr(stem.size() - extension.size());
        if (lowercase(tail) == lowercase(extension)) {
            stem = trim(stem.substr(0, stem.size() - extension.size()));
            if (stem.empty()) stem = DEFAULT_BASE_NAME;
        }
    }
    stem = truncate_utf8(stem, MAX_STEM_BYTES);

    std::string candidate = stem + extension;
    unsigned suffix = 1;
    while (taken_.count(candidate)) {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "_%02u", suffix);
        candidate = stem + buffer + extension;
        ++suffix;
    }
    taken_.insert(candidate);
    return candidate;
}

} // namespace FileNaming
