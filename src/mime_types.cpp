#include "../include/helpers.h"
#include "../include/mime_types.h"

namespace {
    struct mime_entry_t {
        const char* ext;
        const char* type;
    };

    constexpr mime_entry_t MIME_TABLE[] = {
        // images
        {"jpg",  "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"jpe",  "image/jpeg"},
        {"png",  "image/png"},
        {"gif",  "image/gif"},
        {"webp", "image/webp"},
        {"bmp",  "image/bmp"},
        {"tif",  "image/tiff"},
        {"tiff", "image/tiff"},
        {"svg",  "image/svg+xml"},
        {"ico",  "image/vnd.microsoft.icon"},

        // video
        {"mp4",  "video/mp4"},
        {"m4v",  "video/mp4"},
        {"mov",  "video/quicktime"},
        {"qt",   "video/quicktime"},
        {"webm", "video/webm"},
        {"mkv",  "video/x-matroska"},
        {"avi",  "video/x-msvideo"},
        {"mpeg", "video/mpeg"},
        {"mpg",  "video/mpeg"},

        // audio
        {"mp3",  "audio/mpeg"},
        {"ogg",  "audio/ogg"},
        {"oga",  "audio/ogg"},
        {"wav",  "audio/x-wav"},
        {"m4a",  "audio/mp4"},
        {"flac", "audio/flac"},

        // text and documents
        {"txt",  "text/plain"},
        {"csv",  "text/csv"},
        {"html", "text/html"},
        {"htm",  "text/html"},
        {"json", "application/json"},
        {"xml",  "application/xml"},
        {"pdf",  "application/pdf"},
        {"zip",  "application/zip"},
        {"gz",   "application/gzip"},
        {"tar",  "application/x-tar"},
    };
} // namespace

std::optional<std::string> guess_mime_type(std::string_view filename) {
    std::string_view ext = sv_extension(filename);
    if (ext.empty()) return std::nullopt;

    for (const auto& e : MIME_TABLE) {
        if (ieq(ext, e.ext)) return std::string(e.type);
    }
    return std::nullopt;
}

std::string mime_type_or_default(std::string_view filename) {
    auto type = guess_mime_type(filename);
    return type ? *type : std::string(DEFAULT_MIME_TYPE);
}
