#include <cstdio>
#include <filesystem>

#include "../include/defaults.h"
#include "../include/mime_types.h"
#include "../include/upload_validator.h"

namespace fs = std::filesystem;

upload_check_t check_upload(
    const std::string& expected_mime_type,
    const std::string& path,
    std::uint64_t size_limit
) {
    upload_check_t result;

    std::uint64_t size = fs::file_size(path);
    if (size > size_limit) {
        char buf[128];
        std::snprintf(
            buf, sizeof(buf),
            "File is too big for upload (%llu MB), limit is %llu MB",
            (unsigned long long)(size / MIB), (unsigned long long)(size_limit / MIB)
        );
        result.error  = upload_error_t::too_large;
        result.reason = buf;
        return result;
    }

    auto actual = guess_mime_type(path);
    if (!actual || *actual != expected_mime_type) {
        result.error  = upload_error_t::type_mismatch;
        result.reason = "File should have type '" + expected_mime_type + "', found '" +
                        (actual ? *actual : std::string("unknown")) + "'";
        return result;
    }

    return result;
}
