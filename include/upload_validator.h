#ifndef UPLOAD_VALIDATOR_H
#define UPLOAD_VALIDATOR_H

#include <cstdint>
#include <string>

enum class upload_error_t : std::uint8_t {
    none          = 0,
    too_large     = 1,
    type_mismatch = 2
};

struct upload_check_t {
    upload_error_t error{upload_error_t::none};
    std::string reason;

    bool ok() const { return error == upload_error_t::none; }
    explicit operator bool() const { return ok(); }
};

// Pre-flight check before a file is attached. Only the file size (stat) and
// the media type guessed from the extension are looked at. Size is checked
// first. Throws std::filesystem::filesystem_error if the file cannot be stat'ed.
upload_check_t check_upload(
    const std::string& expected_mime_type,
    const std::string& path,
    std::uint64_t size_limit
);

#endif // UPLOAD_VALIDATOR_H
