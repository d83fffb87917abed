#include <doctest/doctest.h>

#include <filesystem>

#include "../include/defaults.h"
#include "../include/upload_validator.h"
#include "support/test_helpers.hpp"

TEST_CASE("Photo over the limit is rejected with its size in whole MB") {
    TempDir dir;
    std::string path = dir.sized("big.jpg", 6 * MIB);

    upload_check_t r = check_upload("image/jpeg", path, PHOTO_SIZE_LIMIT);
    CHECK_FALSE(r.ok());
    CHECK(r.error == upload_error_t::too_large);
    CHECK(r.reason.find("6 MB") != std::string::npos);
    CHECK(r.reason.find("limit is 5 MB") != std::string::npos);
}

TEST_CASE("Photo under the limit with a jpeg extension passes") {
    TempDir dir;
    std::string path = dir.sized("small.jpg", 4 * MIB);

    upload_check_t r = check_upload("image/jpeg", path, PHOTO_SIZE_LIMIT);
    CHECK(r.ok());
    CHECK(static_cast<bool>(r));
    CHECK(r.reason.empty());
}

TEST_CASE("A file exactly at the limit is accepted") {
    TempDir dir;
    std::string path = dir.sized("edge.JPG", 5 * MIB);

    CHECK(check_upload(PHOTO_MIME_TYPE, path, PHOTO_SIZE_LIMIT).ok());
}

TEST_CASE("Video with a png extension is a type mismatch") {
    TempDir dir;
    std::string path = dir.sized("frame.png", 1024);

    upload_check_t r = check_upload("video/mp4", path, VIDEO_SIZE_LIMIT);
    CHECK(r.error == upload_error_t::type_mismatch);
    CHECK(r.reason == "File should have type 'video/mp4', found 'image/png'");
}

TEST_CASE("Unknown extension is a type mismatch") {
    TempDir dir;
    std::string path = dir.write("clip", "data");

    upload_check_t r = check_upload(VIDEO_MIME_TYPE, path, VIDEO_SIZE_LIMIT);
    CHECK(r.error == upload_error_t::type_mismatch);
    CHECK(r.reason.find("found 'unknown'") != std::string::npos);
}

TEST_CASE("Size is checked before the media type") {
    TempDir dir;
    std::string path = dir.sized("huge.png", 21 * MIB);

    CHECK(check_upload(VIDEO_MIME_TYPE, path, VIDEO_SIZE_LIMIT).error == upload_error_t::too_large);
}

TEST_CASE("Missing files raise a filesystem error") {
    TempDir dir;
    CHECK_THROWS_AS(check_upload(PHOTO_MIME_TYPE, dir.file("nope.jpg"), PHOTO_SIZE_LIMIT),
                    std::filesystem::filesystem_error);
}
