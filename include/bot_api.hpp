#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "defaults.h"
#include "https_transport.hpp"
#include "logger.hpp"
#include "multipart.hpp"

struct bot_identity_t {
    std::int64_t id{0};
    std::string username;
    std::string first_name;
};

// Session with the Bot API for a single chat.
//
// Remote failures (any status other than 200) are logged and reported as
// false / std::nullopt. TransportError and filesystem errors while reading
// an attachment propagate to the caller.
class BotApiClient {
public:
    BotApiClient(
        std::string token,
        std::int64_t chat_id,
        Transport& transport,
        Logger& log,
        std::string endpoint = DEFAULT_API_ENDPOINT
    );

    void disable_notifications() { silent_ = true; }
    void enable_notifications() { silent_ = false; }

    void set_parse_mode(std::string mode) { parse_mode_ = std::move(mode); }
    void clear_parse_mode() { parse_mode_.reset(); }

    void enable_insecure_connection() { trust_.mode = trust_mode_t::insecure; }
    void enable_certificate_verification() { trust_.mode = trust_mode_t::verify; }
    void set_pinned_root(std::string pem) { trust_.root_cert_pem = std::move(pem); }

    bool silent() const { return silent_; }
    const std::optional<std::string>& parse_mode() const { return parse_mode_; }
    const trust_policy_t& trust() const { return trust_; }
    std::int64_t chat_id() const { return chat_id_; }

    // <endpoint>/bot<token>/<method>
    std::string method_url(const std::string& method) const;

    std::optional<bot_identity_t> get_me();

    bool send_message(const std::string& text);
    bool send_photo(const std::string& path, const std::string& caption = "");
    bool send_video(const std::string& path, const std::string& caption = "", bool streaming = false);

private:
    using file_ref_t = std::pair<std::string, std::string>; // field, path

    FormFields make_envelope() const;

    std::optional<std::string> call_api(
        const std::string& method,
        const FormFields& fields,
        const std::vector<file_ref_t>& files = {}
    );

    std::string token_;
    std::int64_t chat_id_;
    std::string endpoint_;

    bool silent_{true};
    std::optional<std::string> parse_mode_;
    trust_policy_t trust_;

    Transport& transport_;
    Logger& log_;
};

// Reads the whole file into an attachment named after its basename.
// Throws std::system_error on any I/O error.
attachment_t load_attachment(const std::string& field, const std::string& path);
