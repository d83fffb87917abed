#include <cerrno>
#include <cstdio>
#include <memory>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../include/bot_api.hpp"
#include "../include/helpers.h"

using json = nlohmann::json;

attachment_t load_attachment(const std::string& field, const std::string& path) {
    std::unique_ptr<FILE, int (*)(FILE*)> f(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }

    attachment_t a;
    a.field    = field;
    a.filename = std::string(sv_basename(path));

    char buf[64 * 1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
        a.data.append(buf, n);
    }
    if (std::ferror(f.get())) {
        throw std::system_error(errno ? errno : EIO, std::generic_category(), "read " + path);
    }

    return a;
}

BotApiClient::BotApiClient(
    std::string token,
    std::int64_t chat_id,
    Transport& transport,
    Logger& log,
    std::string endpoint
) : token_(std::move(token)),
    chat_id_(chat_id),
    endpoint_(std::move(endpoint)),
    transport_(transport),
    log_(log) {
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
    log_.redact_literal(token_);
}

std::string BotApiClient::method_url(const std::string& method) const {
    return endpoint_ + "/bot" + token_ + "/" + method;
}

FormFields BotApiClient::make_envelope() const {
    FormFields f;
    f.set("disable_notifications", silent_ ? "true" : "false");
    f.set("chat_id", chat_id_);
    if (parse_mode_ && !parse_mode_->empty()) f.set("parse_mode", *parse_mode_);
    return f;
}

std::optional<std::string> BotApiClient::call_api(
    const std::string& method,
    const FormFields& fields,
    const std::vector<file_ref_t>& files
) {
    // Attachments are fully read and closed before any network I/O.
    std::vector<attachment_t> attachments;
    attachments.reserve(files.size());
    for (const auto& [field, path] : files) {
        attachments.push_back(load_attachment(field, path));
    }

    log_.info("Calling Bot API method %s", method.c_str());

    multipart_body_t body = encode_multipart_formdata(fields, attachments);
    http_response_t r = transport_.post(method_url(method), body, trust_);

    log_.debug("Response status: %ld", r.status);
    log_.debug("Response data: %s", r.body.c_str());

    if (!r.ok()) {
        log_.error("Call to Bot API failed with code %ld: %s", r.status, r.body.c_str());
        return std::nullopt;
    }

    return std::move(r.body);
}

std::optional<bot_identity_t> BotApiClient::get_me() {
    auto response = call_api("getMe", FormFields{});
    if (!response) return std::nullopt;

    try {
        json doc = json::parse(*response);
        const json& result = doc.at("result");

        bot_identity_t me;
        me.id         = result.at("id").get<std::int64_t>();
        me.username   = result.value("username", "");
        me.first_name = result.value("first_name", "");
        return me;
    } catch (const json::exception& e) {
        log_.error("Malformed getMe response: %s", e.what());
        return std::nullopt;
    }
}

bool BotApiClient::send_message(const std::string& text) {
    FormFields message = make_envelope();
    message.set("text", text);

    log_.debug("Trying to send text message '%s' to chat ID %lld...", text.c_str(), (long long)chat_id_);
    return call_api("sendMessage", message).has_value();
}

bool BotApiClient::send_photo(const std::string& path, const std::string& caption) {
    FormFields message = make_envelope();
    if (!caption.empty()) message.set("caption", caption);

    log_.debug("Trying to send photo '%s' to chat ID %lld...", path.c_str(), (long long)chat_id_);
    return call_api("sendPhoto", message, {{"photo", path}}).has_value();
}

bool BotApiClient::send_video(const std::string& path, const std::string& caption, bool streaming) {
    FormFields message = make_envelope();
    if (!caption.empty()) message.set("caption", caption);
    if (streaming) message.set("supports_streaming", true);

    log_.debug("Trying to send video '%s' to chat ID %lld...", path.c_str(), (long long)chat_id_);
    return call_api("sendVideo", message, {{"video", path}}).has_value();
}
