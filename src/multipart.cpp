#include <stdexcept>

#include <sodium.h>
#include <sodium/randombytes.h>

#include "../include/mime_types.h"
#include "../include/multipart.hpp"

namespace {
    constexpr char BOUNDARY_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr uint32_t BOUNDARY_ALPHABET_LEN = sizeof(BOUNDARY_ALPHABET) - 1;

    constexpr const char* CRLF = "\r\n";

    void append_delimiter(std::string& out, const std::string& boundary) {
        out.append("--");
        out.append(boundary);
        out.append(CRLF);
    }
} // namespace

std::string field_value_to_string(const field_value_t& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
    return std::get<bool>(value) ? "true" : "false";
}

void FormFields::put(const std::string& name, field_value_t value) {
    for (auto& f : fields_) {
        if (f.first == name) {
            f.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(name, std::move(value));
}

const field_value_t* FormFields::find(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.first == name) return &f.second;
    }
    return nullptr;
}

std::string generate_boundary() {
    if (sodium_init() < 0) {
        throw std::runtime_error("sodium_init failed");
    }

    std::string boundary(BOUNDARY_LENGTH, '\0');
    for (auto& c : boundary) {
        c = BOUNDARY_ALPHABET[randombytes_uniform(BOUNDARY_ALPHABET_LEN)];
    }
    return boundary;
}

multipart_body_t encode_multipart_formdata(
    const FormFields& fields,
    const std::vector<attachment_t>& attachments,
    const std::string& boundary
) {
    multipart_body_t out;
    out.boundary = boundary;

    std::string& body = out.body;
    bool append_crlf = false;

    for (const auto& [name, value] : fields) {
        if (append_crlf) body.append(CRLF);
        append_crlf = true;

        append_delimiter(body, boundary);
        body.append("Content-Disposition: form-data; name=\"").append(name).append("\"").append(CRLF);
        body.append(CRLF);
        body.append(field_value_to_string(value));
    }

    for (const auto& a : attachments) {
        if (append_crlf) body.append(CRLF);
        append_crlf = true;

        append_delimiter(body, boundary);
        body.append("Content-Disposition: form-data; name=\"").append(a.field)
            .append("\"; filename=\"").append(a.filename).append("\"").append(CRLF);
        body.append("Content-Type: ").append(mime_type_or_default(a.filename)).append(CRLF);
        body.append("Content-Length: ").append(std::to_string(a.data.size())).append(CRLF);
        body.append(CRLF);
        body.append(a.data);
    }

    body.append(CRLF);
    body.append("--").append(boundary).append("--");
    body.append(CRLF);
    body.append(CRLF);

    return out;
}

multipart_body_t encode_multipart_formdata(
    const FormFields& fields,
    const std::vector<attachment_t>& attachments
) {
    return encode_multipart_formdata(fields, attachments, generate_boundary());
}
