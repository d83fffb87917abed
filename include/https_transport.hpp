#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "defaults.h"
#include "logger.hpp"
#include "multipart.hpp"

enum class trust_mode_t : std::uint8_t {
    verify   = 0,  // chain must lead to root_cert_pem, system store is not consulted
    insecure = 1   // no certificate or host name checks at all
};

struct trust_policy_t {
    trust_mode_t mode{trust_mode_t::verify};
    std::string root_cert_pem{PINNED_ROOT_CERTIFICATE};
};

struct http_response_t {
    long status{0};
    std::string body;

    bool ok() const { return status == 200; }
};

struct url_parts_t {
    std::string host;
    std::string port;
    std::string target;
};

// Connection, TLS handshake or certificate verification failure.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Only https:// URLs are accepted. Port defaults to 443, target to "/".
url_parts_t parse_https_url(const std::string& url);

class Transport {
public:
    virtual ~Transport() = default;

    // One blocking POST of a multipart body. Any HTTP status is a normal
    // return; TransportError is thrown when no response could be obtained.
    virtual http_response_t post(
        const std::string& url,
        const multipart_body_t& body,
        const trust_policy_t& trust
    ) = 0;
};

// libcurl backed transport. Every call uses a fresh easy handle, so no
// connection outlives the request. The pinned root is staged in a temporary
// file that only exists for the duration of the call.
class HttpsTransport : public Transport {
public:
    explicit HttpsTransport(Logger& log);

    http_response_t post(
        const std::string& url,
        const multipart_body_t& body,
        const trust_policy_t& trust
    ) override;

private:
    Logger& log_;
};
