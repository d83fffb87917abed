#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <system_error>
#include <unistd.h>

#include <curl/curl.h>

#include "../include/https_transport.hpp"

namespace {
    // Temporary PEM file holding the pinned root. Removed on destruction.
    class ScopedCaFile {
    public:
        explicit ScopedCaFile(const std::string& pem) {
            char tmpl[] = "/tmp/teleword_ca_XXXXXX";
            int fd = ::mkstemp(tmpl);
            if (fd < 0) {
                throw std::system_error(errno, std::generic_category(), "mkstemp (pinned root)");
            }
            path_ = tmpl;

            size_t off = 0;
            while (off < pem.size()) {
                ssize_t n = ::write(fd, pem.data() + off, pem.size() - off);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int err = errno;
                    ::close(fd);
                    ::unlink(path_.c_str());
                    throw std::system_error(err, std::generic_category(), "write (pinned root)");
                }
                off += (size_t)n;
            }

            if (::close(fd) != 0) {
                int err = errno;
                ::unlink(path_.c_str());
                throw std::system_error(err, std::generic_category(), "close (pinned root)");
            }
        }

        ~ScopedCaFile() {
            ::unlink(path_.c_str());
        }

        // non-copyable
        ScopedCaFile(const ScopedCaFile&) = delete;
        ScopedCaFile& operator=(const ScopedCaFile&) = delete;

        const std::string& path() const { return path_; }

    private:
        std::string path_;
    };

    struct curl_deleter_t {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };

    struct slist_deleter_t {
        void operator()(curl_slist* l) const { curl_slist_free_all(l); }
    };

    size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* out = static_cast<std::string*>(userdata);
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    void append_header(std::unique_ptr<curl_slist, slist_deleter_t>& list, const std::string& header) {
        curl_slist* next = curl_slist_append(list.get(), header.c_str());
        if (!next) throw TransportError("curl_slist_append failed");
        (void)list.release();
        list.reset(next);
    }
} // namespace

url_parts_t parse_https_url(const std::string& url) {
    constexpr const char* HTTPS = "https://";

    if (url.rfind(HTTPS, 0) != 0) {
        throw TransportError("URL must start with https://");
    }
    std::string rest = url.substr(std::strlen(HTTPS));

    url_parts_t parts;
    auto slash = rest.find('/');
    std::string host_port = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    parts.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = host_port.find(':');
    if (colon == std::string::npos) {
        parts.host = host_port;
        parts.port = "443";
    } else {
        parts.host = host_port.substr(0, colon);
        parts.port = host_port.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw TransportError("URL has no host");
    }
    return parts;
}

HttpsTransport::HttpsTransport(Logger& log) : log_(log) {}

http_response_t HttpsTransport::post(
    const std::string& url,
    const multipart_body_t& body,
    const trust_policy_t& trust
) {
    url_parts_t parts = parse_https_url(url);
    log_.debug("Sending POST request to %s", parts.target.c_str());

    std::unique_ptr<CURL, curl_deleter_t> curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, slist_deleter_t> headers;
    append_header(headers, "Content-Type: " + body.content_type());
    append_header(headers, "Content-Length: " + std::to_string(body.body.size()));
    append_header(headers, "Expect:");

    http_response_t response;

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.body.size());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<ScopedCaFile> ca_file;
    if (trust.mode == trust_mode_t::insecure) {
        log_.warn("Skipping certificate verification as requested by user!");
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    } else {
        if (trust.root_cert_pem.empty()) {
            throw TransportError("certificate verification requested without a pinned root");
        }
        ca_file = std::make_unique<ScopedCaFile>(trust.root_cert_pem);

        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(h, CURLOPT_CAINFO, ca_file->path().c_str());
        curl_easy_setopt(h, CURLOPT_CAPATH, static_cast<const char*>(nullptr));
    }

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        throw TransportError(
            "HTTPS request to " + parts.host + ":" + parts.port + " failed: " + curl_easy_strerror(res)
        );
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
