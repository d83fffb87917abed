#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "tls_stub_server.hpp"

namespace {
    using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
    using bio_ptr  = std::unique_ptr<BIO, decltype(&BIO_free)>;

    void add_ext(X509* cert, X509V3_CTX* ctx, int nid, const char* value) {
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value);
        if (!ext) throw std::runtime_error("X509V3_EXT_conf_nid failed");
        int rc = X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);
        if (rc != 1) throw std::runtime_error("X509_add_ext failed");
    }

    std::string to_std(beast::string_view s) {
        return std::string(s.data(), s.size());
    }

    std::string bio_to_string(BIO* bio) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        return std::string(data, (size_t)len);
    }
} // namespace

self_signed_cert_t make_self_signed_cert() {
    pkey_ptr key(EVP_EC_gen("prime256v1"), &EVP_PKEY_free);
    if (!key) throw std::runtime_error("EVP_EC_gen failed");

    x509_ptr cert(X509_new(), &X509_free);
    if (!cert) throw std::runtime_error("X509_new failed");

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, (const unsigned char*)"teleword test stub", -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);
    add_ext(cert.get(), &v3, NID_basic_constraints, "critical,CA:TRUE");
    add_ext(cert.get(), &v3, NID_subject_key_identifier, "hash");
    add_ext(cert.get(), &v3, NID_subject_alt_name, "IP:127.0.0.1,DNS:localhost");

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("X509_sign failed");
    }

    self_signed_cert_t out;

    bio_ptr cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!cert_bio || PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_X509 failed");
    }
    out.cert_pem = bio_to_string(cert_bio.get());

    bio_ptr key_bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!key_bio || PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw std::runtime_error("PEM_write_bio_PrivateKey failed");
    }
    out.key_pem = bio_to_string(key_bio.get());

    return out;
}

TlsStubServer::TlsStubServer(unsigned status, std::string body)
    : status_(status),
      body_(std::move(body)),
      cert_(make_self_signed_cert()),
      ctx_(ssl::context::tls_server),
      acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    ctx_.use_certificate_chain(net::buffer(cert_.cert_pem));
    ctx_.use_private_key(net::buffer(cert_.key_pem), ssl::context::pem);

    port_ = acceptor_.local_endpoint().port();

    do_accept();
    thread_ = std::thread([this] { ioc_.run(); });
}

TlsStubServer::~TlsStubServer() {
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
}

std::string TlsStubServer::base_url() const {
    return "https://127.0.0.1:" + std::to_string(port_);
}

std::vector<stub_request_t> TlsStubServer::requests() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
}

void TlsStubServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) return;
        serve(std::move(socket));
        do_accept();
    });
}

void TlsStubServer::serve(tcp::socket socket) {
    beast::error_code ec;
    ssl::stream<tcp::socket> stream(std::move(socket), ctx_);

    // Clients that reject the certificate end here.
    stream.handshake(ssl::stream_base::server, ec);
    if (ec) return;

    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    http::read(stream, buffer, parser, ec);
    if (ec) return;

    http::request<http::string_body> req = parser.release();

    {
        std::lock_guard<std::mutex> lock(mu_);
        stub_request_t r;
        r.method         = to_std(req.method_string());
        r.target         = to_std(req.target());
        r.content_type   = to_std(req[http::field::content_type]);
        r.content_length = to_std(req[http::field::content_length]);
        r.body           = req.body();
        requests_.push_back(std::move(r));
    }

    http::response<http::string_body> res{static_cast<http::status>(status_), req.version()};
    res.set(http::field::server, "teleword-stub");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body_;
    res.prepare_payload();

    http::write(stream, res, ec);
    if (ec) return;

    stream.shutdown(ec);
}
