#include <doctest/doctest.h>

#include <filesystem>

#include "../include/bot_api.hpp"
#include "../include/https_transport.hpp"
#include "support/multipart_reader.hpp"
#include "support/test_helpers.hpp"
#include "support/tls_stub_server.hpp"

namespace {
    size_t count_staged_ca_files() {
        size_t n = 0;
        for (const auto& e : std::filesystem::directory_iterator("/tmp")) {
            if (e.path().filename().string().rfind("teleword_ca_", 0) == 0) ++n;
        }
        return n;
    }

    multipart_body_t sample_body() {
        FormFields f;
        f.set("chat_id", 5);
        f.set("text", "hello");
        return encode_multipart_formdata(f, {{"document", "a.bin", std::string("\0\1\2", 3)}});
    }
} // namespace

TEST_CASE("URLs are split into host, port and target") {
    url_parts_t p = parse_https_url("https://api.telegram.org/bot1:x/getMe");
    CHECK(p.host == "api.telegram.org");
    CHECK(p.port == "443");
    CHECK(p.target == "/bot1:x/getMe");

    p = parse_https_url("https://127.0.0.1:8443");
    CHECK(p.host == "127.0.0.1");
    CHECK(p.port == "8443");
    CHECK(p.target == "/");

    CHECK_THROWS_AS(parse_https_url("http://api.telegram.org/"), TransportError);
    CHECK_THROWS_AS(parse_https_url("https:///path"), TransportError);
}

TEST_CASE("Insecure mode talks to a self-signed server and warns") {
    TlsStubServer server(200, R"({"ok":true,"result":true})");
    CapturingLogger c;
    HttpsTransport transport(c.log);

    trust_policy_t trust;
    trust.mode = trust_mode_t::insecure;

    multipart_body_t body = sample_body();
    http_response_t r = transport.post(server.base_url() + "/botT/sendMessage", body, trust);

    CHECK(r.status == 200);
    CHECK(r.ok());
    CHECK(r.body == R"({"ok":true,"result":true})");
    CHECK(c.contains(log_level_t::warn, "Skipping certificate verification"));

    auto reqs = server.requests();
    REQUIRE(reqs.size() == 1);
    CHECK(reqs[0].method == "POST");
    CHECK(reqs[0].target == "/botT/sendMessage");
    CHECK(reqs[0].content_type == "multipart/form-data; boundary=" + body.boundary);
    CHECK(reqs[0].content_length == std::to_string(body.body.size()));
    CHECK(reqs[0].body == body.body);

    auto parts = read_multipart(reqs[0].body, body.boundary);
    REQUIRE(parts.size() == 3);
    CHECK(parts[2].data == std::string("\0\1\2", 3));
}

TEST_CASE("Verification against an unrelated root fails before anything is sent") {
    TlsStubServer server(200, "{}");
    CapturingLogger c;
    HttpsTransport transport(c.log);

    size_t staged_before = count_staged_ca_files();

    trust_policy_t trust;  // verify against the built-in pinned root
    CHECK_THROWS_AS(transport.post(server.base_url() + "/botT/getMe", sample_body(), trust), TransportError);

    CHECK(server.requests().empty());
    CHECK(count_staged_ca_files() == staged_before);
}

TEST_CASE("Verification against the server's own certificate succeeds") {
    TlsStubServer server(200, "{}");
    CapturingLogger c;
    HttpsTransport transport(c.log);

    size_t staged_before = count_staged_ca_files();

    trust_policy_t trust;
    trust.root_cert_pem = server.cert_pem();

    http_response_t r = transport.post(server.base_url() + "/botT/getMe", sample_body(), trust);
    CHECK(r.status == 200);
    CHECK(server.requests().size() == 1);
    CHECK_FALSE(c.contains(log_level_t::warn, "Skipping certificate verification"));
    CHECK(count_staged_ca_files() == staged_before);
}

TEST_CASE("Non-200 statuses are returned, not thrown") {
    TlsStubServer server(401, R"({"ok":false,"error_code":401,"description":"Unauthorized"})");
    CapturingLogger c;
    HttpsTransport transport(c.log);

    trust_policy_t trust;
    trust.mode = trust_mode_t::insecure;

    http_response_t r = transport.post(server.base_url() + "/botT/getMe", sample_body(), trust);
    CHECK(r.status == 401);
    CHECK_FALSE(r.ok());
    CHECK(r.body.find("Unauthorized") != std::string::npos);
}

TEST_CASE("Connection failures raise TransportError") {
    CapturingLogger c;
    HttpsTransport transport(c.log);

    unsigned short closed_port;
    {
        TlsStubServer server(200, "{}");
        closed_port = server.port();
    }

    trust_policy_t trust;
    trust.mode = trust_mode_t::insecure;
    CHECK_THROWS_AS(
        transport.post("https://127.0.0.1:" + std::to_string(closed_port) + "/x", sample_body(), trust),
        TransportError
    );
}

TEST_CASE("Identity check end to end") {
    CapturingLogger c;
    HttpsTransport transport(c.log);

    SUBCASE("200 yields the identity") {
        TlsStubServer server(200, R"({"ok":true,"result":{"id":1,"username":"bot1"}})");
        BotApiClient bot("1:T", 9, transport, c.log, server.base_url());
        bot.set_pinned_root(server.cert_pem());

        auto me = bot.get_me();
        REQUIRE(me.has_value());
        CHECK(me->id == 1);
        CHECK(me->username == "bot1");

        auto reqs = server.requests();
        REQUIRE(reqs.size() == 1);
        CHECK(reqs[0].target == "/bot1:T/getMe");
    }

    SUBCASE("401 yields nothing") {
        TlsStubServer server(401, "Unauthorized");
        BotApiClient bot("1:T", 9, transport, c.log, server.base_url());
        bot.enable_insecure_connection();

        CHECK_FALSE(bot.get_me().has_value());
        CHECK(c.contains(log_level_t::error, "401"));
    }
}

TEST_CASE("sendMessage end to end") {
    CapturingLogger c;
    HttpsTransport transport(c.log);

    SUBCASE("400 is a failure") {
        TlsStubServer server(400, "Bad Request");
        BotApiClient bot("1:T", 9, transport, c.log, server.base_url());
        bot.enable_insecure_connection();
        CHECK_FALSE(bot.send_message("hello"));
    }

    SUBCASE("200 is a success") {
        TlsStubServer server(200, R"({"ok":true,"result":{"message_id":3}})");
        BotApiClient bot("1:T", 9, transport, c.log, server.base_url());
        bot.enable_insecure_connection();
        CHECK(bot.send_message("hello"));

        auto reqs = server.requests();
        REQUIRE(reqs.size() == 1);
        CHECK(reqs[0].target == "/bot1:T/sendMessage");
        CHECK(reqs[0].body.find("hello") != std::string::npos);
    }
}
