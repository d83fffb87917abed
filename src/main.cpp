#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include <sodium.h>
#include <curl/curl.h>

#include "../include/arg_utils.h"
#include "../include/bot_api.hpp"
#include "../include/config_utils.h"
#include "../include/defaults.h"
#include "../include/https_transport.hpp"
#include "../include/logger.hpp"
#include "../include/upload_validator.h"

namespace {
    struct curl_global_t {
        curl_global_t() { ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; }
        ~curl_global_t() { if (ok) curl_global_cleanup(); }
        bool ok = false;
    };

    int bail(Logger& log, const char* message) {
        log.error("%s", message);
        return EXIT_FAILURE;
    }

    bool read_text_file(const std::string& path, std::string& out) {
        std::ifstream f(path, std::ios::binary);
        if (!f) return false;
        std::ostringstream ss;
        ss << f.rdbuf();
        out = ss.str();
        return !f.bad();
    }

    int run(const TelewordArgs& args, const TelewordConfig& cfg, const std::string& token, Logger& log) {
        HttpsTransport transport(log);
        BotApiClient bot(token, args.chat_id, transport, log, cfg.endpoint);

        // notifications stay disabled unless asked for
        std::optional<bool> silent = args.silent ? args.silent : cfg.silent;
        if (silent && !*silent) bot.enable_notifications();

        if (args.markdown || cfg.markdown) bot.set_parse_mode("markdown");
        if (args.insecure || cfg.insecure) bot.enable_insecure_connection();

        if (!cfg.cert_path.empty()) {
            std::string pem;
            if (!read_text_file(cfg.cert_path, pem)) {
                log.error("Cannot read certificate %s", cfg.cert_path.c_str());
                return EXIT_FAILURE;
            }
            bot.set_pinned_root(pem);
        }

        if (args.mode == "whoami") {
            auto me = bot.get_me();
            if (!me) return bail(log, "Identity check failed.");

            std::fprintf(stdout, "id: %lld\nusername: %s\n", (long long)me->id, me->username.c_str());
            return EXIT_SUCCESS;
        }

        if (args.mode == "text") {
            std::string text = args.text;
            if (text == "-") {
                text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            }

            if (!bot.send_message(text)) return bail(log, "Failed to send message.");
            log.info("Successfully sent message.");
            return EXIT_SUCCESS;
        }

        bool is_photo = (args.mode == "photo");

        if (!args.force) {
            upload_check_t check = is_photo
                ? check_upload(PHOTO_MIME_TYPE, args.path, PHOTO_SIZE_LIMIT)
                : check_upload(VIDEO_MIME_TYPE, args.path, VIDEO_SIZE_LIMIT);
            if (!check) return bail(log, check.reason.c_str());
        }

        if (is_photo) {
            if (!bot.send_photo(args.path, args.caption)) return bail(log, "Failed to send photo.");
            log.info("Successfully sent photo.");
        } else {
            if (!bot.send_video(args.path, args.caption, args.streaming)) return bail(log, "Failed to send video.");
            log.info("Successfully sent video.");
        }
        return EXIT_SUCCESS;
    }
} // namespace

int main(int argc, char** argv) {
    Logger log;

    ArgParser a{log};
    if (a.parse(argc, argv) != 0) return EXIT_FAILURE;

    TelewordArgs args = a.get_args();

    if (args.show_help) {
        a.usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (args.show_version) {
        std::fprintf(stdout, "teleword %s\n", TELEWORD_VERSION);
        return EXIT_SUCCESS;
    }

    if (args.verbose) log.set_threshold(log_level_t::debug);

    TelewordConfig cfg;
    std::string cfg_path = args.config_path;
    if (cfg_path.empty()) {
        const char* env = std::getenv(CONFIG_ENV);
        if (env) cfg_path = env;
    }
    if (!cfg_path.empty()) {
        cfg = GlobalTelewordConfig(cfg_path, log).load();
    }

    auto token = resolve_token(args.token, cfg.token, log);
    if (!token) {
        return bail(log, "Bot API token was not provided as an argument, environment variable or provided via file!");
    }

    if (sodium_init() < 0) {
        return bail(log, "sodium_init failed");
    }

    curl_global_t curl_global;
    if (!curl_global.ok) {
        return bail(log, "curl_global_init failed");
    }

    try {
        return run(args, cfg, *token, log);
    } catch (const TransportError& e) {
        log.error("%s", e.what());
    } catch (const std::system_error& e) {
        log.error("I/O error: %s", e.what());
    } catch (const std::exception& e) {
        log.error("%s", e.what());
    }
    return EXIT_FAILURE;
}
