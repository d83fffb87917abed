#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "defaults.h"
#include "logger.hpp"

struct TelewordConfig {
    std::string endpoint{DEFAULT_API_ENDPOINT};
    std::string cert_path;     // PEM replacing the built-in pinned root
    std::string token;

    bool insecure = false;
    bool markdown = false;
    std::optional<bool> silent;
};

// Reads a small file that may hold secrets. Refuses anything that is not a
// regular file, is a symlink, is writable by group/other or is owned by
// another user.
bool read_private_file(const std::string& path, std::string& out, Logger& log);

// INI style config:
//
//   [api]
//   endpoint = https://api.telegram.org
//   cert_path = /etc/teleword/root.pem
//   insecure = no
//   token = 123:abc
//
//   [send]
//   silent = yes
//   markdown = no
class GlobalTelewordConfig {
    TelewordConfig cfg;
    std::string cfg_path;

    private:
        void set(
            std::string_view section,
            std::string_view key,
            std::string_view val
        );

    public:
        GlobalTelewordConfig(std::string_view path, Logger& log) : log_(log) {
            cfg_path.assign(path.data(), path.size());
        }

        // Defaults are returned when the file cannot be read.
        TelewordConfig load();

        // Parses config text directly.
        TelewordConfig parse(std::string_view text);

    private:
        Logger& log_;
};

// Token precedence: command line, TELEGRAM_BOT_TOKEN, config file, then the
// first existing TOKEN_FILES entry. Surrounding whitespace is stripped.
std::optional<std::string> resolve_token(
    const std::string& cli_token,
    const std::string& config_token,
    Logger& log
);
