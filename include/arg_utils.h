#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "logger.hpp"

struct TelewordArgs {
    std::int64_t chat_id = 0;

    std::string mode;          // "text" / "photo" / "video" / "whoami"
    std::string text;          // text mode, "-" reads stdin
    std::string path;          // photo / video
    std::string caption;

    std::string token;
    std::string config_path;

    std::optional<bool> silent;

    bool streaming = false;
    bool markdown  = false;
    bool force     = false;
    bool insecure  = false;
    bool verbose   = false;

    bool show_help    = false;
    bool show_version = false;
};

class ArgParser {
public:
    explicit ArgParser(Logger& log);

    void usage(const char* prog) const;

    // 0 on success (including --help / --version), -1 on bad arguments.
    int parse(int argc, char** argv);

    TelewordArgs get_args() const { return args_; }

private:
    using handler_t = std::function<bool(int&, int, char**)>;

    bool take_value(std::string& out, int& i, int argc, char** argv);
    bool apply_positionals(const std::vector<std::string>& pos);

    TelewordArgs args_;
    std::unordered_map<std::string, handler_t> option_handlers_;
    Logger& log_;
};
