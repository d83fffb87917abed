#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "../include/arg_utils.h"
#include "../include/defaults.h"

ArgParser::ArgParser(Logger& log) : log_(log) {
    auto flag = [this](bool TelewordArgs::*member) -> handler_t {
        return [this, member](int&, int, char**) { args_.*member = true; return true; };
    };

    option_handlers_ = {
        // General
        {"--help",     flag(&TelewordArgs::show_help)},
        {"--version",  flag(&TelewordArgs::show_version)},
        {"--verbose",  flag(&TelewordArgs::verbose)},
        {"--config",   [this](int& i, int argc, char** argv) { return take_value(args_.config_path, i, argc, argv); }},
        {"--token",    [this](int& i, int argc, char** argv) { return take_value(args_.token, i, argc, argv); }},

        // Message options
        {"--markdown", flag(&TelewordArgs::markdown)},
        {"--silent",   [this](int&, int, char**) { args_.silent = true;  return true; }},
        {"--loud",     [this](int&, int, char**) { args_.silent = false; return true; }},
        {"--force",    flag(&TelewordArgs::force)},
        {"--insecure", flag(&TelewordArgs::insecure)},

        // Photo / video
        {"--caption",   [this](int& i, int argc, char** argv) { return take_value(args_.caption, i, argc, argv); }},
        {"--streaming", flag(&TelewordArgs::streaming)},
    };
}

void ArgParser::usage(const char* prog) const {
    fprintf(
        stderr,
        "Usage:\n"
        "  %s CHAT_ID [options] text <TEXT|->\n"
        "  %s CHAT_ID [options] photo <path> [--caption <text>]\n"
        "  %s CHAT_ID [options] video <path> [--caption <text>] [--streaming]\n"
        "  %s CHAT_ID [options] whoami\n"
        "\n"
        "Options:\n"
        "  --token <token>   Bot API token (else $%s, config, ~/.teleword_token)\n"
        "  --config <path>   Config file (else $%s)\n"
        "  --markdown        Use Markdown formatting\n"
        "  --silent|--loud   Disable/enable notification for the recipient\n"
        "  --force           Skip upload sanity checks\n"
        "  --insecure        Skip certificate verification\n"
        "  --verbose         Log debug information\n"
        "  --version         Print version\n",
        prog, prog, prog, prog, TOKEN_ENV, CONFIG_ENV
    );
}

bool ArgParser::take_value(std::string& out, int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        log_.error("%s requires a value", argv[i]);
        return false;
    }
    out = argv[++i];
    return true;
}

bool ArgParser::apply_positionals(const std::vector<std::string>& pos) {
    if (pos.size() < 2) {
        log_.error("CHAT_ID and a mode are required");
        return false;
    }

    const char* s = pos[0].c_str();
    char* end = nullptr;
    errno = 0;
    long long id = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') {
        log_.error("Invalid chat ID: %s", s);
        return false;
    }
    args_.chat_id = (std::int64_t)id;
    args_.mode = pos[1];

    if (args_.mode == "whoami") {
        if (pos.size() != 2) {
            log_.error("whoami takes no arguments");
            return false;
        }
        return true;
    }

    if (args_.mode != "text" && args_.mode != "photo" && args_.mode != "video") {
        log_.error("Unknown mode: %s", args_.mode.c_str());
        return false;
    }

    if (pos.size() != 3) {
        log_.error("%s mode requires exactly one %s argument", args_.mode.c_str(), args_.mode == "text" ? "TEXT" : "PATH");
        return false;
    }

    if (args_.mode == "text") args_.text = pos[2];
    else                      args_.path = pos[2];

    if (args_.mode == "text" && !args_.caption.empty()) {
        log_.error("--caption is only valid for photo and video");
        return false;
    }
    if (args_.mode != "video" && args_.streaming) {
        log_.error("--streaming is only valid for video");
        return false;
    }
    return true;
}

int ArgParser::parse(int argc, char** argv) {
    args_ = {};
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strncmp(arg, "--", 2) != 0) {
            positionals.emplace_back(arg);
            continue;
        }

        auto it = option_handlers_.find(arg);
        if (it == option_handlers_.end()) {
            log_.error("Unknown argument: %s", arg);
            usage(argv[0]);
            return -1;
        }
        if (!it->second(i, argc, argv)) {
            usage(argv[0]);
            return -1;
        }
    }

    if (args_.show_help || args_.show_version) return 0;

    if (!apply_positionals(positionals)) {
        usage(argv[0]);
        return -1;
    }
    return 0;
}
