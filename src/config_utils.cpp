#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "../include/config_utils.h"
#include "../include/helpers.h"

static inline bool is_safe_fd(int fd, const std::string& path, Logger& log) {
    struct stat st{};
    if (fstat(fd, &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) {
        log.error("Refusing %s (not a regular file).", path.c_str());
        return false;
    }

    // deny group/world-writable
    if ((st.st_mode & 022) != 0) {
        log.error("Refusing %s (writable by group/other).", path.c_str());
        return false;
    }

    // owner must be current user (or root)
    uid_t uid = getuid();
    if (!(st.st_uid == uid || st.st_uid == 0)) {
        log.error("Refusing %s (owner mismatch): expected uid: %d, got: %d", path.c_str(), (int)uid, (int)st.st_uid);
        return false;
    }
    return true;
}

bool read_private_file(const std::string& path, std::string& out, Logger& log) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        log.error("Cannot open %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }

    if (!is_safe_fd(fd, path, log)) {
        ::close(fd);
        return false;
    }

    struct stat st{};
    if (fstat(fd, &st) != 0) {
        log.error("Cannot stat %s: %s", path.c_str(), std::strerror(errno));
        ::close(fd);
        return false;
    }

    out.clear();
    out.resize((size_t)st.st_size);
    size_t off = 0;
    while (off < (size_t)st.st_size) {
        ssize_t n = ::read(fd, out.data()+off, (size_t)st.st_size-off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            log.error("Cannot read %s", path.c_str());
            ::close(fd);
            return false;
        }
        off += (size_t)n;
    }

    ::close(fd);
    return true;
}

void GlobalTelewordConfig::set(std::string_view section, std::string_view key, std::string_view val) {
    bool b;

    if (section == "api") {
        if      (key == "endpoint")  cfg.endpoint.assign(val.data(), val.size());
        else if (key == "cert_path") cfg.cert_path = expand_home(val);
        else if (key == "token")     cfg.token.assign(val.data(), val.size());
        else if (key == "insecure")  { if (parse_bool(val,b)) cfg.insecure = b; }
        else log_.warn("Unknown key '%.*s' in [api]", (int)key.size(), key.data());
        return;
    }

    if (section == "send") {
        if      (key == "silent")   { if (parse_bool(val,b)) cfg.silent = b; }
        else if (key == "markdown") { if (parse_bool(val,b)) cfg.markdown = b; }
        else log_.warn("Unknown key '%.*s' in [send]", (int)key.size(), key.data());
        return;
    }

    log_.warn("Unknown config section [%.*s]", (int)section.size(), section.data());
}

TelewordConfig GlobalTelewordConfig::parse(std::string_view s) {
    std::string_view section = "api";

    while (!s.empty()) {
        size_t eol = s.find('\n');
        std::string_view line = (eol == std::string_view::npos) ? s : s.substr(0, eol);
        s = (eol == std::string_view::npos) ? std::string_view{} : s.substr(eol + 1);

        line = trim(line);
        if (line.empty()) continue;
        if (line.front()=='#' || line.front()==';') continue;

        if (line.front()=='[' && line.back()==']') {
            section = trim(line.substr(1, line.size()-2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) continue;

        std::string_view key = trim(line.substr(0, eq));
        std::string_view val = trim(line.substr(eq+1));
        if (key.empty()) continue;

        this->set(section, key, val);
    }

    return this->cfg;
}

TelewordConfig GlobalTelewordConfig::load() {
    std::string buf;
    if (!read_private_file(cfg_path, buf, log_)) return {};
    return parse(buf);
}

std::optional<std::string> resolve_token(
    const std::string& cli_token,
    const std::string& config_token,
    Logger& log
) {
    auto accept = [](std::string_view t) -> std::optional<std::string> {
        t = trim(t);
        if (t.empty()) return std::nullopt;
        return std::string(t);
    };

    if (auto t = accept(cli_token)) return t;

    if (const char* env = std::getenv(TOKEN_ENV)) {
        if (auto t = accept(env)) return t;
    }

    if (auto t = accept(config_token)) return t;

    for (const char* candidate : TOKEN_FILES) {
        std::string path = expand_home(candidate);

        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) continue;

        std::string contents;
        if (!read_private_file(path, contents, log)) continue;

        log.debug("Using token from %s", path.c_str());
        if (auto t = accept(contents)) return t;
    }

    return std::nullopt;
}
