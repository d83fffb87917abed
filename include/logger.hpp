#pragma once

#include <cstdarg>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "defaults.h"

enum class log_level_t : std::uint8_t {
    debug = 0,
    info  = 1,
    warn  = 2,
    error = 3
};

const char* log_level_name(log_level_t level);

// Logger handed to every component. Messages are formatted printf-style,
// passed through the redaction rules in insertion order and then written to
// the sink (stderr unless replaced).
class Logger {
public:
    using sink_t        = std::function<void(log_level_t, const std::string&)>;
    using redact_rule_t = std::function<void(std::string&)>;

    explicit Logger(log_level_t threshold = log_level_t::info);

    void set_threshold(log_level_t level) { threshold_ = level; }
    log_level_t threshold() const { return threshold_; }

    void set_sink(sink_t sink);

    void add_redaction(redact_rule_t rule);

    // Replaces every occurrence of secret with "<REDACTED>". Empty secrets are ignored.
    void redact_literal(const std::string& secret);

    std::string redact(std::string msg) const;

    void debug(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void warn(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:
    void vlog(log_level_t level, const char* fmt, va_list ap);

    static void write_stderr(log_level_t level, const std::string& msg);

    log_level_t threshold_;
    sink_t sink_;
    std::vector<redact_rule_t> rules_;
};
