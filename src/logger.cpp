#include <cstdio>
#include <ctime>

#include "../include/logger.hpp"

const char* log_level_name(log_level_t level) {
    switch (level) {
        case log_level_t::debug: return "DEBUG";
        case log_level_t::info:  return "INFO";
        case log_level_t::warn:  return "WARN";
        case log_level_t::error: return "ERROR";
    }
    return "?";
}

Logger::Logger(log_level_t threshold) : threshold_(threshold), sink_(&Logger::write_stderr) {}

void Logger::set_sink(sink_t sink) {
    sink_ = sink ? std::move(sink) : sink_t(&Logger::write_stderr);
}

void Logger::add_redaction(redact_rule_t rule) {
    if (rule) rules_.push_back(std::move(rule));
}

void Logger::redact_literal(const std::string& secret) {
    if (secret.empty()) return;

    add_redaction([secret](std::string& msg) {
        constexpr const char* MASK = "<REDACTED>";
        constexpr size_t MASK_LEN  = 10;

        size_t pos = 0;
        while ((pos = msg.find(secret, pos)) != std::string::npos) {
            msg.replace(pos, secret.size(), MASK);
            pos += MASK_LEN;
        }
    });
}

std::string Logger::redact(std::string msg) const {
    for (const auto& rule : rules_) rule(msg);
    return msg;
}

void Logger::vlog(log_level_t level, const char* fmt, va_list ap) {
    if (level < threshold_) return;

    va_list copy;
    va_copy(copy, ap);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n < 0) return;

    std::string msg((size_t)n, '\0');
    std::vsnprintf(msg.data(), msg.size() + 1, fmt, ap);

    sink_(level, redact(std::move(msg)));
}

void Logger::write_stderr(log_level_t level, const std::string& msg) {
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    localtime_r(&now, &tm_now);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);

    const char* color = "";
    if (level == log_level_t::error)     color = RED;
    else if (level == log_level_t::warn) color = YELLOW;

    std::fprintf(
        stderr,
        "%s[ %s | %-6s ] %s%s\n", color, stamp, log_level_name(level), msg.c_str(), *color ? RESET : ""
    );
}

#define LOGGER_FORWARD(name, level)                  \
    void Logger::name(const char* fmt, ...) {       \
        va_list ap;                                  \
        va_start(ap, fmt);                           \
        vlog(level, fmt, ap);                        \
        va_end(ap);                                  \
    }

LOGGER_FORWARD(debug, log_level_t::debug)
LOGGER_FORWARD(info,  log_level_t::info)
LOGGER_FORWARD(warn,  log_level_t::warn)
LOGGER_FORWARD(error, log_level_t::error)

#undef LOGGER_FORWARD
