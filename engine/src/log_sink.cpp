#include "fsplit/log_sink.hpp"

#include <iostream>

namespace fsplit {

namespace {

const char *level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "\033[2m";
    case LogLevel::Info:
        return "\033[0m";
    case LogLevel::Warn:
        return "\033[1;33m";
    case LogLevel::Error:
        return "\033[1;31m";
    }
    return "\033[0m";
}

constexpr const char *reset_color = "\033[0m";

} // namespace

const char *to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

ConsoleLogSink::ConsoleLogSink(bool verbose, bool color)
    : ConsoleLogSink(verbose, color, std::cout, std::cerr) {}

ConsoleLogSink::ConsoleLogSink(bool verbose, bool color, std::ostream &out, std::ostream &err)
    : verbose_(verbose), color_(color), out_(out), err_(err) {}

void ConsoleLogSink::emit(LogLevel level, const std::string &message) {
    const bool is_problem = level == LogLevel::Warn || level == LogLevel::Error;
    if (!is_problem && !verbose_) {
        return;
    }
    std::ostream &stream = is_problem ? err_ : out_;
    if (color_) {
        stream << level_color(level);
    }
    stream << '[' << to_string(level) << "] " << message;
    if (color_) {
        stream << reset_color;
    }
    stream << std::endl;
}

LogSink &null_log_sink() {
    static NullLogSink sink;
    return sink;
}

} // namespace fsplit
