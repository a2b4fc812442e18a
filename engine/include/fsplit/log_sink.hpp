#pragma once

#include <ostream>
#include <string>

namespace fsplit {

enum class LogLevel { Debug, Info, Warn, Error };

const char *to_string(LogLevel level) noexcept;

class LogSink {
  public:
    virtual ~LogSink() = default;

    virtual void emit(LogLevel level, const std::string &message) = 0;
};

class NullLogSink : public LogSink {
  public:
    void emit(LogLevel, const std::string &) override {}
};

// Debug and info lines go to `out` only when verbose; warnings and errors
// always go to `err`.
class ConsoleLogSink : public LogSink {
  public:
    explicit ConsoleLogSink(bool verbose, bool color = true);
    ConsoleLogSink(bool verbose, bool color, std::ostream &out, std::ostream &err);

    void emit(LogLevel level, const std::string &message) override;

  private:
    bool verbose_;
    bool color_;
    std::ostream &out_;
    std::ostream &err_;
};

// Shared no-op sink used when a component is constructed without one.
LogSink &null_log_sink();

} // namespace fsplit
