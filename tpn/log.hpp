#ifndef TPN_LOG_HPP
#define TPN_LOG_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace tpn {

// Log severity. Off disables all output.
enum class LogLevel : uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

const char* LogLevelString(LogLevel level);

// Parse "trace", "debug", "info", "warn", "error" or "off".
// Returns false and leaves *out untouched on unknown input.
bool ParseLogLevel(const std::string& text, LogLevel* out);

// Thread-safe process-wide logger. Writes to stderr by default.
class Logger {
 public:
  static Logger& Instance();

  void SetLevel(LogLevel level) { level_.store(level); }
  LogLevel Level() const { return level_.load(); }

  bool Enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= level_.load();
  }

  // Redirect output (nullptr restores stderr). The stream must outlive use.
  void SetOutput(std::ostream* os);

  void Log(LogLevel level, const std::string& msg);

 private:
  Logger();

  std::mutex mtx_;
  std::ostream* out_;
  std::atomic<LogLevel> level_;
};

// Collects << into a string and emits it on destruction
class LogLine {
 public:
  explicit LogLine(LogLevel level) : level_(level) {}
  ~LogLine() { Logger::Instance().Log(level_, ss_.str()); }

  template <typename T>
  LogLine& operator<<(const T& v) {
    ss_ << v;
    return *this;
  }

 private:
  LogLevel level_;
  std::ostringstream ss_;
};

}  // namespace tpn

// The message expression is only evaluated when the level is enabled.
#define TPN_LOG(level)                                  \
  if (!::tpn::Logger::Instance().Enabled(level)) {      \
  } else                                                \
    ::tpn::LogLine(level)

#define TPN_LOG_TRACE TPN_LOG(::tpn::LogLevel::Trace)
#define TPN_LOG_DEBUG TPN_LOG(::tpn::LogLevel::Debug)
#define TPN_LOG_INFO TPN_LOG(::tpn::LogLevel::Info)
#define TPN_LOG_WARN TPN_LOG(::tpn::LogLevel::Warn)
#define TPN_LOG_ERROR TPN_LOG(::tpn::LogLevel::Error)

#endif  // TPN_LOG_HPP
