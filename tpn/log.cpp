#include "tpn/log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace tpn {

namespace {

std::string Timestamp() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
  localtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
  return out;
}

}  // namespace

const char* LogLevelString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
    default:
      return "?";
  }
}

bool ParseLogLevel(const std::string& text, LogLevel* out) {
  static const struct {
    const char* name;
    LogLevel level;
  } kLevels[] = {
      {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
      {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
      {"error", LogLevel::Error}, {"off", LogLevel::Off},
  };

  for (const auto& entry : kLevels) {
    if (text == entry.name) {
      *out = entry.level;
      return true;
    }
  }
  return false;
}

Logger& Logger::Instance() {
  static Logger inst;
  return inst;
}

Logger::Logger() : out_(&std::cerr), level_(LogLevel::Warn) {}

void Logger::SetOutput(std::ostream* os) {
  std::lock_guard<std::mutex> lock(mtx_);
  out_ = os ? os : &std::cerr;
}

void Logger::Log(LogLevel level, const std::string& msg) {
  if (!Enabled(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  *out_ << Timestamp() << " [" << LogLevelString(level) << "] " << msg
        << std::endl;
}

}  // namespace tpn
