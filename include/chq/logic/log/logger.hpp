#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <chq/logic/result/result.hpp>

namespace chq {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

std::string ToString(LogLevel level);

Result<LogLevel> ParseLogLevel(std::string_view level);

class Logger {
public:
  virtual ~Logger() = default;
  virtual void Log(LogLevel level, std::string_view component, std::string_view message) = 0;
  virtual bool Enabled(LogLevel level) const = 0;
};

// Writes "[LEVEL] component: message" lines.
class StreamLogger final : public Logger {
public:
  explicit StreamLogger(std::ostream& out = std::clog, LogLevel min_level = LogLevel::kWarn);

  void Log(LogLevel level, std::string_view component, std::string_view message) override;
  bool Enabled(LogLevel level) const override;

private:
  std::ostream& out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

class NullLogger final : public Logger {
public:
  void Log(LogLevel level, std::string_view component, std::string_view message) override;
  bool Enabled(LogLevel level) const override;
};

inline constexpr char kLogLevelEnv[] = "CHQ_LOG_LEVEL";

// Fresh StreamLogger on std::clog, level taken from CHQ_LOG_LEVEL (warn when
// unset or unparsable).
std::shared_ptr<Logger> MakeDefaultLogger();

class ComponentLogger {
public:
  ComponentLogger(std::shared_ptr<Logger> logger, std::string component);

  void Debug(std::string_view message) const;
  void Info(std::string_view message) const;
  void Warn(std::string_view message) const;
  void Error(std::string_view message) const;
  bool Enabled(LogLevel level) const;

  const std::shared_ptr<Logger>& Sink() const;

private:
  std::shared_ptr<Logger> logger_;
  std::string component_;
};

}  // namespace chq
