#include <chq/logic/log/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace chq {

std::string ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kOff:
      return "OFF";
  }
  std::unreachable();
}

Result<LogLevel> ParseLogLevel(std::string_view level) {
  std::string lowered{level};
  std::ranges::transform(lowered, lowered.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "info") {
    return LogLevel::kInfo;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  if (lowered == "off" || lowered == "none") {
    return LogLevel::kOff;
  }
  return MakeError<ErrorType::kValidation>("unknown log level '" + std::string{level} + "'",
                                           {.field = "log_level", .value = std::string{level}});
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void StreamLogger::Log(LogLevel level, std::string_view component, std::string_view message) {
  if (!Enabled(level)) {
    return;
  }
  std::lock_guard lock{mutex_};
  out_ << '[' << ToString(level) << "] " << component << ": " << message << '\n';
}

bool StreamLogger::Enabled(LogLevel level) const {
  return level != LogLevel::kOff && level >= min_level_;
}

void NullLogger::Log(LogLevel, std::string_view, std::string_view) {}

bool NullLogger::Enabled(LogLevel) const { return false; }

std::shared_ptr<Logger> MakeDefaultLogger() {
  LogLevel level = LogLevel::kWarn;
  if (const char* env = std::getenv(kLogLevelEnv)) {
    level = ParseLogLevel(env).value_or(LogLevel::kWarn);
  }
  return std::make_shared<StreamLogger>(std::clog, level);
}

ComponentLogger::ComponentLogger(std::shared_ptr<Logger> logger, std::string component)
    : logger_(logger ? std::move(logger) : MakeDefaultLogger()), component_(std::move(component)) {}

void ComponentLogger::Debug(std::string_view message) const {
  logger_->Log(LogLevel::kDebug, component_, message);
}

void ComponentLogger::Info(std::string_view message) const {
  logger_->Log(LogLevel::kInfo, component_, message);
}

void ComponentLogger::Warn(std::string_view message) const {
  logger_->Log(LogLevel::kWarn, component_, message);
}

void ComponentLogger::Error(std::string_view message) const {
  logger_->Log(LogLevel::kError, component_, message);
}

bool ComponentLogger::Enabled(LogLevel level) const { return logger_->Enabled(level); }

const std::shared_ptr<Logger>& ComponentLogger::Sink() const { return logger_; }

}  // namespace chq
