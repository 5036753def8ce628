#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace chq {

enum class ErrorType {
  kUnknown,
  kValidation,
  kQuery,
  kConnection,
  kTimeout,
  kCancelled,
};

// Machine-readable code, e.g. "VALIDATION_ERROR".
std::string ToCode(ErrorType type);

struct ErrorDetails {
  std::optional<std::string> field;
  std::optional<std::string> value;
  std::optional<std::string> query_id;
};

class Error : public std::exception {
private:
  struct ErrorData {
    ErrorType type;
    std::string message;
  };

public:
  Error(ErrorType type, std::string message, ErrorDetails details = {});
  std::string What() const;
  virtual const char* what() const noexcept override;
  Error& Wrap(ErrorType type, std::string message);
  bool Wraps(ErrorType type) const;

  ErrorType Type() const;
  std::string Code() const;
  const ErrorDetails& Details() const;

private:
  std::vector<ErrorData> wrapped_;
  ErrorDetails details_;
  std::string what_;
};

}  // namespace chq
