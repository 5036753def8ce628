#include <chq/logic/result/result.hpp>

#include <algorithm>
#include <ranges>
#include <sstream>
#include <utility>

namespace chq {

std::string ToCode(ErrorType type) {
  switch (type) {
    case ErrorType::kUnknown:
      return "UNKNOWN_ERROR";
    case ErrorType::kValidation:
      return "VALIDATION_ERROR";
    case ErrorType::kQuery:
      return "QUERY_ERROR";
    case ErrorType::kConnection:
      return "CONNECTION_ERROR";
    case ErrorType::kTimeout:
      return "TIMEOUT_ERROR";
    case ErrorType::kCancelled:
      return "CANCELLED_ERROR";
  }
  std::unreachable();
}

Error::Error(ErrorType type, std::string message, ErrorDetails details)
    : wrapped_({ErrorData{type, std::move(message)}}), details_(std::move(details)) {
  what_ = What();
}

std::string Error::What() const {
  std::ostringstream res;
  res << wrapped_.back().message;
  auto view_without_first = wrapped_ | std::views::reverse | std::views::drop(1);
  for (const auto& el : view_without_first) {
    res << ": " << el.message;
  }
  return res.str();
}

Error& Error::Wrap(ErrorType type, std::string message) {
  wrapped_.push_back(ErrorData{type, std::move(message)});
  what_ = What();
  return *this;
}

bool Error::Wraps(ErrorType type) const {
  return std::ranges::find(wrapped_, type, &ErrorData::type) != wrapped_.end();
}

ErrorType Error::Type() const { return wrapped_.front().type; }

std::string Error::Code() const { return ToCode(Type()); }

const ErrorDetails& Error::Details() const { return details_; }

const char* Error::what() const noexcept { return what_.c_str(); }

std::string What(const Error& error) { return error.What(); }

}  // namespace chq
