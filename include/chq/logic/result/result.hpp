#pragma once

#include <expected>
#include <utility>

#include <chq/logic/result/error.hpp>

namespace chq {

struct EmptyResult {};

template <typename OkResult = EmptyResult> using Result = std::expected<OkResult, Error>;

template <typename T = EmptyResult> auto Ok(T&& v = {}) { return Result<T>(std::forward<T>(v)); }

template <ErrorType ErrorType = ErrorType::kUnknown>
std::unexpected<Error> MakeError(std::string message, ErrorDetails details = {}) {
  return std::unexpected<Error>(Error{ErrorType, std::move(message), std::move(details)});
}

template <ErrorType ErrorType = ErrorType::kUnknown, typename T>
std::unexpected<Error> WrapError(Result<T>&& result, std::string message) {
  return std::unexpected<Error>(result.error().Wrap(ErrorType, std::move(message)));
}

std::string What(const Error& error);

} // namespace chq
