#pragma once

/// @file exception.h
/// @brief Exception classes for keyscope.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace keyscope {

/// @brief Base exception class for keyscope errors.
class KeyscopeException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit KeyscopeException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  KeyscopeException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def KEYSCOPE_CHECK
/// @brief Throws KeyscopeException if condition is false.
#define KEYSCOPE_CHECK(cond, code)   \
  do {                               \
    if (!(cond)) {                   \
      throw KeyscopeException(code); \
    }                                \
  } while (0)

/// @def KEYSCOPE_CHECK_MSG
/// @brief Throws KeyscopeException with custom message if condition is false.
#define KEYSCOPE_CHECK_MSG(cond, code, msg) \
  do {                                      \
    if (!(cond)) {                          \
      throw KeyscopeException(code, msg);   \
    }                                       \
  } while (0)

}  // namespace keyscope
