#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace vscore::common {

// Exception type for internal errors (compiler bugs, not user errors).
// Dereferencing an identifier that was never allocated, or casting one to
// the wrong node kind, ends up here.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in vscore, not in the design being compiled.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace vscore::common
