#ifndef LAMBDALOCAL_COMMON_EXCEPTIONS_HPP
#define LAMBDALOCAL_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace lambdalocal::common {

  struct LambdaLocalException : std::runtime_error {

    LambdaLocalException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : LambdaLocalException {

    InvalidConfigurationError(const std::string& msg) : LambdaLocalException(msg) {}
  };

  // No executable could be found at any of the bootstrap locations.
  // Only the caller can fix it by providing a working sandbox.
  struct BootstrapNotFound : LambdaLocalException {

    BootstrapNotFound(const std::string& msg) : LambdaLocalException(msg) {}
  };

  struct ProcessSpawnError : LambdaLocalException {

    ProcessSpawnError(const std::string& msg) : LambdaLocalException(msg) {}
  };

  struct HandoffClosed : LambdaLocalException {

    HandoffClosed() : LambdaLocalException("Invocation handoff has been closed") {}
  };

} // namespace lambdalocal::common

#endif
