#ifndef LAMBDALOCAL_COMMON_UTIL_HPP
#define LAMBDALOCAL_COMMON_UTIL_HPP

#include <lambdalocal/common/exceptions.hpp>

#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <execinfo.h>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace lambdalocal::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  template <typename U>
  bool expect_zero(U&& u)
  {
    if (u) {
      spdlog::error("Expected zero, found: {}, errno {}, message {}", u, errno, strerror(errno));
      traceback();
      return false;
    }
    return true;
  }

  template <typename U>
  bool expect_other(U&& u, int val)
  {
    if (u == val) {
      spdlog::error(
          "Expected value other than {}, found: {}, errno {}, message {}", val, u, errno,
          strerror(errno)
      );
      traceback();
      return false;
    }
    return true;
  }

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  // Same as above, but for plain values that keep their current default.
  template <typename T>
  void cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  std::optional<std::string> getenv(const char* name);

  // Parses an integer environment value, throws InvalidConfigurationError on garbage.
  std::optional<int> getenv_int(const char* name);

  bool getenv_flag(const char* name);

  int64_t unix_ms(std::chrono::system_clock::time_point time);

  // 2006-01-02T15:04:05.000Z
  std::string format_utc_timestamp(std::chrono::system_clock::time_point time);

  // Peak memory of the sandbox in MiB: cgroup v2, cgroup v1, then rusage of children.
  int64_t max_memory_used_mb();

} // namespace lambdalocal::common::util

#endif
