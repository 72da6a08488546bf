#include <lambdalocal/common/util.hpp>

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <fstream>

#include <sys/resource.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lambdalocal::common::util {

  void traceback()
  {
    void* array[10];
    size_t size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    for (size_t i = 0; i < size; ++i)
      spdlog::warn("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  std::optional<std::string> getenv(const char* name)
  {
    const char* val = std::getenv(name);
    if (val == nullptr || *val == '\0') {
      return std::nullopt;
    }
    return std::string{val};
  }

  std::optional<int> getenv_int(const char* name)
  {
    auto val = getenv(name);
    if (!val.has_value()) {
      return std::nullopt;
    }

    int result{};
    auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), result);
    if (ec != std::errc{} || ptr != val->data() + val->size()) {
      throw common::InvalidConfigurationError(
          fmt::format("Environment variable {} is not an integer: {}", name, val.value())
      );
    }
    return result;
  }

  bool getenv_flag(const char* name)
  {
    auto val = getenv(name);
    return val.has_value() && val.value() != "0" && val.value() != "false";
  }

  int64_t unix_ms(std::chrono::system_clock::time_point time)
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
  }

  std::string format_utc_timestamp(std::chrono::system_clock::time_point time)
  {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = unix_ms(time) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    return fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1,
        utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millis
    );
  }

  namespace {

    std::optional<int64_t> read_bytes(const char* path)
    {
      std::ifstream in{path};
      if (!in.is_open()) {
        return std::nullopt;
      }
      int64_t bytes{};
      if (!(in >> bytes)) {
        return std::nullopt;
      }
      return bytes;
    }

  } // namespace

  int64_t max_memory_used_mb()
  {
    constexpr int64_t MIB = 1024 * 1024;

    if (auto bytes = read_bytes("/sys/fs/cgroup/memory.peak"); bytes.has_value()) {
      return bytes.value() / MIB;
    }
    if (auto bytes = read_bytes("/sys/fs/cgroup/memory/memory.max_usage_in_bytes");
        bytes.has_value()) {
      return bytes.value() / MIB;
    }

    // ru_maxrss is in KiB on Linux.
    rusage usage{};
    if (getrusage(RUSAGE_CHILDREN, &usage) != 0) {
      return 0;
    }
    return usage.ru_maxrss / 1024;
  }

} // namespace lambdalocal::common::util
