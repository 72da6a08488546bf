#ifndef LAMBDALOCAL_COMMON_UUID_HPP
#define LAMBDALOCAL_COMMON_UUID_HPP

#include <chrono>
#include <random>
#include <string>

#include <fmt/format.h>
#include <uuid.h>

namespace lambdalocal::common {

  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    uuids::uuid generate()
    {
      return _uuid_generator();
    }

    // Random generators are not thread-safe, each thread keeps its own.
    static std::string random_string()
    {
      thread_local UUID generator;
      return uuids::to_string(generator.generate());
    }

    // X-Ray style trace header: Root=1-<epoch hex>-<96 bit hex>;Parent=<64 bit hex>;Sampled=1
    static std::string trace_id(std::chrono::system_clock::time_point now)
    {
      thread_local UUID generator;

      // Root and Parent come from independent UUIDs.
      std::string root = hex(generator.generate());
      std::string parent = hex(generator.generate());
      auto epoch =
          std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

      return fmt::format(
          "Root=1-{:08x}-{};Parent={};Sampled=1", epoch, root.substr(0, 24), parent.substr(0, 16)
      );
    }

  private:
    static std::string hex(const uuids::uuid& id)
    {
      std::string result;
      for (std::byte b : id.as_bytes()) {
        result += fmt::format("{:02x}", static_cast<unsigned>(b));
      }
      return result;
    }

    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
  };

} // namespace lambdalocal::common

#endif
