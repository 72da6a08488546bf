#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/http.hpp>
#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/server.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <json/json.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

  using lambdalocal::common::InvalidConfigurationError;
  namespace config = lambdalocal::emulator::config;

  std::string read_event(const config::Emulator& cfg)
  {
    std::string event;
    if (cfg.event.has_value()) {
      event = cfg.event.value();
    } else if (cfg.event_file.has_value()) {
      std::ifstream in{cfg.event_file.value()};
      if (!in.is_open()) {
        throw InvalidConfigurationError(
            fmt::format("Could not open event file {}", cfg.event_file.value())
        );
      }
      event.assign(std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{});
    } else if (cfg.event_stdin) {
      event.assign(std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{});
    }

    if (event.empty()) {
      event = "{}";
    }
    return event;
  }

  // Valid JSON is printed on a single line, anything else verbatim.
  std::string one_line(const std::string& body)
  {
    Json::Value root;
    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader{reader_builder.newCharReader()};
    std::string errors;
    if (body.empty() || !reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
      return body;
    }

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    return Json::writeString(writer_builder, root);
  }

} // namespace

int main(int argc, char** argv)
{
  using namespace lambdalocal;

  // Standard output carries only the invocation result.
  spdlog::set_default_logger(spdlog::stderr_color_mt("lambdalocal"));

  emulator::config::Emulator cfg;
  try {
    cfg = emulator::config::Emulator::deserialize(argc, argv);
  } catch (const common::InvalidConfigurationError& exc) {
    spdlog::error("Invalid configuration: {}", exc.what());
    return 1;
  }

  if (cfg.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");

  common::http::HTTPClientFactory::initialize(1);

  int exit_code = 0;
  try {

    emulator::Server server{cfg};
    emulator::Lifecycle::install_signal_handlers(&server.lifecycle());
    server.run();

    if (cfg.stay_open) {

      exit_code = server.wait();

    } else {

      auto& dispatcher = server.dispatcher();
      auto ctx = dispatcher.create_context(read_event(cfg));

      bool failed = false;
      try {
        dispatcher.invoke(ctx);
      } catch (const common::BootstrapNotFound& exc) {
        spdlog::error("Fatal error: {}", exc.what());
        failed = true;
      }

      auto error = ctx->error();
      if (error.has_value()) {
        std::cout << error->serialize() << std::endl;
      } else {
        std::cout << one_line(ctx->reply().value_or("")) << std::endl;
      }

      server.shutdown(failed || error.has_value() ? 1 : 0);
      exit_code = server.wait();
    }

  } catch (const common::LambdaLocalException& exc) {
    spdlog::error("Fatal error: {}", exc.what());
    exit_code = 1;
  }

  common::http::HTTPClientFactory::shutdown();
  spdlog::info("Emulator is closing down");

  return exit_code;
}
