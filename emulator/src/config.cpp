#include <lambdalocal/emulator/config.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace lambdalocal::emulator::config {

  namespace util = common::util;

  std::string Function::arn() const
  {
    if (invoked_arn.has_value()) {
      return invoked_arn.value();
    }

    std::string account;
    std::copy_if(account_id.begin(), account_id.end(), std::back_inserter(account), [](char c) {
      return std::isdigit(static_cast<unsigned char>(c));
    });
    return fmt::format("arn:aws:lambda:{}:{}:function:{}", region, account, name);
  }

  void Function::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional
    util::cereal_load_value(archive, "name", name);
    util::cereal_load_value(archive, "version", version);
    util::cereal_load_value(archive, "memory-size", memory_size);
    util::cereal_load_value(archive, "timeout", timeout);
    util::cereal_load_value(archive, "region", region);
    util::cereal_load_value(archive, "account-id", account_id);
    util::cereal_load_value(archive, "handler", handler);

    std::string value;
    util::cereal_load_value(archive, "trace-id", value);
    if (!value.empty()) {
      trace_id = std::move(value);
    }
    value.clear();
    util::cereal_load_value(archive, "client-context", value);
    if (!value.empty()) {
      client_context = std::move(value);
    }
    value.clear();
    util::cereal_load_value(archive, "cognito-identity", value);
    if (!value.empty()) {
      cognito_identity = std::move(value);
    }
    value.clear();
    util::cereal_load_value(archive, "invoked-arn", value);
    if (!value.empty()) {
      invoked_arn = std::move(value);
    }
  }

  void Function::load_env()
  {
    if (auto val = util::getenv("AWS_LAMBDA_FUNCTION_NAME"); val.has_value()) {
      name = val.value();
    }
    if (auto val = util::getenv("AWS_LAMBDA_FUNCTION_VERSION"); val.has_value()) {
      version = val.value();
    }
    if (auto val = util::getenv_int("AWS_LAMBDA_FUNCTION_MEMORY_SIZE"); val.has_value()) {
      memory_size = val.value();
    }
    if (auto val = util::getenv_int("AWS_LAMBDA_FUNCTION_TIMEOUT"); val.has_value()) {
      timeout = val.value();
    }
    if (auto val = util::getenv("AWS_REGION"); val.has_value()) {
      region = val.value();
    } else if (auto val = util::getenv("AWS_DEFAULT_REGION"); val.has_value()) {
      region = val.value();
    }
    if (auto val = util::getenv("AWS_ACCOUNT_ID"); val.has_value()) {
      account_id = val.value();
    }
    if (auto val = util::getenv("AWS_LAMBDA_FUNCTION_HANDLER"); val.has_value()) {
      handler = val.value();
    } else if (auto val = util::getenv("_HANDLER"); val.has_value()) {
      handler = val.value();
    }
    if (auto val = util::getenv("_X_AMZN_TRACE_ID"); val.has_value()) {
      trace_id = val.value();
    }
    if (auto val = util::getenv("AWS_LAMBDA_CLIENT_CONTEXT"); val.has_value()) {
      client_context = val.value();
    }
    if (auto val = util::getenv("AWS_LAMBDA_COGNITO_IDENTITY"); val.has_value()) {
      cognito_identity = val.value();
    }
    if (auto val = util::getenv("AWS_LAMBDA_FUNCTION_INVOKED_ARN"); val.has_value()) {
      invoked_arn = val.value();
    }
  }

  void Function::set_defaults()
  {
    name = DEFAULT_NAME;
    version = DEFAULT_VERSION;
    memory_size = DEFAULT_MEMORY_SIZE;
    timeout = DEFAULT_TIMEOUT;
    region = DEFAULT_REGION;
    account_id = DEFAULT_ACCOUNT_ID;
    handler = DEFAULT_HANDLER;
    trace_id.reset();
    client_context.reset();
    cognito_identity.reset();
    invoked_arn.reset();
  }

  void Function::validate() const
  {
    if (timeout <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Function timeout must be positive, got {}", timeout)
      );
    }
    if (memory_size <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Function memory size must be positive, got {}", memory_size)
      );
    }
    if (name.empty()) {
      throw common::InvalidConfigurationError("Function name cannot be empty");
    }
  }

  std::string RuntimeAPI::endpoint() const
  {
    return fmt::format("{}:{}", address, port);
  }

  void RuntimeAPI::load(cereal::JSONInputArchive& archive)
  {
    util::cereal_load_value(archive, "address", address);
    util::cereal_load_value(archive, "port", port);
    util::cereal_load_value(archive, "threads", threads);
    util::cereal_load_value(archive, "max-payload-size", max_payload_size);
  }

  void RuntimeAPI::set_defaults()
  {
    address = DEFAULT_ADDRESS;
    port = DEFAULT_PORT;
    threads = DEFAULT_THREADS_NUMBER;
    max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE;
  }

  void InvokeAPI::load(cereal::JSONInputArchive& archive)
  {
    util::cereal_load_value(archive, "port", port);
  }

  void InvokeAPI::set_defaults()
  {
    port = DEFAULT_PORT;
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Bootstrap::load(cereal::JSONInputArchive& archive)
  {
    util::cereal_load_value(archive, "paths", paths);
    util::cereal_load_value(archive, "args", args);
    util::cereal_load_value(archive, "external", external);
    util::cereal_load_value(archive, "capture-output", capture_output);
    util::cereal_load_value(archive, "ready-timeout", ready_timeout);
  }

  void Bootstrap::set_defaults()
  {
    paths = {"/var/runtime/bootstrap", "/var/task/bootstrap", "/opt/bootstrap"};
    args.clear();
    external = false;
    capture_output = true;
    ready_timeout = DEFAULT_READY_TIMEOUT;
  }

  void Watch::load(cereal::JSONInputArchive& archive)
  {
    util::cereal_load_value(archive, "enabled", enabled);
    util::cereal_load_value(archive, "paths", paths);
    util::cereal_load_value(archive, "debounce", debounce);
  }

  void Watch::set_defaults()
  {
    enabled = false;
    paths = {"/var/task", "/opt"};
    debounce = DEFAULT_DEBOUNCE;
  }

  void Emulator::set_defaults()
  {
    verbose = false;
    stay_open = false;
    event.reset();
    event_file.reset();
    event_stdin = false;

    function.set_defaults();
    runtime_api.set_defaults();
    invoke_api.set_defaults();
    workers.set_defaults();
    bootstrap.set_defaults();
    watch.set_defaults();
  }

  void Emulator::load(cereal::JSONInputArchive& archive)
  {
    util::cereal_load_value(archive, "verbose", verbose);
    util::cereal_load_value(archive, "stay-open", stay_open);

    util::cereal_load_optional(archive, "function", function);
    util::cereal_load_optional(archive, "runtime-api", runtime_api);
    util::cereal_load_optional(archive, "invoke-api", invoke_api);
    util::cereal_load_optional(archive, "workers", workers);
    util::cereal_load_optional(archive, "bootstrap", bootstrap);
    util::cereal_load_optional(archive, "watch", watch);
  }

  void Emulator::load_env()
  {
    function.load_env();

    if (auto val = util::getenv_int("LAMBDALOCAL_RUNTIME_PORT"); val.has_value()) {
      runtime_api.port = val.value();
    }
    if (auto val = util::getenv_int("LAMBDALOCAL_API_PORT"); val.has_value()) {
      invoke_api.port = val.value();
    }
    if (util::getenv("LAMBDALOCAL_STAY_OPEN").has_value()) {
      stay_open = util::getenv_flag("LAMBDALOCAL_STAY_OPEN");
    }
    if (util::getenv("LAMBDALOCAL_WATCH").has_value()) {
      watch.enabled = util::getenv_flag("LAMBDALOCAL_WATCH");
    }
    if (util::getenv("LAMBDALOCAL_NO_BOOTSTRAP").has_value()) {
      bootstrap.external = util::getenv_flag("LAMBDALOCAL_NO_BOOTSTRAP");
    }
    if (util::getenv("LAMBDALOCAL_USE_STDIN").has_value()) {
      event_stdin = util::getenv_flag("LAMBDALOCAL_USE_STDIN");
    }
    if (auto val = util::getenv("AWS_LAMBDA_EVENT_BODY"); val.has_value() && !val->empty()) {
      event = val.value();
    }
  }

  Emulator Emulator::deserialize(std::istream& json_config)
  {
    Emulator cfg;
    cfg.set_defaults();

    // Type mismatches and syntax errors surface as rapidjson assertions.
    try {
      cereal::JSONInputArchive archive_in(json_config);
      cfg.load(archive_in);
    } catch (const cereal::RapidJSONException& exc) {
      throw common::InvalidConfigurationError(
          fmt::format("Could not parse configuration, reason: {}", exc.what())
      );
    }

    return cfg;
  }

  Emulator Emulator::deserialize(int argc, char** argv)
  {
    cxxopts::Options options(
        "lambdalocal-emulator", "Runs a function bootstrap behind a local runtime API."
    );
    options.add_options()
      ("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))
      ("v,verbose", "Verbose output.", cxxopts::value<bool>()->default_value("false"))
      ("stay-open", "Keep serving the invoke API after the first invocation.",
        cxxopts::value<bool>()->default_value("false"))
      ("watch", "Restart the bootstrap when code directories change.",
        cxxopts::value<bool>()->default_value("false"))
      ("e,event-file", "File containing the event payload.", cxxopts::value<std::string>())
      ("stdin", "Read the event payload from standard input.",
        cxxopts::value<bool>()->default_value("false"))
      ("no-bootstrap", "Do not start a bootstrap, wait for an external runtime to connect.",
        cxxopts::value<bool>()->default_value("false"))
      ("runtime-port", "Port of the runtime API.", cxxopts::value<int>())
      ("api-port", "Port of the invoke API.", cxxopts::value<int>())
      ("timeout", "Function timeout in seconds.", cxxopts::value<int>())
      ("memory-size", "Function memory size in MB.", cxxopts::value<int>())
      ("handler", "Function handler.", cxxopts::value<std::string>())
      ("bootstrap", "Path of the bootstrap, replaces the default search list.",
        cxxopts::value<std::string>())
      ("event", "Event payload.", cxxopts::value<std::string>())
      ("h,help", "Print usage.");
    options.parse_positional({"handler", "event"});
    options.positional_help("[handler] [event]");

    cxxopts::ParseResult parsed_options;
    try {
      parsed_options = options.parse(argc, argv);
    } catch (const std::exception& exc) {
      throw common::InvalidConfigurationError(
          fmt::format("Could not parse arguments: {}", exc.what())
      );
    }

    if (parsed_options.count("help")) {
      std::cout << options.help() << std::endl;
      exit(0);
    }

    Emulator cfg;
    cfg.set_defaults();

    std::string config_file{parsed_options["config"].as<std::string>()};
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not open config file {}", config_file)
        );
      }

      try {
        cereal::JSONInputArchive archive_in(in_stream);
        cfg.load(archive_in);
      } catch (const cereal::RapidJSONException& exc) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse config file {}, reason: {}", config_file, exc.what())
        );
      }
    }

    cfg.load_env();

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }
    if (parsed_options["stay-open"].as<bool>()) {
      cfg.stay_open = true;
    }
    if (parsed_options["watch"].as<bool>()) {
      cfg.watch.enabled = true;
    }
    if (parsed_options.count("runtime-port")) {
      cfg.runtime_api.port = parsed_options["runtime-port"].as<int>();
    }
    if (parsed_options.count("api-port")) {
      cfg.invoke_api.port = parsed_options["api-port"].as<int>();
    }
    if (parsed_options.count("timeout")) {
      cfg.function.timeout = parsed_options["timeout"].as<int>();
    }
    if (parsed_options.count("memory-size")) {
      cfg.function.memory_size = parsed_options["memory-size"].as<int>();
    }
    if (parsed_options.count("handler")) {
      cfg.function.handler = parsed_options["handler"].as<std::string>();
    }
    if (parsed_options.count("bootstrap")) {
      cfg.bootstrap.paths = {parsed_options["bootstrap"].as<std::string>()};
    }
    if (parsed_options["no-bootstrap"].as<bool>()) {
      cfg.bootstrap.external = true;
    }
    if (parsed_options.count("event")) {
      cfg.event = parsed_options["event"].as<std::string>();
    } else if (parsed_options.count("event-file")) {
      // An explicit file wins over an event body from the environment.
      cfg.event.reset();
    }
    if (parsed_options.count("event-file")) {
      cfg.event_file = parsed_options["event-file"].as<std::string>();
    }
    if (parsed_options["stdin"].as<bool>()) {
      cfg.event_stdin = true;
    }

    cfg.function.validate();

    return cfg;
  }

} // namespace lambdalocal::emulator::config
