#include <lambdalocal/emulator/context.hpp>

#include <lambdalocal/common/util.hpp>
#include <lambdalocal/common/uuid.hpp>
#include <lambdalocal/emulator/config.hpp>

#include <algorithm>
#include <cmath>

#include <drogon/utils/Utilities.h>
#include <fmt/format.h>
#include <json/json.h>

namespace lambdalocal::emulator {

  std::optional<InvocationType> parse_invocation_type(std::string_view type)
  {
    if (type.empty() || type == "RequestResponse" || type == "sync") {
      return InvocationType::REQUEST_RESPONSE;
    } else if (type == "Event" || type == "async") {
      return InvocationType::EVENT;
    } else if (type == "DryRun" || type == "dry-run") {
      return InvocationType::DRY_RUN;
    }
    return std::nullopt;
  }

  std::string_view label(ErrorKind kind)
  {
    switch (kind) {
    case ErrorKind::UNHANDLED:
      return "Unhandled";
    case ErrorKind::INIT_ERROR:
      return "Runtime.InitError";
    case ErrorKind::CRASH:
      return "Runtime.ExitError";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::INVALID_ERROR_SHAPE:
      return "InvalidErrorShape";
    case ErrorKind::BOOTSTRAP_NOT_FOUND:
      return "Runtime.InvalidEntrypoint";
    }
    return "Unknown";
  }

  Json::Value InvocationError::json() const
  {
    Json::Value obj;
    obj["errorMessage"] = message;
    if (type.has_value()) {
      obj["errorType"] = type.value();
    }
    if (!stack_trace.empty()) {
      Json::Value frames = Json::arrayValue;
      for (const auto& frame : stack_trace) {
        frames.append(frame);
      }
      obj["stackTrace"] = frames;
    }
    if (cause) {
      obj["cause"] = cause->json();
    }
    return obj;
  }

  std::string InvocationError::serialize() const
  {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json());
  }

  InvocationError InvocationError::crash(std::string_view request_id)
  {
    return InvocationError{
        ErrorKind::CRASH,
        fmt::format("RequestId: {} Error: Runtime exited without providing a reason", request_id),
        std::string{label(ErrorKind::CRASH)},
        {},
        nullptr};
  }

  InvocationError InvocationError::timeout(
      std::string_view request_id, int timeout, std::chrono::system_clock::time_point now
  )
  {
    // The cloud runtime reports timeouts without an error type.
    return InvocationError{
        ErrorKind::TIMEOUT,
        fmt::format(
            "{} {} Task timed out after {}.00 seconds", common::util::format_utc_timestamp(now),
            request_id, timeout
        ),
        std::nullopt,
        {},
        nullptr};
  }

  InvocationError InvocationError::invalid_shape()
  {
    return InvocationError{
        ErrorKind::INVALID_ERROR_SHAPE,
        "Unable to parse the error payload reported by the runtime",
        std::string{label(ErrorKind::INVALID_ERROR_SHAPE)},
        {},
        nullptr};
  }

  InvocationError InvocationError::bootstrap_not_found(const std::string& reason)
  {
    return InvocationError{
        ErrorKind::BOOTSTRAP_NOT_FOUND, reason,
        std::string{label(ErrorKind::BOOTSTRAP_NOT_FOUND)}, {}, nullptr};
  }

  std::optional<InvocationError>
  InvocationError::from_json(ErrorKind kind, const Json::Value& obj, int depth)
  {
    if (!obj.isObject() || depth > MAX_CAUSE_DEPTH) {
      return std::nullopt;
    }

    InvocationError error{kind, "", std::nullopt, {}, nullptr};

    const Json::Value& message = obj["errorMessage"];
    if (message.isString()) {
      error.message = message.asString();
    } else if (!message.isNull()) {
      return std::nullopt;
    }

    const Json::Value& type = obj["errorType"];
    if (type.isString()) {
      error.type = type.asString();
    } else if (!type.isNull()) {
      return std::nullopt;
    }

    const Json::Value& stack = obj["stackTrace"];
    if (stack.isArray()) {
      Json::StreamWriterBuilder builder;
      builder["indentation"] = "";
      for (const auto& frame : stack) {
        error.stack_trace.push_back(
            frame.isString() ? frame.asString() : Json::writeString(builder, frame)
        );
      }
    } else if (!stack.isNull()) {
      return std::nullopt;
    }

    const Json::Value& cause = obj["cause"];
    if (!cause.isNull()) {
      auto parsed_cause = from_json(kind, cause, depth + 1);
      if (!parsed_cause.has_value()) {
        return std::nullopt;
      }
      error.cause = std::make_shared<const InvocationError>(std::move(parsed_cause.value()));
    }

    return error;
  }

  std::optional<InvocationError> InvocationError::parse(
      ErrorKind kind, std::string_view body, const std::optional<std::string>& type_header
  )
  {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    std::string errors;

    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
      return std::nullopt;
    }

    auto error = from_json(kind, root);
    if (error.has_value() && !error->type.has_value() && type_header.has_value()) {
      error->type = type_header;
    }
    return error;
  }

  Context::Context(
      const config::Function& cfg, std::shared_ptr<spdlog::logger> report_logger,
      clock_t::time_point start
  )
      : request_id(common::UUID::random_string()), function_arn(cfg.arn()),
        version(cfg.version), memory_size(cfg.memory_size),
        trace_id(cfg.trace_id.has_value() ? cfg.trace_id.value() : common::UUID::trace_id(start)),
        timeout(cfg.timeout), start(start), client_context(cfg.client_context),
        cognito_identity(cfg.cognito_identity), _report_logger(std::move(report_logger)),
        _done(_done_promise.get_future().share())
  {
  }

  bool Context::complete(std::optional<InvocationError> error)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_completed) {
      return false;
    }
    _completed = true;

    auto now = clock_t::now();
    if (!error.has_value() && has_expired(now)) {
      error = InvocationError::timeout(request_id, static_cast<int>(timeout.count()), now);
    }
    _error = std::move(error);

    _report(_invoke_wait.has_value() ? _invoke_wait.value() : now);

    _done_promise.set_value();
    return true;
  }

  bool Context::completed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _completed;
  }

  void Context::wait() const
  {
    _done.wait();
  }

  bool Context::wait_until(clock_t::time_point time) const
  {
    return _done.wait_until(time) == std::future_status::ready;
  }

  void Context::set_reply(std::string reply)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_completed) {
      _reply = std::move(reply);
    }
  }

  std::optional<std::string> Context::reply() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _reply;
  }

  std::optional<InvocationError> Context::error() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _error;
  }

  void Context::set_function_error(std::string type)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_completed) {
      _function_error = std::move(type);
    }
  }

  std::optional<std::string> Context::function_error() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _function_error;
  }

  void Context::record_log_tail(std::string_view raw)
  {
    if (raw.size() > MAX_LOG_TAIL) {
      raw.remove_prefix(raw.size() - MAX_LOG_TAIL);
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _log_tail = std::string{raw};
  }

  std::optional<std::string> Context::log_tail() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _log_tail;
  }

  std::optional<std::string> Context::log_result() const
  {
    auto tail = log_tail();
    if (!tail.has_value()) {
      return std::nullopt;
    }
    return drogon::utils::base64Encode(
        reinterpret_cast<const unsigned char*>(tail->data()), static_cast<unsigned int>(tail->size())
    );
  }

  void Context::record_init_end(
      std::optional<int64_t> init_end_ms, std::optional<int64_t> invoke_wait_ms
  )
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (init_end_ms.has_value()) {
      _init_end = clock_t::time_point{std::chrono::milliseconds{init_end_ms.value()}};
    }
    if (invoke_wait_ms.has_value()) {
      _invoke_wait = clock_t::time_point{std::chrono::milliseconds{invoke_wait_ms.value()}};
    }
  }

  void Context::record_worker_start(clock_t::time_point time)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _worker_start = time;
  }

  void Context::log_start()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _fetched = clock_t::now();
    }
    if (_report_logger) {
      _report_logger->info("START RequestId: {} Version: {}", request_id, version);
    }
  }

  void Context::_report(clock_t::time_point end)
  {
    if (!_report_logger) {
      return;
    }

    using ms_t = std::chrono::duration<double, std::milli>;
    double duration =
        std::min(ms_t{end - _fetched.value_or(start)}.count(), ms_t{timeout}.count());
    duration = std::max(duration, 0.0);
    double billed = std::ceil(duration / 100) * 100;

    std::string init_str;
    if (_worker_start.has_value()) {
      auto init_end = _init_end.value_or(_fetched.value_or(start));
      double init_duration = std::max(ms_t{init_end - _worker_start.value()}.count(), 0.0);
      init_str = fmt::format("Init Duration: {:.2f} ms\t", init_duration);
    }

    _report_logger->info("END RequestId: {}", request_id);
    _report_logger->info(
        "REPORT RequestId: {}\t{}Duration: {:.2f} ms\tBilled Duration: {:.0f} ms\t"
        "Memory Size: {} MB\tMax Memory Used: {} MB\t",
        request_id, init_str, duration, billed, memory_size, common::util::max_memory_used_mb()
    );
  }

} // namespace lambdalocal::emulator
