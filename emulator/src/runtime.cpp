#include <lambdalocal/emulator/runtime.hpp>

#include <lambdalocal/common/util.hpp>

#include <charconv>

#include <drogon/utils/Utilities.h>

namespace lambdalocal::emulator {

  namespace {

    std::optional<int64_t> parse_ms(const std::optional<std::string>& header)
    {
      if (!header.has_value() || header->empty()) {
        return std::nullopt;
      }
      int64_t value{};
      auto [ptr, ec] = std::from_chars(header->data(), header->data() + header->size(), value);
      if (ec != std::errc{} || ptr != header->data() + header->size()) {
        return std::nullopt;
      }
      return value;
    }

  } // namespace

  Runtime::Runtime(
      RuntimeState& state, Handoff& handoff, size_t max_payload_size, bool external_worker
  )
      : _state(state), _handoff(handoff), _max_payload_size(max_payload_size),
        _external_worker(external_worker)
  {
    _logger = common::util::create_logger("Runtime");
  }

  std::optional<ProtocolError> Runtime::next(ContextPtr& ctx, const Handoff::cancel_t& cancelled)
  {
    ctx = nullptr;

    if (auto error = _state.transition(State::INVOKE_NEXT); error.has_value()) {
      return error;
    }

    // Workers may fetch again without acknowledging the previous invocation.
    if (auto previous = _state.served(); previous && previous->complete()) {
      SPDLOG_LOGGER_DEBUG(_logger, "Auto-completed invocation {}", previous->request_id);
    }

    Message msg = _handoff.receive(cancelled);
    if (std::holds_alternative<WakeUp>(msg)) {
      SPDLOG_LOGGER_DEBUG(_logger, "Woken up without work");
      return std::nullopt;
    }

    ContextPtr received = std::get<ContextPtr>(msg);

    // The client went away while we were taking the work, give it to the next fetch.
    if (cancelled && cancelled()) {
      if (_handoff.requeue(received)) {
        SPDLOG_LOGGER_DEBUG(_logger, "Re-offered invocation {}", received->request_id);
        return std::nullopt;
      }
      _logger->warn("Could not re-offer invocation {}", received->request_id);
    }

    _state.serve(received);
    received->log_start();
    ctx = std::move(received);

    return std::nullopt;
  }

  std::optional<ProtocolError> Runtime::respond(
      std::string_view request_id, std::string body, const WorkerHeaders& headers
  )
  {
    if (auto error = _check_size(body); error.has_value()) {
      return error;
    }

    ContextPtr ctx;
    if (auto error = _state.transition(State::INVOKE_RESPONSE, request_id, ctx);
        error.has_value()) {
      return error;
    }

    _record_headers(*ctx, headers);
    ctx->set_reply(std::move(body));
    ctx->complete();

    return std::nullopt;
  }

  std::optional<ProtocolError> Runtime::fail(
      std::string_view request_id, std::string_view body, const WorkerHeaders& headers,
      bool& well_formed
  )
  {
    well_formed = true;
    if (auto error = _check_size(body); error.has_value()) {
      return error;
    }

    ContextPtr ctx;
    if (auto error = _state.transition(State::INVOKE_ERROR, request_id, ctx);
        error.has_value()) {
      return error;
    }

    auto parsed = InvocationError::parse(ErrorKind::UNHANDLED, body, headers.error_type);
    if (!parsed.has_value()) {
      _logger->warn("Could not parse error body of invocation {}", request_id);
      well_formed = false;
      parsed = InvocationError::invalid_shape();
    }

    _record_headers(*ctx, headers);
    if (headers.error_type.has_value()) {
      ctx->set_function_error(headers.error_type.value());
    }
    ctx->complete(std::move(parsed));

    return std::nullopt;
  }

  std::optional<ProtocolError> Runtime::init_error(
      std::string_view body, const WorkerHeaders& headers, const Handoff::cancel_t& cancelled,
      bool& well_formed
  )
  {
    well_formed = true;
    if (auto error = _check_size(body); error.has_value()) {
      return error;
    }

    if (auto error = _state.transition(State::INIT_ERROR); error.has_value()) {
      return error;
    }

    auto parsed = InvocationError::parse(ErrorKind::INIT_ERROR, body, headers.error_type);
    if (!parsed.has_value()) {
      well_formed = false;
      parsed = InvocationError::invalid_shape();
    }
    _logger->error("Worker failed to initialize: {}", parsed->message);

    // The invocation that started the worker is waiting in the handoff.
    Message msg = _handoff.receive(cancelled);
    if (std::holds_alternative<WakeUp>(msg)) {
      _logger->warn("No invocation to report the initialization error to");
      return std::nullopt;
    }

    ContextPtr ctx = std::get<ContextPtr>(msg);
    _state.serve(ctx);
    _record_headers(*ctx, headers);
    if (headers.error_type.has_value()) {
      ctx->set_function_error(headers.error_type.value());
    }
    ctx->complete(std::move(parsed));

    return std::nullopt;
  }

  std::optional<ProtocolError> Runtime::_check_size(std::string_view body) const
  {
    if (body.size() > _max_payload_size) {
      return ProtocolError::body_read_error(fmt::format(
          "Request body of {} bytes exceeds the maximum payload size of {} bytes", body.size(),
          _max_payload_size
      ));
    }
    return std::nullopt;
  }

  void Runtime::_record_headers(Context& ctx, const WorkerHeaders& headers)
  {
    auto invoke_wait = parse_ms(headers.invoke_wait);
    auto init_end = parse_ms(headers.init_end);
    if ((headers.invoke_wait.has_value() && !invoke_wait.has_value()) ||
        (headers.init_end.has_value() && !init_end.has_value())) {
      _logger->warn("Ignoring malformed timing headers of invocation {}", ctx.request_id);
    }
    ctx.record_init_end(init_end, invoke_wait);

    // A spawned worker's output is captured directly.
    if (_external_worker && ctx.log_type == LogType::TAIL && headers.log_result.has_value()) {
      ctx.record_log_tail(drogon::utils::base64Decode(headers.log_result.value()));
    }
  }

} // namespace lambdalocal::emulator
