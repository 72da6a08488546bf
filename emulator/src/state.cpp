#include <lambdalocal/emulator/state.hpp>

#include <fmt/format.h>

namespace lambdalocal::emulator {

  std::string_view to_string(State state)
  {
    switch (state) {
    case State::INIT:
      return "STATE_INIT";
    case State::INIT_ERROR:
      return "STATE_INIT_ERROR";
    case State::INVOKE_NEXT:
      return "STATE_INVOKE_NEXT";
    case State::INVOKE_RESPONSE:
      return "STATE_INVOKE_RESPONSE";
    case State::INVOKE_ERROR:
      return "STATE_INVOKE_ERROR";
    }
    return "STATE_UNKNOWN";
  }

  bool is_valid_transition(State from, State to)
  {
    switch (to) {
    case State::INIT_ERROR:
      return from == State::INIT;
    case State::INVOKE_NEXT:
      return from == State::INIT || from == State::INVOKE_NEXT || from == State::INVOKE_RESPONSE ||
             from == State::INVOKE_ERROR;
    case State::INVOKE_RESPONSE:
    case State::INVOKE_ERROR:
      return from == State::INVOKE_NEXT;
    case State::INIT:
      return false;
    }
    return false;
  }

  ProtocolError ProtocolError::invalid_transition(State from, State to)
  {
    return ProtocolError{
        403, "InvalidStateTransition",
        fmt::format("Transition from {} to {} is not allowed.", to_string(from), to_string(to))};
  }

  ProtocolError ProtocolError::invalid_request_id(std::string_view request_id)
  {
    return ProtocolError{400, "InvalidRequestID", fmt::format("Invalid request ID {}", request_id)};
  }

  ProtocolError ProtocolError::body_read_error(std::string_view reason)
  {
    return ProtocolError{413, "BodyReadError", std::string{reason}};
  }

  State RuntimeState::state() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  std::optional<ProtocolError> RuntimeState::transition(State target)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _transition(target);
  }

  std::optional<ProtocolError>
  RuntimeState::transition(State target, std::string_view request_id, ContextPtr& served)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_served || _served->request_id != request_id) {
      return ProtocolError::invalid_request_id(request_id);
    }

    auto error = _transition(target);
    if (!error.has_value()) {
      served = _served;
    }
    return error;
  }

  std::optional<ProtocolError> RuntimeState::_transition(State target)
  {
    if (!is_valid_transition(_state, target)) {
      return ProtocolError::invalid_transition(_state, target);
    }
    _state = target;
    return std::nullopt;
  }

  void RuntimeState::reset()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _state = State::INIT;
    _served.reset();
  }

  ContextPtr RuntimeState::served() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _served;
  }

  void RuntimeState::serve(ContextPtr ctx)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _served = std::move(ctx);
  }

  ContextPtr RuntimeState::inflight() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _inflight;
  }

  void RuntimeState::dispatch(ContextPtr ctx)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _inflight = std::move(ctx);
  }

  void RuntimeState::finish(const ContextPtr& ctx)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_inflight == ctx) {
      _inflight.reset();
    }
  }

} // namespace lambdalocal::emulator
