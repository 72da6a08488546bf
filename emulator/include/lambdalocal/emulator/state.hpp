#ifndef LAMBDALOCAL_EMULATOR_STATE_HPP
#define LAMBDALOCAL_EMULATOR_STATE_HPP

#include <lambdalocal/emulator/context.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lambdalocal::emulator {

  enum class State { INIT = 0, INIT_ERROR, INVOKE_NEXT, INVOKE_RESPONSE, INVOKE_ERROR };

  std::string_view to_string(State state);

  /**
   * Legal predecessors:
   * INIT_ERROR <- INIT
   * INVOKE_NEXT <- INIT, INVOKE_NEXT, INVOKE_RESPONSE, INVOKE_ERROR
   * INVOKE_RESPONSE <- INVOKE_NEXT
   * INVOKE_ERROR <- INVOKE_NEXT
   * INIT is only entered through a reset.
   */
  bool is_valid_transition(State from, State to);

  // Rejection of a control-plane call, reported back to the worker.
  struct ProtocolError {
    int status;
    std::string type;
    std::string message;

    static ProtocolError invalid_transition(State from, State to);
    static ProtocolError invalid_request_id(std::string_view request_id);
    static ProtocolError body_read_error(std::string_view reason);
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Shared state of the control plane.
  ///
  /// Holds the protocol state, the context currently dispatched to the worker
  /// and the context the worker has fetched. Both contexts are the same object
  /// once the worker picks up the invocation; they differ while a dispatched
  /// invocation still waits in the handoff.
  ////////////////////////////////////////////////////////////////////////////////
  class RuntimeState {
  public:
    State state() const;

    std::optional<ProtocolError> transition(State target);

    // Validates that request_id names the fetched invocation, then transitions.
    std::optional<ProtocolError>
    transition(State target, std::string_view request_id, ContextPtr& served);

    // Back to INIT, forgets the fetched invocation.
    void reset();

    ContextPtr served() const;

    void serve(ContextPtr ctx);

    ContextPtr inflight() const;

    void dispatch(ContextPtr ctx);

    // Clears the in-flight slot only if it still holds ctx.
    void finish(const ContextPtr& ctx);

  private:
    std::optional<ProtocolError> _transition(State target);

    mutable std::mutex _mutex;
    State _state = State::INIT;
    ContextPtr _served;
    ContextPtr _inflight;
  };

} // namespace lambdalocal::emulator

#endif
