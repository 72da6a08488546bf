#ifndef LAMBDALOCAL_EMULATOR_RUNTIME_HPP
#define LAMBDALOCAL_EMULATOR_RUNTIME_HPP

#include <lambdalocal/emulator/context.hpp>
#include <lambdalocal/emulator/handoff.hpp>
#include <lambdalocal/emulator/state.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  // Optional request headers the worker attaches to response and error calls.
  struct WorkerHeaders {
    std::optional<std::string> invoke_wait;
    std::optional<std::string> init_end;
    std::optional<std::string> log_result;
    std::optional<std::string> error_type;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Control-plane protocol, independent of the HTTP transport.
  ///
  /// Every mutating call passes the state-transition guard first; rejected
  /// calls return a ProtocolError and leave the in-flight invocation alone.
  ////////////////////////////////////////////////////////////////////////////////
  class Runtime {
  public:
    // An external runtime reports its own log tail through a response header.
    Runtime(
        RuntimeState& state, Handoff& handoff, size_t max_payload_size,
        bool external_worker = false
    );

    /**
     * @brief Waits for the next invocation.
     *
     * An invocation fetched earlier but never answered is completed first.
     *
     * @param ctx set to the fetched invocation, or nullptr when the wait was
     * cancelled before any work arrived.
     */
    std::optional<ProtocolError> next(ContextPtr& ctx, const Handoff::cancel_t& cancelled);

    std::optional<ProtocolError>
    respond(std::string_view request_id, std::string body, const WorkerHeaders& headers);

    // well_formed is false when the body could not be parsed and a generic
    // error was stored instead.
    std::optional<ProtocolError> fail(
        std::string_view request_id, std::string_view body, const WorkerHeaders& headers,
        bool& well_formed
    );

    // Fails the invocation that started the worker.
    std::optional<ProtocolError> init_error(
        std::string_view body, const WorkerHeaders& headers, const Handoff::cancel_t& cancelled,
        bool& well_formed
    );

  private:
    std::optional<ProtocolError> _check_size(std::string_view body) const;

    void _record_headers(Context& ctx, const WorkerHeaders& headers);

    RuntimeState& _state;
    Handoff& _handoff;
    size_t _max_payload_size;
    bool _external_worker;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
