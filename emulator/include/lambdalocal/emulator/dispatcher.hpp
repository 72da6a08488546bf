#ifndef LAMBDALOCAL_EMULATOR_DISPATCHER_HPP
#define LAMBDALOCAL_EMULATOR_DISPATCHER_HPP

#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/context.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  class Handoff;
  class LogTail;
  class RuntimeState;
  class Supervisor;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Pushes invocations through the worker, one at a time.
  ////////////////////////////////////////////////////////////////////////////////
  class Dispatcher {
  public:
    Dispatcher(
        const config::Emulator& cfg, RuntimeState& state, Handoff& handoff, Supervisor& supervisor,
        std::shared_ptr<LogTail> tail, std::shared_ptr<spdlog::logger> report_logger
    );

    ContextPtr create_context(
        std::string payload, InvocationType type = InvocationType::REQUEST_RESPONSE,
        std::optional<std::string> client_context = std::nullopt, LogType log_type = LogType::NONE
    ) const;

    /**
     * @brief Runs the invocation to completion and blocks until it has a result.
     *
     * Concurrent callers are served in turn. The context is always completed
     * on return: with the worker's reply, with its error, with a crash error
     * when the worker died, or with the timeout error once the deadline passed.
     *
     * @throws BootstrapNotFound when the worker cannot be started.
     */
    void invoke(const ContextPtr& ctx);

  private:
    config::Function _function;
    bool _stay_open;
    bool _external_worker;

    RuntimeState& _state;
    Handoff& _handoff;
    Supervisor& _supervisor;
    std::shared_ptr<LogTail> _tail;
    std::shared_ptr<spdlog::logger> _report_logger;

    std::mutex _invoke_mutex;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
