#ifndef LAMBDALOCAL_EMULATOR_SERVER_HPP
#define LAMBDALOCAL_EMULATOR_SERVER_HPP

#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/dispatcher.hpp>
#include <lambdalocal/emulator/handoff.hpp>
#include <lambdalocal/emulator/invoke_api.hpp>
#include <lambdalocal/emulator/lifecycle.hpp>
#include <lambdalocal/emulator/log_tail.hpp>
#include <lambdalocal/emulator/runtime.hpp>
#include <lambdalocal/emulator/runtime_api.hpp>
#include <lambdalocal/emulator/state.hpp>
#include <lambdalocal/emulator/supervisor.hpp>
#include <lambdalocal/emulator/workers.hpp>

#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  struct Server {

    Server(const config::Emulator& cfg);

    ~Server();

    // Starts the HTTP surfaces and returns once the runtime API answers pings.
    void run();

    void shutdown(int exit_code = 0);

    // Blocks until shutdown, stops the HTTP server and returns the exit code.
    int wait();

    Dispatcher& dispatcher()
    {
      return _dispatcher;
    }

    Lifecycle& lifecycle()
    {
      return _lifecycle;
    }

    RuntimeState& state()
    {
      return _state;
    }

    Supervisor& supervisor()
    {
      return _supervisor;
    }

    const config::Emulator& config() const
    {
      return _cfg;
    }

  private:
    void _wait_ready();
    void _stop();

    config::Emulator _cfg;

    std::shared_ptr<spdlog::logger> _logger;

    std::shared_ptr<LogTail> _tail;
    std::shared_ptr<spdlog::logger> _report_logger;

    RuntimeState _state;
    Handoff _handoff;
    Supervisor _supervisor;
    Dispatcher _dispatcher;
    Runtime _runtime;
    // Invocations waiting for their turn must never occupy the threads the
    // worker needs to fetch them.
    Workers _invocation_workers;
    Workers _runtime_workers;
    Lifecycle _lifecycle;

    // Shared pointers are required by drogon
    std::shared_ptr<RuntimeAPI> _runtime_api;
    std::shared_ptr<InvokeAPI> _invoke_api;

    std::thread _server_thread;
    bool _stopped = false;
  };

} // namespace lambdalocal::emulator

#endif
