#include <lambdalocal/emulator/server.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/http.hpp>
#include <lambdalocal/common/util.hpp>

#include <chrono>
#include <future>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>

namespace lambdalocal::emulator {

  Server::Server(const config::Emulator& cfg)
      : _cfg(cfg), _tail(std::make_shared<LogTail>(Context::MAX_LOG_TAIL)),
        _report_logger(create_report_logger(_tail)), _supervisor(cfg, _state, _tail),
        _dispatcher(cfg, _state, _handoff, _supervisor, _tail, _report_logger),
        _runtime(
            _state, _handoff, cfg.runtime_api.max_payload_size, cfg.bootstrap.external
        ),
        _invocation_workers(cfg.workers),
        _runtime_workers(config::Workers::RUNTIME_THREADS_NUMBER),
        _lifecycle(cfg, _state, _supervisor),
        _runtime_api(std::make_shared<RuntimeAPI>(_runtime, _runtime_workers)),
        _invoke_api(std::make_shared<InvokeAPI>(
            _dispatcher, _invocation_workers,
            [this](int exit_code) { _lifecycle.shutdown(exit_code); }
        ))
  {
    _logger = common::util::create_logger("Server");

    _supervisor.on_exit([this](int status, bool intentional, bool aborted) {
      _lifecycle.worker_exited(status, intentional, aborted);
    });
  }

  Server::~Server()
  {
    if (!_stopped && _server_thread.joinable()) {
      shutdown(0);
      wait();
    }
  }

  void Server::run()
  {
    // Requests larger than the payload limit must reach the handlers to get a protocol error.
    constexpr size_t BODY_SLACK = 1024 * 1024;

    drogon::app().disableSigtermHandling();
    drogon::app().registerController(_runtime_api);
    if (_cfg.stay_open) {
      drogon::app().registerController(_invoke_api);
    }
    drogon::app().setThreadNum(_cfg.runtime_api.threads);
    drogon::app().setClientMaxBodySize(_cfg.runtime_api.max_payload_size + BODY_SLACK);
    // The next-invocation call may wait for work indefinitely.
    drogon::app().setIdleConnectionTimeout(0);

    drogon::app().addListener(_cfg.runtime_api.address, _cfg.runtime_api.port);
    if (_cfg.stay_open && _cfg.invoke_api.port != _cfg.runtime_api.port) {
      drogon::app().addListener("0.0.0.0", _cfg.invoke_api.port);
    }

    _server_thread = std::thread{[]() { drogon::app().run(); }};
    _lifecycle.start();

    _wait_ready();

    if (_cfg.stay_open) {
      _logger->info("Lambda API listening on port {}", _cfg.invoke_api.port);
    }
  }

  void Server::_wait_ready()
  {
    using clock_t = std::chrono::steady_clock;

    auto client = common::http::HTTPClientFactory::create_client(
        fmt::format("http://{}", _cfg.runtime_api.address), _cfg.runtime_api.port
    );
    auto deadline = clock_t::now() + std::chrono::milliseconds{_cfg.bootstrap.ready_timeout};

    while (clock_t::now() < deadline) {

      auto ready = std::make_shared<std::promise<bool>>();
      auto future = ready->get_future();
      client.get(
          "/2018-06-01/ping", {},
          [ready](drogon::ReqResult result, const drogon::HttpResponsePtr& response) {
            ready->set_value(
                result == drogon::ReqResult::Ok && response->getStatusCode() == drogon::k200OK
            );
          }
      );

      if (future.wait_until(deadline) == std::future_status::ready && future.get()) {
        _logger->info("Runtime API listening on {}", _cfg.runtime_api.endpoint());
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    throw common::LambdaLocalException(fmt::format(
        "Runtime API at {} did not become ready within {} ms", _cfg.runtime_api.endpoint(),
        _cfg.bootstrap.ready_timeout
    ));
  }

  void Server::shutdown(int exit_code)
  {
    _lifecycle.shutdown(exit_code);
  }

  int Server::wait()
  {
    int exit_code = _lifecycle.wait();
    _stop();
    return exit_code;
  }

  void Server::_stop()
  {
    if (_stopped) {
      return;
    }
    _stopped = true;

    // Releases fetches blocked on the handoff and the dispatcher waiting on them.
    _handoff.close();
    if (auto ctx = _state.inflight(); ctx && ctx->complete(InvocationError::crash(ctx->request_id))) {
      _logger->warn("Invocation {} aborted by shutdown", ctx->request_id);
    }

    _logger->info("Stopping HTTP server");
    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _invocation_workers.wait();
    _runtime_workers.wait();
    _logger->info("Stopped HTTP server");
  }

} // namespace lambdalocal::emulator
