#include <lambdalocal/emulator/dispatcher.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>
#include <lambdalocal/emulator/handoff.hpp>
#include <lambdalocal/emulator/log_tail.hpp>
#include <lambdalocal/emulator/state.hpp>
#include <lambdalocal/emulator/supervisor.hpp>

#include <thread>

namespace lambdalocal::emulator {

  Dispatcher::Dispatcher(
      const config::Emulator& cfg, RuntimeState& state, Handoff& handoff, Supervisor& supervisor,
      std::shared_ptr<LogTail> tail, std::shared_ptr<spdlog::logger> report_logger
  )
      : _function(cfg.function), _stay_open(cfg.stay_open),
        _external_worker(cfg.bootstrap.external), _state(state), _handoff(handoff),
        _supervisor(supervisor), _tail(std::move(tail)), _report_logger(std::move(report_logger))
  {
    _logger = common::util::create_logger("Dispatcher");
  }

  ContextPtr Dispatcher::create_context(
      std::string payload, InvocationType type, std::optional<std::string> client_context,
      LogType log_type
  ) const
  {
    auto ctx = std::make_shared<Context>(_function, _report_logger);
    ctx->payload = std::move(payload);
    ctx->type = type;
    ctx->log_type = log_type;
    if (client_context.has_value()) {
      ctx->client_context = std::move(client_context);
    }
    return ctx;
  }

  void Dispatcher::invoke(const ContextPtr& ctx)
  {
    std::lock_guard<std::mutex> lock(_invoke_mutex);

    if (_handoff.closed()) {
      _logger->warn("Invocation {} arrived during shutdown", ctx->request_id);
      ctx->complete(InvocationError::crash(ctx->request_id));
      return;
    }

    _tail->clear();
    _state.dispatch(ctx);

    try {
      _supervisor.ensure_running(ctx);
    } catch (const common::BootstrapNotFound& exc) {
      _logger->error("Could not start the worker: {}", exc.what());
      ctx->complete(InvocationError::bootstrap_not_found(exc.what()));
      _state.finish(ctx);
      throw;
    } catch (const common::ProcessSpawnError& exc) {
      _logger->error("Could not start the worker: {}", exc.what());
      ctx->complete(InvocationError::crash(ctx->request_id));
      _state.finish(ctx);
      throw;
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Dispatching invocation {}", ctx->request_id);

    try {
      // A worker that never fetches must not hold the invocation past its deadline.
      bool delivered =
          _handoff.send(ctx, [&ctx]() { return ctx->completed() || ctx->has_expired(); });
      if (!delivered) {
        SPDLOG_LOGGER_DEBUG(_logger, "Invocation {} was not fetched", ctx->request_id);
      }
    } catch (const common::HandoffClosed& exc) {
      _logger->warn("Invocation {} cancelled: {}", ctx->request_id, exc.what());
      ctx->complete(InvocationError::crash(ctx->request_id));
    }

    if (!ctx->wait_until(ctx->deadline())) {
      auto error = InvocationError::timeout(
          ctx->request_id, static_cast<int>(ctx->timeout.count()), Context::clock_t::now()
      );
      if (ctx->complete(std::move(error))) {
        _logger->error(
            "Invocation {} timed out after {} seconds", ctx->request_id, ctx->timeout.count()
        );
      }
    }

    auto error = ctx->error();
    if (error.has_value() && error->kind == ErrorKind::TIMEOUT && _stay_open) {
      // The timed-out worker may still be busy, the next invocation gets a fresh one.
      _supervisor.kill();
      _state.reset();
    } else if (_state.state() == State::INIT_ERROR) {
      _supervisor.kill();
      _state.reset();
    }

    if (ctx->log_type == LogType::TAIL && !_external_worker) {
      // Let the output reader catch up with what the worker wrote last.
      std::this_thread::sleep_for(std::chrono::milliseconds{1});
      ctx->record_log_tail(_tail->contents());
    }

    _state.finish(ctx);
  }

} // namespace lambdalocal::emulator
