#include <lambdalocal/emulator/runtime_api.hpp>

#include <lambdalocal/common/http.hpp>
#include <lambdalocal/common/util.hpp>
#include <lambdalocal/emulator/runtime.hpp>
#include <lambdalocal/emulator/workers.hpp>

#include <drogon/HttpResponse.h>
#include <json/value.h>
#include <trantor/net/TcpConnection.h>

namespace lambdalocal::emulator {

  namespace {

    WorkerHeaders worker_headers(const drogon::HttpRequestPtr& request)
    {
      auto header = [&request](const std::string& name) -> std::optional<std::string> {
        const std::string& value = request->getHeader(name);
        if (value.empty()) {
          return std::nullopt;
        }
        return value;
      };

      return WorkerHeaders{
          header("Lambda-Local-Invoke-Wait"), header("Lambda-Local-Init-End"),
          header("Lambda-Local-Log-Result"), header("Lambda-Runtime-Function-Error-Type")};
    }

    // True once the worker has closed the connection of this request.
    Handoff::cancel_t disconnected(const drogon::HttpRequestPtr& request)
    {
      std::weak_ptr<trantor::TcpConnection> conn = request->getConnectionPtr();
      return [conn]() {
        auto ptr = conn.lock();
        return !ptr || ptr->disconnected();
      };
    }

  } // namespace

  RuntimeAPI::RuntimeAPI(Runtime& runtime, Workers& workers) : _runtime(runtime), _workers(workers)
  {
    _logger = common::util::create_logger("RuntimeAPI");
  }

  drogon::HttpResponsePtr RuntimeAPI::accepted_response(const std::string& status)
  {
    auto resp = common::http::HTTPClient::correct_response(status);
    resp->setStatusCode(drogon::k202Accepted);
    return resp;
  }

  drogon::HttpResponsePtr RuntimeAPI::protocol_error(const ProtocolError& error)
  {
    Json::Value json;
    json["errorMessage"] = error.message;
    json["errorType"] = error.type;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(error.status));
    return resp;
  }

  void RuntimeAPI::next(const request_t& request, callback_t&& callback)
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Worker waits for the next invocation");

    // Blocks until the dispatcher hands over an invocation.
    _workers.add_task([request, callback = std::move(callback), this]() {
      ContextPtr ctx;
      if (auto error = _runtime.next(ctx, disconnected(request)); error.has_value()) {
        _logger->warn("Rejected next invocation: {}", error->message);
        callback(protocol_error(error.value()));
        return;
      }

      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k200OK);
      if (!ctx) {
        callback(resp);
        return;
      }

      resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
      resp->addHeader("Lambda-Runtime-Aws-Request-Id", ctx->request_id);
      resp->addHeader(
          "Lambda-Runtime-Deadline-Ms", std::to_string(common::util::unix_ms(ctx->deadline()))
      );
      resp->addHeader("Lambda-Runtime-Invoked-Function-Arn", ctx->function_arn);
      resp->addHeader("Lambda-Runtime-Trace-Id", ctx->trace_id);
      if (ctx->client_context.has_value()) {
        resp->addHeader("Lambda-Runtime-Client-Context", ctx->client_context.value());
      }
      if (ctx->cognito_identity.has_value()) {
        resp->addHeader("Lambda-Runtime-Cognito-Identity", ctx->cognito_identity.value());
      }
      if (ctx->log_type == LogType::TAIL) {
        resp->addHeader("Lambda-Local-Log-Type", "Tail");
      }
      resp->setBody(ctx->payload);

      callback(resp);
    });
  }

  void RuntimeAPI::response(
      const request_t& request, callback_t&& callback, const std::string& request_id
  )
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Worker responds to invocation {}", request_id);

    auto error =
        _runtime.respond(request_id, std::string{request->body()}, worker_headers(request));
    if (error.has_value()) {
      _logger->warn("Rejected response to {}: {}", request_id, error->message);
      callback(protocol_error(error.value()));
      return;
    }

    callback(accepted_response());
  }

  void RuntimeAPI::error(
      const request_t& request, callback_t&& callback, const std::string& request_id
  )
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Worker reports an error for invocation {}", request_id);

    bool well_formed = true;
    auto error = _runtime.fail(request_id, request->body(), worker_headers(request), well_formed);
    if (error.has_value()) {
      _logger->warn("Rejected error of {}: {}", request_id, error->message);
      callback(protocol_error(error.value()));
      return;
    }

    if (!well_formed) {
      auto resp = common::http::HTTPClient::correct_response("InvalidErrorShape");
      resp->setCustomStatusCode(299);
      callback(resp);
      return;
    }
    callback(accepted_response());
  }

  void RuntimeAPI::init_error(const request_t& request, callback_t&& callback)
  {
    _logger->info("Worker reports an initialization error");

    // Waits for the invocation that started the worker.
    _workers.add_task([request, callback = std::move(callback), this]() {
      bool well_formed = true;
      auto error = _runtime.init_error(
          request->body(), worker_headers(request), disconnected(request), well_formed
      );
      if (error.has_value()) {
        _logger->warn("Rejected initialization error: {}", error->message);
        callback(protocol_error(error.value()));
        return;
      }

      if (!well_formed) {
        auto resp = common::http::HTTPClient::correct_response("InvalidErrorShape");
        resp->setCustomStatusCode(299);
        callback(resp);
        return;
      }
      callback(accepted_response());
    });
  }

  void RuntimeAPI::ping(const request_t&, callback_t&& callback)
  {
    callback(common::http::HTTPClient::correct_response("OK"));
  }

} // namespace lambdalocal::emulator
