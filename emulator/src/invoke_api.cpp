#include <lambdalocal/emulator/invoke_api.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>
#include <lambdalocal/emulator/dispatcher.hpp>
#include <lambdalocal/emulator/workers.hpp>

#include <algorithm>
#include <cctype>

#include <drogon/HttpResponse.h>
#include <drogon/utils/Utilities.h>
#include <json/json.h>

namespace lambdalocal::emulator {

  std::optional<std::string> decode_client_context(std::string_view encoded)
  {
    if (encoded.empty() || encoded.size() % 4 != 0) {
      return std::nullopt;
    }

    size_t padding = 0;
    while (padding < 2 && encoded[encoded.size() - 1 - padding] == '=') {
      ++padding;
    }
    auto is_base64 = [](char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    };
    if (!std::all_of(encoded.begin(), encoded.end() - padding, is_base64)) {
      return std::nullopt;
    }

    std::string decoded = drogon::utils::base64Decode(std::string{encoded});

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    std::string errors;
    if (!reader->parse(decoded.data(), decoded.data() + decoded.size(), &root, &errors)) {
      return std::nullopt;
    }

    return decoded;
  }

  InvokeAPI::InvokeAPI(Dispatcher& dispatcher, Workers& workers, fatal_callback_t on_fatal)
      : _dispatcher(dispatcher), _workers(workers), _on_fatal(std::move(on_fatal))
  {
    _logger = common::util::create_logger("InvokeAPI");
  }

  drogon::HttpResponsePtr InvokeAPI::failed_response(
      drogon::HttpStatusCode code, const std::string& type, const std::string& reason
  )
  {
    Json::Value json;
    json["errorMessage"] = reason;
    json["errorType"] = type;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(code);
    return resp;
  }

  drogon::HttpResponsePtr InvokeAPI::invocation_response(const Context& ctx)
  {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(drogon::k200OK);
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->addHeader("x-amzn-RequestId", ctx.request_id);
    resp->addHeader("X-Amz-Executed-Version", ctx.version);
    resp->addHeader("X-Amzn-Trace-Id", ctx.trace_id);

    if (ctx.log_type == LogType::TAIL) {
      resp->addHeader("X-Amz-Log-Result", ctx.log_result().value_or(""));
    }

    if (auto error = ctx.error(); error.has_value()) {
      resp->addHeader("X-Amz-Function-Error", ctx.function_error().value_or("Unhandled"));
      resp->setBody(error->serialize());
    } else {
      resp->setBody(ctx.reply().value_or(""));
    }

    return resp;
  }

  void InvokeAPI::invoke(
      const request_t& request, callback_t&& callback, const std::string& function_name
  )
  {
    auto type = parse_invocation_type(request->getHeader("X-Amz-Invocation-Type"));
    if (!type.has_value()) {
      callback(failed_response(
          drogon::k400BadRequest, "InvalidParameterValueException",
          fmt::format("Unsupported invocation type {}", request->getHeader("X-Amz-Invocation-Type"))
      ));
      return;
    }

    std::optional<std::string> client_context;
    if (const std::string& header = request->getHeader("X-Amz-Client-Context"); !header.empty()) {
      client_context = decode_client_context(header);
      if (!client_context.has_value()) {
        callback(failed_response(
            drogon::k400BadRequest, "InvalidRequestContentException",
            "Client context must be a valid Base64-encoded JSON object."
        ));
        return;
      }
    }

    LogType log_type =
        request->getHeader("X-Amz-Log-Type") == "Tail" ? LogType::TAIL : LogType::NONE;

    auto ctx = _dispatcher.create_context(
        std::string{request->body()}, type.value(), std::move(client_context), log_type
    );
    _logger->info("Invoke function {}, request {}", function_name, ctx->request_id);

    if (type == InvocationType::DRY_RUN) {
      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k204NoContent);
      resp->addHeader("x-amzn-RequestId", ctx->request_id);
      callback(resp);
      return;
    }

    if (type == InvocationType::EVENT) {
      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k202Accepted);
      resp->addHeader("x-amzn-RequestId", ctx->request_id);
      resp->addHeader("X-Amzn-Trace-Id", ctx->trace_id);
      callback(resp);

      _workers.add_task([ctx, this]() {
        try {
          _dispatcher.invoke(ctx);
        } catch (const common::LambdaLocalException& exc) {
          _logger->error("Asynchronous invocation {} failed: {}", ctx->request_id, exc.what());
          _on_fatal(1);
        }
      });
      return;
    }

    _workers.add_task([ctx, callback = std::move(callback), this]() {
      try {
        _dispatcher.invoke(ctx);
      } catch (const common::LambdaLocalException& exc) {
        _logger->error("Invocation {} failed: {}", ctx->request_id, exc.what());
        callback(invocation_response(*ctx));
        _on_fatal(1);
        return;
      }
      callback(invocation_response(*ctx));
    });
  }

} // namespace lambdalocal::emulator
