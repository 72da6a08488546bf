#ifndef LAMBDALOCAL_EMULATOR_INVOKE_API_HPP
#define LAMBDALOCAL_EMULATOR_INVOKE_API_HPP

#include <lambdalocal/emulator/context.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <drogon/HttpController.h>
#include <drogon/HttpTypes.h>
#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  class Dispatcher;
  class Workers;

  // Decodes a base64 client context and checks that it holds JSON.
  std::optional<std::string> decode_client_context(std::string_view encoded);

  // Invoke-compatible HTTP surface of a stay-open emulator.
  struct InvokeAPI : public drogon::HttpController<InvokeAPI, false>,
                     std::enable_shared_from_this<InvokeAPI> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;
    using fatal_callback_t = std::function<void(int)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(InvokeAPI::invoke, "/2015-03-31/functions/{1}/invocations", drogon::Post);
    METHOD_LIST_END

    InvokeAPI(Dispatcher& dispatcher, Workers& workers, fatal_callback_t on_fatal);

    void invoke(const request_t& request, callback_t&& callback, const std::string& function_name);

    // Mirrors the worker's reply or error the way the cloud invoke API does.
    static drogon::HttpResponsePtr invocation_response(const Context& ctx);

    static drogon::HttpResponsePtr
    failed_response(drogon::HttpStatusCode code, const std::string& type, const std::string& reason);

  private:
    Dispatcher& _dispatcher;
    Workers& _workers;
    fatal_callback_t _on_fatal;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
