#ifndef LAMBDALOCAL_EMULATOR_RUNTIME_API_HPP
#define LAMBDALOCAL_EMULATOR_RUNTIME_API_HPP

#include <lambdalocal/emulator/state.hpp>

#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpController.h>
#include <drogon/HttpTypes.h>
#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  class Runtime;
  class Workers;

  // HTTP surface of the control plane, called by the worker.
  struct RuntimeAPI : public drogon::HttpController<RuntimeAPI, false>,
                      std::enable_shared_from_this<RuntimeAPI> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(RuntimeAPI::next, "/2018-06-01/runtime/invocation/next", drogon::Get);
    ADD_METHOD_TO(RuntimeAPI::response, "/2018-06-01/runtime/invocation/{1}/response", drogon::Post);
    ADD_METHOD_TO(RuntimeAPI::error, "/2018-06-01/runtime/invocation/{1}/error", drogon::Post);
    ADD_METHOD_TO(RuntimeAPI::init_error, "/2018-06-01/runtime/init/error", drogon::Post);
    ADD_METHOD_TO(RuntimeAPI::ping, "/2018-06-01/ping", drogon::Get);
    METHOD_LIST_END

    RuntimeAPI(Runtime& runtime, Workers& workers);

    void next(const request_t& request, callback_t&& callback);

    void response(const request_t& request, callback_t&& callback, const std::string& request_id);

    void error(const request_t& request, callback_t&& callback, const std::string& request_id);

    void init_error(const request_t& request, callback_t&& callback);

    void ping(const request_t& request, callback_t&& callback);

    static drogon::HttpResponsePtr accepted_response(const std::string& status = "OK");

    static drogon::HttpResponsePtr protocol_error(const ProtocolError& error);

  private:
    Runtime& _runtime;
    Workers& _workers;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
