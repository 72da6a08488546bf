#ifndef LAMBDALOCAL_EMULATOR_TESTS_CLIENT_HPP
#define LAMBDALOCAL_EMULATOR_TESTS_CLIENT_HPP

#include <lambdalocal/common/http.hpp>

#include <functional>
#include <future>
#include <memory>

#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

// Blocks until the request issued by send completes; nullptr on a transport error.
inline drogon::HttpResponsePtr
wait_response(const std::function<void(lambdalocal::common::http::HTTPClient::callback_t&&)>& send)
{
  auto result = std::make_shared<std::promise<drogon::HttpResponsePtr>>();
  auto future = result->get_future();
  send([result](drogon::ReqResult status, const drogon::HttpResponsePtr& response) {
    result->set_value(status == drogon::ReqResult::Ok ? response : nullptr);
  });
  return future.get();
}

#endif
