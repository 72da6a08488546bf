#include <lambdalocal/common/http.hpp>

#include <lambdalocal/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <fmt/format.h>
#include <json/value.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace lambdalocal::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  HTTPClient::HTTPClient() : _http_client(nullptr) {}

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop)
  {
    this->_http_client = drogon::HttpClient::newHttpClient(address, loop, false, false);
  }

  std::shared_ptr<drogon::HttpRequest>
  HTTPClient::get(const std::string& path, headers_t&& headers, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(path);
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post(
      const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setBody(std::move(body));
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  void HTTPClient::request(
      std::shared_ptr<drogon::HttpRequest>& req, headers_t&& headers, callback_t&& callback
  )
  {
    if (!_http_client) {
      throw common::LambdaLocalException("Uninitialized HTTP client!");
    }
    for (const auto& header : headers) {
      req->addHeader(header.first, header.second);
    }
    _http_client->sendRequest(req, std::move(callback));
  }

  HTTPClient::response_ptr_t HTTPClient::correct_response(const std::string& status)
  {
    Json::Value json;
    json["status"] = status;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(drogon::k200OK);
    return resp;
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    HTTPClientFactory::_pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    HTTPClientFactory::_pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    HTTPClientFactory::_pool.reset();
  }

  HTTPClient HTTPClientFactory::create_client(std::string address, int port)
  {
    if (!_pool) {
      throw common::LambdaLocalException("Uninitialized HTTPClientFactory!");
    }

    if (port != -1) {
      return HTTPClient{fmt::format("{}:{}", address, port), _pool->getNextLoop()};
    } else {
      return HTTPClient{address, _pool->getNextLoop()};
    }
  }

} // namespace lambdalocal::common::http
