#ifndef LAMBDALOCAL_COMMON_HTTP_HPP
#define LAMBDALOCAL_COMMON_HTTP_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace drogon {
  struct HttpRequest;
  struct HttpResponse;
  enum class ReqResult;
  struct HttpClient;
} // namespace drogon

namespace trantor {
  struct EventLoop;
  struct EventLoopThreadPool;
} // namespace trantor

namespace lambdalocal::common::http {

  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using response_ptr_t = std::shared_ptr<drogon::HttpResponse>;
    using headers_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t =
        std::function<void(drogon::ReqResult, const std::shared_ptr<drogon::HttpResponse>&)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop);

    request_ptr_t get(const std::string& path, headers_t&& headers, callback_t&& callback);

    request_ptr_t post(
        const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
    );

    static response_ptr_t correct_response(const std::string& status);

  private:
    void request(request_ptr_t& req, headers_t&& headers, callback_t&& callback);

    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    static HTTPClient create_client(std::string address, int port = -1);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace lambdalocal::common::http

#endif
