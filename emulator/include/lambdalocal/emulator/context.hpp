#ifndef LAMBDALOCAL_EMULATOR_CONTEXT_HPP
#define LAMBDALOCAL_EMULATOR_CONTEXT_HPP

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace Json {
  class Value;
} // namespace Json

namespace lambdalocal::emulator {

  namespace config {
    struct Function;
  } // namespace config

  enum class InvocationType { REQUEST_RESPONSE, EVENT, DRY_RUN };

  // Accepts the cloud names (RequestResponse, Event, DryRun) and the short aliases.
  std::optional<InvocationType> parse_invocation_type(std::string_view type);

  enum class LogType { NONE, TAIL };

  enum class ErrorKind {
    UNHANDLED,
    INIT_ERROR,
    CRASH,
    TIMEOUT,
    INVALID_ERROR_SHAPE,
    BOOTSTRAP_NOT_FOUND
  };

  std::string_view label(ErrorKind kind);

  struct InvocationError {

    static constexpr int MAX_CAUSE_DEPTH = 8;

    ErrorKind kind;
    std::string message;
    std::optional<std::string> type;
    std::vector<std::string> stack_trace;
    std::shared_ptr<const InvocationError> cause;

    Json::Value json() const;

    // Compact JSON: {"errorMessage", "errorType"?, "stackTrace"?, "cause"?}
    std::string serialize() const;

    static InvocationError crash(std::string_view request_id);

    static InvocationError
    timeout(std::string_view request_id, int timeout, std::chrono::system_clock::time_point now);

    static InvocationError invalid_shape();

    static InvocationError bootstrap_not_found(const std::string& reason);

    // Returns nullopt when the body is not a JSON object of the expected shape.
    static std::optional<InvocationError> parse(
        ErrorKind kind, std::string_view body, const std::optional<std::string>& type_header
    );

    static std::optional<InvocationError> from_json(ErrorKind kind, const Json::Value& obj, int depth = 0);
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief State of a single invocation attempt.
  ///
  /// Identity and timing are fixed at construction. The reply, captured logs and
  /// worker timestamps are filled by the runtime API and the supervisor; the
  /// result becomes final on the first call to complete(), which also releases
  /// every thread blocked in wait().
  ////////////////////////////////////////////////////////////////////////////////
  struct Context {

    using clock_t = std::chrono::system_clock;

    static constexpr size_t MAX_LOG_TAIL = 4096;

    Context(
        const config::Function& cfg, std::shared_ptr<spdlog::logger> report_logger,
        clock_t::time_point start = clock_t::now()
    );

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const std::string request_id;
    const std::string function_arn;
    const std::string version;
    const int memory_size;
    const std::string trace_id;
    const std::chrono::seconds timeout;
    const clock_t::time_point start;

    // Configured before the context is handed off, read-only afterwards.
    std::string payload;
    InvocationType type = InvocationType::REQUEST_RESPONSE;
    LogType log_type = LogType::NONE;
    std::optional<std::string> client_context;
    std::optional<std::string> cognito_identity;

    clock_t::time_point deadline() const
    {
      return start + timeout;
    }

    bool has_expired() const
    {
      return has_expired(clock_t::now());
    }

    bool has_expired(clock_t::time_point now) const
    {
      return now >= deadline();
    }

    std::chrono::milliseconds elapsed(clock_t::time_point now = clock_t::now()) const
    {
      return std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
    }

    // First call wins, later calls are no-ops returning false.
    bool complete(std::optional<InvocationError> error = std::nullopt);

    bool completed() const;

    void wait() const;

    bool wait_until(clock_t::time_point time) const;

    void set_reply(std::string reply);

    std::optional<std::string> reply() const;

    std::optional<InvocationError> error() const;

    // Error category the worker reported in its error-type header.
    void set_function_error(std::string type);

    std::optional<std::string> function_error() const;

    // Keeps only the most recent MAX_LOG_TAIL bytes.
    void record_log_tail(std::string_view raw);

    std::optional<std::string> log_tail() const;

    // Base64 of the captured tail.
    std::optional<std::string> log_result() const;

    // Timestamps reported by the worker, in Unix milliseconds.
    void record_init_end(std::optional<int64_t> init_end_ms, std::optional<int64_t> invoke_wait_ms);

    // Set when this invocation had to (re)start the worker.
    void record_worker_start(clock_t::time_point time);

    // Emits the START line when the worker receives the invocation.
    void log_start();

  private:
    void _report(clock_t::time_point end);

    std::shared_ptr<spdlog::logger> _report_logger;

    mutable std::mutex _mutex;
    bool _completed{};
    std::promise<void> _done_promise;
    std::shared_future<void> _done;

    std::optional<std::string> _reply;
    std::optional<InvocationError> _error;
    std::optional<std::string> _function_error;
    std::optional<std::string> _log_tail;

    std::optional<clock_t::time_point> _worker_start;
    std::optional<clock_t::time_point> _fetched;
    std::optional<clock_t::time_point> _init_end;
    std::optional<clock_t::time_point> _invoke_wait;
  };

  using ContextPtr = std::shared_ptr<Context>;

} // namespace lambdalocal::emulator

#endif
