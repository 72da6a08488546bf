#include <lambdalocal/emulator/supervisor.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>
#include <lambdalocal/common/uuid.hpp>
#include <lambdalocal/emulator/log_tail.hpp>
#include <lambdalocal/emulator/state.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <map>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

extern char** environ;

namespace lambdalocal::emulator {

  namespace {

    std::string log_stream_name(const std::string& version)
    {
      std::string hex = common::UUID::random_string();
      hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());

      std::time_t now = std::time(nullptr);
      std::tm utc{};
      gmtime_r(&now, &utc);

      return fmt::format("{:%Y/%m/%d}/[{}]{}", utc, version, hex);
    }

    bool write_all(int fd, const char* data, size_t len)
    {
      while (len > 0) {
        ssize_t written = ::write(fd, data, len);
        if (written == -1) {
          if (errno == EINTR) {
            continue;
          }
          return false;
        }
        data += written;
        len -= written;
      }
      return true;
    }

  } // namespace

  Supervisor::Supervisor(
      const config::Emulator& cfg, RuntimeState& state, std::shared_ptr<LogTail> tail
  )
      : _function(cfg.function), _bootstrap(cfg.bootstrap),
        _runtime_endpoint(cfg.runtime_api.endpoint()),
        _log_stream_name(log_stream_name(cfg.function.version)), _state(state),
        _tail(std::move(tail))
  {
    _logger = common::util::create_logger("Supervisor");
  }

  Supervisor::~Supervisor()
  {
    kill();
  }

  std::optional<std::string> Supervisor::find_bootstrap() const
  {
    for (const auto& path : _bootstrap.paths) {
      struct stat st{};
      if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0) {
        return path;
      }
    }
    return std::nullopt;
  }

  std::vector<std::string> Supervisor::environment() const
  {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
      std::string_view var{*entry};
      auto pos = var.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      env[std::string{var.substr(0, pos)}] = std::string{var.substr(pos + 1)};
    }

    env["AWS_LAMBDA_RUNTIME_API"] = _runtime_endpoint;
    env["AWS_LAMBDA_FUNCTION_NAME"] = _function.name;
    env["AWS_LAMBDA_FUNCTION_VERSION"] = _function.version;
    env["AWS_LAMBDA_FUNCTION_MEMORY_SIZE"] = std::to_string(_function.memory_size);
    env["AWS_LAMBDA_LOG_GROUP_NAME"] = fmt::format("/aws/lambda/{}", _function.name);
    env["AWS_LAMBDA_LOG_STREAM_NAME"] = _log_stream_name;
    env["AWS_REGION"] = _function.region;
    env["AWS_DEFAULT_REGION"] = _function.region;
    env["_HANDLER"] = _function.handler;

    // Fake credentials keep SDKs inside the worker from failing at startup.
    namespace util = common::util;
    if (!util::getenv("AWS_ACCESS_KEY_ID").has_value()) {
      env["AWS_ACCESS_KEY_ID"] = util::getenv("AWS_ACCESS_KEY").value_or("SOME_ACCESS_KEY_ID");
    }
    if (!util::getenv("AWS_SECRET_ACCESS_KEY").has_value()) {
      env["AWS_SECRET_ACCESS_KEY"] =
          util::getenv("AWS_SECRET_KEY").value_or("SOME_SECRET_ACCESS_KEY");
    }
    if (!util::getenv("AWS_SESSION_TOKEN").has_value()) {
      if (auto token = util::getenv("AWS_SECURITY_TOKEN"); token.has_value()) {
        env["AWS_SESSION_TOKEN"] = token.value();
      }
    }

    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [key, value] : env) {
      result.emplace_back(fmt::format("{}={}", key, value));
    }
    return result;
  }

  bool Supervisor::ensure_running(const ContextPtr& ctx)
  {
    if (_bootstrap.external) {
      return false;
    }

    std::lock_guard<std::mutex> spawn_lock(_spawn_mutex);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_running) {
        return false;
      }
    }

    // Threads of the previous worker have finished or are about to.
    _join();

    auto path = find_bootstrap();
    if (!path.has_value()) {
      throw common::BootstrapNotFound(
          fmt::format("Couldn't find valid bootstrap(s): [{}]", fmt::join(_bootstrap.paths, " "))
      );
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args{path.value()};
    args.insert(args.end(), _bootstrap.args.begin(), _bootstrap.args.end());
    std::vector<std::string> env = environment();

    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& var : env) {
      envp.push_back(var.data());
    }
    envp.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (_bootstrap.capture_output && ::pipe2(fds, O_CLOEXEC) == -1) {
      throw common::ProcessSpawnError(
          fmt::format("Could not create output pipe, reason {} {}", errno, strerror(errno))
      );
    }

    pid_t child = fork();
    if (child < 0) {
      int err = errno;
      if (_bootstrap.capture_output) {
        ::close(fds[0]);
        ::close(fds[1]);
      }
      throw common::ProcessSpawnError(
          fmt::format("Fork failed! {}, reason {} {}", child, err, strerror(err))
      );
    }

    if (child == 0) {

      // Own process group, so that kill() reaps the worker's children too.
      ::setpgid(0, 0);

      if (_bootstrap.capture_output) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
      } else {
        // Standard output is reserved for the invocation result.
        ::dup2(STDERR_FILENO, STDOUT_FILENO);
      }

      ::execve(argv[0], argv.data(), envp.data());
      _exit(127);
    }

    // Mirror the child's setpgid; it fails harmlessly once the child has exec'd.
    if (::setpgid(child, child) == -1 && errno != EACCES && errno != ESRCH) {
      _logger->warn("Could not move worker {} to its process group: {}", child, strerror(errno));
    }

    if (_bootstrap.capture_output) {
      ::close(fds[1]);
    }

    if (ctx) {
      ctx->record_worker_start(Context::clock_t::now());
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      _pid = child;
      _running = true;
      _intentional = false;
    }
    _logger->info("Started worker {} with PID {}", path.value(), child);

    if (_bootstrap.capture_output) {
      _reader = std::thread{&Supervisor::_read_output, this, fds[0]};
    }
    _watcher = std::thread{&Supervisor::_watch, this, child};

    return true;
  }

  bool Supervisor::running() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _running;
  }

  std::optional<pid_t> Supervisor::pid() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running) {
      return std::nullopt;
    }
    return _pid;
  }

  void Supervisor::kill()
  {
    std::lock_guard<std::mutex> spawn_lock(_spawn_mutex);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_running && _pid > 0) {
        _intentional = true;
        if (::killpg(_pid, SIGKILL) == -1 && errno != ESRCH) {
          _logger->error("Could not kill worker group {}, reason {}", _pid, strerror(errno));
        } else {
          _logger->info("Killed worker {}", _pid);
        }
      }
    }
    _join();
  }

  void Supervisor::on_exit(exit_callback_t callback)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _exit_callback = std::move(callback);
  }

  void Supervisor::_join()
  {
    if (_watcher.joinable()) {
      _watcher.join();
    }
    _reader_stop = true;
    if (_reader.joinable()) {
      _reader.join();
    }
    _reader_stop = false;
  }

  void Supervisor::_watch(pid_t pid)
  {
    int status = 0;
    pid_t ret = 0;
    do {
      ret = ::waitpid(pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1) {
      _logger->error("Could not wait for worker {}, reason {}", pid, strerror(errno));
    } else if (WIFEXITED(status)) {
      _logger->info("Worker {} exited with status {}", pid, WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
      _logger->info("Worker {} terminated by signal {}", pid, WTERMSIG(status));
    }

    // Reap whatever the worker left behind in its group.
    if (::killpg(pid, SIGKILL) == -1 && errno != ESRCH) {
      _logger->warn("Could not clean up process group {}, reason {}", pid, strerror(errno));
    }

    bool intentional = false;
    exit_callback_t callback;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _running = false;
      _pid = -1;
      intentional = _intentional;
      callback = _exit_callback;
    }

    _state.reset();

    bool aborted = false;
    if (!intentional) {
      auto ctx = _state.inflight();
      if (ctx && ctx->complete(InvocationError::crash(ctx->request_id))) {
        _logger->error("Worker exited during invocation {}", ctx->request_id);
        aborted = true;
      }
    }

    if (callback) {
      callback(status, intentional, aborted);
    }
  }

  void Supervisor::_read_output(int fd)
  {
    std::array<char, 4096> buffer;
    pollfd pfd{fd, POLLIN, 0};

    while (true) {

      int ret = ::poll(&pfd, 1, 100);
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        _logger->error("Polling worker output failed, reason {}", strerror(errno));
        break;
      }
      if (ret == 0) {
        if (_reader_stop) {
          break;
        }
        continue;
      }

      ssize_t count = ::read(fd, buffer.data(), buffer.size());
      if (count == -1) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        _logger->error("Reading worker output failed, reason {}", strerror(errno));
        break;
      }
      if (count == 0) {
        break;
      }

      // Carriage returns would hide log lines in the terminal and in the tail.
      std::replace(buffer.begin(), buffer.begin() + count, '\r', '\n');

      if (!write_all(STDERR_FILENO, buffer.data(), count)) {
        SPDLOG_LOGGER_DEBUG(_logger, "Could not forward worker output, reason {}", strerror(errno));
      }
      _tail->append(std::string_view{buffer.data(), static_cast<size_t>(count)});
    }

    ::close(fd);
  }

} // namespace lambdalocal::emulator
