#include <lambdalocal/emulator/lifecycle.hpp>

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/common/util.hpp>
#include <lambdalocal/emulator/context.hpp>
#include <lambdalocal/emulator/state.hpp>
#include <lambdalocal/emulator/supervisor.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <optional>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace lambdalocal::emulator {

  namespace {

    constexpr uint32_t WATCH_MASK = IN_DELETE | IN_MODIFY | IN_MOVE | IN_CREATE;

    std::atomic<Lifecycle*> signal_target{nullptr};

    void signal_handler(int signum)
    {
      Lifecycle* lifecycle = signal_target.load();
      if (!lifecycle) {
        return;
      }
      if (signum == SIGHUP || signum == SIGUSR1) {
        lifecycle->restart();
      } else {
        lifecycle->shutdown(0);
      }
    }

    bool epoll_add(int epoll_fd, int fd)
    {
      epoll_event event{};
      memset(&event, 0, sizeof(epoll_event));
      event.events = EPOLLIN;
      event.data.fd = fd;

      if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
        spdlog::error("Adding descriptor to epoll failed, reason: {}", strerror(errno));
        return false;
      }
      return true;
    }

    void notify(int fd)
    {
      uint64_t tmp = 1;
      common::util::expect_other(::write(fd, &tmp, sizeof(tmp)), -1);
    }

    void consume(int fd)
    {
      uint64_t tmp = 0;
      if (::read(fd, &tmp, sizeof(tmp)) == -1 && errno != EAGAIN) {
        spdlog::error("Reading eventfd failed, reason: {}", strerror(errno));
      }
    }

  } // namespace

  Lifecycle::Lifecycle(const config::Emulator& cfg, RuntimeState& state, Supervisor& supervisor)
      : _stay_open(cfg.stay_open), _external(cfg.bootstrap.external), _watch(cfg.watch), _state(state), _supervisor(supervisor)
  {
    _logger = common::util::create_logger("Lifecycle");

    _epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (_epoll_fd < 0) {
      throw common::LambdaLocalException(
          fmt::format("Incorrect epoll initialization! {}", strerror(errno))
      );
    }

    _restart_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    _shutdown_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (_restart_fd == -1 || _shutdown_fd == -1) {
      throw common::LambdaLocalException(
          fmt::format("Incorrect eventfd initialization! {}", strerror(errno))
      );
    }
    if (!epoll_add(_epoll_fd, _restart_fd) || !epoll_add(_epoll_fd, _shutdown_fd)) {
      throw common::LambdaLocalException("Could not register lifecycle events");
    }

    if (_watch.enabled) {
      _inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
      if (_inotify_fd == -1 || !epoll_add(_epoll_fd, _inotify_fd)) {
        throw common::LambdaLocalException(
            fmt::format("Could not initialize file watching! {}", strerror(errno))
        );
      }
      for (const auto& path : _watch.paths) {
        _watch_tree(path);
      }
      _logger->info("Watching {} directories for changes", _watches.size());
    }
  }

  Lifecycle::~Lifecycle()
  {
    if (_thread.joinable()) {
      shutdown(0);
      _thread.join();
    }

    Lifecycle* self = this;
    signal_target.compare_exchange_strong(self, nullptr);

    for (int fd : {_inotify_fd, _shutdown_fd, _restart_fd, _epoll_fd}) {
      if (fd != -1) {
        ::close(fd);
      }
    }
  }

  void Lifecycle::install_signal_handlers(Lifecycle* lifecycle)
  {
    signal_target = lifecycle;

    struct sigaction sa {};
    sa.sa_handler = &signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int signum : {SIGINT, SIGTERM, SIGHUP, SIGUSR1}) {
      common::util::expect_zero(sigaction(signum, &sa, nullptr));
    }

    // Writes to a worker that has gone away must not kill the emulator.
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    common::util::expect_zero(sigaction(SIGPIPE, &ignore, nullptr));
  }

  void Lifecycle::start()
  {
    _thread = std::thread{&Lifecycle::_loop, this};
  }

  void Lifecycle::restart()
  {
    notify(_restart_fd);
  }

  void Lifecycle::shutdown(int exit_code)
  {
    bool expected = false;
    if (_shutdown_requested.compare_exchange_strong(expected, true)) {
      _exit_code = exit_code;
    }
    notify(_shutdown_fd);
  }

  int Lifecycle::wait()
  {
    if (_thread.joinable()) {
      _thread.join();
    }
    return _exit_code;
  }

  void Lifecycle::worker_exited(int status, bool intentional, bool aborted)
  {
    if (intentional) {
      return;
    }

    if (_stay_open) {
      _logger->warn("Worker exited with status {}, the next invocation starts a new one", status);
      return;
    }

    // One-shot: there is no restart, an invocation left without a result ends the process.
    // A worker that replied and then exited leaves the exit code to the caller.
    if (aborted) {
      _logger->error("Worker exited before completing the invocation");
      shutdown(1);
    }
  }

  void Lifecycle::handle_restart()
  {
    if (!_stay_open) {
      _logger->info("Restart requested without stay-open, exiting");
      shutdown(EXIT_RESTART);
      return;
    }
    if (_external) {
      _logger->info("Restart requested for an external runtime, exiting");
      shutdown(EXIT_RESTART);
      return;
    }

    _logger->info("Restarting worker");
    auto ctx = _state.inflight();
    _supervisor.kill();
    _state.reset();

    if (ctx && ctx->complete(InvocationError::crash(ctx->request_id))) {
      _logger->warn("Invocation {} aborted by restart", ctx->request_id);
    }
  }

  void Lifecycle::_loop()
  {
    using clock_t = std::chrono::steady_clock;

    std::array<epoll_event, 8> events{};
    std::optional<clock_t::time_point> pending_change;

    while (true) {

      if (pending_change.has_value() && clock_t::now() >= pending_change.value()) {
        pending_change.reset();
        _logger->info("Handler or layer files changed, restarting worker");
        handle_restart();
      }

      int timeout = -1;
      if (pending_change.has_value()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            pending_change.value() - clock_t::now()
        );
        timeout = std::max(static_cast<int>(remaining.count()), 0);
      }

      int count = epoll_wait(_epoll_fd, events.data(), events.size(), timeout);
      if (count == -1) {
        if (errno == EINTR) {
          continue;
        }
        _logger->error("Waiting for lifecycle events failed, reason: {}", strerror(errno));
        _exit_code = 1;
        break;
      }

      for (int i = 0; i < count; ++i) {

        int fd = events[i].data.fd;
        if (fd == _shutdown_fd) {
          consume(fd);
          _logger->info("Shutting down with exit code {}", _exit_code.load());
          auto ctx = _state.inflight();
          _supervisor.kill();
          if (ctx && ctx->complete(InvocationError::crash(ctx->request_id))) {
            _logger->warn("Invocation {} aborted by shutdown", ctx->request_id);
          }
          return;
        } else if (fd == _restart_fd) {
          consume(fd);
          _logger->info("Restart requested");
          handle_restart();
        } else if (fd == _inotify_fd) {
          if (_drain_inotify()) {
            // Bursts of changes within the debounce window cause one restart.
            pending_change = clock_t::now() + std::chrono::milliseconds{_watch.debounce};
          }
        }
      }
    }

    _supervisor.kill();
  }

  void Lifecycle::_watch_tree(const std::string& root)
  {
    namespace fs = std::filesystem;

    auto add = [this](const fs::path& dir) {
      int wd = inotify_add_watch(_inotify_fd, dir.c_str(), WATCH_MASK | IN_ONLYDIR);
      if (wd == -1) {
        _logger->warn("Cannot watch {}, reason: {}", dir.string(), strerror(errno));
        return;
      }
      _watches[wd] = dir.string();
    };

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      _logger->warn("Cannot watch {}, not a directory", root);
      return;
    }
    add(root);

    fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied, ec};
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
      if (it->is_directory(ec) && !it->is_symlink(ec)) {
        add(it->path());
      }
    }
  }

  bool Lifecycle::_drain_inotify()
  {
    alignas(inotify_event) std::array<char, 4096> buffer;
    bool changed = false;

    while (true) {

      ssize_t n = ::read(_inotify_fd, buffer.data(), buffer.size());
      if (n == -1) {
        if (errno == EINTR) {
          continue;
        }
        if (errno != EAGAIN) {
          _logger->error("Reading file events failed, reason: {}", strerror(errno));
        }
        break;
      }
      if (n == 0) {
        break;
      }

      char* ptr = buffer.data();
      while (ptr < buffer.data() + n) {

        auto* event = reinterpret_cast<inotify_event*>(ptr);
        ptr += sizeof(inotify_event) + event->len;

        if (event->mask & IN_IGNORED) {
          _watches.erase(event->wd);
          continue;
        }
        if (!(event->mask & WATCH_MASK)) {
          continue;
        }
        changed = true;

        auto it = _watches.find(event->wd);
        if (it == _watches.end()) {
          continue;
        }
        std::string dir = it->second;
        SPDLOG_LOGGER_DEBUG(_logger, "File event {:#x} in {}", event->mask, dir);

        // New subdirectories are watched too.
        if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) &&
            event->len > 0) {
          _watch_tree((std::filesystem::path{dir} / event->name).string());
        }
      }
    }

    return changed;
  }

} // namespace lambdalocal::emulator
