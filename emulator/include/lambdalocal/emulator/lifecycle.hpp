#ifndef LAMBDALOCAL_EMULATOR_LIFECYCLE_HPP
#define LAMBDALOCAL_EMULATOR_LIFECYCLE_HPP

#include <lambdalocal/emulator/config.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  class RuntimeState;
  class Supervisor;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Restart and shutdown controller.
  ///
  /// Requests arrive from signal handlers, from the supervisor and from
  /// inotify; all of them only write to an eventfd. A single thread waits on
  /// the descriptors with epoll and performs the actual work.
  ////////////////////////////////////////////////////////////////////////////////
  class Lifecycle {
  public:
    static constexpr int EXIT_RESTART = 2;

    Lifecycle(const config::Emulator& cfg, RuntimeState& state, Supervisor& supervisor);

    ~Lifecycle();

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    void start();

    // Both are safe to call from a signal handler.
    void restart();
    void shutdown(int exit_code);

    // Blocks until shutdown was requested, returns the exit code.
    int wait();

    // Called by the supervisor after reaping the worker.
    void worker_exited(int status, bool intentional, bool aborted);

    // Kills the worker and fails the in-flight invocation. Exits in one-shot
    // mode and when the runtime is external, since nothing could restart it.
    void handle_restart();

    // Routes SIGINT, SIGTERM, SIGHUP and SIGUSR1 to this instance.
    static void install_signal_handlers(Lifecycle* lifecycle);

    size_t watched_directories() const
    {
      return _watches.size();
    }

  private:
    void _loop();
    void _watch_tree(const std::string& root);
    bool _drain_inotify();

    bool _stay_open;
    bool _external;
    config::Watch _watch;

    RuntimeState& _state;
    Supervisor& _supervisor;

    int _epoll_fd = -1;
    int _restart_fd = -1;
    int _shutdown_fd = -1;
    int _inotify_fd = -1;
    std::unordered_map<int, std::string> _watches;

    std::atomic<bool> _shutdown_requested{false};
    std::atomic<int> _exit_code{0};

    std::thread _thread;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
