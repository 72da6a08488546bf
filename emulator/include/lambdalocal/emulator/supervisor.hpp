#ifndef LAMBDALOCAL_EMULATOR_SUPERVISOR_HPP
#define LAMBDALOCAL_EMULATOR_SUPERVISOR_HPP

#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/context.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  class LogTail;
  class RuntimeState;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Owns the single worker process of the sandbox.
  ///
  /// The worker is started lazily by the first invocation and runs in its own
  /// process group. A watcher thread reaps it; an exit that was not requested
  /// through kill() fails the in-flight invocation with a crash error.
  ////////////////////////////////////////////////////////////////////////////////
  class Supervisor {
  public:
    // Exit status as returned by waitpid, whether kill() caused the exit, and
    // whether the exit failed an invocation that had no result yet.
    using exit_callback_t = std::function<void(int status, bool intentional, bool aborted)>;

    Supervisor(const config::Emulator& cfg, RuntimeState& state, std::shared_ptr<LogTail> tail);

    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Starts the worker unless it is already running.
     *
     * @param ctx invocation that triggered the start; receives the spawn time
     * used for the init duration of its report.
     * @return true when a new worker was spawned; always false for an
     * external runtime.
     * @throws BootstrapNotFound when no executable exists at the bootstrap paths.
     * @throws ProcessSpawnError when the pipe or fork fails.
     */
    bool ensure_running(const ContextPtr& ctx);

    bool running() const;

    std::optional<pid_t> pid() const;

    // Kills the worker's process group and waits until it has been reaped.
    void kill();

    void on_exit(exit_callback_t callback);

    // First executable among the configured bootstrap paths.
    std::optional<std::string> find_bootstrap() const;

    // KEY=VALUE entries passed to the worker.
    std::vector<std::string> environment() const;

  private:
    void _watch(pid_t pid);
    void _read_output(int fd);
    void _join();

    config::Function _function;
    config::Bootstrap _bootstrap;
    std::string _runtime_endpoint;
    std::string _log_stream_name;

    RuntimeState& _state;
    std::shared_ptr<LogTail> _tail;

    // Serializes spawning and killing.
    std::mutex _spawn_mutex;

    mutable std::mutex _mutex;
    pid_t _pid = -1;
    bool _running = false;
    bool _intentional = false;
    exit_callback_t _exit_callback;

    std::thread _watcher;
    std::thread _reader;
    std::atomic<bool> _reader_stop{false};

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lambdalocal::emulator

#endif
