#ifndef LAMBDALOCAL_EMULATOR_WORKERS_HPP
#define LAMBDALOCAL_EMULATOR_WORKERS_HPP

#include <lambdalocal/emulator/config.hpp>

#include <utility>

#include <BS_thread_pool.hpp>

namespace lambdalocal::emulator {

  // Moves blocking endpoint work off the HTTP event loops.
  class Workers {
  public:
    explicit Workers(int threads) : _pool(threads) {}

    explicit Workers(const config::Workers& cfg) : Workers(cfg.threads) {}

    template <typename F>
    void add_task(F&& func)
    {
      _pool.detach_task(std::forward<F>(func));
    }

    void wait()
    {
      _pool.wait();
    }

  private:
    BS::thread_pool _pool;
  };

} // namespace lambdalocal::emulator

#endif
