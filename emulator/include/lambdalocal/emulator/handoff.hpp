#ifndef LAMBDALOCAL_EMULATOR_HANDOFF_HPP
#define LAMBDALOCAL_EMULATOR_HANDOFF_HPP

#include <lambdalocal/emulator/context.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <variant>

namespace lambdalocal::emulator {

  // Unblocks a waiting consumer without carrying any work.
  struct WakeUp {
  };

  using Message = std::variant<ContextPtr, WakeUp>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Single-slot, unbuffered rendezvous between the dispatcher and the
  /// next-invocation endpoint.
  ///
  /// A producer blocks until a consumer has taken its context, so at most one
  /// context is ever waiting. Both sides poll a cancellation predicate: a
  /// cancelled producer withdraws its offer, a cancelled consumer receives
  /// WakeUp instead of work.
  ////////////////////////////////////////////////////////////////////////////////
  class Handoff {
  public:
    using cancel_t = std::function<bool()>;
    using duration_t = std::chrono::milliseconds;

    static constexpr duration_t DEFAULT_POLL{50};

    // Returns true once a consumer took ctx; false when cancelled first.
    // Throws HandoffClosed after close().
    bool send(ContextPtr ctx, const cancel_t& cancelled = nullptr, duration_t poll = DEFAULT_POLL);

    Message receive(const cancel_t& cancelled = nullptr, duration_t poll = DEFAULT_POLL);

    // Puts back work taken by a consumer that could not deliver it.
    // Does not wait; returns false when the slot is occupied or closed.
    bool requeue(ContextPtr ctx);

    // Releases all waiters, later receives return WakeUp immediately.
    void close();

    bool closed() const;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    ContextPtr _offer;
    bool _closed = false;
  };

} // namespace lambdalocal::emulator

#endif
