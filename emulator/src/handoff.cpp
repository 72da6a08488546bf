#include <lambdalocal/emulator/handoff.hpp>

#include <lambdalocal/common/exceptions.hpp>

namespace lambdalocal::emulator {

  bool Handoff::send(ContextPtr ctx, const cancel_t& cancelled, duration_t poll)
  {
    std::unique_lock<std::mutex> lock(_mutex);

    // Wait for the slot to become free.
    while (_offer && !_closed) {
      if (cancelled && cancelled()) {
        return false;
      }
      _cv.wait_for(lock, poll);
    }
    if (_closed) {
      throw common::HandoffClosed{};
    }

    _offer = ctx;
    _cv.notify_all();

    while (_offer == ctx) {
      if (_closed || (cancelled && cancelled())) {
        _offer.reset();
        _cv.notify_all();
        if (_closed) {
          throw common::HandoffClosed{};
        }
        return false;
      }
      _cv.wait_for(lock, poll);
    }

    return true;
  }

  Message Handoff::receive(const cancel_t& cancelled, duration_t poll)
  {
    std::unique_lock<std::mutex> lock(_mutex);

    while (!_offer) {
      if (_closed || (cancelled && cancelled())) {
        return WakeUp{};
      }
      _cv.wait_for(lock, poll);
    }

    ContextPtr ctx = std::move(_offer);
    _offer.reset();
    _cv.notify_all();

    return ctx;
  }

  bool Handoff::requeue(ContextPtr ctx)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_offer || _closed) {
        return false;
      }
      _offer = std::move(ctx);
    }
    _cv.notify_all();
    return true;
  }

  void Handoff::close()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _closed = true;
    }
    _cv.notify_all();
  }

  bool Handoff::closed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

} // namespace lambdalocal::emulator
