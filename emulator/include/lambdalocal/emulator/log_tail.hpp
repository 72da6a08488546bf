#ifndef LAMBDALOCAL_EMULATOR_LOG_TAIL_HPP
#define LAMBDALOCAL_EMULATOR_LOG_TAIL_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

namespace lambdalocal::emulator {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Rolling buffer holding the most recent bytes of worker output.
  ///
  /// Written by the supervisor's pipe reader and by the report logger,
  /// drained by the dispatcher when an invocation asks for its log tail.
  ////////////////////////////////////////////////////////////////////////////////
  class LogTail {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit LogTail(size_t capacity = DEFAULT_CAPACITY);

    void append(std::string_view data);

    std::string contents() const;

    void clear();

    size_t capacity() const
    {
      return _capacity;
    }

  private:
    size_t _capacity;
    mutable std::mutex _mutex;
    std::string _buffer;
  };

  class LogTailSink : public spdlog::sinks::base_sink<std::mutex> {
  public:
    explicit LogTailSink(std::shared_ptr<LogTail> tail) : _tail(std::move(tail)) {}

  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

  private:
    std::shared_ptr<LogTail> _tail;
  };

  // Plain-pattern logger for START/END/REPORT lines, writes to stderr and the tail.
  std::shared_ptr<spdlog::logger> create_report_logger(std::shared_ptr<LogTail> tail);

} // namespace lambdalocal::emulator

#endif
