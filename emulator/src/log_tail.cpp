#include <lambdalocal/emulator/log_tail.hpp>

#include <spdlog/sinks/stdout_sinks.h>

namespace lambdalocal::emulator {

  LogTail::LogTail(size_t capacity) : _capacity(capacity)
  {
    _buffer.reserve(capacity);
  }

  void LogTail::append(std::string_view data)
  {
    if (data.size() >= _capacity) {
      data.remove_prefix(data.size() - _capacity);
    }

    std::lock_guard<std::mutex> lock(_mutex);
    size_t total = _buffer.size() + data.size();
    if (total > _capacity) {
      _buffer.erase(0, total - _capacity);
    }
    _buffer.append(data);
  }

  std::string LogTail::contents() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _buffer;
  }

  void LogTail::clear()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _buffer.clear();
  }

  void LogTailSink::sink_it_(const spdlog::details::log_msg& msg)
  {
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    _tail->append(std::string_view{formatted.data(), formatted.size()});
  }

  std::shared_ptr<spdlog::logger> create_report_logger(std::shared_ptr<LogTail> tail)
  {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto tail_sink = std::make_shared<LogTailSink>(std::move(tail));

    auto logger = std::make_shared<spdlog::logger>(
        "report", spdlog::sinks_init_list{stderr_sink, tail_sink}
    );
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    return logger;
  }

} // namespace lambdalocal::emulator
