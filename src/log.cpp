#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<LogLevel> &current_level() {
  static std::atomic<LogLevel> level{LogLevel::INFO};
  return level;
}

// Lanes log from worker threads; keep lines whole
std::mutex &output_mutex() {
  static std::mutex mutex;
  return mutex;
}

void write(LogLevel level, const char *tag, const std::string &message) {
  if (level < current_level().load(std::memory_order_relaxed)) {
    return;
  }

  std::lock_guard<std::mutex> lock(output_mutex());
  std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
  out << "[" << tag << "] " << message << '\n';
}

} // namespace

void set_log_level(LogLevel level) {
  current_level().store(level, std::memory_order_relaxed);
}

LogLevel log_level() { return current_level().load(std::memory_order_relaxed); }

void log_debug(const std::string &message) {
  write(LogLevel::DEBUG, "DEBUG", message);
}

void log_info(const std::string &message) {
  write(LogLevel::INFO, "INFO", message);
}

void log_warn(const std::string &message) {
  write(LogLevel::WARN, "WARN", message);
}

void log_error(const std::string &message) {
  write(LogLevel::ERROR, "ERROR", message);
}
