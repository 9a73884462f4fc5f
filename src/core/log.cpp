#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace eos_miner {

namespace {

std::mutex g_log_mutex;

void WriteLine(std::ostream& out, const char* level, std::string_view message) {
  // 三个级别共享同一把锁，保证 stdout/stderr 交错时时序仍可读。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << " [" << level << "] " << message
      << '\n';
  out.flush();
}

}  // namespace

void LogInfo(std::string_view message) {
  WriteLine(std::cout, "INFO", message);
}

void LogWarn(std::string_view message) {
  WriteLine(std::cout, "WARN", message);
}

void LogError(std::string_view message) {
  WriteLine(std::cerr, "ERROR", message);
}

}  // namespace eos_miner
