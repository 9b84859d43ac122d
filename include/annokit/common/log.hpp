#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace aklog {
enum Level { TRACE = 0, DEBUG, INFO, WARN, ERROR };
inline std::atomic<Level> g_level{INFO};
inline std::mutex g_mu;

inline const char* lvlstr(Level l) {
  switch (l) {
    case TRACE: return "TRACE";
    case DEBUG: return "DEBUG";
    case INFO: return "INFO";
    case WARN: return "WARN";
    default: return "ERROR";
  }
}

template <typename... A>
inline void write(Level l, const char* file, int line, const A&... a) {
  const Level current = g_level.load(std::memory_order_relaxed);
  if (l < current) return;
  std::ostringstream os;
  (void)std::initializer_list<int>{(os << a, 0)...};
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  struct tm tm_buf;
#if defined(_WIN32) || defined(_WIN64)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif

  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << "[" << lvlstr(l) << "] " << std::put_time(&tm_buf, "%F %T") << " " << file
            << ":" << line << " | " << os.str() << "\n";
}

// Case-insensitive; WARNING is accepted as WARN. Unknown names fall back to INFO.
inline Level levelFromString(const std::string& level_name) {
  std::string upper = level_name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "TRACE") return TRACE;
  if (upper == "DEBUG") return DEBUG;
  if (upper == "INFO") return INFO;
  if (upper == "WARN" || upper == "WARNING") return WARN;
  if (upper == "ERROR") return ERROR;
  write(WARN, __FILE__, __LINE__, "Unknown log level '", level_name, "', defaulting to INFO");
  return INFO;
}
}  // namespace aklog

#define LOGT(...) aklog::write(aklog::TRACE, __FILE__, __LINE__, __VA_ARGS__)
#define LOGD(...) aklog::write(aklog::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define LOGI(...) aklog::write(aklog::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define LOGW(...) aklog::write(aklog::WARN, __FILE__, __LINE__, __VA_ARGS__)
#define LOGE(...) aklog::write(aklog::ERROR, __FILE__, __LINE__, __VA_ARGS__)
