#pragma once
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <chrono>
#include <ctime>

namespace ptg {
namespace log {

enum class Level { TRACE=0, DEBUG=1, INFO=2, WARN=3, ERROR=4, NONE=5 };

namespace detail {

struct LevelName { Level level; const char* name; };

static const LevelName kLevelNames[] = {
  {Level::TRACE, "TRACE"}, {Level::DEBUG, "DEBUG"}, {Level::INFO, "INFO"},
  {Level::WARN, "WARN"},   {Level::ERROR, "ERROR"}, {Level::NONE, "NONE"},
};

inline bool iequals(const char* a, const char* b) {
  for (; *a && *b; ++a, ++b) {
    char x = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char y = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (x != y) return false;
  }
  return *a == *b;
}

inline const char* basename(const char* path) {
  const char* slash = std::strrchr(path, '/');
#if defined(_WIN32)
  const char* back = std::strrchr(path, '\\');
  if (back && (!slash || back > slash)) slash = back;
#endif
  return slash ? slash + 1 : path;
}

// -1 until first use; PTG_LOG_LEVEL seeds it.
inline std::atomic<int>& level_slot() {
  static std::atomic<int> slot{-1};
  return slot;
}

} // namespace detail

inline const char* level_name(Level lv) {
  for (const auto& e : detail::kLevelNames) {
    if (e.level == lv) return e.name;
  }
  return "NONE";
}

// Accepts a level name in any case ("warn", "WARN") or its digit ("3").
inline bool try_parse_level(const char* s, Level& out) {
  if (!s || !*s) return false;
  if (s[0] >= '0' && s[0] <= '5' && s[1] == '\0') {
    out = static_cast<Level>(s[0] - '0');
    return true;
  }
  for (const auto& e : detail::kLevelNames) {
    if (detail::iequals(s, e.name)) { out = e.level; return true; }
  }
  return false;
}

inline Level parse_level(const char* s, Level defv = Level::INFO) {
  Level lv = defv;
  return try_parse_level(s, lv) ? lv : defv;
}

inline Level current_level() {
  std::atomic<int>& slot = detail::level_slot();
  int v = slot.load(std::memory_order_acquire);
  if (v >= 0) return static_cast<Level>(v);
  Level lv = parse_level(std::getenv("PTG_LOG_LEVEL"));
  slot.store(static_cast<int>(lv), std::memory_order_release);
  return lv;
}

inline void set_level(Level lv) {
  detail::level_slot().store(static_cast<int>(lv), std::memory_order_release);
}

inline bool enabled(Level lv) { return lv != Level::NONE && lv >= current_level(); }

inline bool with_timestamp() {
  static const bool on = [] {
    const char* env = std::getenv("PTG_LOG_TS");
    return env && (std::strcmp(env, "1") == 0 || detail::iequals(env, "true"));
  }();
  return on;
}

inline void logv(Level lv, const char* file, int line, const char* fmt, va_list ap) {
  if (!enabled(lv)) return;
  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);

  char ts[40] = {0};
  if (with_timestamp()) {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::snprintf(ts, sizeof(ts), "[%04d-%02d-%02d %02d:%02d:%02d.%03d] ",
                  tm.tm_year+1900, tm.tm_mon+1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  }
  std::fprintf(stderr, "%sptg %-5s %s:%d: %s\n", ts, level_name(lv), detail::basename(file), line, msg);
}

inline void logf(Level lv, const char* file, int line, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt);
  logv(lv, file, line, fmt, ap);
  va_end(ap);
}

template <typename... Args>
inline void log_trace(const char* file, int line, const char* fmt, Args... args) {
  logf(Level::TRACE, file, line, fmt, args...);
}

template <typename... Args>
inline void log_debug(const char* file, int line, const char* fmt, Args... args) {
  logf(Level::DEBUG, file, line, fmt, args...);
}

template <typename... Args>
inline void log_info(const char* file, int line, const char* fmt, Args... args) {
  logf(Level::INFO, file, line, fmt, args...);
}

template <typename... Args>
inline void log_warn(const char* file, int line, const char* fmt, Args... args) {
  logf(Level::WARN, file, line, fmt, args...);
}

template <typename... Args>
inline void log_error(const char* file, int line, const char* fmt, Args... args) {
  logf(Level::ERROR, file, line, fmt, args...);
}

} // namespace log
} // namespace ptg
