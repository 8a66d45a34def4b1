#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lowir::diag {

enum class LogLevel {
  Off,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::logger &lowir_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("lowir");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("lowir", sink);
      lg->set_level(spdlog::level::info);
      lg->set_pattern("[%^%-5l%$] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

// Performance hints, e.g. operators that had to go through a fallback kernel.
inline spdlog::logger &perf_hint_logger() {
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("lowir.perf_hints");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("lowir.perf_hints", sink);
      lg->set_level(spdlog::level::info);
      lg->set_pattern("[%^perf%$] %v");
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline void set_log_level(LogLevel level) {
  spdlog::level::level_enum lvl = spdlog::level::info;
  switch (level) {
  case LogLevel::Off:
    lvl = spdlog::level::off;
    break;
  case LogLevel::Warn:
    lvl = spdlog::level::warn;
    break;
  case LogLevel::Info:
    lvl = spdlog::level::info;
    break;
  case LogLevel::Debug:
    lvl = spdlog::level::debug;
    break;
  case LogLevel::Trace:
    lvl = spdlog::level::trace;
    break;
  }
  lowir_logger().set_level(lvl);
  perf_hint_logger().set_level(level == LogLevel::Off ? spdlog::level::off
                                                      : spdlog::level::info);
}

#define LOWIR_TRACE(...) ::lowir::diag::lowir_logger().trace(__VA_ARGS__)
#define LOWIR_DEBUG(...) ::lowir::diag::lowir_logger().debug(__VA_ARGS__)
#define LOWIR_INFO(...) ::lowir::diag::lowir_logger().info(__VA_ARGS__)
#define LOWIR_WARN(...) ::lowir::diag::lowir_logger().warn(__VA_ARGS__)
#define LOWIR_ERROR(...) ::lowir::diag::lowir_logger().error(__VA_ARGS__)

#define LOWIR_PERF_HINT(...) ::lowir::diag::perf_hint_logger().info(__VA_ARGS__)

} // namespace lowir::diag
