#pragma once

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <util/common/util.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

// Some common debug selectors. These and the names below are constant
// initialized, so loggers may be created from other files' static
// initializers.
constexpr const char *TEST = "TEST";
constexpr const char *ALWAYS = "ALWAYS";
constexpr const char *FATAL = "FATAL";

// Environment variables controlling which selectors are enabled, and the tag
// printed at the start of each line.
constexpr const char *DEBUG_ENV = "FIFOCACHE_DEBUG";
constexpr const char *DEBUG_PID_ENV = "FIFOCACHE_DEBUGPID";

namespace fifocache {
namespace util::log {

// Initialize a logger with a debug selector
bool init_logger(std::string selector);

constexpr const char *ERR = "_ERR";

class debug_sink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  debug_sink(std::string selector)
      : _enabled(false),
        _stdout_sink(std::make_shared<spdlog::sinks::stdout_sink_mt>()) {
    std::string debug = fifocache::util::common::GetEnv(DEBUG_ENV);
    std::string pid = fifocache::util::common::GetEnv(DEBUG_PID_ENV);
    _stdout_sink->set_pattern(
        fmt::format("%H:%M:%S.%f {} {} %v", pid, selector));
    if (selector == ALWAYS || selector == FATAL) {
      _enabled = true;
    } else {
      _enabled = fifocache::util::common::ContainsLabel(debug, selector);
    }
  }
  void sink_it_(const spdlog::details::log_msg &msg) override {
    if (_enabled) {
      _stdout_sink->log(msg);
    }
  }
  void flush_() override { _stdout_sink->flush(); }

 private:
  bool _enabled;
  std::shared_ptr<spdlog::sinks::stdout_sink_mt> _stdout_sink;
};

// Used to initialize some common debug selectors
class _log {
 public:
  _log();
  ~_log();

 private:
  static bool _l_always;
  static bool _l_fatal;
  static bool _l_test;
};

};  // namespace util::log
};  // namespace fifocache

// Write a log line given a selector
template <typename... Args>
void log(std::string selector, spdlog::format_string_t<Args...> fmt,
         Args &&...args) {
  auto logger = spdlog::get(selector);
  if (logger == nullptr) {
    fifocache::util::log::init_logger(selector);
    logger = spdlog::get(selector);
  }
  logger->info(fmt, std::forward<Args>(args)...);
}

// Write a log line and throw
template <typename... Args>
[[noreturn]] void fatal(spdlog::format_string_t<Args...> f, Args &&...args) {
  auto logger = spdlog::get(FATAL);
  if (logger == nullptr) {
    fifocache::util::log::init_logger(FATAL);
    logger = spdlog::get(FATAL);
  }
  std::string msg =
      fmt::vformat(fmt::string_view(f), fmt::make_format_args(args...));
  logger->info(msg);
  logger->flush();
  throw std::runtime_error(msg);
}
