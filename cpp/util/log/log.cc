#include <util/log/log.h>

#include <string_view>

namespace fifocache {
namespace util::log {

bool _log::_l_always = init_logger(ALWAYS);
bool _log::_l_fatal = init_logger(FATAL);
bool _log::_l_test = init_logger(TEST);

// Guards logger creation, which can race when save workers log first.
std::mutex _mu;

static bool is_err_selector(const std::string &selector) {
  return std::string_view(selector).ends_with(ERR);
}

bool init_logger(std::string selector) {
  std::lock_guard<std::mutex> guard(_mu);
  if (spdlog::get(selector) != nullptr) {
    return false;
  }
  auto sink = std::make_shared<fifocache::util::log::debug_sink>(selector);
  auto logger = std::make_shared<spdlog::logger>(selector, sink);
  // Error lines must not sit in a buffer if the process dies next.
  if (selector == FATAL || is_err_selector(selector)) {
    logger->flush_on(spdlog::level::info);
  }
  spdlog::register_logger(logger);
  return true;
}

};  // namespace util::log
};  // namespace fifocache
