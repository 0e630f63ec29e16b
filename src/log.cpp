/**
 * @file log.cpp
 * @brief Logging helpers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

#include "zklink/logging.hpp"

namespace zk
{
namespace link
{

void set_log_level(LogLevel level)
{
  namespace logging = boost::log;

  if (level == LogLevel::OFF)
  {
    logging::core::get()->set_logging_enabled(false);
    return;
  }

  logging::trivial::severity_level severity = logging::trivial::info;
  switch (level)
  {
    case LogLevel::TRACE:
      severity = logging::trivial::trace;
      break;
    case LogLevel::DEBUG:
      severity = logging::trivial::debug;
      break;
    case LogLevel::INFO:
      severity = logging::trivial::info;
      break;
    case LogLevel::WARNING:
      severity = logging::trivial::warning;
      break;
    case LogLevel::ERROR:
    case LogLevel::OFF:
      severity = logging::trivial::error;
      break;
  }

  logging::core::get()->set_logging_enabled(true);
  logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

namespace internal
{

std::string hex_preview(const uint8_t* data, size_t len, size_t limit)
{
  static const char digits[] = "0123456789ABCDEF";

  std::string text;
  const size_t shown = len < limit ? len : limit;
  text.reserve(shown * 3 + 4);

  for (size_t i = 0; i < shown; ++i)
  {
    if (i > 0)
    {
      text += ' ';
    }
    text += digits[(data[i] >> 4) & 0x0F];
    text += digits[data[i] & 0x0F];
  }

  if (len > shown)
  {
    text += " ...";
  }

  return text;
}

}  // namespace internal
}  // namespace link
}  // namespace zk
