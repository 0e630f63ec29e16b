/**
 * @file logging.hpp
 * @brief zklink log level control
 *
 * zklink writes its records through Boost.Log's trivial logger. Sinks and
 * formatting are left to the application.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

namespace zk
{
namespace link
{

/**
 * @brief Minimum severity passed to Boost.Log sinks
 */
enum class LogLevel
{
  TRACE,    // Packet bytes
  DEBUG,    // Handshake steps, transport lifecycle
  INFO,     // Connect / disconnect
  WARNING,  // Best-effort failures
  ERROR,
  OFF,
};

/**
 * @brief Install a severity filter on the Boost.Log core
 *
 * Affects every record logged through the trivial logger, not only
 * zklink's.
 */
void set_log_level(LogLevel level);

}  // namespace link
}  // namespace zk
