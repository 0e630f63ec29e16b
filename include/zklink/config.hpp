/**
 * @file config.hpp
 * @brief Connection configuration
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{

/**
 * @brief Underlying channel
 */
enum class TransportKind : uint8_t
{
  UDP,  // Datagrams, used by most terminals
  TCP,  // Byte stream
};

/**
 * @brief Wire framing on top of the channel
 */
enum class Framing : uint8_t
{
  RAW,      // Encoded packets sent as-is
  WRAPPED,  // 8-byte [0x5050][0x8272][LEN] envelope per packet (TCP only)
};

/**
 * @brief Settings for one device connection
 *
 * Example usage:
 * @code
 * ClientConfig cfg;
 * cfg.host = "192.168.1.201";
 * cfg.transport = TransportKind::TCP;
 * cfg.framing = Framing::WRAPPED;
 * cfg.password = 123456;
 * Client client(cfg);
 * @endcode
 */
struct ClientConfig
{
  std::string host = "192.168.1.201";  ///< Device host name or address
  uint16_t port = DEFAULT_PORT;        ///< Device port
  TransportKind transport = TransportKind::UDP;
  Framing framing = Framing::RAW;  ///< Ignored for UDP

  std::chrono::milliseconds connect_timeout{DEFAULT_TIMEOUT_MS};
  std::chrono::milliseconds read_timeout{DEFAULT_TIMEOUT_MS};

  uint32_t password = DEFAULT_PASSWORD;  ///< CommKey
  uint8_t ticks = DEFAULT_TICKS;         ///< CommKey scrambling constant

  /**
   * @brief Answer a CMD_ACK_UNAUTH challenge with CMD_AUTH
   *
   * When false, connect() fails with AUTHENTICATION_REQUIRED instead.
   */
  bool auto_authenticate = true;

  /**
   * @brief Reject responses whose reply id differs from the request's
   *
   * Off by default: devices are not consistent about echoing reply ids.
   */
  bool strict_reply_id = false;
};

}  // namespace link
}  // namespace zk
