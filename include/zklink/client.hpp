/**
 * @file client.hpp
 * @brief zklink device client
 *
 * Connection handshake, CommKey authentication and the request/response
 * primitive used by higher-level device operations.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "zklink/config.hpp"
#include "zklink/errors.hpp"
#include "zklink/packet.hpp"
#include "zklink/protocol.hpp"
#include "zklink/session.hpp"
#include "zklink/transport.hpp"

namespace zk
{
namespace link
{

/**
 * @brief Client for one ZKTeco terminal
 *
 * Owns its transport exclusively and shares its Session with any status
 * readers obtained through session(). The protocol is half-duplex: each
 * call sends one packet and waits for exactly one response, so a Client
 * must not be used from several threads at once.
 *
 * Example usage:
 * @code
 * ClientConfig cfg;
 * cfg.host = "192.168.1.201";
 *
 * Client client(cfg);
 * if (client.connect() != ErrorCode::OK)
 * {
 *   std::cerr << describe(client.last_error()) << "\n";
 *   return 1;
 * }
 *
 * Packet response;
 * client.request(Command::GET_VERSION, response);
 * client.disconnect();
 * @endcode
 */
class Client
{
 public:
  /**
   * @brief Construct a client using the transport selected by config
   */
  explicit Client(ClientConfig config);

  /**
   * @brief Construct a client on a caller-supplied transport
   *
   * @param config    Settings (transport fields are ignored)
   * @param transport Disconnected transport, owned by the client
   */
  Client(ClientConfig config, std::unique_ptr<ITransport> transport);

  /**
   * @brief Disconnects if still connected
   */
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * @brief Open the transport and perform the handshake
   *
   * Sends CMD_CONNECT. On CMD_ACK_UNAUTH answers with CMD_AUTH carrying
   * the CommKey derived from config.password and the challenge's session
   * id. On failure the transport is closed again.
   *
   * @return ErrorCode::OK, ALREADY_CONNECTED, AUTHENTICATION_REQUIRED,
   *         AUTHENTICATION_FAILED, DEVICE_ERROR, UNEXPECTED_RESPONSE,
   *         TIMEOUT, or a codec/transport error
   */
  ErrorCode connect();

  /**
   * @brief Send CMD_EXIT (best effort) and close the connection
   *
   * The transport is closed and the session reset regardless of whether
   * CMD_EXIT could be sent.
   */
  void disconnect();

  /**
   * @brief Check if the handshake completed and the transport is open
   */
  bool is_connected() const;

  /**
   * @brief Send one request and wait for its response
   *
   * Consumes one reply id. The response is returned whatever its command
   * code; interpreting it is up to the caller.
   *
   * @param cmd      Request command
   * @param data     Payload (can be nullptr if len == 0)
   * @param len      Payload length in bytes
   * @param response Decoded response
   * @return ErrorCode::OK, SESSION_NOT_INITIALIZED, PAYLOAD_TOO_LARGE,
   *         TIMEOUT, INVALID_REPLY_ID (strict_reply_id only), or a
   *         codec/transport error
   */
  ErrorCode request(Command cmd, const uint8_t* data, size_t len, Packet& response);

  ErrorCode request(Command cmd, Packet& response)
  {
    return request(cmd, nullptr, 0, response);
  }

  ErrorCode request(Command cmd, const std::vector<uint8_t>& payload, Packet& response)
  {
    return request(cmd, payload.data(), payload.size(), response);
  }

  /* ----------------------------------------------------------------------- */
  /* Device operations                                                       */
  /* ----------------------------------------------------------------------- */

  /**
   * @brief Resume normal operation (CMD_ENABLEDEVICE)
   */
  ErrorCode enable_device();

  /**
   * @brief Lock the keypad and show "Working..." (CMD_DISABLEDEVICE)
   */
  ErrorCode disable_device();

  /**
   * @brief Read the firmware version string (CMD_GET_VERSION)
   */
  ErrorCode get_firmware_version(std::string& version);

  /**
   * @brief Restart the device (CMD_RESTART)
   *
   * The device drops the connection; the client is disconnected afterwards.
   */
  ErrorCode restart();

  /**
   * @brief Power the device off (CMD_POWEROFF)
   *
   * The device drops the connection; the client is disconnected afterwards.
   */
  ErrorCode power_off();

  /* ----------------------------------------------------------------------- */
  /* Accessors                                                               */
  /* ----------------------------------------------------------------------- */

  /**
   * @brief Handle to the shared session state
   */
  Session session() const
  {
    return session_;
  }

  /**
   * @brief Details of the most recent failure
   */
  const ErrorInfo& last_error() const
  {
    return last_error_;
  }

  const ClientConfig& config() const
  {
    return config_;
  }

  ITransport& transport()
  {
    return *transport_;
  }

 private:
  ErrorCode handshake();
  ErrorCode send_packet(const Packet& packet);
  ErrorCode receive_packet(Packet& packet);
  ErrorCode send_and_close(Command cmd);
  ErrorCode expect_ack(Command cmd, Packet& response);
  ErrorCode fail(ErrorCode code, uint32_t expected = 0, uint32_t actual = 0);

  ClientConfig config_;                     ///< Connection settings
  std::unique_ptr<ITransport> transport_;   ///< Exclusively owned channel
  Session session_;                         ///< Shared session state
  ErrorInfo last_error_;                    ///< Most recent failure
  std::vector<uint8_t> tx_buffer_;          ///< Encoded outgoing packet
  std::vector<uint8_t> rx_buffer_;          ///< Raw incoming packet
};

}  // namespace link
}  // namespace zk
