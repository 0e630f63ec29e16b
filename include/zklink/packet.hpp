/**
 * @file packet.hpp
 * @brief Protocol packet and codec
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "zklink/errors.hpp"
#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{

/**
 * @brief Logical protocol packet
 *
 * Value object created per request or response. The checksum is not
 * stored: encode_packet() computes it from the fields and decode_packet()
 * verifies it before returning the packet.
 */
struct Packet
{
  Command command = Command::CONNECT;  ///< Command code
  uint16_t session_id = 0;             ///< Session id (0 before the handshake)
  uint16_t reply_id = 0;               ///< Reply id
  std::vector<uint8_t> payload;        ///< Command-specific data

  Packet() = default;

  Packet(Command cmd, uint16_t session, uint16_t reply)
      : command(cmd), session_id(session), reply_id(reply)
  {
  }

  Packet(Command cmd, uint16_t session, uint16_t reply, std::vector<uint8_t> data)
      : command(cmd), session_id(session), reply_id(reply), payload(std::move(data))
  {
  }

  /**
   * @brief Checksum the packet would carry on the wire
   */
  uint16_t checksum() const;

  /**
   * @brief Encoded size (header + payload)
   */
  size_t size() const
  {
    return HEADER_SIZE + payload.size();
  }

  bool is_response() const
  {
    return link::is_response(command);
  }

  bool is_success() const
  {
    return link::is_success(command);
  }

  bool is_error() const
  {
    return link::is_error(command);
  }
};

/**
 * @brief Encode a packet
 *
 * Generates [CMD][CHECKSUM][SESSION_ID][REPLY_ID][DATA...], all header
 * fields little-endian.
 *
 * @param packet Packet to encode
 * @param out    Output buffer (cleared first)
 * @return ErrorCode::OK, or ErrorCode::PAYLOAD_TOO_LARGE if the payload
 *         exceeds MAX_PAYLOAD_SIZE (out is left empty)
 */
ErrorCode encode_packet(const Packet& packet, std::vector<uint8_t>& out);

/**
 * @brief Decode a packet
 *
 * Everything after the 8-byte header is taken as payload.
 *
 * @param data Received bytes
 * @param len  Number of bytes
 * @param out  Decoded packet (untouched on failure)
 * @param info Optional failure details (may be nullptr)
 * @return ErrorCode::OK, PACKET_TOO_SHORT, UNKNOWN_COMMAND or CHECKSUM_MISMATCH
 */
ErrorCode decode_packet(const uint8_t* data, size_t len, Packet& out,
                        ErrorInfo* info = nullptr);

/**
 * @brief Display form "Packet[CMD_ACK_OK(2000)](session=1, reply=2, len=0)"
 */
std::string to_string(const Packet& packet);

}  // namespace link
}  // namespace zk
