/**
 * @file packet.cpp
 * @brief Packet encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/packet.hpp"

#include "checksum.hpp"

namespace zk
{
namespace link
{

namespace
{

inline void put_u16(std::vector<uint8_t>& out, uint16_t value)
{
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline uint16_t get_u16(const uint8_t* p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

}  // namespace

uint16_t Packet::checksum() const
{
  return internal::calc_checksum(command_to_code(command), session_id, reply_id, payload.data(),
                                 payload.size());
}

ErrorCode encode_packet(const Packet& packet, std::vector<uint8_t>& out)
{
  out.clear();

  if (packet.payload.size() > MAX_PAYLOAD_SIZE)
  {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  out.reserve(packet.size());

  put_u16(out, command_to_code(packet.command));
  put_u16(out, packet.checksum());
  put_u16(out, packet.session_id);
  put_u16(out, packet.reply_id);

  out.insert(out.end(), packet.payload.begin(), packet.payload.end());

  return ErrorCode::OK;
}

ErrorCode decode_packet(const uint8_t* data, size_t len, Packet& out, ErrorInfo* info)
{
  if (len < HEADER_SIZE)
  {
    if (info)
    {
      info->code = ErrorCode::PACKET_TOO_SHORT;
      info->expected = HEADER_SIZE;
      info->actual = static_cast<uint32_t>(len);
    }
    return ErrorCode::PACKET_TOO_SHORT;
  }

  const uint16_t command_raw = get_u16(&data[0]);
  const uint16_t checksum_received = get_u16(&data[2]);
  const uint16_t session_id = get_u16(&data[4]);
  const uint16_t reply_id = get_u16(&data[6]);

  Command command;
  if (command_from_code(command_raw, command) != ErrorCode::OK)
  {
    if (info)
    {
      info->code = ErrorCode::UNKNOWN_COMMAND;
      info->expected = 0;
      info->actual = command_raw;
    }
    return ErrorCode::UNKNOWN_COMMAND;
  }

  const uint8_t* payload = data + HEADER_SIZE;
  const size_t payload_len = len - HEADER_SIZE;

  const uint16_t checksum_calculated =
      internal::calc_checksum(command_raw, session_id, reply_id, payload, payload_len);
  if (checksum_calculated != checksum_received)
  {
    if (info)
    {
      info->code = ErrorCode::CHECKSUM_MISMATCH;
      info->expected = checksum_calculated;
      info->actual = checksum_received;
    }
    return ErrorCode::CHECKSUM_MISMATCH;
  }

  out.command = command;
  out.session_id = session_id;
  out.reply_id = reply_id;
  out.payload.assign(payload, payload + payload_len);

  return ErrorCode::OK;
}

std::string to_string(const Packet& packet)
{
  std::string text = "Packet[";
  text += to_string(packet.command);
  text += "](session=";
  text += std::to_string(packet.session_id);
  text += ", reply=";
  text += std::to_string(packet.reply_id);
  text += ", len=";
  text += std::to_string(packet.payload.size());
  text += ')';
  return text;
}

}  // namespace link
}  // namespace zk
