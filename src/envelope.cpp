/**
 * @file envelope.cpp
 * @brief TCP envelope wrapping implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "envelope.hpp"

namespace zk
{
namespace link
{
namespace internal
{

void wrap_envelope(const uint8_t* data, size_t len, std::vector<uint8_t>& out)
{
  out.clear();
  out.reserve(ENVELOPE_SIZE + len);

  out.push_back(static_cast<uint8_t>(TCP_MAGIC_1 & 0xFF));
  out.push_back(static_cast<uint8_t>((TCP_MAGIC_1 >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(TCP_MAGIC_2 & 0xFF));
  out.push_back(static_cast<uint8_t>((TCP_MAGIC_2 >> 8) & 0xFF));

  const uint32_t length = static_cast<uint32_t>(len);
  out.push_back(static_cast<uint8_t>(length & 0xFF));
  out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((length >> 24) & 0xFF));

  if (len > 0 && data != nullptr)
  {
    out.insert(out.end(), data, data + len);
  }
}

bool unwrap_envelope(const uint8_t* data, size_t len, std::vector<uint8_t>& out,
                     uint32_t* declared_len)
{
  out.clear();

  const bool wrapped = len >= ENVELOPE_SIZE &&
                       (data[0] | (data[1] << 8)) == TCP_MAGIC_1 &&
                       (data[2] | (data[3] << 8)) == TCP_MAGIC_2;

  if (!wrapped)
  {
    if (len > 0)
    {
      out.assign(data, data + len);
    }
    return false;
  }

  if (declared_len)
  {
    *declared_len = static_cast<uint32_t>(data[4]) | (static_cast<uint32_t>(data[5]) << 8) |
                    (static_cast<uint32_t>(data[6]) << 16) |
                    (static_cast<uint32_t>(data[7]) << 24);
  }

  out.assign(data + ENVELOPE_SIZE, data + len);
  return true;
}

}  // namespace internal
}  // namespace link
}  // namespace zk
