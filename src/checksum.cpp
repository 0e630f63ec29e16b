/**
 * @file checksum.cpp
 * @brief ZKTeco packet checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "checksum.hpp"

namespace zk
{
namespace link
{
namespace internal
{

namespace
{

// Firmware folds by subtracting 0xFFFF, not by dropping the carry.
inline uint32_t fold(uint32_t sum)
{
  while (sum > 0xFFFF)
  {
    sum -= 0xFFFF;
  }
  return sum;
}

}  // namespace

uint16_t calc_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                       const uint8_t* data, size_t len)
{
  uint32_t sum = 0;

  // Header words; the checksum field itself counts as 0x0000
  sum = fold(sum + command);
  sum = fold(sum + session_id);
  sum = fold(sum + reply_id);

  size_t i = 0;
  for (; i + 1 < len; i += 2)
  {
    const uint32_t word = data[i] | (static_cast<uint32_t>(data[i + 1]) << 8);
    sum = fold(sum + word);
  }

  // Odd trailing byte
  if (i < len)
  {
    sum = fold(sum + data[i]);
  }

  return static_cast<uint16_t>(~fold(sum));
}

bool verify_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                     const uint8_t* data, size_t len, uint16_t expected)
{
  return calc_checksum(command, session_id, reply_id, data, len) == expected;
}

}  // namespace internal
}  // namespace link
}  // namespace zk
