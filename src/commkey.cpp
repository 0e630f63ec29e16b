/**
 * @file commkey.cpp
 * @brief CommKey authentication key derivation implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "commkey.hpp"

namespace zk
{
namespace link
{
namespace internal
{

CommKey make_commkey(uint32_t password, uint16_t session_id, uint8_t ticks)
{
  // Reverse bit order
  uint32_t k = 0;
  for (int bit = 0; bit < 32; ++bit)
  {
    k = (k << 1) | ((password >> bit) & 1u);
  }

  k += session_id;

  const uint8_t b0 = static_cast<uint8_t>(k & 0xFF) ^ 'Z';
  const uint8_t b1 = static_cast<uint8_t>((k >> 8) & 0xFF) ^ 'K';
  const uint8_t b2 = static_cast<uint8_t>((k >> 16) & 0xFF) ^ 'S';
  const uint8_t b3 = static_cast<uint8_t>((k >> 24) & 0xFF) ^ 'O';

  // Swap 16-bit halves: high half first
  CommKey key = {b2, b3, b0, b1};

  key[0] ^= ticks;
  key[1] ^= ticks;
  key[2] = ticks;  // firmware overwrites, does not XOR
  key[3] ^= ticks;

  return key;
}

}  // namespace internal
}  // namespace link
}  // namespace zk
