/**
 * @file commkey.hpp
 * @brief CommKey authentication key derivation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{
namespace internal
{

/**
 * @brief Authentication key sent as the CMD_AUTH payload
 */
using CommKey = std::array<uint8_t, 4>;

/**
 * @brief Scramble a CommKey password with the session id
 *
 * 1. Reverse the 32 password bits
 * 2. Add session_id (32-bit wraparound)
 * 3. XOR the little-endian bytes with 'Z', 'K', 'S', 'O'
 * 4. Swap the two 16-bit halves
 * 5. XOR bytes 0, 1, 3 with ticks and overwrite byte 2 with ticks
 *
 * @param password   CommKey configured on the device
 * @param session_id Session id carried by CMD_ACK_UNAUTH
 * @param ticks      Ticks constant (DEFAULT_TICKS)
 * @return 4-byte key
 */
CommKey make_commkey(uint32_t password, uint16_t session_id, uint8_t ticks = DEFAULT_TICKS);

}  // namespace internal
}  // namespace link
}  // namespace zk
