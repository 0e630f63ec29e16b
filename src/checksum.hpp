/**
 * @file checksum.hpp
 * @brief ZKTeco packet checksum (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace zk
{
namespace link
{
namespace internal
{

/**
 * @brief Calculate packet checksum
 *
 * Sums [CMD][0x0000][SESSION_ID][REPLY_ID][DATA...] as little-endian
 * 16-bit words (a trailing odd byte counts as a low byte), subtracting
 * 0xFFFF whenever the running sum exceeds 0xFFFF, and returns the
 * ones-complement of the result.
 *
 * @param command    Command code
 * @param session_id Session id
 * @param reply_id   Reply id
 * @param data       Payload (can be nullptr if len == 0)
 * @param len        Payload length in bytes
 * @return Checksum value
 */
uint16_t calc_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                       const uint8_t* data, size_t len);

/**
 * @brief Verify a received checksum
 *
 * @return true if calc_checksum() over the same fields equals expected
 */
bool verify_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                     const uint8_t* data, size_t len, uint16_t expected);

}  // namespace internal
}  // namespace link
}  // namespace zk
