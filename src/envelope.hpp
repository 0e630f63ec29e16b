/**
 * @file envelope.hpp
 * @brief TCP envelope wrapping (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{
namespace internal
{

/**
 * @brief Wrap an encoded packet in the TCP envelope
 *
 * Generates [0x5050][0x8272][LEN:4][DATA...], all fields little-endian.
 *
 * @param data Encoded packet
 * @param len  Packet length in bytes
 * @param out  Output buffer (cleared first)
 */
void wrap_envelope(const uint8_t* data, size_t len, std::vector<uint8_t>& out);

/**
 * @brief Strip the TCP envelope if present
 *
 * If the first four bytes are not both magic markers, the input is copied
 * through unchanged. The declared length is not checked against the
 * number of bytes that follow.
 *
 * @param data         Received bytes
 * @param len          Number of bytes
 * @param out          Inner packet bytes (cleared first)
 * @param declared_len Length field of the envelope (set only when wrapped, may be nullptr)
 * @return true if an envelope was found and removed
 */
bool unwrap_envelope(const uint8_t* data, size_t len, std::vector<uint8_t>& out,
                     uint32_t* declared_len = nullptr);

}  // namespace internal
}  // namespace link
}  // namespace zk
