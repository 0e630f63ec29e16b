/**
 * @file errors.hpp
 * @brief zklink error codes
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/system/error_code.hpp>

namespace zk
{
namespace link
{

/**
 * @brief Result codes returned by every fallible zklink operation
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "zklink/errors.def"
#undef ERR
};

/**
 * @brief Details accompanying a failed operation
 *
 * Meaning of expected/actual per code:
 * - PACKET_TOO_SHORT:    minimum length / received length
 * - CHECKSUM_MISMATCH:   calculated checksum / checksum in header
 * - UNKNOWN_COMMAND:     - / raw command code
 * - INVALID_REPLY_ID:    request reply id / response reply id
 * - PAYLOAD_TOO_LARGE:   MAX_PAYLOAD_SIZE / payload length
 * - DEVICE_ERROR,
 *   UNEXPECTED_RESPONSE: - / response command code
 * - TIMEOUT:             timeout in milliseconds / -
 * - IO_ERROR:            see io
 */
struct ErrorInfo
{
  ErrorCode code = ErrorCode::OK;  ///< Failure kind
  uint32_t expected = 0;           ///< Expected value
  uint32_t actual = 0;             ///< Received value
  boost::system::error_code io;    ///< Underlying socket error

  void clear()
  {
    *this = ErrorInfo();
  }
};

/**
 * @brief Get error message string
 * @param code Error code
 * @return Static message, "unknown error" for values outside errors.def
 */
const char* error_message(ErrorCode code);

/**
 * @brief Render a failure with its details
 *
 * e.g. "checksum mismatch: expected 0x1A2B, received 0x1A2C"
 */
std::string describe(const ErrorInfo& info);

/**
 * @brief Check if retrying the same operation may succeed
 *
 * True for TIMEOUT, READ_TIMEOUT, CONNECTION_TIMEOUT, IO_ERROR, DEVICE_ERROR.
 */
bool is_recoverable(ErrorCode code);

/**
 * @brief Check if the caller must disconnect and connect again
 *
 * True for SESSION_NOT_INITIALIZED, INVALID_SESSION_STATE, IO_ERROR,
 * CONNECTION_CLOSED, NOT_CONNECTED.
 */
bool requires_reconnect(ErrorCode code);

}  // namespace link
}  // namespace zk
