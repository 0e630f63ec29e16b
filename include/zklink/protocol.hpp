/**
 * @file protocol.hpp
 * @brief zklink protocol definitions
 *
 * Client-side definitions for the ZKTeco terminal communication protocol.
 * Shared by the packet codec, the transports and the client.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "zklink/errors.hpp"

namespace zk
{
namespace link
{

/* ========================================================================= */
/* Packet format constants                                                   */
/* ========================================================================= */

/**
 * @brief Packet header size in bytes
 *
 * [CMD:2][CHECKSUM:2][SESSION_ID:2][REPLY_ID:2]
 */
constexpr size_t HEADER_SIZE = 8;

/**
 * @brief Maximum payload size in bytes
 *
 * A complete packet never exceeds 65535 bytes.
 */
constexpr size_t MAX_PAYLOAD_SIZE = 65535 - HEADER_SIZE;

/**
 * @brief TCP envelope magic markers
 *
 * Some devices wrap every TCP packet in an 8-byte envelope starting with
 * these two little-endian 16-bit values.
 */
constexpr uint16_t TCP_MAGIC_1 = 0x5050;
constexpr uint16_t TCP_MAGIC_2 = 0x8272;

/**
 * @brief TCP envelope header size in bytes
 *
 * [MAGIC1:2][MAGIC2:2][LENGTH:4]
 */
constexpr size_t ENVELOPE_SIZE = 8;

/**
 * Packet format:
 *
 * [CMD_L][CMD_H][SUM_L][SUM_H][SID_L][SID_H][RID_L][RID_H][DATA...]
 *
 * - CMD:  command code (little-endian u16)
 * - SUM:  checksum over the whole packet with SUM zeroed
 * - SID:  session id assigned by the device (0 before the handshake)
 * - RID:  reply id, incremented by the host per request
 * - DATA: payload, 0 <= N <= MAX_PAYLOAD_SIZE
 */

/* ========================================================================= */
/* Connection defaults                                                       */
/* ========================================================================= */

/** @brief Default device port (UDP and TCP) */
constexpr uint16_t DEFAULT_PORT = 4370;

/** @brief Default connect and read timeout in milliseconds */
constexpr uint32_t DEFAULT_TIMEOUT_MS = 5000;

/** @brief Default CommKey password */
constexpr uint32_t DEFAULT_PASSWORD = 0;

/** @brief Ticks constant used in the last CommKey scrambling step */
constexpr uint8_t DEFAULT_TICKS = 50;

/** @brief First reply id issued after a handshake (USHRT_MAX - 1) */
constexpr uint16_t INITIAL_REPLY_ID = 65534;

/* ========================================================================= */
/* Command codes                                                             */
/* ========================================================================= */

/**
 * @brief Protocol command and acknowledgement codes
 *
 * Closed set defined via commands.def. Raw values outside this table are
 * rejected by command_from_code().
 */
enum class Command : uint16_t
{
#define CMD(name, code, label) name = code,
#include "zklink/commands.def"
#undef CMD
};

/**
 * @brief Resolve a raw command code
 *
 * @param code Raw 16-bit code read from the wire
 * @param out  Resolved command (untouched on failure)
 * @return ErrorCode::OK, or ErrorCode::UNKNOWN_COMMAND for codes outside the table
 */
ErrorCode command_from_code(uint16_t code, Command& out);

/**
 * @brief Raw wire value of a command
 */
constexpr uint16_t command_to_code(Command cmd)
{
  return static_cast<uint16_t>(cmd);
}

/**
 * @brief Check for a device-to-host acknowledgement code
 */
bool is_response(Command cmd);

/**
 * @brief Check for a host-to-device request code
 */
bool is_request(Command cmd);

/**
 * @brief Check for ACK_OK or ACK_DATA
 */
bool is_success(Command cmd);

/**
 * @brief Check for ACK_ERROR, ACK_ERROR_CMD, ACK_ERROR_INIT or ACK_ERROR_DATA
 */
bool is_error(Command cmd);

/**
 * @brief Canonical label, e.g. "CMD_CONNECT"
 *
 * @return Static string, "CMD_UNKNOWN" for values outside the table
 */
const char* command_name(Command cmd);

/**
 * @brief Display form "CMD_CONNECT(1000)"
 */
std::string to_string(Command cmd);

/* ========================================================================= */
/* Real-time event flags (CMD_REG_EVENT payload)                             */
/* ========================================================================= */

constexpr uint32_t EF_ATTLOG = 1u << 0;        ///< Attendance record
constexpr uint32_t EF_FINGER = 1u << 1;        ///< Finger placed
constexpr uint32_t EF_ENROLLUSER = 1u << 2;    ///< User enrolled
constexpr uint32_t EF_ENROLLFINGER = 1u << 3;  ///< Fingerprint enrolled
constexpr uint32_t EF_BUTTON = 1u << 4;        ///< Button pressed
constexpr uint32_t EF_UNLOCK = 1u << 5;        ///< Door unlocked
constexpr uint32_t EF_VERIFY = 1u << 7;        ///< Verification
constexpr uint32_t EF_FPFTR = 1u << 8;         ///< Fingerprint minutiae captured
constexpr uint32_t EF_ALARM = 1u << 9;         ///< Alarm signal

/* ========================================================================= */
/* Data table selectors (CMD_DB_RRQ)                                         */
/* ========================================================================= */

constexpr uint8_t FCT_ATTLOG = 1;
constexpr uint8_t FCT_FINGERTMP = 2;
constexpr uint8_t FCT_OPLOG = 4;
constexpr uint8_t FCT_USER = 5;
constexpr uint8_t FCT_SMS = 6;
constexpr uint8_t FCT_UDATA = 7;
constexpr uint8_t FCT_WORKCODE = 8;

/**
 * @brief Verification modes reported in attendance records
 */
enum class VerifyMode : uint8_t
{
  PASSWORD = 0,
  FINGERPRINT = 1,
  CARD = 3,
  FACE = 15,
};

/**
 * @brief Punch types reported in attendance records
 */
enum class PunchType : uint8_t
{
  CHECK_IN = 0,
  CHECK_OUT = 1,
  OVERTIME_IN = 2,
  OVERTIME_OUT = 3,
};

}  // namespace link
}  // namespace zk
