/**
 * @file errors.cpp
 * @brief zklink error code helpers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/errors.hpp"

#include <cstdio>

#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "zklink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

std::string describe(const ErrorInfo& info)
{
  std::string text = error_message(info.code);
  char buf[96];

  switch (info.code)
  {
    case ErrorCode::PACKET_TOO_SHORT:
      std::snprintf(buf, sizeof(buf), ": expected at least %u bytes, got %u bytes",
                    static_cast<unsigned>(info.expected), static_cast<unsigned>(info.actual));
      text += buf;
      break;

    case ErrorCode::CHECKSUM_MISMATCH:
      std::snprintf(buf, sizeof(buf), ": expected 0x%04X, received 0x%04X",
                    static_cast<unsigned>(info.expected), static_cast<unsigned>(info.actual));
      text += buf;
      break;

    case ErrorCode::UNKNOWN_COMMAND:
      std::snprintf(buf, sizeof(buf), ": %u", static_cast<unsigned>(info.actual));
      text += buf;
      break;

    case ErrorCode::INVALID_REPLY_ID:
      std::snprintf(buf, sizeof(buf), ": expected %u, got %u",
                    static_cast<unsigned>(info.expected), static_cast<unsigned>(info.actual));
      text += buf;
      break;

    case ErrorCode::PAYLOAD_TOO_LARGE:
      std::snprintf(buf, sizeof(buf), ": %u bytes (max: %u bytes)",
                    static_cast<unsigned>(info.actual), static_cast<unsigned>(info.expected));
      text += buf;
      break;

    case ErrorCode::DEVICE_ERROR:
    case ErrorCode::UNEXPECTED_RESPONSE:
      text += ": ";
      text += to_string(static_cast<Command>(info.actual));
      break;

    case ErrorCode::TIMEOUT:
      std::snprintf(buf, sizeof(buf), " after %ums", static_cast<unsigned>(info.expected));
      text += buf;
      break;

    default:
      break;
  }

  if (info.io)
  {
    text += ": ";
    text += info.io.message();
  }

  return text;
}

bool is_recoverable(ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::TIMEOUT:
    case ErrorCode::READ_TIMEOUT:
    case ErrorCode::CONNECTION_TIMEOUT:
    case ErrorCode::IO_ERROR:
    case ErrorCode::DEVICE_ERROR:
      return true;
    default:
      return false;
  }
}

bool requires_reconnect(ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::SESSION_NOT_INITIALIZED:
    case ErrorCode::INVALID_SESSION_STATE:
    case ErrorCode::IO_ERROR:
    case ErrorCode::CONNECTION_CLOSED:
    case ErrorCode::NOT_CONNECTED:
      return true;
    default:
      return false;
  }
}

}  // namespace link
}  // namespace zk
