/**
 * @file command.cpp
 * @brief Command registry implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{

ErrorCode command_from_code(uint16_t code, Command& out)
{
  switch (code)
  {
#define CMD(name, value, label)  \
  case value:                    \
    out = Command::name;         \
    return ErrorCode::OK;
#include "zklink/commands.def"
#undef CMD
    default:
      return ErrorCode::UNKNOWN_COMMAND;
  }
}

bool is_response(Command cmd)
{
  switch (cmd)
  {
    case Command::ACK_OK:
    case Command::ACK_ERROR:
    case Command::ACK_DATA:
    case Command::ACK_RETRY:
    case Command::ACK_REPEAT:
    case Command::ACK_UNAUTH:
    case Command::ACK_UNKNOWN:
    case Command::ACK_ERROR_CMD:
    case Command::ACK_ERROR_INIT:
    case Command::ACK_ERROR_DATA:
      return true;
    default:
      return false;
  }
}

bool is_request(Command cmd)
{
  return !is_response(cmd);
}

bool is_success(Command cmd)
{
  return cmd == Command::ACK_OK || cmd == Command::ACK_DATA;
}

bool is_error(Command cmd)
{
  switch (cmd)
  {
    case Command::ACK_ERROR:
    case Command::ACK_ERROR_CMD:
    case Command::ACK_ERROR_INIT:
    case Command::ACK_ERROR_DATA:
      return true;
    default:
      return false;
  }
}

const char* command_name(Command cmd)
{
  switch (cmd)
  {
#define CMD(name, value, label) \
  case Command::name:           \
    return label;
#include "zklink/commands.def"
#undef CMD
    default:
      return "CMD_UNKNOWN";
  }
}

std::string to_string(Command cmd)
{
  std::string text = command_name(cmd);
  text += '(';
  text += std::to_string(command_to_code(cmd));
  text += ')';
  return text;
}

}  // namespace link
}  // namespace zk
