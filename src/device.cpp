/**
 * @file device.cpp
 * @brief Thin device operations built on Client::request()
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/client.hpp"

#include "log.hpp"

namespace zk
{
namespace link
{

ErrorCode Client::expect_ack(Command cmd, Packet& response)
{
  const ErrorCode err = request(cmd, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (response.is_success())
  {
    return ErrorCode::OK;
  }

  if (response.is_error())
  {
    return fail(ErrorCode::DEVICE_ERROR, 0, command_to_code(response.command));
  }

  return fail(ErrorCode::UNEXPECTED_RESPONSE, 0, command_to_code(response.command));
}

ErrorCode Client::enable_device()
{
  ZKLINK_LOG_DEBUG << "Enabling device...";

  Packet response;
  return expect_ack(Command::ENABLE_DEVICE, response);
}

ErrorCode Client::disable_device()
{
  ZKLINK_LOG_DEBUG << "Disabling device...";

  Packet response;
  return expect_ack(Command::DISABLE_DEVICE, response);
}

ErrorCode Client::get_firmware_version(std::string& version)
{
  ZKLINK_LOG_DEBUG << "Getting firmware version...";

  Packet response;
  const ErrorCode err = expect_ack(Command::GET_VERSION, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  // NUL-terminated ASCII
  size_t len = 0;
  while (len < response.payload.size() && response.payload[len] != 0)
  {
    ++len;
  }

  version.assign(reinterpret_cast<const char*>(response.payload.data()), len);
  ZKLINK_LOG_DEBUG << "Firmware version: " << version;
  return ErrorCode::OK;
}

ErrorCode Client::send_and_close(Command cmd)
{
  last_error_.clear();

  if (!session_.is_connected())
  {
    return fail(ErrorCode::SESSION_NOT_INITIALIZED);
  }

  const Packet packet(cmd, session_.session_id(), session_.next_reply_id());
  const ErrorCode err = send_packet(packet);

  // The device drops the connection without answering
  transport_->disconnect();
  session_.close();
  return err;
}

ErrorCode Client::restart()
{
  ZKLINK_LOG_WARNING << "Restarting device...";
  return send_and_close(Command::RESTART);
}

ErrorCode Client::power_off()
{
  ZKLINK_LOG_WARNING << "Powering off device...";
  return send_and_close(Command::POWER_OFF);
}

}  // namespace link
}  // namespace zk
