/**
 * @file client.cpp
 * @brief zklink client implementation (handshake and request/response)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/client.hpp"

#include <utility>

#include "commkey.hpp"
#include "log.hpp"

namespace zk
{
namespace link
{

Client::Client(ClientConfig config) : Client(config, make_transport(config)) {}

Client::Client(ClientConfig config, std::unique_ptr<ITransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      session_(),
      last_error_(),
      tx_buffer_(),
      rx_buffer_()
{
}

Client::~Client()
{
  if (is_connected())
  {
    disconnect();
  }
}

ErrorCode Client::connect()
{
  last_error_.clear();

  if (session_.is_connected())
  {
    return fail(ErrorCode::ALREADY_CONNECTED);
  }

  ZKLINK_LOG_INFO << "Connecting to " << transport_->remote_address() << " via "
                  << transport_->get_type() << "...";

  if (transport_->connect(&last_error_) != ErrorCode::OK)
  {
    return last_error_.code;
  }

  const ErrorCode err = handshake();
  if (err != ErrorCode::OK)
  {
    ZKLINK_LOG_WARNING << "Handshake with " << transport_->remote_address()
                       << " failed: " << describe(last_error_);
    transport_->disconnect();
    session_.close();
  }

  return err;
}

ErrorCode Client::handshake()
{
  const Packet connect_packet(Command::CONNECT, 0, 0);
  ErrorCode err = send_packet(connect_packet);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Packet response;
  err = receive_packet(response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (response.is_success())
  {
    if (session_.initialize(response.session_id) != ErrorCode::OK)
    {
      return fail(ErrorCode::INVALID_SESSION_STATE);
    }
    ZKLINK_LOG_INFO << "Connected successfully (session_id=" << response.session_id << ")";
    return ErrorCode::OK;
  }

  if (response.command == Command::ACK_UNAUTH)
  {
    if (!config_.auto_authenticate)
    {
      return fail(ErrorCode::AUTHENTICATION_REQUIRED);
    }

    ZKLINK_LOG_INFO << "Device requires authentication, sending CommKey...";

    // The challenge carries the session id to authenticate on
    const uint16_t session_id = response.session_id;
    const internal::CommKey key = internal::make_commkey(config_.password, session_id, config_.ticks);

    ZKLINK_LOG_DEBUG << "Auth key: " << internal::hex_preview(key.data(), key.size())
                     << " (session_id=" << session_id << ")";

    const Packet auth_packet(Command::AUTH, session_id, 0,
                             std::vector<uint8_t>(key.begin(), key.end()));
    err = send_packet(auth_packet);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    Packet auth_response;
    err = receive_packet(auth_response);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    if (auth_response.is_success())
    {
      if (session_.initialize(auth_response.session_id) != ErrorCode::OK)
      {
        return fail(ErrorCode::INVALID_SESSION_STATE);
      }
      ZKLINK_LOG_INFO << "Authenticated successfully (session_id=" << auth_response.session_id
                      << ")";
      return ErrorCode::OK;
    }

    if (auth_response.is_error())
    {
      return fail(ErrorCode::AUTHENTICATION_FAILED, 0, command_to_code(auth_response.command));
    }

    return fail(ErrorCode::UNEXPECTED_RESPONSE, 0, command_to_code(auth_response.command));
  }

  if (response.is_error())
  {
    return fail(ErrorCode::DEVICE_ERROR, 0, command_to_code(response.command));
  }

  return fail(ErrorCode::UNEXPECTED_RESPONSE, 0, command_to_code(response.command));
}

void Client::disconnect()
{
  if (session_.is_connected() && transport_->is_connected())
  {
    ZKLINK_LOG_INFO << "Disconnecting from " << transport_->remote_address() << "...";

    const Packet exit_packet(Command::EXIT, session_.session_id(), session_.next_reply_id());
    if (send_packet(exit_packet) != ErrorCode::OK)
    {
      ZKLINK_LOG_WARNING << "Failed to send EXIT command: " << describe(last_error_);
    }
  }

  transport_->disconnect();
  session_.close();
  ZKLINK_LOG_INFO << "Disconnected";
}

bool Client::is_connected() const
{
  return session_.is_connected() && transport_->is_connected();
}

ErrorCode Client::request(Command cmd, const uint8_t* data, size_t len, Packet& response)
{
  last_error_.clear();

  if (!session_.is_connected())
  {
    return fail(ErrorCode::SESSION_NOT_INITIALIZED);
  }

  if (len > MAX_PAYLOAD_SIZE)
  {
    return fail(ErrorCode::PAYLOAD_TOO_LARGE, MAX_PAYLOAD_SIZE, static_cast<uint32_t>(len));
  }

  Packet packet(cmd, session_.session_id(), session_.next_reply_id());
  if (len > 0 && data != nullptr)
  {
    packet.payload.assign(data, data + len);
  }

  ErrorCode err = send_packet(packet);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  err = receive_packet(response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (config_.strict_reply_id && response.reply_id != packet.reply_id)
  {
    return fail(ErrorCode::INVALID_REPLY_ID, packet.reply_id, response.reply_id);
  }

  return ErrorCode::OK;
}

ErrorCode Client::send_packet(const Packet& packet)
{
  ZKLINK_LOG_TRACE << "Sending: " << to_string(packet);

  if (encode_packet(packet, tx_buffer_) != ErrorCode::OK)
  {
    return fail(ErrorCode::PAYLOAD_TOO_LARGE, MAX_PAYLOAD_SIZE,
                static_cast<uint32_t>(packet.payload.size()));
  }

  return transport_->send(tx_buffer_.data(), tx_buffer_.size(), &last_error_);
}

ErrorCode Client::receive_packet(Packet& packet)
{
  const ErrorCode err = transport_->receive(config_.read_timeout, rx_buffer_, &last_error_);
  if (err == ErrorCode::READ_TIMEOUT)
  {
    return fail(ErrorCode::TIMEOUT, static_cast<uint32_t>(config_.read_timeout.count()));
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const ErrorCode decoded = decode_packet(rx_buffer_.data(), rx_buffer_.size(), packet, &last_error_);
  if (decoded != ErrorCode::OK)
  {
    return decoded;
  }

  ZKLINK_LOG_TRACE << "Received: " << to_string(packet);
  return ErrorCode::OK;
}

ErrorCode Client::fail(ErrorCode code, uint32_t expected, uint32_t actual)
{
  last_error_.code = code;
  last_error_.expected = expected;
  last_error_.actual = actual;
  last_error_.io.clear();
  return code;
}

}  // namespace link
}  // namespace zk
