/**
 * @file tcp_transport.hpp
 * @brief TCP transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "zklink/transport.hpp"

namespace zk
{
namespace link
{

/**
 * @brief TCP transport with optional envelope framing
 *
 * Nagle's algorithm is disabled so every packet is written immediately.
 * With Framing::WRAPPED every outgoing packet gets the 8-byte envelope;
 * incoming data is unwrapped only if it starts with the magic markers.
 */
class TcpTransport : public ITransport
{
 public:
  /**
   * @param host            Host name or address
   * @param port            Port (default 4370)
   * @param framing         Envelope framing
   * @param connect_timeout Maximum time for connect()
   */
  TcpTransport(std::string host, uint16_t port = DEFAULT_PORT, Framing framing = Framing::RAW,
               std::chrono::milliseconds connect_timeout =
                   std::chrono::milliseconds(DEFAULT_TIMEOUT_MS));
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  ErrorCode connect(ErrorInfo* info = nullptr) override;
  void disconnect() override;
  bool is_connected() const override;
  ErrorCode send(const uint8_t* data, size_t len, ErrorInfo* info = nullptr) override;
  ErrorCode receive(std::chrono::milliseconds timeout, std::vector<uint8_t>& out,
                    ErrorInfo* info = nullptr) override;
  std::string remote_address() const override;

  std::string get_type() const override
  {
    return "TCP";
  }

  Framing framing() const
  {
    return framing_;
  }

 private:
  std::string host_;                         ///< Configured host
  uint16_t port_;                            ///< Configured port
  Framing framing_;                          ///< Envelope framing
  std::chrono::milliseconds connect_timeout_;
  boost::asio::io_context io_;               ///< Drives every socket operation
  boost::asio::ip::tcp::socket socket_;      ///< Stream to the device
  boost::asio::ip::tcp::endpoint endpoint_;  ///< Resolved endpoint (valid once connected)
  std::vector<uint8_t> rx_buffer_;           ///< Receive scratch buffer
};

}  // namespace link
}  // namespace zk
