/**
 * @file udp_transport.hpp
 * @brief UDP transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "zklink/transport.hpp"

namespace zk
{
namespace link
{

/**
 * @brief UDP transport
 *
 * Most terminals speak UDP on port 4370. connect() binds an ephemeral
 * local port and fixes the remote endpoint; one datagram carries one
 * packet.
 */
class UdpTransport : public ITransport
{
 public:
  /**
   * @param host Host name or address
   * @param port Port (default 4370)
   */
  explicit UdpTransport(std::string host, uint16_t port = DEFAULT_PORT);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  ErrorCode connect(ErrorInfo* info = nullptr) override;
  void disconnect() override;
  bool is_connected() const override;
  ErrorCode send(const uint8_t* data, size_t len, ErrorInfo* info = nullptr) override;
  ErrorCode receive(std::chrono::milliseconds timeout, std::vector<uint8_t>& out,
                    ErrorInfo* info = nullptr) override;
  std::string remote_address() const override;

  std::string get_type() const override
  {
    return "UDP";
  }

  /**
   * @brief Local port bound by connect() (0 when not connected)
   */
  uint16_t local_port() const;

 private:
  std::string host_;                         ///< Configured host
  uint16_t port_;                            ///< Configured port
  boost::asio::io_context io_;               ///< Drives every socket operation
  boost::asio::ip::udp::socket socket_;      ///< Connected datagram socket
  boost::asio::ip::udp::endpoint endpoint_;  ///< Remote endpoint (valid once connected)
  std::vector<uint8_t> rx_buffer_;           ///< Receive scratch buffer
};

}  // namespace link
}  // namespace zk
