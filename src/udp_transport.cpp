/**
 * @file udp_transport.cpp
 * @brief UDP transport implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/udp_transport.hpp"

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "io_util.hpp"
#include "log.hpp"

namespace zk
{
namespace link
{

using boost::asio::ip::udp;

namespace
{

ErrorCode fail(ErrorInfo* info, ErrorCode code, const boost::system::error_code& ec = {})
{
  if (info)
  {
    info->code = code;
    info->io = ec;
  }
  return code;
}

}  // namespace

UdpTransport::UdpTransport(std::string host, uint16_t port)
    : host_(std::move(host)),
      port_(port),
      io_(),
      socket_(io_),
      endpoint_(),
      rx_buffer_(internal::RX_BUFFER_SIZE)
{
}

UdpTransport::~UdpTransport()
{
  if (is_connected())
  {
    ZKLINK_LOG_WARNING << "UDP transport to " << remote_address()
                       << " destroyed while still connected";
    disconnect();
  }
}

ErrorCode UdpTransport::connect(ErrorInfo* info)
{
  if (is_connected())
  {
    return fail(info, ErrorCode::ALREADY_CONNECTED);
  }

  boost::system::error_code ec;
  udp::resolver resolver(io_);
  const udp::resolver::results_type endpoints =
      resolver.resolve(host_, std::to_string(port_), ec);
  if (ec || endpoints.empty())
  {
    ZKLINK_LOG_WARNING << "Cannot resolve " << host_ << ":" << port_ << ": " << ec.message();
    return fail(info, ErrorCode::INVALID_ADDRESS, ec);
  }

  const udp::endpoint remote = *endpoints.begin();
  ZKLINK_LOG_DEBUG << "Connecting to " << remote << " via UDP...";

  // Any local port, same address family as the device
  socket_.open(remote.protocol(), ec);
  if (!ec)
  {
    socket_.bind(udp::endpoint(remote.protocol(), 0), ec);
  }
  if (!ec)
  {
    socket_.connect(remote, ec);
  }
  if (ec)
  {
    boost::system::error_code ignored;
    socket_.close(ignored);
    ZKLINK_LOG_WARNING << "UDP socket setup failed: " << ec.message();
    return fail(info, ErrorCode::IO_ERROR, ec);
  }

  endpoint_ = remote;
  ZKLINK_LOG_DEBUG << "Connected to " << remote << " via UDP";
  return ErrorCode::OK;
}

void UdpTransport::disconnect()
{
  if (!is_connected())
  {
    return;
  }

  ZKLINK_LOG_DEBUG << "Disconnecting from " << remote_address() << "...";

  boost::system::error_code ec;
  socket_.close(ec);
  endpoint_ = udp::endpoint();
}

bool UdpTransport::is_connected() const
{
  return socket_.is_open();
}

ErrorCode UdpTransport::send(const uint8_t* data, size_t len, ErrorInfo* info)
{
  if (!is_connected())
  {
    return fail(info, ErrorCode::NOT_CONNECTED);
  }

  ZKLINK_LOG_TRACE << "Sending " << len
                   << " bytes via UDP: " << internal::hex_preview(data, len, 32);

  boost::system::error_code ec;
  socket_.send(boost::asio::buffer(data, len), 0, ec);
  if (ec)
  {
    ZKLINK_LOG_WARNING << "send() failed: " << ec.message();
    return fail(info, ErrorCode::IO_ERROR, ec);
  }

  return ErrorCode::OK;
}

ErrorCode UdpTransport::receive(std::chrono::milliseconds timeout, std::vector<uint8_t>& out,
                                ErrorInfo* info)
{
  out.clear();

  if (!is_connected())
  {
    return fail(info, ErrorCode::NOT_CONNECTED);
  }

  boost::system::error_code result = boost::asio::error::would_block;
  size_t received = 0;
  socket_.async_receive(boost::asio::buffer(rx_buffer_),
                        [&](const boost::system::error_code& e, size_t n)
                        {
                          result = e;
                          received = n;
                        });

  if (!internal::run_for(io_, timeout))
  {
    boost::system::error_code ec;
    socket_.cancel(ec);
    internal::drain(io_);
    ZKLINK_LOG_WARNING << "Read timeout after " << timeout.count() << "ms";
    return fail(info, ErrorCode::READ_TIMEOUT);
  }

  if (result)
  {
    ZKLINK_LOG_WARNING << "Read error: " << result.message();
    return fail(info, ErrorCode::IO_ERROR, result);
  }

  if (received == 0)
  {
    ZKLINK_LOG_WARNING << "Received 0 bytes";
    return fail(info, ErrorCode::CONNECTION_CLOSED);
  }

  ZKLINK_LOG_TRACE << "Received " << received << " bytes via UDP: "
                   << internal::hex_preview(rx_buffer_.data(), received, 32);

  out.assign(rx_buffer_.begin(), rx_buffer_.begin() + received);
  return ErrorCode::OK;
}

std::string UdpTransport::remote_address() const
{
  if (is_connected())
  {
    return endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port());
  }
  return host_ + ":" + std::to_string(port_);
}

uint16_t UdpTransport::local_port() const
{
  if (!is_connected())
  {
    return 0;
  }

  boost::system::error_code ec;
  const udp::endpoint local = socket_.local_endpoint(ec);
  return ec ? 0 : local.port();
}

}  // namespace link
}  // namespace zk
