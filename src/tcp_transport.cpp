/**
 * @file tcp_transport.cpp
 * @brief TCP transport implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/tcp_transport.hpp"

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include "envelope.hpp"
#include "io_util.hpp"
#include "log.hpp"

namespace zk
{
namespace link
{

using boost::asio::ip::tcp;

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

TcpTransport::TcpTransport(std::string host, uint16_t port, Framing framing,
                           std::chrono::milliseconds connect_timeout)
    : host_(std::move(host)),
      port_(port),
      framing_(framing),
      connect_timeout_(connect_timeout),
      io_(),
      socket_(io_),
      endpoint_(),
      rx_buffer_(internal::RX_BUFFER_SIZE)
{
}

TcpTransport::~TcpTransport()
{
  if (is_connected())
  {
    ZKLINK_LOG_WARNING << "TCP transport to " << remote_address()
                       << " destroyed while still connected";
    disconnect();
  }
}

ErrorCode TcpTransport::connect(ErrorInfo* info)
{
  if (is_connected())
  {
    return fail(info, ErrorCode::ALREADY_CONNECTED);
  }

  boost::system::error_code ec;
  tcp::resolver resolver(io_);
  const tcp::resolver::results_type endpoints =
      resolver.resolve(host_, std::to_string(port_), ec);
  if (ec || endpoints.empty())
  {
    ZKLINK_LOG_WARNING << "Cannot resolve " << host_ << ":" << port_ << ": " << ec.message();
    return fail(info, ErrorCode::INVALID_ADDRESS, ec);
  }

  ZKLINK_LOG_DEBUG << "Connecting to " << host_ << ":" << port_ << " via TCP...";

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
                             [&](const boost::system::error_code& e, const tcp::endpoint& ep)
                             {
                               result = e;
                               if (!e)
                               {
                                 endpoint_ = ep;
                               }
                             });

  if (!internal::run_for(io_, connect_timeout_))
  {
    socket_.close(ec);
    internal::drain(io_);
    ZKLINK_LOG_WARNING << "Connection to " << host_ << ":" << port_ << " timed out";
    return fail(info, ErrorCode::CONNECTION_TIMEOUT);
  }

  if (result)
  {
    socket_.close(ec);
    ZKLINK_LOG_WARNING << "Connection to " << host_ << ":" << port_
                       << " failed: " << result.message();
    return fail(info, ErrorCode::IO_ERROR, result);
  }

  socket_.set_option(tcp::no_delay(true), ec);
  if (ec)
  {
    socket_.close(ec);
    return fail(info, ErrorCode::IO_ERROR, ec);
  }

  ZKLINK_LOG_DEBUG << "Connected to " << remote_address();
  return ErrorCode::OK;
}

void TcpTransport::disconnect()
{
  if (!is_connected())
  {
    return;
  }

  ZKLINK_LOG_DEBUG << "Disconnecting from " << remote_address() << "...";

  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  if (ec)
  {
    ZKLINK_LOG_DEBUG << "shutdown() failed: " << ec.message();
  }
  socket_.close(ec);
  endpoint_ = tcp::endpoint();
}

bool TcpTransport::is_connected() const
{
  return socket_.is_open();
}

ErrorCode TcpTransport::send(const uint8_t* data, size_t len, ErrorInfo* info)
{
  if (!is_connected())
  {
    return fail(info, ErrorCode::NOT_CONNECTED);
  }

  std::vector<uint8_t> wrapped;
  const uint8_t* out = data;
  size_t out_len = len;

  if (framing_ == Framing::WRAPPED)
  {
    internal::wrap_envelope(data, len, wrapped);
    out = wrapped.data();
    out_len = wrapped.size();
  }

  ZKLINK_LOG_TRACE << "Sending " << out_len << " bytes: " << internal::hex_preview(out, out_len);

  // Writes are bounded by the connect timeout
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(socket_, boost::asio::buffer(out, out_len),
                           [&](const boost::system::error_code& e, size_t) { result = e; });

  if (!internal::run_for(io_, connect_timeout_))
  {
    boost::system::error_code ec;
    socket_.cancel(ec);
    internal::drain(io_);
    ZKLINK_LOG_WARNING << "Send to " << remote_address() << " timed out";
    return fail(info, ErrorCode::IO_ERROR, boost::asio::error::timed_out);
  }

  if (result)
  {
    ZKLINK_LOG_WARNING << "send() failed: " << result.message();
    return fail(info, ErrorCode::IO_ERROR, result);
  }

  return ErrorCode::OK;
}

ErrorCode TcpTransport::receive(std::chrono::milliseconds timeout, std::vector<uint8_t>& out,
                                ErrorInfo* info)
{
  out.clear();

  if (!is_connected())
  {
    return fail(info, ErrorCode::NOT_CONNECTED);
  }

  boost::system::error_code result = boost::asio::error::would_block;
  size_t received = 0;
  socket_.async_read_some(boost::asio::buffer(rx_buffer_),
                          [&](const boost::system::error_code& e, size_t n)
                          {
                            result = e;
                            received = n;
                          });

  if (!internal::run_for(io_, timeout))
  {
    // Leave the connection open; only the pending read is abandoned
    boost::system::error_code ec;
    socket_.cancel(ec);
    internal::drain(io_);
    ZKLINK_LOG_WARNING << "Read timeout after " << timeout.count() << "ms";
    return fail(info, ErrorCode::READ_TIMEOUT);
  }

  if (result == boost::asio::error::eof || (!result && received == 0))
  {
    ZKLINK_LOG_WARNING << "Connection closed by " << remote_address();
    return fail(info, ErrorCode::CONNECTION_CLOSED, result);
  }

  if (result)
  {
    ZKLINK_LOG_WARNING << "recv() failed: " << result.message();
    return fail(info, ErrorCode::IO_ERROR, result);
  }

  ZKLINK_LOG_TRACE << "Received " << received
                   << " bytes: " << internal::hex_preview(rx_buffer_.data(), received);

  if (framing_ == Framing::WRAPPED)
  {
    uint32_t declared_len = 0;
    if (internal::unwrap_envelope(rx_buffer_.data(), received, out, &declared_len))
    {
      if (declared_len != out.size())
      {
        ZKLINK_LOG_WARNING << "Envelope declares " << declared_len << " bytes, received "
                           << out.size();
      }
    }
    else
    {
      ZKLINK_LOG_DEBUG << "Received data without envelope, passing through";
    }
  }
  else
  {
    out.assign(rx_buffer_.begin(), rx_buffer_.begin() + received);
  }

  return ErrorCode::OK;
}

std::string TcpTransport::remote_address() const
{
  if (is_connected() && endpoint_.port() != 0)
  {
    return endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port());
  }
  return host_ + ":" + std::to_string(port_);
}

}  // namespace link
}  // namespace zk
