/**
 * @file transport.cpp
 * @brief Transport selection
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/transport.hpp"

#include "zklink/tcp_transport.hpp"
#include "zklink/udp_transport.hpp"

namespace zk
{
namespace link
{

std::unique_ptr<ITransport> make_transport(const ClientConfig& config)
{
  switch (config.transport)
  {
    case TransportKind::TCP:
      return std::unique_ptr<ITransport>(
          new TcpTransport(config.host, config.port, config.framing, config.connect_timeout));

    case TransportKind::UDP:
    default:
      return std::unique_ptr<ITransport>(new UdpTransport(config.host, config.port));
  }
}

}  // namespace link
}  // namespace zk
