/**
 * @file test_transport.cpp
 * @brief Envelope framing and UDP/TCP transport tests against loopback peers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <chrono>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

#include "envelope.hpp"
#include "zklink/config.hpp"
#include "zklink/tcp_transport.hpp"
#include "zklink/transport.hpp"
#include "zklink/udp_transport.hpp"

using namespace zk::link;
using boost::asio::ip::address_v4;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;
using std::chrono::milliseconds;

/* ========================================================================= */
/* Envelope Tests                                                            */
/* ========================================================================= */

TEST_CASE("Envelope wrap")
{
  const uint8_t data[] = {0x01, 0x02, 0x03, 0x04};
  std::vector<uint8_t> out;
  internal::wrap_envelope(data, sizeof(data), out);

  REQUIRE(out.size() == 12);
  CHECK(out[0] == 0x50);
  CHECK(out[1] == 0x50);
  CHECK(out[2] == 0x72);
  CHECK(out[3] == 0x82);
  CHECK(out[4] == 4);
  CHECK(out[5] == 0);
  CHECK(out[6] == 0);
  CHECK(out[7] == 0);
  CHECK(out[8] == 0x01);
  CHECK(out[11] == 0x04);
}

TEST_CASE("Envelope unwrap")
{
  SUBCASE("Wrapped input")
  {
    const uint8_t data[] = {0x50, 0x50, 0x72, 0x82, 0x03, 0x00, 0x00, 0x00, 0xAA, 0xBB, 0xCC};
    std::vector<uint8_t> out;
    uint32_t declared = 0;

    CHECK(internal::unwrap_envelope(data, sizeof(data), out, &declared));
    CHECK(declared == 3);
    CHECK(out == std::vector<uint8_t>{0xAA, 0xBB, 0xCC});
  }

  SUBCASE("Declared length is not enforced")
  {
    const uint8_t data[] = {0x50, 0x50, 0x72, 0x82, 0x10, 0x00, 0x00, 0x00, 0xAA};
    std::vector<uint8_t> out;
    uint32_t declared = 0;

    CHECK(internal::unwrap_envelope(data, sizeof(data), out, &declared));
    CHECK(declared == 16);
    CHECK(out.size() == 1);
  }

  SUBCASE("Unwrapped input passes through")
  {
    const uint8_t data[] = {0xE8, 0x03, 0x17, 0xFC, 0x00, 0x00, 0x00, 0x00};
    std::vector<uint8_t> out;

    CHECK_FALSE(internal::unwrap_envelope(data, sizeof(data), out));
    CHECK(out == std::vector<uint8_t>(data, data + sizeof(data)));
  }

  SUBCASE("Short input passes through")
  {
    const uint8_t data[] = {0x50, 0x50, 0x72, 0x82};
    std::vector<uint8_t> out;

    CHECK_FALSE(internal::unwrap_envelope(data, sizeof(data), out));
    CHECK(out.size() == 4);
  }
}

/* ========================================================================= */
/* UDP Transport Tests                                                       */
/* ========================================================================= */

TEST_CASE("UDP transport")
{
  boost::asio::io_context io;
  udp::socket peer(io, udp::endpoint(address_v4::loopback(), 0));
  const uint16_t port = peer.local_endpoint().port();

  UdpTransport transport("127.0.0.1", port);
  CHECK(transport.get_type() == "UDP");
  CHECK_FALSE(transport.is_connected());

  SUBCASE("Not connected")
  {
    const uint8_t data[] = {0x01};
    ErrorInfo info;
    CHECK(transport.send(data, 1, &info) == ErrorCode::NOT_CONNECTED);
    CHECK(info.code == ErrorCode::NOT_CONNECTED);

    std::vector<uint8_t> out;
    CHECK(transport.receive(milliseconds(10), out) == ErrorCode::NOT_CONNECTED);
  }

  SUBCASE("Send and receive")
  {
    REQUIRE(transport.connect() == ErrorCode::OK);
    CHECK(transport.is_connected());
    CHECK(transport.local_port() != 0);
    CHECK(transport.remote_address() == "127.0.0.1:" + std::to_string(port));
    CHECK(transport.connect() == ErrorCode::ALREADY_CONNECTED);

    const uint8_t request[] = {0xE8, 0x03, 0x17, 0xFC, 0x00, 0x00, 0x00, 0x00};
    REQUIRE(transport.send(request, sizeof(request)) == ErrorCode::OK);

    std::vector<uint8_t> buffer(64);
    udp::endpoint sender;
    const size_t n = peer.receive_from(boost::asio::buffer(buffer), sender);
    CHECK(n == sizeof(request));
    CHECK(sender.port() == transport.local_port());

    const uint8_t reply[] = {0xD0, 0x07, 0x00, 0x00, 0x34, 0x12, 0x00, 0x00, 0x99};
    peer.send_to(boost::asio::buffer(reply), sender);

    std::vector<uint8_t> out;
    REQUIRE(transport.receive(milliseconds(1000), out) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>(reply, reply + sizeof(reply)));

    transport.disconnect();
    CHECK_FALSE(transport.is_connected());
  }

  SUBCASE("Read timeout keeps the socket usable")
  {
    REQUIRE(transport.connect() == ErrorCode::OK);

    std::vector<uint8_t> out;
    ErrorInfo info;
    CHECK(transport.receive(milliseconds(50), out, &info) == ErrorCode::READ_TIMEOUT);
    CHECK(info.code == ErrorCode::READ_TIMEOUT);
    CHECK(out.empty());
    CHECK(transport.is_connected());

    const uint8_t request[] = {0x01, 0x02};
    REQUIRE(transport.send(request, sizeof(request)) == ErrorCode::OK);

    std::vector<uint8_t> buffer(64);
    udp::endpoint sender;
    peer.receive_from(boost::asio::buffer(buffer), sender);
    const uint8_t reply[] = {0x03, 0x04};
    peer.send_to(boost::asio::buffer(reply), sender);

    REQUIRE(transport.receive(milliseconds(1000), out) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>{0x03, 0x04});
  }
}

/* ========================================================================= */
/* TCP Transport Tests                                                       */
/* ========================================================================= */

namespace
{

struct TcpPeer
{
  boost::asio::io_context io;
  tcp::acceptor acceptor;
  tcp::socket socket;

  TcpPeer() : io(), acceptor(io, tcp::endpoint(address_v4::loopback(), 0)), socket(io) {}

  uint16_t port() const
  {
    return acceptor.local_endpoint().port();
  }
};

}  // namespace

TEST_CASE("TCP transport")
{
  TcpPeer peer;

  SUBCASE("Raw framing")
  {
    TcpTransport transport("127.0.0.1", peer.port(), Framing::RAW, milliseconds(1000));
    CHECK(transport.get_type() == "TCP");
    CHECK(transport.framing() == Framing::RAW);

    REQUIRE(transport.connect() == ErrorCode::OK);
    peer.acceptor.accept(peer.socket);
    CHECK(transport.is_connected());
    CHECK(transport.connect() == ErrorCode::ALREADY_CONNECTED);

    const uint8_t request[] = {0xE8, 0x03, 0x17, 0xFC, 0x00, 0x00, 0x00, 0x00};
    REQUIRE(transport.send(request, sizeof(request)) == ErrorCode::OK);

    std::vector<uint8_t> buffer(sizeof(request));
    boost::asio::read(peer.socket, boost::asio::buffer(buffer));
    CHECK(buffer == std::vector<uint8_t>(request, request + sizeof(request)));

    const uint8_t reply[] = {0xD0, 0x07, 0x00, 0x00, 0x34, 0x12, 0x00, 0x00};
    boost::asio::write(peer.socket, boost::asio::buffer(reply));

    std::vector<uint8_t> out;
    REQUIRE(transport.receive(milliseconds(1000), out) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>(reply, reply + sizeof(reply)));
  }

  SUBCASE("Wrapped framing")
  {
    TcpTransport transport("127.0.0.1", peer.port(), Framing::WRAPPED, milliseconds(1000));
    REQUIRE(transport.connect() == ErrorCode::OK);
    peer.acceptor.accept(peer.socket);

    const uint8_t request[] = {0x01, 0x02, 0x03, 0x04};
    REQUIRE(transport.send(request, sizeof(request)) == ErrorCode::OK);

    std::vector<uint8_t> buffer(12);
    boost::asio::read(peer.socket, boost::asio::buffer(buffer));
    CHECK(buffer[0] == 0x50);
    CHECK(buffer[1] == 0x50);
    CHECK(buffer[2] == 0x72);
    CHECK(buffer[3] == 0x82);
    CHECK(buffer[4] == 4);
    CHECK(buffer[8] == 0x01);
    CHECK(buffer[11] == 0x04);

    std::vector<uint8_t> reply;
    const uint8_t body[] = {0xAA, 0xBB};
    internal::wrap_envelope(body, sizeof(body), reply);
    boost::asio::write(peer.socket, boost::asio::buffer(reply));

    std::vector<uint8_t> out;
    REQUIRE(transport.receive(milliseconds(1000), out) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>{0xAA, 0xBB});
  }

  SUBCASE("Read timeout keeps the connection")
  {
    TcpTransport transport("127.0.0.1", peer.port(), Framing::RAW, milliseconds(1000));
    REQUIRE(transport.connect() == ErrorCode::OK);
    peer.acceptor.accept(peer.socket);

    std::vector<uint8_t> out;
    CHECK(transport.receive(milliseconds(50), out) == ErrorCode::READ_TIMEOUT);
    CHECK(transport.is_connected());

    const uint8_t reply[] = {0x05, 0x06};
    boost::asio::write(peer.socket, boost::asio::buffer(reply));
    REQUIRE(transport.receive(milliseconds(1000), out) == ErrorCode::OK);
    CHECK(out == std::vector<uint8_t>{0x05, 0x06});
  }

  SUBCASE("Peer close")
  {
    TcpTransport transport("127.0.0.1", peer.port(), Framing::RAW, milliseconds(1000));
    REQUIRE(transport.connect() == ErrorCode::OK);
    peer.acceptor.accept(peer.socket);
    peer.socket.close();

    std::vector<uint8_t> out;
    CHECK(transport.receive(milliseconds(1000), out) == ErrorCode::CONNECTION_CLOSED);
  }

  SUBCASE("Disconnect")
  {
    TcpTransport transport("127.0.0.1", peer.port(), Framing::RAW, milliseconds(1000));
    REQUIRE(transport.connect() == ErrorCode::OK);
    transport.disconnect();
    CHECK_FALSE(transport.is_connected());

    const uint8_t data[] = {0x01};
    CHECK(transport.send(data, 1) == ErrorCode::NOT_CONNECTED);
  }
}

TEST_CASE("Invalid address")
{
  ErrorInfo info;

  TcpTransport tcp_transport("zklink.invalid", DEFAULT_PORT, Framing::RAW, milliseconds(500));
  CHECK(tcp_transport.connect(&info) == ErrorCode::INVALID_ADDRESS);
  CHECK(info.code == ErrorCode::INVALID_ADDRESS);
  CHECK_FALSE(tcp_transport.is_connected());

  UdpTransport udp_transport("zklink.invalid", DEFAULT_PORT);
  CHECK(udp_transport.connect() == ErrorCode::INVALID_ADDRESS);
  CHECK_FALSE(udp_transport.is_connected());
}

TEST_CASE("Transport selection")
{
  ClientConfig config;
  config.host = "127.0.0.1";

  config.transport = TransportKind::UDP;
  const std::unique_ptr<ITransport> udp_transport = make_transport(config);
  REQUIRE(udp_transport != nullptr);
  CHECK(udp_transport->get_type() == "UDP");

  config.transport = TransportKind::TCP;
  config.framing = Framing::WRAPPED;
  const std::unique_ptr<ITransport> tcp_transport = make_transport(config);
  REQUIRE(tcp_transport != nullptr);
  CHECK(tcp_transport->get_type() == "TCP");
  CHECK(static_cast<TcpTransport&>(*tcp_transport).framing() == Framing::WRAPPED);
}
