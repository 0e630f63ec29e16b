/**
 * @file minimal_binary.cpp
 * @brief Minimal program that connects to a real device and disconnects
 *
 * The device address is read from ZKLINK_DEVICE_IP. Optional
 * ZKLINK_DEVICE_PORT, ZKLINK_PASSWORD and ZKLINK_TCP=1 select the port,
 * CommKey password and transport.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "zklink/client.hpp"
#include "zklink/logging.hpp"

using namespace zk::link;

int main()
{
  const char* host = std::getenv("ZKLINK_DEVICE_IP");
  if (host == nullptr || host[0] == '\0')
  {
    std::fprintf(stderr, "ZKLINK_DEVICE_IP is not set\n");
    return 2;
  }

  set_log_level(LogLevel::DEBUG);

  ClientConfig config;
  config.host = host;

  if (const char* port = std::getenv("ZKLINK_DEVICE_PORT"))
  {
    config.port = static_cast<uint16_t>(std::strtoul(port, nullptr, 10));
  }
  if (const char* password = std::getenv("ZKLINK_PASSWORD"))
  {
    config.password = static_cast<uint32_t>(std::strtoul(password, nullptr, 10));
  }
  if (const char* tcp = std::getenv("ZKLINK_TCP"))
  {
    if (std::strcmp(tcp, "1") == 0)
    {
      config.transport = TransportKind::TCP;
      config.framing = Framing::WRAPPED;
    }
  }

  Client client(config);
  if (client.connect() != ErrorCode::OK)
  {
    std::fprintf(stderr, "connect failed: %s\n", describe(client.last_error()).c_str());
    return 1;
  }

  std::printf("connected, session id %u\n", static_cast<unsigned>(client.session().session_id()));

  std::string version;
  if (client.get_firmware_version(version) == ErrorCode::OK)
  {
    std::printf("firmware: %s\n", version.c_str());
  }

  client.disconnect();
  return 0;
}
