/**
 * @file link_c_api.cpp
 * @brief zklink C API implementation
 *
 * C wrapper for the C++ Client class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>

#include "checksum.hpp"
#include "commkey.hpp"
#include "zklink/client.hpp"
#include "zklink/link.h"

using namespace zk::link;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct ZkLink
{
  Client client;

  explicit ZkLink(const ClientConfig& config) : client(config) {}
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* zklink_strerror(zklink_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case ZKLINK_ERR_##name:   \
    return msg;
#include "zklink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

ZkLink* zklink_create(const char* host, uint16_t port, zklink_transport_t transport,
                      uint32_t password, uint32_t timeout_ms)
{
  if (host == nullptr || host[0] == '\0')
  {
    return nullptr;
  }

  ClientConfig config;
  config.host = host;
  config.port = port != 0 ? port : DEFAULT_PORT;
  config.password = password;

  switch (transport)
  {
    case ZKLINK_TRANSPORT_UDP:
      config.transport = TransportKind::UDP;
      break;
    case ZKLINK_TRANSPORT_TCP:
      config.transport = TransportKind::TCP;
      config.framing = Framing::RAW;
      break;
    case ZKLINK_TRANSPORT_TCP_WRAPPED:
      config.transport = TransportKind::TCP;
      config.framing = Framing::WRAPPED;
      break;
    default:
      return nullptr;
  }

  if (timeout_ms != 0)
  {
    config.connect_timeout = std::chrono::milliseconds(timeout_ms);
    config.read_timeout = std::chrono::milliseconds(timeout_ms);
  }

  return new (std::nothrow) ZkLink(config);
}

void zklink_destroy(ZkLink* link)
{
  delete link;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

zklink_error_t zklink_connect(ZkLink* link)
{
  if (link == nullptr)
  {
    return ZKLINK_ERR_NOT_CONNECTED;
  }
  return static_cast<zklink_error_t>(link->client.connect());
}

void zklink_disconnect(ZkLink* link)
{
  if (link)
  {
    link->client.disconnect();
  }
}

int zklink_is_connected(const ZkLink* link)
{
  if (link && link->client.is_connected())
  {
    return 1;
  }
  return 0;
}

uint16_t zklink_session_id(const ZkLink* link)
{
  if (link)
  {
    return link->client.session().session_id();
  }
  return 0;
}

zklink_error_t zklink_request(ZkLink* link, uint16_t command, const uint8_t* data, size_t len,
                              zklink_response_t* response, uint8_t* out, size_t out_size)
{
  if (link == nullptr)
  {
    return ZKLINK_ERR_NOT_CONNECTED;
  }

  Command cmd;
  if (command_from_code(command, cmd) != ErrorCode::OK)
  {
    return ZKLINK_ERR_UNKNOWN_COMMAND;
  }

  Packet reply;
  const ErrorCode err = link->client.request(cmd, data, len, reply);
  if (err != ErrorCode::OK)
  {
    return static_cast<zklink_error_t>(err);
  }

  if (response)
  {
    response->command = command_to_code(reply.command);
    response->session_id = reply.session_id;
    response->reply_id = reply.reply_id;
    response->payload_len = reply.payload.size();
  }

  if (out && out_size > 0 && !reply.payload.empty())
  {
    const size_t n = reply.payload.size() < out_size ? reply.payload.size() : out_size;
    std::memcpy(out, reply.payload.data(), n);
  }

  return ZKLINK_ERR_OK;
}

/* ========================================================================= */
/* Protocol helpers                                                          */
/* ========================================================================= */

uint16_t zklink_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                         const uint8_t* data, size_t len)
{
  return internal::calc_checksum(command, session_id, reply_id, data, len);
}

void zklink_make_commkey(uint32_t password, uint16_t session_id, uint8_t ticks, uint8_t out[4])
{
  if (out == nullptr)
  {
    return;
  }

  const internal::CommKey key = internal::make_commkey(password, session_id, ticks);
  std::memcpy(out, key.data(), key.size());
}
