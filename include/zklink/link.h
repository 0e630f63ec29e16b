/**
 * @file link.h
 * @brief zklink C API
 *
 * C-compatible interface for the zklink device client.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Default device port */
#define ZKLINK_DEFAULT_PORT 4370

  /** @brief Packet header size */
#define ZKLINK_HEADER_SIZE 8

  /** @brief Maximum payload size */
#define ZKLINK_MAX_PAYLOAD_SIZE 65527

  /** @brief Default CommKey ticks constant */
#define ZKLINK_DEFAULT_TICKS 50

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) ZKLINK_ERR_##name = val,
#include "zklink/errors.def"
#undef ERR
  } zklink_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* zklink_strerror(zklink_error_t err);

  /* ========================================================================= */
  /* Transport selection                                                       */
  /* ========================================================================= */

  typedef enum
  {
    ZKLINK_TRANSPORT_UDP = 0,         /**< UDP datagrams */
    ZKLINK_TRANSPORT_TCP = 1,         /**< TCP, packets sent as-is */
    ZKLINK_TRANSPORT_TCP_WRAPPED = 2, /**< TCP with 8-byte envelope */
  } zklink_transport_t;

  /* ========================================================================= */
  /* Client handle                                                             */
  /* ========================================================================= */

  /** @brief Opaque handle to a client instance */
  typedef struct ZkLink ZkLink;

  /**
   * @brief Response returned by zklink_request()
   */
  typedef struct
  {
    uint16_t command;     /**< Response command code */
    uint16_t session_id;  /**< Session id */
    uint16_t reply_id;    /**< Reply id */
    size_t payload_len;   /**< Payload bytes available (may exceed the caller's buffer) */
  } zklink_response_t;

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new client instance
   *
   * @param host       Device host name or address
   * @param port       Device port (0 for ZKLINK_DEFAULT_PORT)
   * @param transport  Transport selection
   * @param password   CommKey password (0 if none)
   * @param timeout_ms Connect and read timeout (0 for the 5000 ms default)
   * @return Pointer to client instance, or NULL on invalid arguments or allocation failure
   */
  ZkLink* zklink_create(const char* host, uint16_t port, zklink_transport_t transport,
                        uint32_t password, uint32_t timeout_ms);

  /**
   * @brief Destroy client instance, disconnecting first if needed
   * @param link Client instance (NULL-safe)
   */
  void zklink_destroy(ZkLink* link);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Open the transport and perform the handshake
   * @param link Client instance
   * @return ZKLINK_ERR_OK on success
   */
  zklink_error_t zklink_connect(ZkLink* link);

  /**
   * @brief Send CMD_EXIT (best effort) and close the connection
   * @param link Client instance
   */
  void zklink_disconnect(ZkLink* link);

  /**
   * @brief Check connection status
   * @param link Client instance
   * @return 1 if connected, 0 otherwise
   */
  int zklink_is_connected(const ZkLink* link);

  /**
   * @brief Current session id (0 when disconnected)
   * @param link Client instance
   */
  uint16_t zklink_session_id(const ZkLink* link);

  /**
   * @brief Send one request and wait for its response
   *
   * @param link        Client instance
   * @param command     Request command code
   * @param data        Request payload (can be NULL if len == 0)
   * @param len         Request payload length
   * @param response    Response header (can be NULL)
   * @param out         Buffer for the response payload (can be NULL)
   * @param out_size    Size of out; excess payload is truncated
   * @return ZKLINK_ERR_OK on success
   */
  zklink_error_t zklink_request(ZkLink* link, uint16_t command, const uint8_t* data, size_t len,
                                zklink_response_t* response, uint8_t* out, size_t out_size);

  /* ========================================================================= */
  /* Protocol helpers                                                          */
  /* ========================================================================= */

  /**
   * @brief Packet checksum over command, session id, reply id and payload
   */
  uint16_t zklink_checksum(uint16_t command, uint16_t session_id, uint16_t reply_id,
                           const uint8_t* data, size_t len);

  /**
   * @brief CommKey authentication key
   * @param out 4-byte output buffer
   */
  void zklink_make_commkey(uint32_t password, uint16_t session_id, uint8_t ticks, uint8_t out[4]);

#ifdef __cplusplus
} /* extern "C" */
#endif
