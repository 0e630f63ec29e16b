/**
 * @file transport.hpp
 * @brief Transport interface
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "zklink/config.hpp"
#include "zklink/errors.hpp"

namespace zk
{
namespace link
{

/**
 * @brief Byte channel to one device
 *
 * Implementations hide their wire framing: send() takes an encoded packet
 * and receive() returns one, envelope already removed. A transport is
 * owned by a single client; it is not safe for concurrent senders.
 *
 * The socket is released on disconnect() and in the destructor.
 */
class ITransport
{
 public:
  virtual ~ITransport() = default;

  /**
   * @brief Open the channel to the configured endpoint
   *
   * @param info Optional failure details (may be nullptr)
   * @return ErrorCode::OK, ALREADY_CONNECTED, INVALID_ADDRESS,
   *         CONNECTION_TIMEOUT or IO_ERROR
   */
  virtual ErrorCode connect(ErrorInfo* info = nullptr) = 0;

  /**
   * @brief Close the channel
   *
   * No-op when not connected.
   */
  virtual void disconnect() = 0;

  /**
   * @brief Check if connected
   */
  virtual bool is_connected() const = 0;

  /**
   * @brief Send one encoded packet
   *
   * @param data Packet bytes
   * @param len  Number of bytes
   * @param info Optional failure details (may be nullptr)
   * @return ErrorCode::OK, NOT_CONNECTED or IO_ERROR
   */
  virtual ErrorCode send(const uint8_t* data, size_t len, ErrorInfo* info = nullptr) = 0;

  /**
   * @brief Receive one packet
   *
   * On READ_TIMEOUT the pending read is cancelled and the channel stays
   * open.
   *
   * @param timeout Maximum wait
   * @param out     Packet bytes (cleared first)
   * @param info    Optional failure details (may be nullptr)
   * @return ErrorCode::OK, NOT_CONNECTED, READ_TIMEOUT, CONNECTION_CLOSED or IO_ERROR
   */
  virtual ErrorCode receive(std::chrono::milliseconds timeout, std::vector<uint8_t>& out,
                            ErrorInfo* info = nullptr) = 0;

  /**
   * @brief Remote endpoint, e.g. "192.168.1.201:4370"
   */
  virtual std::string remote_address() const = 0;

  /**
   * @brief Transport type name ("UDP" or "TCP")
   */
  virtual std::string get_type() const = 0;
};

/**
 * @brief Create the transport selected by the configuration
 */
std::unique_ptr<ITransport> make_transport(const ClientConfig& config);

}  // namespace link
}  // namespace zk
