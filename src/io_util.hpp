/**
 * @file io_util.hpp
 * @brief Boost.Asio helpers shared by the transports (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>

#include <boost/asio/io_context.hpp>

namespace zk
{
namespace link
{
namespace internal
{

/**
 * @brief Largest datagram or stream chunk accepted by receive()
 */
constexpr size_t RX_BUFFER_SIZE = 65536 + 8;

/**
 * @brief Run the context until its pending operations complete
 *
 * @param io      Context with asynchronous operations queued
 * @param timeout Maximum time to run
 * @return true if every operation completed, false if the timeout expired
 *         with operations still pending (the caller must cancel or close
 *         them and call drain())
 */
inline bool run_for(boost::asio::io_context& io, std::chrono::milliseconds timeout)
{
  io.restart();
  io.run_for(timeout);
  return io.stopped();
}

/**
 * @brief Run cancelled handlers to completion
 */
inline void drain(boost::asio::io_context& io)
{
  io.restart();
  io.run();
}

}  // namespace internal
}  // namespace link
}  // namespace zk
