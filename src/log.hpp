/**
 * @file log.hpp
 * @brief Logging macros (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/log/trivial.hpp>

#define ZKLINK_LOG(severity) BOOST_LOG_TRIVIAL(severity) << "[zklink] "

#define ZKLINK_LOG_TRACE ZKLINK_LOG(trace)
#define ZKLINK_LOG_DEBUG ZKLINK_LOG(debug)
#define ZKLINK_LOG_INFO ZKLINK_LOG(info)
#define ZKLINK_LOG_WARNING ZKLINK_LOG(warning)
#define ZKLINK_LOG_ERROR ZKLINK_LOG(error)

namespace zk
{
namespace link
{
namespace internal
{

/**
 * @brief Hex dump of the first bytes of a buffer, e.g. "E8 03 17 FC ..."
 *
 * @param data  Buffer
 * @param len   Buffer length
 * @param limit Maximum number of bytes rendered
 */
std::string hex_preview(const uint8_t* data, size_t len, size_t limit = 16);

}  // namespace internal
}  // namespace link
}  // namespace zk
